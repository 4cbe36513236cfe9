#include "cleansheet/xml/HiddenNodePruner.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace cleansheet {
namespace xml {

bool HiddenNodePruner::isHidden(const XMLDocument& document, NodeId element) const {
    const std::string* value = document.attribute(element, profile_.hidden_attribute_namespace,
                                                  profile_.hidden_attribute_name);
    const std::string& effective = value ? *value : profile_.hidden_attribute_default;
    const auto& hidden = profile_.hidden_attribute_values;
    return std::find(hidden.begin(), hidden.end(), effective) != hidden.end();
}

std::string HiddenNodePruner::label(const XMLDocument& document, NodeId element, size_t traversal_index) const {
    for (const auto& [ns, local] : profile_.identity_attributes) {
        if (const std::string* value = document.attribute(element, ns, local)) {
            return *value;
        }
    }
    return "#" + std::to_string(traversal_index);
}

PruneResult HiddenNodePruner::prune(XMLDocument& document) const {
    PruneResult result;

    struct Candidate {
        NodeId id;
        std::string label;
    };
    std::vector<Candidate> candidates;

    const std::vector<NodeId> elements = document.findElements(profile_.element_namespace,
                                                               profile_.element_local_name);
    for (size_t i = 0; i < elements.size(); ++i) {
        if (isHidden(document, elements[i])) {
            candidates.push_back(Candidate{elements[i], label(document, elements[i], i)});
        }
    }

    for (const auto& candidate : candidates) {
        if (document.detach(candidate.id)) {
            result.removed++;
            result.removed_labels.push_back(candidate.label);
        } else {
            XML_DEBUG("Hidden {} '{}' already detached with an ancestor", profile_.element_local_name, candidate.label);
        }
    }

    XML_DEBUG("Scanned {} {} elements, removed {}", elements.size(), profile_.element_local_name, result.removed);
    return result;
}

}} // namespace cleansheet::xml
