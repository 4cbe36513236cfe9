#include "cleansheet/opc/EntryTransformer.hpp"
#include "cleansheet/xml/XMLDocument.hpp"
#include "cleansheet/xml/HiddenNodePruner.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace cleansheet {
namespace opc {

const char* toString(TransformAction action) noexcept {
    switch (action) {
        case TransformAction::Unchanged: return "unchanged";
        case TransformAction::Replace:   return "replace";
        case TransformAction::Drop:      return "drop";
    }
    return "unknown";
}

bool EntryTransformer::isMacroEntry(std::string_view entry_name) const {
    return options_.remove_macros && profile_.supportsMacroRemoval() &&
           entry_name == profile_.macro_entry_name;
}

bool EntryTransformer::isDescriptorEntry(std::string_view entry_name) const {
    return options_.remove_hidden_sheets && entry_name == profile_.trigger_entry_name;
}

bool EntryTransformer::isTarget(std::string_view entry_name) const {
    return isMacroEntry(entry_name) || isDescriptorEntry(entry_name);
}

TransformOutcome EntryTransformer::transform(std::string_view entry_name, std::string_view raw_bytes) const {
    if (isMacroEntry(entry_name)) {
        diagnostics_.info(fmt::format("Removed macro entry {}", entry_name));
        return TransformOutcome::drop();
    }
    if (isDescriptorEntry(entry_name)) {
        return pruneDescriptor(entry_name, raw_bytes);
    }
    return TransformOutcome::unchanged();
}

TransformOutcome EntryTransformer::pruneDescriptor(std::string_view entry_name, std::string_view raw_bytes) const {
    auto parsed = xml::XMLDocument::parse(raw_bytes);
    if (!parsed) {
        diagnostics_.warning(core::ErrorCode::ParseFailure,
                           fmt::format("Failed to parse {}, keeping original: {}", entry_name, parsed.error().message));
        return TransformOutcome::unchanged();
    }

    xml::XMLDocument& document = parsed.value();
    xml::HiddenNodePruner pruner(profile_);
    xml::PruneResult pruned = pruner.prune(document);

    if (pruned.removed == 0) {
        OPC_DEBUG("No hidden {} elements in {}", profile_.element_local_name, entry_name);
        return TransformOutcome::unchanged();
    }

    auto serialized = document.serialize();
    if (!serialized) {
        diagnostics_.warning(core::ErrorCode::ParseFailure,
                           fmt::format("Failed to serialize {}, keeping original: {}",
                                       entry_name, serialized.error().fullMessage()));
        return TransformOutcome::unchanged();
    }

    for (const auto& label : pruned.removed_labels) {
        diagnostics_.info(fmt::format("Removed hidden {} '{}' from {}", profile_.element_local_name, label, entry_name));
    }
    return TransformOutcome::replace(std::move(serialized.value()), pruned.removed);
}

}} // namespace cleansheet::opc
