#include "cleansheet/xml/XMLDocument.hpp"
#include "cleansheet/xml/XMLStreamReader.hpp"
#include "cleansheet/xml/XMLStreamWriter.hpp"
#include "cleansheet/core/Exception.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"

#include <utf8.h>
#include <algorithm>
#include <cctype>
#include <iterator>

namespace cleansheet {
namespace xml {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view prefixOf(std::string_view qualified_name) {
    size_t colon = qualified_name.find(':');
    return colon == std::string_view::npos ? std::string_view{} : qualified_name.substr(0, colon);
}

void writeNode(XMLStreamWriter& writer, const std::vector<Node>& nodes, NodeId id) {
    const Node& n = nodes[id];
    switch (n.kind) {
        case NodeKind::Element:
            writer.startElement(n.name);
            for (const auto& attr : n.attributes) {
                writer.writeAttribute(attr.name, attr.value);
            }
            for (NodeId child : n.children) {
                writeNode(writer, nodes, child);
            }
            writer.endElement();
            break;
        case NodeKind::Text:
            writer.writeText(n.value);
            break;
        case NodeKind::CData:
            writer.writeCDATA(n.value);
            break;
        case NodeKind::Comment:
            writer.writeComment(n.value);
            break;
        case NodeKind::ProcessingInstruction:
            writer.writeProcessingInstruction(n.name, n.value);
            break;
        case NodeKind::Document:
            break;
    }
}

std::string encodeUTF16(const std::string& utf8_text, TextEncoding encoding, bool with_bom) {
    std::u16string units;
    units.reserve(utf8_text.size());
    utf8::utf8to16(utf8_text.begin(), utf8_text.end(), std::back_inserter(units));

    const bool little_endian = encoding == TextEncoding::UTF16LE;
    std::string out;
    out.reserve((units.size() + 1) * 2);
    if (with_bom) {
        units.insert(units.begin(), u'\xFEFF');
    }
    for (char16_t unit : units) {
        const char lo = static_cast<char>(unit & 0xFF);
        const char hi = static_cast<char>((unit >> 8) & 0xFF);
        if (little_endian) {
            out.push_back(lo);
            out.push_back(hi);
        } else {
            out.push_back(hi);
            out.push_back(lo);
        }
    }
    return out;
}

} // namespace

XMLDocument::XMLDocument() {
    Node document;
    document.kind = NodeKind::Document;
    nodes_.push_back(std::move(document));
}

void XMLDocument::detectEncoding(std::string_view bytes) {
    auto byteAt = [&bytes](size_t i) {
        return i < bytes.size() ? static_cast<unsigned char>(bytes[i]) : 0x100u;
    };

    if (byteAt(0) == 0xFF && byteAt(1) == 0xFE) {
        encoding_ = TextEncoding::UTF16LE;
        has_bom_ = true;
    } else if (byteAt(0) == 0xFE && byteAt(1) == 0xFF) {
        encoding_ = TextEncoding::UTF16BE;
        has_bom_ = true;
    } else if (byteAt(0) == 0xEF && byteAt(1) == 0xBB && byteAt(2) == 0xBF) {
        encoding_ = TextEncoding::UTF8;
        has_bom_ = true;
    } else if (byteAt(0) == '<' && byteAt(1) == 0x00) {
        encoding_ = TextEncoding::UTF16LE;
    } else if (byteAt(0) == 0x00 && byteAt(1) == '<') {
        encoding_ = TextEncoding::UTF16BE;
    } else {
        encoding_ = TextEncoding::UTF8;
    }
}

NodeId XMLDocument::appendNode(NodeId parent, NodeKind kind) {
    NodeId id = static_cast<NodeId>(nodes_.size());
    Node n;
    n.kind = kind;
    n.parent = parent;
    nodes_.push_back(std::move(n));
    nodes_[parent].children.push_back(id);
    return id;
}

core::Result<XMLDocument> XMLDocument::parse(std::string_view bytes) {
    XMLDocument doc;
    doc.detectEncoding(bytes);

    std::vector<NodeId> stack;
    stack.push_back(kDocumentNode);

    XMLStreamReader reader;
    reader.setXmlDeclCallback([&doc](std::string_view version, std::string_view encoding, int standalone) {
        doc.has_declaration_ = true;
        doc.version_.assign(version);
        doc.declared_encoding_.assign(encoding);
        doc.standalone_ = standalone;
    });
    reader.setStartElementCallback([&doc, &stack](std::string_view name, const std::vector<XMLAttribute>& attributes, int) {
        NodeId id = doc.appendNode(stack.back(), NodeKind::Element);
        Node& element = doc.nodes_[id];
        element.name.assign(name);
        element.attributes.reserve(attributes.size());
        for (const auto& attr : attributes) {
            element.attributes.push_back(NodeAttribute{std::string(attr.name), std::string(attr.value)});
        }
        stack.push_back(id);
    });
    reader.setEndElementCallback([&stack](std::string_view, int) {
        stack.pop_back();
    });
    reader.setTextCallback([&doc, &stack](std::string_view text, bool in_cdata, int) {
        NodeId id = doc.appendNode(stack.back(), in_cdata ? NodeKind::CData : NodeKind::Text);
        doc.nodes_[id].value.assign(text);
    });
    reader.setCommentCallback([&doc, &stack](std::string_view comment, int) {
        NodeId id = doc.appendNode(stack.back(), NodeKind::Comment);
        doc.nodes_[id].value.assign(comment);
    });
    reader.setProcessingInstructionCallback([&doc, &stack](std::string_view target, std::string_view data, int) {
        NodeId id = doc.appendNode(stack.back(), NodeKind::ProcessingInstruction);
        doc.nodes_[id].name.assign(target);
        doc.nodes_[id].value.assign(data);
    });

    XMLParseError result = reader.parseFromString(bytes);
    if (isError(result)) {
        return core::makeError(core::ErrorCode::ParseFailure, reader.getLastErrorMessage());
    }
    if (doc.rootElement() == kNoNode) {
        return core::makeError(core::ErrorCode::ParseFailure, "Document has no root element");
    }

    XML_DEBUG("Built document tree with {} nodes", doc.nodes_.size());
    return doc;
}

core::Result<std::string> XMLDocument::serialize() const {
    std::string declared = declared_encoding_;
    if (encoding_ == TextEncoding::UTF8 && !declared.empty() && !equalsIgnoreCase(declared, "UTF-8")) {
        XML_WARN("Re-encoding document declared as {} to UTF-8", declared);
        declared = "UTF-8";
    }

    std::string text;
    try {
        XMLStreamWriter writer;
        if (has_declaration_) {
            writer.writeDeclaration(version_, declared, standalone_);
        }
        bool first = true;
        for (NodeId child : nodes_[kDocumentNode].children) {
            if (!first) {
                writer.writeRaw("\n");
            }
            writeNode(writer, nodes_, child);
            first = false;
        }
        writer.endDocument();
        text = writer.toString();
    } catch (const core::CleanSheetException& e) {
        core::Error error = e.toError();
        error.context = "XML serialization";
        return error;
    }

    if (encoding_ == TextEncoding::UTF8) {
        if (has_bom_) {
            text.insert(0, "\xEF\xBB\xBF");
        }
        return text;
    }

    try {
        return encodeUTF16(text, encoding_, has_bom_);
    } catch (const utf8::exception& e) {
        return core::makeError(core::ErrorCode::InternalError,
                               std::string("UTF-16 encoding failed: ") + e.what(), "XML serialization");
    }
}

NodeId XMLDocument::rootElement() const {
    for (NodeId child : nodes_[kDocumentNode].children) {
        if (nodes_[child].kind == NodeKind::Element) {
            return child;
        }
    }
    return kNoNode;
}

std::string_view XMLDocument::localName(std::string_view qualified_name) {
    size_t colon = qualified_name.find(':');
    return colon == std::string_view::npos ? qualified_name : qualified_name.substr(colon + 1);
}

std::string XMLDocument::resolvePrefix(NodeId element, std::string_view prefix) const {
    if (prefix == "xml") {
        return XML_NAMESPACE;
    }

    const std::string declaration = prefix.empty() ? std::string("xmlns") : "xmlns:" + std::string(prefix);
    for (NodeId id = element; id != kNoNode && id != kDocumentNode; id = nodes_[id].parent) {
        for (const auto& attr : nodes_[id].attributes) {
            if (attr.name == declaration) {
                return attr.value;
            }
        }
    }
    return std::string();
}

std::string XMLDocument::namespaceOf(NodeId element) const {
    const Node& n = nodes_.at(element);
    if (n.kind != NodeKind::Element) {
        return std::string();
    }
    return resolvePrefix(element, prefixOf(n.name));
}

const std::string* XMLDocument::attribute(NodeId element, std::string_view ns, std::string_view local) const {
    const Node& n = nodes_.at(element);
    for (const auto& attr : n.attributes) {
        if (localName(attr.name) != local) {
            continue;
        }
        std::string_view prefix = prefixOf(attr.name);
        if (prefix == "xmlns" || (prefix.empty() && attr.name == "xmlns")) {
            continue;
        }
        if (prefix.empty()) {
            if (ns.empty()) {
                return &attr.value;
            }
            continue;
        }
        if (resolvePrefix(element, prefix) == ns) {
            return &attr.value;
        }
    }
    return nullptr;
}

void XMLDocument::collectElements(NodeId id, std::string_view ns, std::string_view local,
                                  std::vector<NodeId>& out) const {
    for (NodeId child : nodes_[id].children) {
        const Node& n = nodes_[child];
        if (n.kind != NodeKind::Element) {
            continue;
        }
        if (localName(n.name) == local && namespaceOf(child) == ns) {
            out.push_back(child);
        }
        collectElements(child, ns, local, out);
    }
}

std::vector<NodeId> XMLDocument::findElements(std::string_view ns, std::string_view local) const {
    std::vector<NodeId> result;
    collectElements(kDocumentNode, ns, local, result);
    return result;
}

bool XMLDocument::isAttached(NodeId id) const {
    if (id >= nodes_.size()) {
        return false;
    }
    for (NodeId current = id; current != kDocumentNode; current = nodes_[current].parent) {
        if (current == kNoNode || nodes_[current].detached) {
            return false;
        }
    }
    return true;
}

bool XMLDocument::detach(NodeId id) {
    if (id == kDocumentNode || !isAttached(id)) {
        return false;
    }

    Node& n = nodes_[id];
    auto& siblings = nodes_[n.parent].children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), id), siblings.end());
    n.detached = true;
    return true;
}

}} // namespace cleansheet::xml
