#include "cleansheet/xml/XMLStreamWriter.hpp"
#include "cleansheet/core/Exception.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"

namespace cleansheet {
namespace xml {

XMLStreamWriter::XMLStreamWriter() {
    buffer_.setFlushCallback([this](const char* data, size_t length) {
        flushToOutput(data, length);
    });
    pending_attributes_.reserve(16);
}

void XMLStreamWriter::flushToOutput(const char* data, size_t length) {
    if (length == 0) return;
    bytes_written_ += length;
    memory_buffer_.append(data, length);
}

void XMLStreamWriter::writeDeclaration(std::string_view version, std::string_view encoding, int standalone) {
    buffer_.append("<?xml version=\"");
    buffer_.append(version.empty() ? std::string_view("1.0") : version);
    buffer_.append('"');
    if (!encoding.empty()) {
        buffer_.append(" encoding=\"");
        buffer_.append(encoding);
        buffer_.append('"');
    }
    if (standalone >= 0) {
        buffer_.append(standalone ? " standalone=\"yes\"" : " standalone=\"no\"");
    }
    buffer_.append("?>\n");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        XML_WARN("Auto-closing unclosed element: {}", element_stack_.top());
        endElement();
    }
    flush();
}

void XMLStreamWriter::startElement(const std::string& name) {
    if (name.empty()) {
        throw core::ParameterException("Element name cannot be empty", "name", __FILE__, __LINE__);
    }

    ensureElementClosed();

    buffer_.append('<');
    buffer_.append(name);
    element_stack_.push(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        throw core::OperationException("No element to close", "endElement",
                                       core::ErrorCode::InternalError, __FILE__, __LINE__);
    }

    std::string element_name = std::move(element_stack_.top());
    element_stack_.pop();

    if (in_element_) {
        // 自闭合元素
        writeAttributesToBuffer();
        buffer_.append("/>");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_name);
        buffer_.append('>');
    }
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    if (!in_element_) {
        throw core::OperationException("Cannot write attribute outside of element", "writeAttribute",
                                       core::ErrorCode::InternalError, __FILE__, __LINE__);
    }
    if (name.empty()) {
        throw core::ParameterException("Attribute name cannot be empty", "name", __FILE__, __LINE__);
    }

    pending_attributes_.emplace_back(name, std::string(value));
}

void XMLStreamWriter::writeText(std::string_view text) {
    if (text.empty()) {
        return;
    }
    ensureElementClosed();
    writeEscapedText(text);
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    ensureElementClosed();
    buffer_.append(data);
}

void XMLStreamWriter::writeCDATA(std::string_view data) {
    ensureElementClosed();
    buffer_.append(XMLEscapes::CDATA_OPEN);

    size_t start = 0;
    size_t pos = 0;
    while ((pos = data.find("]]>", start)) != std::string_view::npos) {
        buffer_.append(data.substr(start, pos - start));
        buffer_.append(XMLEscapes::CDATA_SPLIT);
        start = pos + 3;
    }
    buffer_.append(data.substr(start));

    buffer_.append(XMLEscapes::CDATA_CLOSE);
}

void XMLStreamWriter::writeComment(std::string_view comment) {
    ensureElementClosed();
    buffer_.append("<!--");
    buffer_.append(comment);
    buffer_.append("-->");
}

void XMLStreamWriter::writeProcessingInstruction(std::string_view target, std::string_view data) {
    ensureElementClosed();
    buffer_.append("<?");
    buffer_.append(target);
    if (!data.empty()) {
        buffer_.append(' ');
        buffer_.append(data);
    }
    buffer_.append("?>");
}

void XMLStreamWriter::flush() {
    buffer_.flush();
}

void XMLStreamWriter::clear() {
    buffer_.clear();
    while (!element_stack_.empty()) {
        element_stack_.pop();
    }
    in_element_ = false;
    pending_attributes_.clear();
    memory_buffer_.clear();
    bytes_written_ = 0;
}

std::string XMLStreamWriter::toString() {
    flush();
    return memory_buffer_;
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_.append(' ');
        buffer_.append(attr.key);
        buffer_.append("=\"");
        writeEscapedAttribute(attr.value);
        buffer_.append('"');
    }
    pending_attributes_.clear();
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.append('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::writeEscapedAttribute(std::string_view value) {
    size_t run_start = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        const char* replacement = nullptr;
        size_t replacement_len = 0;
        switch (value[i]) {
            case '&':  replacement = XMLEscapes::AMP;  replacement_len = XMLEscapes::AMP_LEN;  break;
            case '<':  replacement = XMLEscapes::LT;   replacement_len = XMLEscapes::LT_LEN;   break;
            case '>':  replacement = XMLEscapes::GT;   replacement_len = XMLEscapes::GT_LEN;   break;
            case '"':  replacement = XMLEscapes::QUOT; replacement_len = XMLEscapes::QUOT_LEN; break;
            case '\n': replacement = XMLEscapes::NL;   replacement_len = XMLEscapes::NL_LEN;   break;
            case '\r': replacement = XMLEscapes::CR;   replacement_len = XMLEscapes::CR_LEN;   break;
            case '\t': replacement = XMLEscapes::TAB;  replacement_len = XMLEscapes::TAB_LEN;  break;
            default: continue;
        }
        buffer_.append(value.data() + run_start, i - run_start);
        buffer_.append(replacement, replacement_len);
        run_start = i + 1;
    }
    buffer_.append(value.data() + run_start, value.size() - run_start);
}

void XMLStreamWriter::writeEscapedText(std::string_view text) {
    size_t run_start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char* replacement = nullptr;
        size_t replacement_len = 0;
        switch (text[i]) {
            case '&':  replacement = XMLEscapes::AMP; replacement_len = XMLEscapes::AMP_LEN; break;
            case '<':  replacement = XMLEscapes::LT;  replacement_len = XMLEscapes::LT_LEN;  break;
            case '>':  replacement = XMLEscapes::GT;  replacement_len = XMLEscapes::GT_LEN;  break;
            case '\r': replacement = XMLEscapes::CR;  replacement_len = XMLEscapes::CR_LEN;  break;
            default: continue;
        }
        buffer_.append(text.data() + run_start, i - run_start);
        buffer_.append(replacement, replacement_len);
        run_start = i + 1;
    }
    buffer_.append(text.data() + run_start, text.size() - run_start);
}

}} // namespace cleansheet::xml
