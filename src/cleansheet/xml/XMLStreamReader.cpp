#include "cleansheet/xml/XMLStreamReader.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cstring>
#include <fmt/format.h>

namespace cleansheet {
namespace xml {

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    // 编码参数为空：按 BOM / XML 声明自动识别
    parser_ = XML_ParserCreate(nullptr);
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    XML_SetCommentHandler(parser_, commentHandler);
    XML_SetProcessingInstructionHandler(parser_, processingInstructionHandler);
    XML_SetCdataSectionHandler(parser_, startCdataHandler, endCdataHandler);
    XML_SetXmlDeclHandler(parser_, xmlDeclHandler);

    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    is_parsing_ = false;
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    last_error_line_ = 0;
    attribute_pool_.clear();
    current_text_.clear();
    in_cdata_ = false;
    bytes_parsed_ = 0;
    elements_parsed_ = 0;
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();

    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Empty XML input");
        return last_error_;
    }

    if (!initializeParser()) {
        return last_error_;
    }

    is_parsing_ = true;

    // 分块送入 expat，避免单次长度超过 int 范围
    size_t offset = 0;
    while (offset < size) {
        size_t chunk = std::min(CHUNK_SIZE, size - offset);
        bool is_final = offset + chunk == size;

        void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(chunk));
        if (!expat_buffer) {
            handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
            break;
        }
        std::memcpy(expat_buffer, buffer + offset, chunk);

        if (XML_ParseBuffer(parser_, static_cast<int>(chunk), is_final ? 1 : 0) == XML_STATUS_ERROR) {
            // 回调中主动停止时错误已记录
            if (last_error_ == XMLParseError::Ok) {
                failFromExpat();
            }
            break;
        }

        offset += chunk;
        bytes_parsed_ = offset;
    }

    is_parsing_ = false;
    cleanupParser();

    if (last_error_ == XMLParseError::Ok) {
        XML_DEBUG("Parsed {} bytes, {} elements", bytes_parsed_, elements_parsed_);
    }
    return last_error_;
}

std::string XMLStreamReader::getParserVersion() const {
    return XML_ExpatVersion();
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_DEBUG("XML parse error: {}", message);
}

void XMLStreamReader::failFromExpat() {
    last_error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
    handleError(XMLParseError::ParseFailed,
                fmt::format("Parse error at line {}, column {}: {}",
                            XML_GetCurrentLineNumber(parser_),
                            XML_GetCurrentColumnNumber(parser_),
                            XML_ErrorString(XML_GetErrorCode(parser_))));
}

template<typename F>
void XMLStreamReader::invokeCallback(const char* what, F&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", what, e.what()));
        XML_StopParser(parser_, XML_FALSE);
    }
}

void XMLStreamReader::flushText() {
    if (current_text_.empty()) {
        return;
    }
    if (text_callback_) {
        invokeCallback("Text", [this] { text_callback_(current_text_, in_cdata_, current_depth_); });
    }
    current_text_.clear();
}

// libexpat回调函数实现
void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();

    if (static_cast<size_t>(reader->current_depth_) >= MAX_DEPTH) {
        reader->handleError(XMLParseError::ParseFailed,
                            fmt::format("Element nesting deeper than {} levels", MAX_DEPTH));
        XML_StopParser(reader->parser_, XML_FALSE);
        return;
    }

    reader->elements_parsed_++;

    reader->attribute_pool_.clear();
    for (size_t i = 0; attrs && attrs[i]; i += 2) {
        reader->attribute_pool_.emplace_back(std::string_view(attrs[i]), std::string_view(attrs[i + 1]));
    }

    if (reader->start_element_callback_) {
        std::string_view element_name{name, std::strlen(name)};
        reader->invokeCallback("Start element", [reader, element_name] {
            reader->start_element_callback_(element_name, reader->attribute_pool_, reader->current_depth_);
        });
    }

    reader->current_depth_++;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();

    reader->current_depth_--;

    if (reader->end_element_callback_) {
        std::string_view element_name{name, std::strlen(name)};
        reader->invokeCallback("End element", [reader, element_name] {
            reader->end_element_callback_(element_name, reader->current_depth_);
        });
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

void XMLCALL XMLStreamReader::commentHandler(void* userData, const XML_Char* data) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();

    if (reader->comment_callback_) {
        std::string_view comment{data, std::strlen(data)};
        reader->invokeCallback("Comment", [reader, comment] {
            reader->comment_callback_(comment, reader->current_depth_);
        });
    }
}

void XMLCALL XMLStreamReader::processingInstructionHandler(void* userData, const XML_Char* target, const XML_Char* data) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();

    if (reader->pi_callback_) {
        std::string_view target_view{target, std::strlen(target)};
        std::string_view data_view = data ? std::string_view{data, std::strlen(data)} : std::string_view{};
        reader->invokeCallback("Processing instruction", [reader, target_view, data_view] {
            reader->pi_callback_(target_view, data_view, reader->current_depth_);
        });
    }
}

void XMLCALL XMLStreamReader::startCdataHandler(void* userData) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    reader->flushText();
    reader->in_cdata_ = true;
}

void XMLCALL XMLStreamReader::endCdataHandler(void* userData) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    // 空 CDATA 段也要上报，保持结构
    if (reader->current_text_.empty() && reader->text_callback_) {
        reader->invokeCallback("Text", [reader] {
            reader->text_callback_(std::string_view{}, true, reader->current_depth_);
        });
    }
    reader->flushText();
    reader->in_cdata_ = false;
}

void XMLCALL XMLStreamReader::xmlDeclHandler(void* userData, const XML_Char* version, const XML_Char* encoding, int standalone) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    // 文本声明（外部实体）没有 version，只处理文档声明
    if (!version || !reader->xml_decl_callback_) {
        return;
    }
    std::string_view version_view{version, std::strlen(version)};
    std::string_view encoding_view = encoding ? std::string_view{encoding, std::strlen(encoding)} : std::string_view{};
    reader->invokeCallback("XML declaration", [reader, version_view, encoding_view, standalone] {
        reader->xml_decl_callback_(version_view, encoding_view, standalone);
    });
}

}} // namespace cleansheet::xml
