#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <expat.h>
#include "cleansheet/core/Constants.hpp"

namespace cleansheet {
namespace xml {

/**
 * @brief 基于libexpat的流式XML解析器（SAX）
 *
 * 不做命名空间处理：元素名和属性名按源文本中的限定名上报，
 * xmlns 声明作为普通属性保留，便于原样重写。
 * 字符数据不裁剪，在下一个结构事件之前整段上报。
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// XML属性（指向解析器内部缓冲区，仅在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, bool in_cdata, int depth)>;
    using CommentCallback = std::function<void(std::string_view comment, int depth)>;
    using ProcessingInstructionCallback = std::function<void(std::string_view target, std::string_view data, int depth)>;
    using XmlDeclCallback = std::function<void(std::string_view version, std::string_view encoding, int standalone)>;

private:
    XML_Parser parser_ = nullptr;

    // 解析状态
    bool is_parsing_ = false;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    int last_error_line_ = 0;

    std::vector<XMLAttribute> attribute_pool_;

    // 当前累积的字符数据及其是否位于 CDATA 段内
    std::string current_text_;
    bool in_cdata_ = false;

    static constexpr size_t CHUNK_SIZE = cleansheet::core::Constants::kIOBufferSize * 8;
    static constexpr size_t MAX_DEPTH = 1024;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    CommentCallback comment_callback_;
    ProcessingInstructionCallback pi_callback_;
    XmlDeclCallback xml_decl_callback_;

    size_t bytes_parsed_ = 0;
    size_t elements_parsed_ = 0;

    // libexpat回调函数（静态）
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);
    static void XMLCALL commentHandler(void* userData, const XML_Char* data);
    static void XMLCALL processingInstructionHandler(void* userData, const XML_Char* target, const XML_Char* data);
    static void XMLCALL startCdataHandler(void* userData);
    static void XMLCALL endCdataHandler(void* userData);
    static void XMLCALL xmlDeclHandler(void* userData, const XML_Char* version, const XML_Char* encoding, int standalone);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    void flushText();
    void handleError(XMLParseError error, const std::string& message);
    void failFromExpat();

    template<typename F>
    void invokeCallback(const char* what, F&& fn);

public:
    XMLStreamReader() = default;
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }
    void setCommentCallback(CommentCallback callback) { comment_callback_ = std::move(callback); }
    void setProcessingInstructionCallback(ProcessingInstructionCallback callback) { pi_callback_ = std::move(callback); }
    void setXmlDeclCallback(XmlDeclCallback callback) { xml_decl_callback_ = std::move(callback); }

    /**
     * @brief 解析完整文档（编码由 BOM 或 XML 声明自动识别）
     */
    XMLParseError parseFromBuffer(const char* buffer, size_t size);
    XMLParseError parseFromString(std::string_view xml_content) {
        return parseFromBuffer(xml_content.data(), xml_content.size());
    }

    bool isParsing() const { return is_parsing_; }
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getLastErrorLine() const { return last_error_line_; }
    size_t getBytesParsed() const { return bytes_parsed_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    std::string getParserVersion() const;
};

}} // namespace cleansheet::xml
