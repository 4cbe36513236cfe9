/**
 * @file XMLStreamWriter.hpp
 * @brief 缓冲式XML流写入器
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <stack>

#include "cleansheet/utils/SafeBuffer.hpp"
#include "cleansheet/core/Constants.hpp"
#include "cleansheet/xml/XMLEscapes.hpp"

namespace cleansheet {
namespace xml {

/**
 * @brief XML流写入器，输出到内存
 *
 * 属性先缓存，元素闭合时统一写出；没有子节点的元素写成自闭合形式。
 * 调用顺序错误（如在元素外写属性）抛出 OperationException。
 */
class XMLStreamWriter {
private:
    static constexpr size_t DEFAULT_BUFFER_SIZE = cleansheet::core::Constants::kIOBufferSize;

    utils::SafeBuffer<DEFAULT_BUFFER_SIZE> buffer_;

    std::stack<std::string> element_stack_;
    bool in_element_ = false;

    struct PendingAttribute {
        std::string key;
        std::string value;

        PendingAttribute(std::string k, std::string v)
            : key(std::move(k)), value(std::move(v)) {}
    };
    std::vector<PendingAttribute> pending_attributes_;

    std::string memory_buffer_;
    size_t bytes_written_ = 0;

    void flushToOutput(const char* data, size_t length);
    void writeAttributesToBuffer();
    void ensureElementClosed();

    void writeEscapedAttribute(std::string_view value);
    void writeEscapedText(std::string_view text);

public:
    XMLStreamWriter();
    ~XMLStreamWriter() = default;

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    /**
     * @brief 写出 XML 声明
     * @param standalone -1 省略，0 为 "no"，1 为 "yes"
     */
    void writeDeclaration(std::string_view version, std::string_view encoding, int standalone = -1);

    /**
     * @brief 文档结束：关闭所有未闭合元素并刷新
     */
    void endDocument();

    void startElement(const std::string& name);
    void endElement();

    void writeAttribute(const std::string& name, std::string_view value);

    void writeText(std::string_view text);
    void writeRaw(std::string_view data);
    void writeCDATA(std::string_view data);
    void writeComment(std::string_view comment);
    void writeProcessingInstruction(std::string_view target, std::string_view data);

    void flush();
    void clear();

    /**
     * @brief 获取输出结果
     */
    std::string toString();

    size_t getBytesWritten() const { return bytes_written_; }
    size_t getOpenElementCount() const { return element_stack_.size(); }
};

}} // namespace cleansheet::xml
