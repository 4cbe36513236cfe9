/**
 * @file XMLDocument.hpp
 * @brief 索引式XML文档树
 */

#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "cleansheet/core/Expected.hpp"

namespace cleansheet {
namespace xml {

using NodeId = uint32_t;
constexpr NodeId kNoNode = std::numeric_limits<NodeId>::max();

enum class NodeKind {
    Document,
    Element,
    Text,
    CData,
    Comment,
    ProcessingInstruction
};

// 源文档字符编码
enum class TextEncoding {
    UTF8,
    UTF16LE,
    UTF16BE
};

struct NodeAttribute {
    std::string name;   // 源文本中的限定名，如 "table:display"
    std::string value;
};

struct Node {
    NodeKind kind = NodeKind::Element;
    std::string name;    // 元素限定名 / PI 目标
    std::string value;   // 文本、CDATA、注释内容 / PI 数据
    std::vector<NodeAttribute> attributes;
    NodeId parent = kNoNode;
    std::vector<NodeId> children;
    bool detached = false;
};

/**
 * @brief 解析后的XML文档
 *
 * 节点存放在连续数组中，以下标互相引用，0 号节点是文档节点。
 * 摘除节点只把下标从父节点的子列表中移除，节点本身及其 parent 仍保留，
 * 所以已摘除子树里的命名空间解析照常可用。
 *
 * 序列化时按源文档的编码输出：UTF-8（保留源 BOM），或带源字节序 BOM 的 UTF-16。
 * 其他声明编码（如 ISO-8859-1）由 expat 解码后统一改写为 UTF-8。
 * DOCTYPE 和根元素之外的空白不保留。
 */
class XMLDocument {
public:
    static constexpr NodeId kDocumentNode = 0;

    static constexpr const char* XML_NAMESPACE = "http://www.w3.org/XML/1998/namespace";

    XMLDocument();

    /**
     * @brief 解析字节序列
     * @return 失败时错误码为 ParseFailure，消息包含行列号
     */
    static core::Result<XMLDocument> parse(std::string_view bytes);

    /**
     * @brief 序列化为源编码的字节序列
     */
    core::Result<std::string> serialize() const;

    const Node& node(NodeId id) const { return nodes_.at(id); }
    size_t nodeCount() const { return nodes_.size(); }

    /**
     * @brief 文档元素（根元素），不存在时返回 kNoNode
     */
    NodeId rootElement() const;

    /**
     * @brief 限定名中的本地名部分
     */
    static std::string_view localName(std::string_view qualified_name);

    /**
     * @brief 元素的命名空间URI，无命名空间或前缀未声明时返回空串
     */
    std::string namespaceOf(NodeId element) const;

    /**
     * @brief 按命名空间和本地名查找属性值
     *
     * 不带前缀的属性不属于任何命名空间（即使元素有默认命名空间）。
     * @return 属性不存在时返回 nullptr
     */
    const std::string* attribute(NodeId element, std::string_view ns, std::string_view local) const;

    /**
     * @brief 按文档顺序查找所有仍挂在树上的匹配元素（任意深度）
     */
    std::vector<NodeId> findElements(std::string_view ns, std::string_view local) const;

    /**
     * @brief 从父节点摘除
     * @return 节点已被摘除（或祖先已被摘除）时返回 false，不做任何修改
     */
    bool detach(NodeId id);

    /**
     * @brief 节点是否仍可从文档节点到达
     */
    bool isAttached(NodeId id) const;

    TextEncoding encoding() const { return encoding_; }
    bool hasByteOrderMark() const { return has_bom_; }
    const std::string& declaredEncoding() const { return declared_encoding_; }

private:
    std::vector<Node> nodes_;

    // XML 声明
    bool has_declaration_ = false;
    std::string version_;
    std::string declared_encoding_;
    int standalone_ = -1;

    TextEncoding encoding_ = TextEncoding::UTF8;
    bool has_bom_ = false;

    NodeId appendNode(NodeId parent, NodeKind kind);
    std::string resolvePrefix(NodeId element, std::string_view prefix) const;
    void collectElements(NodeId id, std::string_view ns, std::string_view local,
                         std::vector<NodeId>& out) const;
    void detectEncoding(std::string_view bytes);
};

}} // namespace cleansheet::xml
