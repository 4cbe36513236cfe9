#pragma once

#include "cleansheet/xml/XMLDocument.hpp"
#include "cleansheet/opc/FormatProfile.hpp"
#include <string>
#include <vector>

namespace cleansheet {
namespace xml {

struct PruneResult {
    size_t removed = 0;
    std::vector<std::string> removed_labels;
};

/**
 * @brief 按格式描述剪除文档中的隐藏工作表/表格节点
 *
 * 先按文档顺序收集所有隐藏候选，再逐个摘除；已被摘除（或祖先已被摘除）
 * 的节点跳过且不计数。不做任何 I/O。
 */
class HiddenNodePruner {
public:
    explicit HiddenNodePruner(const opc::FormatProfile& profile)
        : profile_(profile) {}

    PruneResult prune(XMLDocument& document) const;

    /**
     * @brief 元素是否被标记为隐藏（缺省属性值按 profile 默认值处理）
     */
    bool isHidden(const XMLDocument& document, NodeId element) const;

    /**
     * @brief 诊断用标签：第一个存在的标识属性值，否则 "#<候选序号>"
     */
    std::string label(const XMLDocument& document, NodeId element, size_t traversal_index) const;

private:
    const opc::FormatProfile& profile_;
};

}} // namespace cleansheet::xml
