#pragma once

#include "cleansheet/core/SanitizeOptions.hpp"
#include "cleansheet/core/Diagnostics.hpp"
#include "cleansheet/opc/FormatProfile.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cleansheet {
namespace opc {

enum class TransformAction {
    Unchanged,   // 原样写入源字节
    Replace,     // 写入 bytes
    Drop         // 不写入任何条目
};

const char* toString(TransformAction action) noexcept;

struct TransformOutcome {
    TransformAction action = TransformAction::Unchanged;
    std::string bytes;
    size_t nodes_removed = 0;

    static TransformOutcome unchanged() { return TransformOutcome{}; }
    static TransformOutcome drop() { return TransformOutcome{TransformAction::Drop, std::string(), 0}; }
    static TransformOutcome replace(std::string data, size_t removed) {
        return TransformOutcome{TransformAction::Replace, std::move(data), removed};
    }
};

/**
 * @brief 单个条目的转换决策
 *
 * 宏条目直接丢弃；描述条目解析后剪除隐藏节点再按原编码序列化。
 * 解析或序列化失败时保留原内容并记录 ParseFailure 诊断，不向外抛异常。
 */
class EntryTransformer {
public:
    EntryTransformer(const core::SanitizeOptions& options,
                     const FormatProfile& profile,
                     core::DiagnosticLog& diagnostics)
        : options_(options), profile_(profile), diagnostics_(diagnostics) {}

    /**
     * @brief 该条目是否需要经过 transform()
     */
    bool isTarget(std::string_view entry_name) const;

    TransformOutcome transform(std::string_view entry_name, std::string_view raw_bytes) const;

    TransformOutcome transform(std::string_view entry_name, const std::vector<uint8_t>& raw_bytes) const {
        return transform(entry_name, std::string_view(reinterpret_cast<const char*>(raw_bytes.data()), raw_bytes.size()));
    }

private:
    const core::SanitizeOptions& options_;
    const FormatProfile& profile_;
    core::DiagnosticLog& diagnostics_;

    bool isMacroEntry(std::string_view entry_name) const;
    bool isDescriptorEntry(std::string_view entry_name) const;
    TransformOutcome pruneDescriptor(std::string_view entry_name, std::string_view raw_bytes) const;
};

}} // namespace cleansheet::opc
