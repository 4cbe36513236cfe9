#pragma once

#include "cleansheet/core/ErrorCode.hpp"
#include <string>
#include <vector>

namespace cleansheet {
namespace core {

enum class Severity {
    Info,
    Warning,
    Error
};

const char* toString(Severity severity) noexcept;

struct Diagnostic {
    Severity severity = Severity::Info;
    ErrorCode code = ErrorCode::Ok;
    std::string message;
};

/**
 * @brief 运行期诊断记录
 *
 * 各组件把值得注意的事件（删除的条目、剪除的节点、降级处理的错误）
 * 记录在这里，同时写入日志。记录不影响控制流。
 */
class DiagnosticLog {
public:
    void report(Severity severity, ErrorCode code, const std::string& message);

    void info(const std::string& message) { report(Severity::Info, ErrorCode::Ok, message); }
    void warning(ErrorCode code, const std::string& message) { report(Severity::Warning, code, message); }
    void error(ErrorCode code, const std::string& message) { report(Severity::Error, code, message); }

    const std::vector<Diagnostic>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool hasErrors() const;
    size_t count(ErrorCode code) const;

    void clear() { entries_.clear(); }

private:
    std::vector<Diagnostic> entries_;
};

}} // namespace cleansheet::core
