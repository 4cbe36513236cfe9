#include "cleansheet/core/Diagnostics.hpp"
#include "cleansheet/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace cleansheet {
namespace core {

const char* toString(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

void DiagnosticLog::report(Severity severity, ErrorCode code, const std::string& message) {
    switch (severity) {
        case Severity::Info:
            CORE_INFO("{}", message);
            break;
        case Severity::Warning:
            CORE_WARN("{} ({})", message, codeName(code));
            break;
        case Severity::Error:
            CORE_ERROR("{} ({})", message, codeName(code));
            break;
    }
    entries_.push_back(Diagnostic{severity, code, message});
}

bool DiagnosticLog::hasErrors() const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [](const Diagnostic& d) { return d.severity == Severity::Error; });
}

size_t DiagnosticLog::count(ErrorCode code) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [code](const Diagnostic& d) { return d.code == code; }));
}

}} // namespace cleansheet::core
