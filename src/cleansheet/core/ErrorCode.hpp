#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace cleansheet {
namespace core {

/**
 * @brief CleanSheet统一错误码
 *
 * 致命错误终止本次运行；ParseFailure 与 CapabilityUnsupported
 * 只在单个条目或单项能力上降级处理，不影响运行结果。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    OutOfMemory = 2,
    InternalError = 3,

    // 文件操作错误 (20-39)
    NotFound = 20,
    AlreadyExists = 21,
    AccessDenied = 22,
    IoFailure = 23,

    // 容器格式错误 (40-59)
    Corrupt = 40,
    UnsupportedType = 41,

    // XML处理错误 (60-79)
    ParseFailure = 60,

    // 能力状态 (80-89)
    CapabilityUnsupported = 80
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    explicit operator bool() const noexcept { return isError(); }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码名称（用于日志，如 "AlreadyExists"）
 */
const char* codeName(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}} // namespace cleansheet::core
