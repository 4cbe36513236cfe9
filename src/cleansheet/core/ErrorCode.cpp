#include "cleansheet/core/ErrorCode.hpp"

namespace cleansheet {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误 (1-19)
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::OutOfMemory:
            return "Out of memory";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件操作错误 (20-39)
        case ErrorCode::NotFound:
            return "File not found";
        case ErrorCode::AlreadyExists:
            return "File already exists";
        case ErrorCode::AccessDenied:
            return "File access denied";
        case ErrorCode::IoFailure:
            return "I/O failure";

        // 容器格式错误 (40-59)
        case ErrorCode::Corrupt:
            return "Corrupt container";
        case ErrorCode::UnsupportedType:
            return "Unsupported file type";

        case ErrorCode::ParseFailure:
            return "XML parse failure";

        case ErrorCode::CapabilityUnsupported:
            return "Capability not supported for this format";

        default:
            return "Unknown error";
    }
}

const char* codeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::AccessDenied: return "AccessDenied";
        case ErrorCode::IoFailure: return "IoFailure";
        case ErrorCode::Corrupt: return "Corrupt";
        case ErrorCode::UnsupportedType: return "UnsupportedType";
        case ErrorCode::ParseFailure: return "ParseFailure";
        case ErrorCode::CapabilityUnsupported: return "CapabilityUnsupported";
        default: return "Unknown";
    }
}

}} // namespace cleansheet::core
