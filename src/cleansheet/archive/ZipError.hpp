#pragma once

namespace cleansheet {
namespace archive {

// 错误码枚举
enum class ZipError {
    Ok,                    // 操作成功
    NotOpen,               // ZIP 文件未打开
    IoFail,                // I/O 操作失败
    BadFormat,             // ZIP 格式错误（签名、截断）
    CrcMismatch,           // 条目内容与 CRC-32 不符
    TooLarge,              // 条目太大，无法载入内存
    FileNotFound,          // 文件或条目未找到
    EndOfEntries,          // 遍历已到末尾
    InvalidParameter,      // 无效参数
    CompressionFail,       // 压缩失败
    InternalError          // 内部错误
};

// 只有 ZipError::Ok 被视为成功
constexpr bool operator!(ZipError error) noexcept {
    return error != ZipError::Ok;
}

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

inline const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok:               return "ok";
        case ZipError::NotOpen:          return "archive not open";
        case ZipError::IoFail:           return "I/O failure";
        case ZipError::BadFormat:        return "bad archive format";
        case ZipError::CrcMismatch:      return "CRC mismatch";
        case ZipError::TooLarge:         return "entry too large";
        case ZipError::FileNotFound:     return "not found";
        case ZipError::EndOfEntries:     return "end of entries";
        case ZipError::InvalidParameter: return "invalid parameter";
        case ZipError::CompressionFail:  return "compression failure";
        case ZipError::InternalError:    return "internal error";
    }
    return "unknown";
}

}} // namespace cleansheet::archive
