/**
 * @file Exception.hpp
 * @brief CleanSheet异常类定义
 *
 * 异常只用于编程错误（如 XML 写入器的调用顺序错误），
 * 在组件边界处被捕获并转换为 Error。
 */

#pragma once

#include <stdexcept>
#include <string>
#include "cleansheet/core/ErrorCode.hpp"

namespace cleansheet {
namespace core {

/**
 * @brief CleanSheet基础异常类
 */
class CleanSheetException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    CleanSheetException(const std::string& message,
                        ErrorCode code = ErrorCode::InternalError,
                        const char* file = nullptr,
                        int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    /**
     * @brief 转换为 Error，供 Result 通道使用
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public CleanSheetException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常（调用顺序错误等）
 */
class OperationException : public CleanSheetException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InternalError,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

}} // namespace cleansheet::core

