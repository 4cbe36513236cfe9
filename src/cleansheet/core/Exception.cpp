/**
 * @file Exception.cpp
 * @brief CleanSheet异常类实现
 */

#include "cleansheet/core/Exception.hpp"
#include <fmt/format.h>

namespace cleansheet {
namespace core {

CleanSheetException::CleanSheetException(const std::string& message,
                                         ErrorCode code,
                                         const char* file,
                                         int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

Error CleanSheetException::toError() const {
    return Error(error_code_, what());
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : CleanSheetException(parameter_name.empty() ? message
                              : fmt::format("{} (parameter: {})", message, parameter_name),
                          ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : CleanSheetException(operation.empty() ? message
                              : fmt::format("{} (operation: {})", message, operation),
                          code, file, line)
    , operation_(operation) {
}

}} // namespace cleansheet::core
