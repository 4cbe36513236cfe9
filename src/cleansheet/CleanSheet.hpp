#pragma once

// CleanSheet - 电子表格清理库
// 删除宏与隐藏工作表，其余内容原样保留

#include <string>

#include "cleansheet/core/ErrorCode.hpp"
#include "cleansheet/core/Expected.hpp"
#include "cleansheet/core/Path.hpp"
#include "cleansheet/core/SanitizeOptions.hpp"
#include "cleansheet/core/Diagnostics.hpp"
#include "cleansheet/utils/Logger.hpp"

// 版本信息
#define CLEANSHEET_VERSION_MAJOR 1
#define CLEANSHEET_VERSION_MINOR 0
#define CLEANSHEET_VERSION_PATCH 0
#define CLEANSHEET_VERSION_STRING "1.0.0"

// 平台检测
#ifdef _WIN32
    #define CLEANSHEET_WINDOWS
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#elif defined(__linux__)
    #define CLEANSHEET_LINUX
#elif defined(__APPLE__)
    #define CLEANSHEET_MACOS
#endif

// 导出宏定义
#ifdef CLEANSHEET_WINDOWS
    #ifdef CLEANSHEET_SHARED
        #ifdef CLEANSHEET_EXPORTS
            #define CLEANSHEET_API __declspec(dllexport)
        #else
            #define CLEANSHEET_API __declspec(dllimport)
        #endif
    #else
        #define CLEANSHEET_API
    #endif
#else
    #define CLEANSHEET_API
#endif

namespace cleansheet {

inline std::string getVersion() {
    return CLEANSHEET_VERSION_STRING;
}

/**
 * @brief 日志设置
 */
struct LogSettings {
    Logger::Level level = Logger::Level::INFO;
    std::string log_file;        // 为空时不写文件
    bool enable_console = true;
};

/**
 * @brief 初始化CleanSheet库（日志系统）
 * @return 初始化是否成功
 */
CLEANSHEET_API bool initialize(const LogSettings& settings = LogSettings{});

/**
 * @brief 刷新并关闭日志
 */
CLEANSHEET_API void cleanup();

/**
 * @brief 清理一个电子表格文件
 *
 * 按输入扩展名选择处理流程（xlsx/xlsm、ods、csv）。
 * 可恢复的问题（如描述条目无法解析）记录到 diagnostics 而不是返回错误。
 */
CLEANSHEET_API core::VoidResult sanitize(const core::Path& input,
                                         const core::Path& output,
                                         const core::SanitizeOptions& options,
                                         core::DiagnosticLog& diagnostics);

CLEANSHEET_API core::VoidResult sanitize(const core::Path& input,
                                         const core::Path& output,
                                         const core::SanitizeOptions& options);

} // namespace cleansheet
