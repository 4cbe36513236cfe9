#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <memory>
#include <string>
#include <fstream>
#include <iostream>
#include <mutex>
#include <chrono>
#include <vector>
#include <atomic>
#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef ERROR
#undef ERROR
#endif

namespace cleansheet {

/**
 * @brief 进程级日志器
 *
 * 控制台输出带颜色，文件输出按大小滚动。日志文件路径为空时只输出到控制台。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "",
                   Level level = Level::INFO,
                   bool enable_console = true,
                   size_t max_file_size = 10 * 1024 * 1024,
                   size_t max_files = 5,
                   WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }

    void flush();
    void shutdown();

    /**
     * @brief 带源码位置的日志入口，供 CLEANSHEET_LOG_* 宏使用
     *
     * 位置前缀与消息分开格式化，没有参数时消息按原文输出。
     */
    template<typename... Args>
    void logAt(Level level, const char* file, int line, const char* func,
               const std::string& fmt_str, const Args&... args) {
        if (!should_log(level)) {
            return;
        }
        std::string message = locationPrefix(file, line, func);
        if constexpr (sizeof...(Args) == 0) {
            message += fmt_str;
        } else {
            message += safe_format(fmt_str, args...);
        }
        write(level, message);
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void write(Level level, const std::string& message);
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    void flush_streams();   // 调用方持有 mutex_
    std::string format_message(Level level, const std::string& message) const;
    std::string level_to_string(Level level) const;
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 格式串与参数不匹配时退回原始格式串
    template<typename... Args>
    static std::string safe_format(const std::string& fmt_str, const Args&... args) {
        try {
            return fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            return fmt_str;
        }
    }

    static std::string locationPrefix(const char* file, int line, const char* func);

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    std::atomic<size_t> current_file_size_{0};
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

// 跨编译器的函数签名宏，使用简洁的函数名而不是完整签名
#if defined(_MSC_VER)
#  define CLEANSHEET_FUNC __FUNCTION__
#elif defined(__GNUC__) || defined(__clang__)
#  define CLEANSHEET_FUNC __FUNCTION__
#else
#  define CLEANSHEET_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define CLEANSHEET_LOG_TRACE(fmt, ...) \
    cleansheet::Logger::getInstance().logAt(cleansheet::Logger::Level::TRACE, __FILE__, __LINE__, CLEANSHEET_FUNC, fmt, ##__VA_ARGS__)
#define CLEANSHEET_LOG_DEBUG(fmt, ...) \
    cleansheet::Logger::getInstance().logAt(cleansheet::Logger::Level::DEBUG, __FILE__, __LINE__, CLEANSHEET_FUNC, fmt, ##__VA_ARGS__)
#define CLEANSHEET_LOG_INFO(fmt, ...) \
    cleansheet::Logger::getInstance().logAt(cleansheet::Logger::Level::INFO, __FILE__, __LINE__, CLEANSHEET_FUNC, fmt, ##__VA_ARGS__)
#define CLEANSHEET_LOG_WARN(fmt, ...) \
    cleansheet::Logger::getInstance().logAt(cleansheet::Logger::Level::WARN, __FILE__, __LINE__, CLEANSHEET_FUNC, fmt, ##__VA_ARGS__)
#define CLEANSHEET_LOG_ERROR(fmt, ...) \
    cleansheet::Logger::getInstance().logAt(cleansheet::Logger::Level::ERROR, __FILE__, __LINE__, CLEANSHEET_FUNC, fmt, ##__VA_ARGS__)
#define CLEANSHEET_LOG_CRITICAL(fmt, ...) \
    cleansheet::Logger::getInstance().logAt(cleansheet::Logger::Level::CRITICAL, __FILE__, __LINE__, CLEANSHEET_FUNC, fmt, ##__VA_ARGS__)

} // namespace cleansheet
