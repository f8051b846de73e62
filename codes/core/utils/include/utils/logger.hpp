#pragma once

#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstdarg>

namespace clobber {
namespace utils {

// 日志级别枚举
enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// 日志级别转字符串
const char* log_level_to_string(LogLevel level);

// 字符串转日志级别（不区分大小写，未知值返回INFO）
LogLevel string_to_log_level(const std::string& str);

// 命令行 -v 次数转日志级别：0-WARN，1-INFO，>=2-DEBUG
LogLevel verbosity_to_log_level(int verbosity);

class Logger {
public:
    // 获取单例
    static Logger& instance();

    // ========== 初始化与配置 ==========

    // 初始化日志系统
    // level: 日志级别
    // file: 日志文件路径（追加写），为空则只输出到控制台
    // return: 0-成功，-1-日志文件打开失败
    int init(LogLevel level, const std::string& file = "");

    // 设置日志级别
    void set_level(LogLevel level);

    // 获取当前日志级别
    LogLevel get_level() const;

    // 设置日志文件，为空关闭文件输出
    // return: 0-成功
    int set_file(const std::string& file);

    // 启用/禁用控制台输出
    void set_console_output(bool enabled);

    // 设置日志格式
    // 支持占位符: %time %level %module %message %thread
    // 默认格式: "[%time] [%level] [%module] %message"
    void set_format(const std::string& format);

    // ========== 日志输出 ==========

    // printf风格输出
    void log(LogLevel level, const char* module, const char* fmt, ...);

    void debug(const char* module, const char* fmt, ...);
    void info(const char* module, const char* fmt, ...);
    void warn(const char* module, const char* fmt, ...);
    void error(const char* module, const char* fmt, ...);

    // 检查某级别是否启用
    bool is_level_enabled(LogLevel level) const;

    // ========== 刷新与关闭 ==========

    void flush();

    void shutdown();

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logv(LogLevel level, const char* module, const char* fmt, va_list args);
    void format_and_write(LogLevel level, const char* module, const char* message);
    void close_file_locked();

    std::atomic<LogLevel> level_;
    std::mutex mutex_;
    std::ofstream file_;
    bool console_enabled_;
    std::string format_;
};

} // namespace utils
} // namespace clobber

// ========== 便捷宏 ==========

#define LOG_DEBUG(module, fmt, ...) \
    do { \
        auto& logger_ = ::clobber::utils::Logger::instance(); \
        if (logger_.is_level_enabled(::clobber::utils::LogLevel::DEBUG)) { \
            logger_.debug(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(module, fmt, ...) \
    do { \
        auto& logger_ = ::clobber::utils::Logger::instance(); \
        if (logger_.is_level_enabled(::clobber::utils::LogLevel::INFO)) { \
            logger_.info(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_WARN(module, fmt, ...) \
    do { \
        auto& logger_ = ::clobber::utils::Logger::instance(); \
        if (logger_.is_level_enabled(::clobber::utils::LogLevel::WARN)) { \
            logger_.warn(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(module, fmt, ...) \
    do { \
        auto& logger_ = ::clobber::utils::Logger::instance(); \
        if (logger_.is_level_enabled(::clobber::utils::LogLevel::ERROR)) { \
            logger_.error(module, fmt, ##__VA_ARGS__); \
        } \
    } while(0)
