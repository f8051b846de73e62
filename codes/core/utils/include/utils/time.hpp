#pragma once

#include <cstdint>
#include <string>
#include <chrono>

namespace clobber {
namespace utils {

// 压测内部统一使用单调时钟
using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Nanos = std::chrono::nanoseconds;

// ========== 时间获取函数 ==========

// 获取当前时间戳（毫秒，自Unix纪元）
uint64_t get_current_time_ms();

// 获取单调时间戳（毫秒，不受系统时间修改影响）
uint64_t get_monotonic_time_ms();

// 获取单调时间戳（微秒）
uint64_t get_monotonic_time_us();

// ========== 时间格式化 ==========

// 格式化当前时间为字符串
// format: strftime格式字符串，默认 "%Y-%m-%d %H:%M:%S"
std::string format_current_time(const char* format = "%Y-%m-%d %H:%M:%S");

// 把纳秒时长格式化成便于阅读的字符串，如 "1.5s"、"250ms"、"40us"
std::string format_duration(Nanos duration);

// ========== 时间工具类 ==========

// 计时器类，用于测量耗时
class StopWatch {
public:
    StopWatch();
    ~StopWatch() = default;

    void reset();

    uint64_t elapsed_ms() const;
    uint64_t elapsed_us() const;
    Nanos elapsed() const;

private:
    TimePoint start_;
};

// 超时检测器
class TimeoutChecker {
public:
    // timeout_ms: 超时时间（毫秒）
    explicit TimeoutChecker(uint64_t timeout_ms);
    ~TimeoutChecker() = default;

    bool is_timeout() const;

    // 获取剩余时间（毫秒），返回0表示已超时
    uint64_t remaining_ms() const;

    void reset();

private:
    uint64_t timeout_ms_;
    uint64_t start_time_ms_;
};

} // namespace utils
} // namespace clobber
