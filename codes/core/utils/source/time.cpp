#include "utils/time.hpp"
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace clobber {
namespace utils {

uint64_t get_current_time_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

uint64_t get_monotonic_time_ms() {
    auto now = SteadyClock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

uint64_t get_monotonic_time_us() {
    auto now = SteadyClock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
}

std::string format_current_time(const char* format) {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::string format_duration(Nanos duration) {
    const int64_t ns = duration.count();
    char buf[64];
    if (ns >= 1000000000LL) {
        snprintf(buf, sizeof(buf), "%.3fs", static_cast<double>(ns) / 1e9);
    } else if (ns >= 1000000LL) {
        snprintf(buf, sizeof(buf), "%.3fms", static_cast<double>(ns) / 1e6);
    } else if (ns >= 1000LL) {
        snprintf(buf, sizeof(buf), "%.3fus", static_cast<double>(ns) / 1e3);
    } else {
        snprintf(buf, sizeof(buf), "%lldns", static_cast<long long>(ns));
    }
    return buf;
}

// StopWatch implementation
StopWatch::StopWatch() {
    reset();
}

void StopWatch::reset() {
    start_ = SteadyClock::now();
}

uint64_t StopWatch::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed()).count();
}

uint64_t StopWatch::elapsed_us() const {
    return std::chrono::duration_cast<std::chrono::microseconds>(elapsed()).count();
}

Nanos StopWatch::elapsed() const {
    return std::chrono::duration_cast<Nanos>(SteadyClock::now() - start_);
}

// TimeoutChecker implementation
TimeoutChecker::TimeoutChecker(uint64_t timeout_ms)
    : timeout_ms_(timeout_ms)
    , start_time_ms_(get_monotonic_time_ms())
{
}

bool TimeoutChecker::is_timeout() const {
    return remaining_ms() == 0;
}

uint64_t TimeoutChecker::remaining_ms() const {
    uint64_t elapsed = get_monotonic_time_ms() - start_time_ms_;
    if (elapsed >= timeout_ms_) {
        return 0;
    }
    return timeout_ms_ - elapsed;
}

void TimeoutChecker::reset() {
    start_time_ms_ = get_monotonic_time_ms();
}

} // namespace utils
} // namespace clobber
