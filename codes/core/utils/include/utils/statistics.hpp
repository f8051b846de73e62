#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace clobber {
namespace utils {

// 一次压测的汇总统计
struct LoadSummary {
    uint64_t iterations = 0;          // 完成的 connect/write/read 循环次数（含失败）
    uint64_t successful_requests = 0; // 三个阶段都成功的次数
    uint64_t connects = 0;
    uint64_t connect_timeouts = 0;
    uint64_t connect_errors = 0;
    uint64_t write_errors = 0;
    uint64_t read_timeouts = 0;
    uint64_t read_errors = 0;
    uint64_t pacing_shortfalls = 0;   // 节奏跟不上目标速率的次数
    uint64_t bytes_written = 0;
    uint64_t bytes_read = 0;
    uint32_t avg_latency_us = 0;
    uint32_t p50_latency_us = 0;
    uint32_t p95_latency_us = 0;
    uint32_t p99_latency_us = 0;
};

// 压测统计
// 非线程安全：每个IO线程持有自己的实例，线程退出后由调用方merge
class LoadStatistics {
public:
    LoadStatistics();
    ~LoadStatistics() = default;

    // ========== 统计记录 ==========

    void record_iteration();
    void record_success(uint32_t latency_us);
    void record_connect();
    void record_connect_timeout();
    void record_connect_error();
    void record_write_error();
    void record_read_timeout();
    void record_read_error();
    void record_pacing_shortfall();
    void record_bytes_written(uint64_t bytes);
    void record_bytes_read(uint64_t bytes);

    // ========== 汇总 ==========

    // 把另一份统计合并进来（延迟样本一并合并）
    void merge(const LoadStatistics& other);

    // 计算汇总（含延迟百分位）
    LoadSummary summary() const;

    // 单行可读格式，用于结束时打印
    std::string to_string() const;

    void reset();

private:
    void push_latency(uint32_t latency_us);

    // 最大延迟样本数：超过后丢弃较旧的一半，保留最近的样本
    static constexpr size_t MAX_LATENCIES = 100000;

    LoadSummary counters_;
    std::vector<uint32_t> latencies_;
};

} // namespace utils
} // namespace clobber
