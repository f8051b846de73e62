#include "utils/statistics.hpp"
#include <algorithm>
#include <cstdio>
#include <numeric>

namespace clobber {
namespace utils {

constexpr size_t LoadStatistics::MAX_LATENCIES;

LoadStatistics::LoadStatistics() {
    latencies_.reserve(1024);
}

void LoadStatistics::record_iteration() {
    ++counters_.iterations;
}

void LoadStatistics::record_success(uint32_t latency_us) {
    ++counters_.successful_requests;
    push_latency(latency_us);
}

void LoadStatistics::record_connect() {
    ++counters_.connects;
}

void LoadStatistics::record_connect_timeout() {
    ++counters_.connect_timeouts;
}

void LoadStatistics::record_connect_error() {
    ++counters_.connect_errors;
}

void LoadStatistics::record_write_error() {
    ++counters_.write_errors;
}

void LoadStatistics::record_read_timeout() {
    ++counters_.read_timeouts;
}

void LoadStatistics::record_read_error() {
    ++counters_.read_errors;
}

void LoadStatistics::record_pacing_shortfall() {
    ++counters_.pacing_shortfalls;
}

void LoadStatistics::record_bytes_written(uint64_t bytes) {
    counters_.bytes_written += bytes;
}

void LoadStatistics::record_bytes_read(uint64_t bytes) {
    counters_.bytes_read += bytes;
}

void LoadStatistics::push_latency(uint32_t latency_us) {
    if (latencies_.size() >= MAX_LATENCIES) {
        // 缓冲区满，滑动窗口：移除旧的一半，保留新的一半
        size_t half = MAX_LATENCIES / 2;
        std::copy(latencies_.begin() + half, latencies_.end(), latencies_.begin());
        latencies_.resize(latencies_.size() - half);
    }
    latencies_.push_back(latency_us);
}

void LoadStatistics::merge(const LoadStatistics& other) {
    counters_.iterations += other.counters_.iterations;
    counters_.successful_requests += other.counters_.successful_requests;
    counters_.connects += other.counters_.connects;
    counters_.connect_timeouts += other.counters_.connect_timeouts;
    counters_.connect_errors += other.counters_.connect_errors;
    counters_.write_errors += other.counters_.write_errors;
    counters_.read_timeouts += other.counters_.read_timeouts;
    counters_.read_errors += other.counters_.read_errors;
    counters_.pacing_shortfalls += other.counters_.pacing_shortfalls;
    counters_.bytes_written += other.counters_.bytes_written;
    counters_.bytes_read += other.counters_.bytes_read;

    for (uint32_t latency : other.latencies_) {
        push_latency(latency);
    }
}

LoadSummary LoadStatistics::summary() const {
    LoadSummary result = counters_;
    if (latencies_.empty()) {
        return result;
    }

    std::vector<uint32_t> sorted(latencies_);
    std::sort(sorted.begin(), sorted.end());

    uint64_t sum = std::accumulate(sorted.begin(), sorted.end(), static_cast<uint64_t>(0));
    result.avg_latency_us = static_cast<uint32_t>(sum / sorted.size());

    size_t n = sorted.size();
    result.p50_latency_us = sorted[n * 50 / 100];
    result.p95_latency_us = sorted[std::min(n - 1, n * 95 / 100)];
    result.p99_latency_us = sorted[std::min(n - 1, n * 99 / 100)];
    return result;
}

std::string LoadStatistics::to_string() const {
    LoadSummary s = summary();
    char buf[512];
    snprintf(buf, sizeof(buf),
             "iterations=%llu ok=%llu connects=%llu connect_timeouts=%llu connect_errors=%llu "
             "write_errors=%llu read_timeouts=%llu read_errors=%llu behind=%llu "
             "written=%lluB read=%lluB latency_us(avg/p50/p95/p99)=%u/%u/%u/%u",
             static_cast<unsigned long long>(s.iterations),
             static_cast<unsigned long long>(s.successful_requests),
             static_cast<unsigned long long>(s.connects),
             static_cast<unsigned long long>(s.connect_timeouts),
             static_cast<unsigned long long>(s.connect_errors),
             static_cast<unsigned long long>(s.write_errors),
             static_cast<unsigned long long>(s.read_timeouts),
             static_cast<unsigned long long>(s.read_errors),
             static_cast<unsigned long long>(s.pacing_shortfalls),
             static_cast<unsigned long long>(s.bytes_written),
             static_cast<unsigned long long>(s.bytes_read),
             s.avg_latency_us, s.p50_latency_us, s.p95_latency_us, s.p99_latency_us);
    return buf;
}

void LoadStatistics::reset() {
    counters_ = LoadSummary();
    latencies_.clear();
}

} // namespace utils
} // namespace clobber
