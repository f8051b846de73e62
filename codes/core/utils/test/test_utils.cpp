// =============================================================================
//  Clobber TCP Load Generator - Utils Module
//  文件: test_utils.cpp
//  描述: Utils模块单元测试
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include "utils/error.hpp"
#include "utils/time.hpp"
#include "utils/logger.hpp"
#include "utils/statistics.hpp"

using namespace clobber::utils;

// =============================================================================
// Error模块测试用例
// =============================================================================

TEST(ErrorTest, ErrorCodeToString) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::SUCCESS), "SUCCESS");
    EXPECT_STREQ(error_code_to_string(ErrorCode::TIMEOUT), "TIMEOUT");
    EXPECT_STREQ(error_code_to_string(ErrorCode::CONFIG_INVALID_DURATION), "CONFIG_INVALID_DURATION");
    EXPECT_STREQ(error_code_to_string(ErrorCode::NETWORK_CONNECT_ERROR), "NETWORK_CONNECT_ERROR");
}

TEST(ErrorTest, ErrorCodeToDescription) {
    EXPECT_STRNE(error_code_to_description(ErrorCode::SUCCESS), nullptr);
    EXPECT_STRNE(error_code_to_description(ErrorCode::NETWORK_READ_ERROR), nullptr);
}

TEST(ErrorTest, IsSuccessIsError) {
    EXPECT_TRUE(is_success(ErrorCode::SUCCESS));
    EXPECT_FALSE(is_success(ErrorCode::TIMEOUT));
    EXPECT_FALSE(is_error(ErrorCode::SUCCESS));
    EXPECT_TRUE(is_error(ErrorCode::RESOURCE_EXHAUSTED));
}

TEST(ErrorTest, ResultSuccess) {
    Result<int> r = make_ok(42);
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_err());
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(r.error_code(), ErrorCode::SUCCESS);
}

TEST(ErrorTest, ResultFailure) {
    Result<size_t> r = make_err<size_t>(ErrorCode::NETWORK_WRITE_ERROR, "broken pipe");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.error_code(), ErrorCode::NETWORK_WRITE_ERROR);
    EXPECT_EQ(r.error_message(), "broken pipe");
    EXPECT_EQ(r.value_or(7u), 7u);
}

TEST(ErrorTest, ResultVoid) {
    Result<void> ok = make_ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> err = make_err(ErrorCode::NETWORK_POLL_ERROR);
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error_code(), ErrorCode::NETWORK_POLL_ERROR);
    // 未给消息时使用错误码描述
    EXPECT_FALSE(err.error_message().empty());
}

// =============================================================================
// Time模块测试用例
// =============================================================================

TEST(TimeTest, MonotonicClockAdvances) {
    uint64_t t1 = get_monotonic_time_us();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    uint64_t t2 = get_monotonic_time_us();
    EXPECT_GT(t2, t1);
    EXPECT_GT(get_current_time_ms(), 0u);
}

TEST(TimeTest, StopWatchElapsed) {
    StopWatch sw;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    EXPECT_GE(sw.elapsed_ms(), 5u);  // 允许误差
    EXPECT_GE(sw.elapsed_us(), sw.elapsed_ms());
}

TEST(TimeTest, StopWatchReset) {
    StopWatch sw;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    sw.reset();
    EXPECT_LT(sw.elapsed_ms(), 5u);
}

TEST(TimeoutCheckerTest, NotTimeout) {
    TimeoutChecker tc(1000);
    EXPECT_FALSE(tc.is_timeout());
    EXPECT_GT(tc.remaining_ms(), 0u);
}

TEST(TimeoutCheckerTest, TimeoutAndReset) {
    TimeoutChecker tc(10);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(tc.is_timeout());
    EXPECT_EQ(tc.remaining_ms(), 0u);
    tc.reset();
    EXPECT_FALSE(tc.is_timeout());
}

TEST(TimeTest, FormatDuration) {
    EXPECT_EQ(format_duration(std::chrono::milliseconds(1500)), "1.500s");
    EXPECT_EQ(format_duration(std::chrono::milliseconds(250)), "250.000ms");
    EXPECT_EQ(format_duration(std::chrono::microseconds(40)), "40.000us");
    EXPECT_EQ(format_duration(Nanos(12)), "12ns");
}

TEST(TimeTest, FormatCurrentTime) {
    EXPECT_FALSE(format_current_time().empty());
    EXPECT_EQ(format_current_time("%Y").size(), 4u);
}

// =============================================================================
// Logger模块测试用例
// =============================================================================

TEST(LoggerTest, SetLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);
    EXPECT_FALSE(logger.is_level_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_level_enabled(LogLevel::ERROR));
    logger.set_level(LogLevel::DEBUG);
    EXPECT_TRUE(logger.is_level_enabled(LogLevel::DEBUG));
}

TEST(LoggerTest, StringToLogLevel) {
    EXPECT_EQ(string_to_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(string_to_log_level("TRACE"), LogLevel::DEBUG);
    EXPECT_EQ(string_to_log_level("Warn"), LogLevel::WARN);
    EXPECT_EQ(string_to_log_level("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(string_to_log_level("bogus"), LogLevel::INFO);
}

TEST(LoggerTest, LogLevelToString) {
    EXPECT_STREQ(log_level_to_string(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(log_level_to_string(LogLevel::ERROR), "ERROR");
}

// -v 次数：无=WARN，-v=INFO，-vv/-vvv=DEBUG
TEST(LoggerTest, VerbosityToLogLevel) {
    EXPECT_EQ(verbosity_to_log_level(0), LogLevel::WARN);
    EXPECT_EQ(verbosity_to_log_level(1), LogLevel::INFO);
    EXPECT_EQ(verbosity_to_log_level(2), LogLevel::DEBUG);
    EXPECT_EQ(verbosity_to_log_level(3), LogLevel::DEBUG);
}

TEST(LoggerTest, WritesToFile) {
    std::string path = "/tmp/clobber_logger_test_" + std::to_string(::getpid()) + ".log";
    std::remove(path.c_str());

    Logger& logger = Logger::instance();
    ASSERT_EQ(logger.init(LogLevel::INFO, path), 0);
    logger.set_console_output(false);
    LOG_DEBUG("Test", "hidden %d", 1);
    LOG_WARN("Test", "running behind; consider adding more connections");
    logger.flush();

    std::ifstream file(path);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_NE(content.str().find("[WARN] [Test] running behind"), std::string::npos);
    EXPECT_EQ(content.str().find("hidden"), std::string::npos);

    logger.set_file("");
    logger.set_console_output(true);
    logger.set_level(LogLevel::WARN);
    std::remove(path.c_str());
}

// =============================================================================
// Statistics模块测试用例
// =============================================================================

TEST(StatisticsTest, RecordCounters) {
    LoadStatistics stats;
    stats.record_iteration();
    stats.record_iteration();
    stats.record_connect();
    stats.record_connect_timeout();
    stats.record_read_timeout();
    stats.record_write_error();
    stats.record_pacing_shortfall();
    stats.record_bytes_written(100);
    stats.record_bytes_read(40);

    LoadSummary s = stats.summary();
    EXPECT_EQ(s.iterations, 2u);
    EXPECT_EQ(s.connects, 1u);
    EXPECT_EQ(s.connect_timeouts, 1u);
    EXPECT_EQ(s.read_timeouts, 1u);
    EXPECT_EQ(s.write_errors, 1u);
    EXPECT_EQ(s.pacing_shortfalls, 1u);
    EXPECT_EQ(s.bytes_written, 100u);
    EXPECT_EQ(s.bytes_read, 40u);
    EXPECT_EQ(s.successful_requests, 0u);
}

TEST(StatisticsTest, LatencyPercentiles) {
    LoadStatistics stats;
    for (uint32_t i = 1; i <= 100; ++i) {
        stats.record_success(i);
    }
    LoadSummary s = stats.summary();
    EXPECT_EQ(s.successful_requests, 100u);
    EXPECT_EQ(s.avg_latency_us, 50u);
    EXPECT_EQ(s.p50_latency_us, 51u);
    EXPECT_EQ(s.p95_latency_us, 96u);
    EXPECT_EQ(s.p99_latency_us, 100u);
}

TEST(StatisticsTest, MergeThreadStatistics) {
    LoadStatistics a;
    LoadStatistics b;
    a.record_iteration();
    a.record_success(10);
    b.record_iteration();
    b.record_read_error();
    b.record_bytes_written(5);

    LoadStatistics merged;
    merged.merge(a);
    merged.merge(b);
    LoadSummary s = merged.summary();
    EXPECT_EQ(s.iterations, 2u);
    EXPECT_EQ(s.successful_requests, 1u);
    EXPECT_EQ(s.read_errors, 1u);
    EXPECT_EQ(s.bytes_written, 5u);
    EXPECT_EQ(s.p50_latency_us, 10u);
}

TEST(StatisticsTest, ToStringAndReset) {
    LoadStatistics stats;
    stats.record_iteration();
    stats.record_connect_error();
    EXPECT_NE(stats.to_string().find("connect_errors=1"), std::string::npos);

    stats.reset();
    LoadSummary s = stats.summary();
    EXPECT_EQ(s.iterations, 0u);
    EXPECT_EQ(s.connect_errors, 0u);
}

// 文件结束
