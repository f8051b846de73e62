// =============================================================================
//  Clobber TCP Load Generator - Config Module
//  文件: test_config.cpp
//  描述: Config模块单元测试
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include "config/config.hpp"
#include <fstream>
#include <cstdio>
#include <thread>
#include <netinet/in.h>
#include <unistd.h>

namespace clobber {
namespace config {

using utils::ErrorCode;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = LoadConfig();
    }

    LoadConfig config_;
};

// =============================================================================
// TargetAddress
// =============================================================================

TEST(TargetAddressTest, ParseIpv4) {
    auto r = TargetAddress::parse("127.0.0.1:8000");
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_TRUE(r.value().is_valid());
    EXPECT_EQ(r.value().family(), AF_INET);
    EXPECT_EQ(r.value().port(), 8000);
    EXPECT_EQ(r.value().to_string(), "127.0.0.1:8000");
    EXPECT_EQ(r.value().sockaddr_len(), sizeof(sockaddr_in));
}

TEST(TargetAddressTest, ParseIpv6) {
    auto r = TargetAddress::parse("[::1]:9000");
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(r.value().family(), AF_INET6);
    EXPECT_EQ(r.value().port(), 9000);
    EXPECT_EQ(r.value().to_string(), "[::1]:9000");
}

// 只接受字面地址，不做DNS解析
TEST(TargetAddressTest, RejectsInvalid) {
    const char* bad[] = {
        "", "127.0.0.1", "localhost:80", "127.0.0.1:0", "127.0.0.1:65536",
        "127.0.0.1:-1", "127.0.0.1:80x", "::1:80", "[::1]80", "[::1]:", "1.2.3:80"
    };
    for (const char* text : bad) {
        auto r = TargetAddress::parse(text);
        EXPECT_TRUE(r.is_err()) << text;
        EXPECT_EQ(r.error_code(), ErrorCode::CONFIG_INVALID_ADDRESS) << text;
    }
}

TEST(TargetAddressTest, DefaultIsUnset) {
    TargetAddress addr;
    EXPECT_FALSE(addr.is_valid());
    EXPECT_EQ(addr.port(), 0);
    EXPECT_EQ(addr.to_string(), "<unset>");
}

TEST(TargetAddressTest, FromSockaddr) {
    auto parsed = TargetAddress::parse("10.1.2.3:443");
    ASSERT_TRUE(parsed.is_ok());
    TargetAddress copy = TargetAddress::from_sockaddr(parsed.value().sockaddr_ptr(),
                                                      parsed.value().sockaddr_len());
    EXPECT_EQ(copy.to_string(), "10.1.2.3:443");

    TargetAddress empty = TargetAddress::from_sockaddr(nullptr, 0);
    EXPECT_FALSE(empty.is_valid());
}

// =============================================================================
// 时长解析
// =============================================================================

TEST(DurationTest, SingleUnits) {
    EXPECT_EQ(parse_duration_ns("500ms").value(), 500000000ULL);
    EXPECT_EQ(parse_duration_ns("5s").value(), 5000000000ULL);
    EXPECT_EQ(parse_duration_ns("10m").value(), 600000000000ULL);
    EXPECT_EQ(parse_duration_ns("2h").value(), 7200000000000ULL);
    EXPECT_EQ(parse_duration_ns("1d").value(), 86400000000000ULL);
    EXPECT_EQ(parse_duration_ns("250us").value(), 250000ULL);
    EXPECT_EQ(parse_duration_ns("7ns").value(), 7ULL);
}

TEST(DurationTest, CompoundAndLongForms) {
    EXPECT_EQ(parse_duration_ns("1h 30m").value(), 5400000000000ULL);
    EXPECT_EQ(parse_duration_ns("1m30s").value(), 90000000000ULL);
    EXPECT_EQ(parse_duration_ns("2 seconds").value(), 2000000000ULL);
    EXPECT_EQ(parse_duration_ns("1week").value(), 604800000000000ULL);
}

TEST(DurationTest, RejectsInvalid) {
    const char* bad[] = {"", "   ", "10", "s", "1.5s", "5 parsecs", "-5s", "99999999999999999999s"};
    for (const char* text : bad) {
        auto r = parse_duration_ns(text);
        EXPECT_TRUE(r.is_err()) << text;
        EXPECT_EQ(r.error_code(), ErrorCode::CONFIG_INVALID_DURATION) << text;
    }
}

// 上限100年：换算成有符号纳秒时不能溢出
TEST(DurationTest, UpperBound) {
    EXPECT_TRUE(parse_duration_ns("2000w").is_ok());
    EXPECT_TRUE(parse_duration_ns("36500d").is_ok());
    EXPECT_EQ(parse_duration_ns("36501d").error_code(), ErrorCode::CONFIG_INVALID_DURATION);
    EXPECT_EQ(parse_duration_ns("20000w").error_code(), ErrorCode::CONFIG_INVALID_DURATION);
    EXPECT_EQ(parse_duration_ms("20000w").error_code(), ErrorCode::CONFIG_INVALID_DURATION);
}

TEST(DurationTest, MillisRoundUp) {
    EXPECT_EQ(parse_duration_ms("0s").value(), 0u);
    EXPECT_EQ(parse_duration_ms("1ns").value(), 1u);
    EXPECT_EQ(parse_duration_ms("2s").value(), 2000u);
}

// =============================================================================
// LoadConfig
// =============================================================================

TEST_F(ConfigTest, Defaults) {
    EXPECT_FALSE(config_.target.is_valid());
    EXPECT_FALSE(config_.has_rate());
    EXPECT_FALSE(config_.has_duration());
    EXPECT_EQ(config_.num_threads, 1u);
    EXPECT_EQ(config_.connections, 10u);
    EXPECT_EQ(config_.connect_timeout_ms, 250u);
    EXPECT_EQ(config_.read_timeout_ms, 250u);
}

TEST_F(ConfigTest, ConnectionsPerThread) {
    config_.num_threads = 4;
    config_.connections = 8;
    EXPECT_EQ(config_.connections_per_thread(), 2u);

    // 连接数少于线程数时每个线程仍有1个
    config_.connections = 3;
    EXPECT_EQ(config_.connections_per_thread(), 1u);

    config_.connections = 10;
    EXPECT_EQ(config_.connections_per_thread(), 2u);
}

TEST_F(ConfigTest, ResolvedThreadsUsesCpuCount) {
    config_.num_threads = 0;
    unsigned int cpus = std::thread::hardware_concurrency();
    EXPECT_EQ(config_.resolved_threads(), cpus == 0 ? 1u : cpus);

    config_.num_threads = 3;
    EXPECT_EQ(config_.resolved_threads(), 3u);
}

TEST_F(ConfigTest, LoadFromFullJsonString) {
    const std::string json_str = R"({
        "target": "127.0.0.1:8080",
        "rate": 1000,
        "duration": "1m 5s",
        "threads": 4,
        "connections": 64,
        "connect_timeout": 100,
        "read_timeout": 500
    })";
    auto r = load_from_string(json_str, config_);
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(config_.target.to_string(), "127.0.0.1:8080");
    EXPECT_EQ(config_.rate, 1000u);
    EXPECT_EQ(config_.duration_ms, 65000u);
    EXPECT_EQ(config_.num_threads, 4u);
    EXPECT_EQ(config_.connections, 64u);
    EXPECT_EQ(config_.connect_timeout_ms, 100u);
    EXPECT_EQ(config_.read_timeout_ms, 500u);
}

// 未出现的字段保持原值
TEST_F(ConfigTest, LoadPartialJsonKeepsExisting) {
    config_.connections = 100;
    auto r = load_from_string(R"({"target": "[::1]:80", "duration": 1500})", config_);
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(config_.connections, 100u);
    EXPECT_TRUE(config_.has_duration());
    EXPECT_EQ(config_.duration_ms, 1500u);
    EXPECT_EQ(config_.target.family(), AF_INET6);
}

// 时长为0也是指定了时长；null表示不限时
TEST_F(ConfigTest, ZeroDurationIsALimit) {
    auto r = load_from_string(R"({"duration": "0s"})", config_);
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_TRUE(config_.has_duration());
    EXPECT_EQ(config_.duration_ms, 0u);

    config_.clear_duration();
    r = load_from_string(R"({"duration": 0})", config_);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(config_.has_duration());

    r = load_from_string(R"({"duration": null})", config_);
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(config_.has_duration());
}

TEST_F(ConfigTest, LoadInvalidJson) {
    config_.rate = 7;
    auto r = load_from_string("{ not json", config_);
    EXPECT_EQ(r.error_code(), ErrorCode::CONFIG_PARSE_ERROR);
    // 失败时不修改原配置
    EXPECT_EQ(config_.rate, 7u);

    r = load_from_string(R"({"rate": "fast"})", config_);
    EXPECT_EQ(r.error_code(), ErrorCode::CONFIG_INVALID_VALUE);

    r = load_from_string(R"({"target": "example.com:80"})", config_);
    EXPECT_EQ(r.error_code(), ErrorCode::CONFIG_INVALID_VALUE);

    r = load_from_string(R"({"duration": "soon"})", config_);
    EXPECT_EQ(r.error_code(), ErrorCode::CONFIG_INVALID_VALUE);
}

TEST_F(ConfigTest, LoadFromFile) {
    std::string path = "/tmp/clobber_config_test_" + std::to_string(::getpid()) + ".json";
    {
        std::ofstream file(path);
        file << R"({"target": "127.0.0.1:9999", "threads": 2})";
    }
    auto r = load_from_file(path, config_);
    std::remove(path.c_str());
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(config_.target.port(), 9999);
    EXPECT_EQ(config_.num_threads, 2u);
}

TEST_F(ConfigTest, LoadFromMissingFile) {
    auto r = load_from_file("/nonexistent/clobber.json", config_);
    EXPECT_EQ(r.error_code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigTest, Validate) {
    EXPECT_EQ(validate(config_).error_code(), ErrorCode::CONFIG_MISSING_REQUIRED);

    config_.target = TargetAddress::parse("127.0.0.1:80").value();
    EXPECT_TRUE(validate(config_).is_ok());

    config_.connections = 0;
    EXPECT_EQ(validate(config_).error_code(), ErrorCode::CONFIG_INVALID_VALUE);
    config_.connections = 1;

    config_.connect_timeout_ms = 0;
    EXPECT_EQ(validate(config_).error_code(), ErrorCode::CONFIG_INVALID_VALUE);
    config_.connect_timeout_ms = 250;

    config_.read_timeout_ms = 0;
    EXPECT_EQ(validate(config_).error_code(), ErrorCode::CONFIG_INVALID_VALUE);
    config_.read_timeout_ms = 250;

    config_.set_duration_ms(kMaxDurationMs);
    EXPECT_TRUE(validate(config_).is_ok());
    config_.set_duration_ms(kMaxDurationMs + 1);
    EXPECT_EQ(validate(config_).error_code(), ErrorCode::CONFIG_INVALID_DURATION);

    auto r = load_from_string(R"({"duration": 18446744073709551615})", config_);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(validate(config_).error_code(), ErrorCode::CONFIG_INVALID_DURATION);
}

TEST_F(ConfigTest, ExportedJsonLoadsBack) {
    config_.target = TargetAddress::parse("127.0.0.1:8080").value();
    config_.rate = 50;
    config_.set_duration_ms(3000);
    auto exported = to_json_string(config_);
    ASSERT_TRUE(exported.is_ok());

    LoadConfig loaded;
    auto r = load_from_string(exported.value(), loaded);
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(loaded.target.to_string(), "127.0.0.1:8080");
    EXPECT_EQ(loaded.rate, 50u);
    EXPECT_TRUE(loaded.has_duration());
    EXPECT_EQ(loaded.duration_ms, 3000u);

    config_.clear_duration();
    LoadConfig unbounded;
    unbounded.set_duration_ms(5);
    ASSERT_TRUE(load_from_string(to_json_string(config_).value(), unbounded).is_ok());
    EXPECT_FALSE(unbounded.has_duration());
}

} // namespace config
} // namespace clobber

// 文件结束
