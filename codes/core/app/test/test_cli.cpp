// =============================================================================
//  Clobber TCP Load Generator - App Module
//  文件: test_cli.cpp
//  描述: 命令行解析与请求负载读取单元测试
//  版权: Copyright (c) 2026
// =============================================================================

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>
#include "app/cli.hpp"

namespace clobber {
namespace app {

using utils::ErrorCode;

// 把字符串参数转成getopt需要的可写argv
class Args {
public:
    Args(std::initializer_list<std::string> args)
        : storage_(args)
    {
        for (std::string& arg : storage_) {
            argv_.push_back(&arg[0]);
        }
        argv_.push_back(nullptr);
    }

    Args(const Args&) = delete;
    Args& operator=(const Args&) = delete;

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

class TempFile {
public:
    explicit TempFile(const std::string& content) {
        static int counter = 0;
        path_ = "/tmp/clobber_cli_test_" + std::to_string(::getpid()) + "_" +
                std::to_string(counter++);
        std::ofstream file(path_, std::ios::binary);
        file << content;
    }

    ~TempFile() {
        std::remove(path_.c_str());
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

utils::Result<CliOptions> parse(Args&& args) {
    return parse_args(args.argc(), args.argv());
}

// CLI_UseCase001: 只给目标地址，其余取默认值
TEST(CliTest, Defaults) {
    auto r = parse({"clobber", "-t", "127.0.0.1:8000"});
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    const CliOptions& o = r.value();
    EXPECT_EQ(o.config.target.to_string(), "127.0.0.1:8000");
    EXPECT_EQ(o.config.connections, 100u);
    EXPECT_EQ(o.config.num_threads, 1u);
    EXPECT_EQ(o.config.rate, 0u);
    EXPECT_EQ(o.config.duration_ms, 0u);
    EXPECT_EQ(o.config.connect_timeout_ms, 250u);
    EXPECT_EQ(o.config.read_timeout_ms, 250u);
    EXPECT_EQ(o.verbosity, 0);
    EXPECT_EQ(o.log_file, "clobber.log");
    EXPECT_TRUE(o.body_file.empty());
    EXPECT_FALSE(o.pooled);
}

// CLI_UseCase002: 全部参数
TEST(CliTest, AllFlags) {
    auto r = parse({"clobber", "--target", "[::1]:9000", "--rate", "500", "--threads", "4",
                    "-c", "32", "-d", "1m30s", "--connect-timeout", "100",
                    "--read-timeout", "300", "-vv", "-f", "body.txt",
                    "--log-file", "", "--pool"});
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    const CliOptions& o = r.value();
    EXPECT_EQ(o.config.target.to_string(), "[::1]:9000");
    EXPECT_EQ(o.config.rate, 500u);
    EXPECT_EQ(o.config.num_threads, 4u);
    EXPECT_EQ(o.config.connections, 32u);
    EXPECT_EQ(o.config.duration_ms, 90000u);
    EXPECT_EQ(o.config.connect_timeout_ms, 100u);
    EXPECT_EQ(o.config.read_timeout_ms, 300u);
    EXPECT_EQ(o.verbosity, 2);
    EXPECT_EQ(o.body_file, "body.txt");
    EXPECT_TRUE(o.log_file.empty());
    EXPECT_TRUE(o.pooled);
}

TEST(CliTest, RepeatedVerbose) {
    auto r = parse({"clobber", "-v", "-t", "127.0.0.1:1", "-vv"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().verbosity, 3);
}

// 不足1ms的时长向上取整
TEST(CliTest, DurationRoundsUpToMillis) {
    auto r = parse({"clobber", "-t", "127.0.0.1:1", "-d", "1500us"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().config.duration_ms, 2u);
}

// "-d 0s"表示立即结束，与不传-d不同
TEST(CliTest, ZeroDurationIsExplicit) {
    auto zero = parse({"clobber", "-t", "127.0.0.1:1", "-d", "0s"});
    ASSERT_TRUE(zero.is_ok()) << zero.error_message();
    EXPECT_TRUE(zero.value().config.has_duration());
    EXPECT_EQ(zero.value().config.duration_ms, 0u);

    auto unbounded = parse({"clobber", "-t", "127.0.0.1:1"});
    ASSERT_TRUE(unbounded.is_ok());
    EXPECT_FALSE(unbounded.value().config.has_duration());

    EXPECT_EQ(parse({"clobber", "-t", "127.0.0.1:1", "-d", "20000w"}).error_code(),
              ErrorCode::CONFIG_INVALID_DURATION);
}

// CLI_UseCase003: 用法错误
TEST(CliTest, UsageErrors) {
    EXPECT_EQ(parse({"clobber"}).error_code(), ErrorCode::CONFIG_MISSING_REQUIRED);
    EXPECT_EQ(parse({"clobber", "-t", "localhost:80"}).error_code(),
              ErrorCode::CONFIG_INVALID_ADDRESS);
    EXPECT_EQ(parse({"clobber", "-t", "127.0.0.1:80", "--rate", "fast"}).error_code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(parse({"clobber", "-t", "127.0.0.1:80", "-c", "-5"}).error_code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(parse({"clobber", "-t", "127.0.0.1:80", "--threads", "99999999999"}).error_code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(parse({"clobber", "-t", "127.0.0.1:80", "-d", "forever"}).error_code(),
              ErrorCode::CONFIG_INVALID_DURATION);
    EXPECT_EQ(parse({"clobber", "-t", "127.0.0.1:80", "-c", "0"}).error_code(),
              ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(parse({"clobber", "-t", "127.0.0.1:80", "--bogus"}).error_code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(parse({"clobber", "-t", "127.0.0.1:80", "-x"}).error_code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(parse({"clobber", "-t"}).error_code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(parse({"clobber", "-t", "127.0.0.1:80", "extra"}).error_code(),
              ErrorCode::INVALID_ARGUMENT);
}

TEST(CliTest, HelpAndVersionSkipValidation) {
    auto help = parse({"clobber", "--help"});
    ASSERT_TRUE(help.is_ok());
    EXPECT_TRUE(help.value().show_help);

    auto version = parse({"clobber", "--version"});
    ASSERT_TRUE(version.is_ok());
    EXPECT_TRUE(version.value().show_version);

    EXPECT_NE(usage("clobber").find("--target"), std::string::npos);
}

// CLI_UseCase004: 配置文件覆盖默认值，命令行覆盖配置文件
TEST(CliTest, ConfigFileThenFlags) {
    TempFile cfg(R"({"target": "127.0.0.1:7000", "connections": 7, "rate": 10})");
    auto r = parse({"clobber", "--config", cfg.path(), "--rate", "20"});
    ASSERT_TRUE(r.is_ok()) << r.error_message();
    EXPECT_EQ(r.value().config.target.port(), 7000);
    EXPECT_EQ(r.value().config.connections, 7u);
    EXPECT_EQ(r.value().config.rate, 20u);

    EXPECT_EQ(parse({"clobber", "--config", "/nonexistent/clobber.json"}).error_code(),
              ErrorCode::FILE_NOT_FOUND);
}

// CLI_UseCase005: 请求负载来源
TEST(CliTest, ReadBodyFromStream) {
    CliOptions options;
    std::istringstream in(std::string("GET /\r\n\0bin", 11));
    auto body = read_body(options, in, false);
    ASSERT_TRUE(body.is_ok());
    EXPECT_EQ(body.value().size(), 11u);
    EXPECT_EQ(body.value().body()[7], 0u);

    std::istringstream empty("");
    auto none = read_body(options, empty, false);
    ASSERT_TRUE(none.is_ok());
    EXPECT_TRUE(none.value().empty());
}

TEST(CliTest, ReadBodyFromTerminalIsUsageError) {
    CliOptions options;
    std::istringstream in("ignored");
    EXPECT_EQ(read_body(options, in, true).error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST(CliTest, ReadBodyFromFile) {
    TempFile file("hello");
    CliOptions options;
    options.body_file = file.path();
    std::istringstream in("ignored");
    auto body = read_body(options, in, true);
    ASSERT_TRUE(body.is_ok());
    EXPECT_EQ(std::string(body.value().body().begin(), body.value().body().end()), "hello");

    options.body_file = "/nonexistent/body.bin";
    EXPECT_EQ(read_body(options, in, false).error_code(), ErrorCode::FILE_NOT_FOUND);
}

// CLI_UseCase006: 退出码
TEST(CliTest, ExitCodes) {
    Args version({"clobber", "--version"});
    EXPECT_EQ(run(version.argc(), version.argv()), kExitOk);

    Args bad({"clobber", "--bogus"});
    EXPECT_EQ(run(bad.argc(), bad.argv()), kExitUsage);

    Args missing({"clobber", "--rate", "5"});
    EXPECT_EQ(run(missing.argc(), missing.argv()), kExitUsage);
}

} // namespace app
} // namespace clobber

// 文件结束
