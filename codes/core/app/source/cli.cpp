// =============================================================================
//  Clobber TCP Load Generator - App Module
//  文件: cli.cpp
//  描述: 命令行解析、请求负载读取与程序入口实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "app/cli.hpp"
#include "client/connection_job.hpp"
#include "client/traffic_generator.hpp"
#include "utils/logger.hpp"
#include "utils/time.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <iterator>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace clobber {
namespace app {

using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace details {

// 仅有长选项的参数
enum LongOnlyOption {
    OPT_RATE = 256,
    OPT_THREADS,
    OPT_CONNECT_TIMEOUT,
    OPT_READ_TIMEOUT,
    OPT_CONFIG,
    OPT_LOG_FILE,
    OPT_POOL,
    OPT_VERSION
};

// 命令行上出现过的原始值，空串表示未指定
struct RawArgs {
    std::string target;
    std::string rate;
    std::string threads;
    std::string connections;
    std::string duration;
    std::string connect_timeout;
    std::string read_timeout;
};

Result<uint32_t> ParseU32(const char* name, const std::string& text) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return make_err<uint32_t>(ErrorCode::INVALID_ARGUMENT,
                                  std::string("invalid value for --") + name + ": '" + text + "'");
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || value > 0xFFFFFFFFULL) {
        return make_err<uint32_t>(ErrorCode::INVALID_ARGUMENT,
                                  std::string("invalid value for --") + name + ": '" + text + "'");
    }
    return make_ok(static_cast<uint32_t>(value));
}

// 把命令行上的值覆盖到配置上
Result<void> ApplyRawArgs(const RawArgs& raw, config::LoadConfig& cfg) {
    if (!raw.target.empty()) {
        Result<config::TargetAddress> target = config::TargetAddress::parse(raw.target);
        if (target.is_err()) {
            return make_err(target.error_code(), target.error_message());
        }
        cfg.target = target.value();
    }

    struct NumericArg {
        const char* name;
        const std::string* text;
        uint32_t* field;
    };
    NumericArg numeric[] = {
        {"rate", &raw.rate, &cfg.rate},
        {"threads", &raw.threads, &cfg.num_threads},
        {"connections", &raw.connections, &cfg.connections},
        {"connect-timeout", &raw.connect_timeout, &cfg.connect_timeout_ms},
        {"read-timeout", &raw.read_timeout, &cfg.read_timeout_ms},
    };
    for (const NumericArg& arg : numeric) {
        if (arg.text->empty()) {
            continue;
        }
        Result<uint32_t> value = ParseU32(arg.name, *arg.text);
        if (value.is_err()) {
            return make_err(value.error_code(), value.error_message());
        }
        *arg.field = value.value();
    }

    if (!raw.duration.empty()) {
        Result<uint64_t> ms = config::parse_duration_ms(raw.duration);
        if (ms.is_err()) {
            return make_err(ms.error_code(), ms.error_message());
        }
        // "0s"也算指定了时长：第一轮开始前即结束
        cfg.set_duration_ms(ms.value());
    }
    return make_ok();
}

} // namespace details

std::string usage(const char* program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " --target <ip:port> [OPTIONS] < request\n"
        << "\n"
        << "TCP load generator: opens many connections, writes the request body\n"
        << "read from stdin (or --file), reads until the server closes, repeats.\n"
        << "\n"
        << "Options:\n"
        << "  -t, --target <ip:port>       Host to clobber (required)\n"
        << "      --rate <n>               Limit to n requests per second (default: unlimited)\n"
        << "  -c, --connections <n>        Max number of open connections (default: "
        << config::kDefaultCliConnections << ")\n"
        << "  -d, --duration <time>        Length of the run, e.g. 10s, 5m, 1h 30m (default: forever)\n"
        << "      --threads <n>            Number of threads, 0 for one per CPU (default: "
        << config::kDefaultThreads << ")\n"
        << "      --connect-timeout <ms>   Connect timeout (default: "
        << config::kDefaultConnectTimeoutMs << ")\n"
        << "      --read-timeout <ms>      Read timeout (default: "
        << config::kDefaultReadTimeoutMs << ")\n"
        << "  -f, --file <path>            Read the request body from a file instead of stdin\n"
        << "      --config <path>          Load settings from a JSON file; flags override it\n"
        << "      --log-file <path>        Log file, empty to disable (default: "
        << kDefaultLogFile << ")\n"
        << "      --pool                   Run one worker-pool job per connection\n"
        << "  -v                           Verbosity: -v info, -vv debug\n"
        << "  -h, --help                   Show this help\n"
        << "      --version                Show version\n";
    return oss.str();
}

Result<CliOptions> parse_args(int argc, char** argv) {
    static struct option long_options[] = {
        {"target", required_argument, nullptr, 't'},
        {"connections", required_argument, nullptr, 'c'},
        {"duration", required_argument, nullptr, 'd'},
        {"file", required_argument, nullptr, 'f'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"rate", required_argument, nullptr, details::OPT_RATE},
        {"threads", required_argument, nullptr, details::OPT_THREADS},
        {"connect-timeout", required_argument, nullptr, details::OPT_CONNECT_TIMEOUT},
        {"read-timeout", required_argument, nullptr, details::OPT_READ_TIMEOUT},
        {"config", required_argument, nullptr, details::OPT_CONFIG},
        {"log-file", required_argument, nullptr, details::OPT_LOG_FILE},
        {"pool", no_argument, nullptr, details::OPT_POOL},
        {"version", no_argument, nullptr, details::OPT_VERSION},
        {nullptr, 0, nullptr, 0}
    };

    CliOptions options;
    details::RawArgs raw;

    // 允许重复解析（测试中多次调用）
    optind = 0;
    opterr = 0;

    int c;
    int option_index = 0;
    while ((c = getopt_long(argc, argv, ":t:c:d:f:vh", long_options, &option_index)) != -1) {
        switch (c) {
            case 't':
                raw.target = optarg;
                break;
            case 'c':
                raw.connections = optarg;
                break;
            case 'd':
                raw.duration = optarg;
                break;
            case 'f':
                options.body_file = optarg;
                break;
            case 'v':
                ++options.verbosity;
                break;
            case 'h':
                options.show_help = true;
                break;
            case details::OPT_RATE:
                raw.rate = optarg;
                break;
            case details::OPT_THREADS:
                raw.threads = optarg;
                break;
            case details::OPT_CONNECT_TIMEOUT:
                raw.connect_timeout = optarg;
                break;
            case details::OPT_READ_TIMEOUT:
                raw.read_timeout = optarg;
                break;
            case details::OPT_CONFIG:
                options.config_file = optarg;
                break;
            case details::OPT_LOG_FILE:
                options.log_file = optarg;
                break;
            case details::OPT_POOL:
                options.pooled = true;
                break;
            case details::OPT_VERSION:
                options.show_version = true;
                break;
            case ':':
                return make_err<CliOptions>(ErrorCode::INVALID_ARGUMENT,
                                            std::string("missing value for ") + argv[optind - 1]);
            default:
                if (optopt > 0 && optopt < details::OPT_RATE) {
                    return make_err<CliOptions>(ErrorCode::INVALID_ARGUMENT,
                                                std::string("unknown option: -") +
                                                static_cast<char>(optopt));
                }
                return make_err<CliOptions>(ErrorCode::INVALID_ARGUMENT,
                                            std::string("unknown option: ") + argv[optind - 1]);
        }
    }

    if (optind < argc) {
        return make_err<CliOptions>(ErrorCode::INVALID_ARGUMENT,
                                    std::string("unexpected argument: ") + argv[optind]);
    }
    if (options.show_help || options.show_version) {
        return make_ok(std::move(options));
    }

    options.config.connections = config::kDefaultCliConnections;
    if (!options.config_file.empty()) {
        Result<void> loaded = config::load_from_file(options.config_file, options.config);
        if (loaded.is_err()) {
            return make_err<CliOptions>(loaded.error_code(), loaded.error_message());
        }
    }

    Result<void> applied = details::ApplyRawArgs(raw, options.config);
    if (applied.is_err()) {
        return make_err<CliOptions>(applied.error_code(), applied.error_message());
    }

    Result<void> valid = config::validate(options.config);
    if (valid.is_err()) {
        return make_err<CliOptions>(valid.error_code(), valid.error_message());
    }
    return make_ok(std::move(options));
}

Result<client::Message> read_body(const CliOptions& options,
                                  std::istream& in,
                                  bool in_is_terminal) {
    if (!options.body_file.empty()) {
        std::ifstream file(options.body_file, std::ios::binary);
        if (!file.is_open()) {
            return make_err<client::Message>(ErrorCode::FILE_NOT_FOUND,
                                             "cannot open request file: " + options.body_file);
        }
        std::vector<uint8_t> body((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
        if (file.bad()) {
            return make_err<client::Message>(ErrorCode::FILE_READ_ERROR,
                                             "failed to read request file: " + options.body_file);
        }
        return make_ok(client::Message(std::move(body)));
    }

    if (in_is_terminal) {
        return make_err<client::Message>(ErrorCode::INVALID_ARGUMENT,
                                         "no request body: pipe it on stdin or use --file");
    }

    std::vector<uint8_t> body((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        return make_err<client::Message>(ErrorCode::FILE_READ_ERROR, "failed to read stdin");
    }
    return make_ok(client::Message(std::move(body)));
}

int run(int argc, char** argv) {
    const char* program = argc > 0 ? argv[0] : "clobber";

    Result<CliOptions> parsed = parse_args(argc, argv);
    if (parsed.is_err()) {
        std::cerr << "error: " << parsed.error_message() << "\n\n" << usage(program);
        return kExitUsage;
    }
    const CliOptions& options = parsed.value();
    if (options.show_help) {
        std::cout << usage(program);
        return kExitOk;
    }
    if (options.show_version) {
        std::cout << "clobber " << kVersion << "\n";
        return kExitOk;
    }

    utils::Logger& logger = utils::Logger::instance();
    if (logger.init(utils::verbosity_to_log_level(options.verbosity), options.log_file) != 0) {
        std::cerr << "warning: cannot open log file '" << options.log_file
                  << "', logging to console only\n";
    }

    Result<client::Message> body = read_body(options, std::cin, ::isatty(STDIN_FILENO) != 0);
    if (body.is_err()) {
        LOG_ERROR("Main", "%s", body.error_message().c_str());
        std::cerr << "error: " << body.error_message() << "\n";
        logger.shutdown();
        return kExitUsage;
    }
    LOG_DEBUG("Main", "request body: %zu bytes", body.value().size());

    client::RunReport report;
    Result<void> result = make_ok();
    if (options.pooled) {
        client::PooledTrafficGenerator generator(options.config, body.value());
        result = generator.run(&report);
    } else {
        client::TrafficGenerator generator(options.config, body.value());
        result = generator.run(&report);
    }

    if (result.is_err()) {
        LOG_ERROR("Main", "run failed: %s", result.error_message().c_str());
        logger.shutdown();
        return kExitRunFailure;
    }

    utils::LoadSummary summary = report.statistics.summary();
    LOG_INFO("Main", "Run complete: %u thread(s) x %u slot(s), %s elapsed",
             report.threads_spawned, report.slots_per_thread,
             utils::format_duration(report.wall_time).c_str());
    LOG_INFO("Main", "%llu requests, %llu ok, %llu connect timeouts, %llu read timeouts, "
             "%llu bytes written, %llu bytes read",
             static_cast<unsigned long long>(summary.iterations),
             static_cast<unsigned long long>(summary.successful_requests),
             static_cast<unsigned long long>(summary.connect_timeouts),
             static_cast<unsigned long long>(summary.read_timeouts),
             static_cast<unsigned long long>(summary.bytes_written),
             static_cast<unsigned long long>(summary.bytes_read));

    logger.shutdown();
    return kExitOk;
}

} // namespace app
} // namespace clobber

// 文件结束
