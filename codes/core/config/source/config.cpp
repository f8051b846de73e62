// =============================================================================
//  Clobber TCP Load Generator - Config Module
//  文件: config.cpp
//  描述: 压测配置解析、校验与导出
//  版权: Copyright (c) 2026
// =============================================================================
#include "config/config.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

// 仅在cpp文件中包含nlohmann/json，头文件不暴露
#include <nlohmann/json.hpp>

namespace clobber {
namespace config {

using json = nlohmann::json;
using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace details {

// 严格解析无符号整数（不接受符号、空串与尾随字符）
bool ParseUnsigned(const std::string& text, uint64_t max_value, uint64_t& out) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0' || value > max_value) {
        return false;
    }
    out = value;
    return true;
}

// 时长单位 -> 纳秒倍数，未知单位返回0
uint64_t UnitToNanos(const std::string& unit) {
    static const uint64_t kUs = 1000ULL;
    static const uint64_t kMs = 1000ULL * kUs;
    static const uint64_t kSec = 1000ULL * kMs;
    static const uint64_t kMin = 60ULL * kSec;
    static const uint64_t kHour = 60ULL * kMin;
    static const uint64_t kDay = 24ULL * kHour;

    if (unit == "ns" || unit == "nsec" || unit == "nanos") return 1;
    if (unit == "us" || unit == "usec" || unit == "micros") return kUs;
    if (unit == "ms" || unit == "msec" || unit == "millis") return kMs;
    if (unit == "s" || unit == "sec" || unit == "secs" ||
        unit == "second" || unit == "seconds") return kSec;
    if (unit == "m" || unit == "min" || unit == "mins" ||
        unit == "minute" || unit == "minutes") return kMin;
    if (unit == "h" || unit == "hr" || unit == "hrs" ||
        unit == "hour" || unit == "hours") return kHour;
    if (unit == "d" || unit == "day" || unit == "days") return kDay;
    if (unit == "w" || unit == "week" || unit == "weeks") return 7ULL * kDay;
    return 0;
}

void ApplyJson(const json& j, LoadConfig& cfg) {
    if (j.contains("target")) {
        auto target = TargetAddress::parse(j["target"].get<std::string>());
        if (target.is_err()) {
            throw std::invalid_argument(target.error_message());
        }
        cfg.target = target.value();
    }
    if (j.contains("rate")) cfg.rate = j["rate"].get<uint32_t>();
    if (j.contains("duration")) {
        const auto& d = j["duration"];
        if (d.is_null()) {
            cfg.clear_duration();
        } else if (d.is_string()) {
            auto ms = parse_duration_ms(d.get<std::string>());
            if (ms.is_err()) {
                throw std::invalid_argument(ms.error_message());
            }
            cfg.set_duration_ms(ms.value());
        } else {
            cfg.set_duration_ms(d.get<uint64_t>());
        }
    }
    if (j.contains("threads")) cfg.num_threads = j["threads"].get<uint32_t>();
    if (j.contains("connections")) cfg.connections = j["connections"].get<uint32_t>();
    if (j.contains("connect_timeout")) cfg.connect_timeout_ms = j["connect_timeout"].get<uint32_t>();
    if (j.contains("read_timeout")) cfg.read_timeout_ms = j["read_timeout"].get<uint32_t>();
}

} // namespace details

// ========== TargetAddress ==========

TargetAddress::TargetAddress()
    : length_(0)
{
    std::memset(&storage_, 0, sizeof(storage_));
}

Result<TargetAddress> TargetAddress::parse(const std::string& text) {
    std::string host;
    std::string port_text;

    if (!text.empty() && text[0] == '[') {
        size_t close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            return make_err<TargetAddress>(ErrorCode::CONFIG_INVALID_ADDRESS,
                                           "Invalid target address: " + text);
        }
        host = text.substr(1, close - 1);
        port_text = text.substr(close + 2);
    } else {
        size_t colon = text.rfind(':');
        if (colon == std::string::npos || text.find(':') != colon) {
            return make_err<TargetAddress>(ErrorCode::CONFIG_INVALID_ADDRESS,
                                           "Invalid target address: " + text);
        }
        host = text.substr(0, colon);
        port_text = text.substr(colon + 1);
    }

    uint64_t port = 0;
    if (!details::ParseUnsigned(port_text, 65535, port) || port == 0) {
        return make_err<TargetAddress>(ErrorCode::CONFIG_INVALID_ADDRESS,
                                       "Invalid target port: " + text);
    }

    TargetAddress addr;
    sockaddr_in* v4 = reinterpret_cast<sockaddr_in*>(&addr.storage_);
    sockaddr_in6* v6 = reinterpret_cast<sockaddr_in6*>(&addr.storage_);
    if (inet_pton(AF_INET, host.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(static_cast<uint16_t>(port));
        addr.length_ = sizeof(sockaddr_in);
    } else if (inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(static_cast<uint16_t>(port));
        addr.length_ = sizeof(sockaddr_in6);
    } else {
        return make_err<TargetAddress>(ErrorCode::CONFIG_INVALID_ADDRESS,
                                       "Invalid target host: " + text);
    }
    return make_ok(addr);
}

TargetAddress TargetAddress::from_sockaddr(const sockaddr* addr, socklen_t len) {
    TargetAddress result;
    if (addr != nullptr && len > 0 && len <= static_cast<socklen_t>(sizeof(result.storage_))) {
        std::memcpy(&result.storage_, addr, len);
        result.length_ = len;
    }
    return result;
}

uint16_t TargetAddress::port() const {
    if (storage_.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&storage_)->sin_port);
    }
    if (storage_.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_port);
    }
    return 0;
}

std::string TargetAddress::to_string() const {
    char ip[INET6_ADDRSTRLEN] = {0};
    if (storage_.ss_family == AF_INET) {
        inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(&storage_)->sin_addr,
                  ip, sizeof(ip));
        return std::string(ip) + ":" + std::to_string(port());
    }
    if (storage_.ss_family == AF_INET6) {
        inet_ntop(AF_INET6, &reinterpret_cast<const sockaddr_in6*>(&storage_)->sin6_addr,
                  ip, sizeof(ip));
        return "[" + std::string(ip) + "]:" + std::to_string(port());
    }
    return "<unset>";
}

// ========== 时长解析 ==========

Result<uint64_t> parse_duration_ns(const std::string& text) {
    uint64_t total = 0;
    size_t i = 0;
    bool seen_part = false;

    while (i < text.size()) {
        if (std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
            continue;
        }

        size_t num_start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        size_t unit_start = i;
        while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) {
            ++i;
        }

        uint64_t value = 0;
        uint64_t scale = details::UnitToNanos(text.substr(unit_start, i - unit_start));
        if (!details::ParseUnsigned(text.substr(num_start, unit_start - num_start),
                                    UINT64_MAX, value) || scale == 0) {
            return make_err<uint64_t>(ErrorCode::CONFIG_INVALID_DURATION,
                                      "Invalid duration: '" + text + "'");
        }
        if (value != 0 && scale > (UINT64_MAX - total) / value) {
            return make_err<uint64_t>(ErrorCode::CONFIG_INVALID_DURATION,
                                      "Duration overflow: '" + text + "'");
        }
        total += value * scale;
        seen_part = true;
    }

    if (!seen_part) {
        return make_err<uint64_t>(ErrorCode::CONFIG_INVALID_DURATION, "Empty duration");
    }
    if (total > kMaxDurationMs * 1000000ULL) {
        return make_err<uint64_t>(ErrorCode::CONFIG_INVALID_DURATION,
                                  "Duration too long: '" + text + "'");
    }
    return make_ok(total);
}

Result<uint64_t> parse_duration_ms(const std::string& text) {
    Result<uint64_t> ns = parse_duration_ns(text);
    if (ns.is_err()) {
        return ns;
    }
    return make_ok<uint64_t>((ns.value() + 999999ULL) / 1000000ULL);
}

// ========== LoadConfig ==========

uint32_t LoadConfig::resolved_threads() const {
    if (num_threads != 0) {
        return num_threads;
    }
    unsigned int cpus = std::thread::hardware_concurrency();
    return cpus == 0 ? 1 : cpus;
}

uint32_t LoadConfig::connections_per_thread() const {
    // 连接数少于线程数时每个线程仍至少跑一个连接
    uint32_t per_thread = connections / resolved_threads();
    return per_thread == 0 ? 1 : per_thread;
}

// ========== JSON加载与导出 ==========

Result<void> load_from_string(const std::string& json_str, LoadConfig& cfg) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return make_err(ErrorCode::CONFIG_PARSE_ERROR, "Config root must be a JSON object");
        }
        // 先在副本上解析，失败时不修改调用方的配置
        LoadConfig parsed = cfg;
        details::ApplyJson(j, parsed);
        cfg = parsed;
        return make_ok();
    } catch (const json::parse_error& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON value out of range: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, e.what());
    }
}

Result<void> load_from_file(const std::string& file_path, LoadConfig& cfg) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_err(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return make_err(ErrorCode::FILE_READ_ERROR, "Failed to read config file: " + file_path);
    }
    return load_from_string(buffer.str(), cfg);
}

Result<void> validate(const LoadConfig& cfg) {
    if (!cfg.target.is_valid()) {
        return make_err(ErrorCode::CONFIG_MISSING_REQUIRED, "Missing target address");
    }
    if (cfg.connections == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "connections must be at least 1");
    }
    if (cfg.connect_timeout_ms == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "connect_timeout must be positive");
    }
    if (cfg.read_timeout_ms == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "read_timeout must be positive");
    }
    if (cfg.has_duration() && cfg.duration_ms > kMaxDurationMs) {
        return make_err(ErrorCode::CONFIG_INVALID_DURATION, "duration exceeds 100 years");
    }
    return make_ok();
}

Result<std::string> to_json_string(const LoadConfig& cfg) {
    json j;
    j["target"] = cfg.target.to_string();
    j["rate"] = cfg.rate;
    if (cfg.has_duration()) {
        j["duration"] = cfg.duration_ms;
    } else {
        j["duration"] = nullptr;
    }
    j["threads"] = cfg.num_threads;
    j["connections"] = cfg.connections;
    j["connect_timeout"] = cfg.connect_timeout_ms;
    j["read_timeout"] = cfg.read_timeout_ms;
    return make_ok(j.dump(4));
}

} // namespace config
} // namespace clobber

// 文件结束
