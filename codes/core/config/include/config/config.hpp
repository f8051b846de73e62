// =============================================================================
//  Clobber TCP Load Generator - Config Module
//  文件: config.hpp
//  描述: 压测配置结构、目标地址与时长解析
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <string>
#include <sys/socket.h>
#include "utils/error.hpp"

namespace clobber {
namespace config {

// 默认值（与库的默认构造保持一致；命令行的connections默认为100）
constexpr uint32_t kDefaultThreads = 1;
constexpr uint32_t kDefaultConnections = 10;
constexpr uint32_t kDefaultCliConnections = 100;
constexpr uint32_t kDefaultConnectTimeoutMs = 250;
constexpr uint32_t kDefaultReadTimeoutMs = 250;

// 运行时长上限（100年），换算成纳秒并加上启动时刻后仍不会溢出int64
constexpr uint64_t kMaxDurationMs = 100ULL * 365 * 24 * 3600 * 1000;

// 压测目标地址（IPv4/IPv6字面量 + 端口，不做DNS解析）
class TargetAddress {
public:
    TargetAddress();

    // 解析 "1.2.3.4:80" 或 "[::1]:80"
    static utils::Result<TargetAddress> parse(const std::string& text);

    // 由sockaddr构造（测试里用于包装监听端地址）
    static TargetAddress from_sockaddr(const sockaddr* addr, socklen_t len);

    bool is_valid() const { return length_ != 0; }
    int family() const { return storage_.ss_family; }
    uint16_t port() const;

    const sockaddr* sockaddr_ptr() const {
        return reinterpret_cast<const sockaddr*>(&storage_);
    }
    socklen_t sockaddr_len() const { return length_; }

    // 还原成 "ip:port" / "[ip]:port"
    std::string to_string() const;

private:
    sockaddr_storage storage_;
    socklen_t length_;
};

// 解析humantime风格的时长："500ms"、"5s"、"10m"、"2h"、"1d"、"1h 30m"
// return: 纳秒数，格式非法时返回CONFIG_INVALID_DURATION
utils::Result<uint64_t> parse_duration_ns(const std::string& text);

// 同上，换算为毫秒，不足1ms的部分向上取整
utils::Result<uint64_t> parse_duration_ms(const std::string& text);

// 压测配置：运行开始后不可变，按值拷贝到各线程
struct LoadConfig {
    TargetAddress target;
    uint32_t rate = 0;                 // 每秒请求上限，0表示不限速
    uint64_t duration_ms = 0;          // 运行时长，仅在limit_duration为true时生效
    bool limit_duration = false;       // 指定了时长（包括0，表示立即结束）
    uint32_t num_threads = kDefaultThreads;  // 0表示使用CPU核数
    uint32_t connections = kDefaultConnections;
    uint32_t connect_timeout_ms = kDefaultConnectTimeoutMs;
    uint32_t read_timeout_ms = kDefaultReadTimeoutMs;

    LoadConfig() = default;
    explicit LoadConfig(const TargetAddress& addr) : target(addr) {}

    bool has_rate() const { return rate != 0; }
    bool has_duration() const { return limit_duration; }

    void set_duration_ms(uint64_t ms) {
        duration_ms = ms;
        limit_duration = true;
    }

    void clear_duration() {
        duration_ms = 0;
        limit_duration = false;
    }

    // 解析后的线程数（0 -> CPU核数，至少为1）
    uint32_t resolved_threads() const;

    // 每线程连接数 = max(1, connections / threads)
    uint32_t connections_per_thread() const;
};

// ========== JSON加载与导出（防腐层：头文件不暴露nlohmann/json） ==========

// 从JSON字符串加载，只覆盖出现的字段
utils::Result<void> load_from_string(const std::string& json_str, LoadConfig& cfg);

// 从JSON文件加载
utils::Result<void> load_from_file(const std::string& file_path, LoadConfig& cfg);

// 校验配置合法性
utils::Result<void> validate(const LoadConfig& cfg);

// 导出为JSON字符串
utils::Result<std::string> to_json_string(const LoadConfig& cfg);

} // namespace config
} // namespace clobber

// 文件结束
