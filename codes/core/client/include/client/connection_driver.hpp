// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: connection_driver.hpp
//  描述: ConnectionDriver单次connect/write/read请求周期（阻塞+超时）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <vector>
#include "client/message.hpp"
#include "client/tcp_connection.hpp"
#include "config/config.hpp"
#include "utils/error.hpp"
#include "utils/statistics.hpp"

namespace clobber {
namespace client {

// 请求在哪个阶段失败
enum class RequestPhase : uint8_t {
    NONE = 0,      // 没有失败
    CONNECT = 1,
    WRITE = 2,
    READ = 3
};

const char* request_phase_to_string(RequestPhase phase);

// 一次请求周期的结果
struct RequestOutcome {
    RequestPhase failed_phase = RequestPhase::NONE;
    utils::ErrorCode error = utils::ErrorCode::SUCCESS;
    bool connected = false;
    uint64_t bytes_written = 0;
    uint64_t bytes_read = 0;
    uint32_t latency_us = 0;
    bool behind = false;   // 本轮结束时速率已跟不上

    bool ok() const { return failed_phase == RequestPhase::NONE; }
};

// 把一次请求结果计入统计
void record_outcome(utils::LoadStatistics& stats, const RequestOutcome& outcome);

/**
 * @brief 阻塞式请求周期：connect（超时）-> 写完整负载 -> 读到EOF（超时），丢弃响应内容
 *
 * 供WorkerPool中的job使用；基于poll等待，每个阶段各自计时。
 * 超时是预期结果，按DEBUG/WARN记录；其他IO错误按ERROR记录。
 */
class ConnectionDriver {
public:
    ConnectionDriver(const config::TargetAddress& target,
                     uint32_t connect_timeout_ms,
                     uint32_t read_timeout_ms);

    // 连接，超时返回TIMEOUT，其他失败返回NETWORK_CONNECT_ERROR
    utils::Result<void> connect_with_timeout(TcpConnection& conn) const;

    // 写完整个负载；写阶段的等待也以read_timeout为上限
    utils::Result<size_t> write(TcpConnection& conn, const Message& message) const;

    // 读到对端关闭为止，整个读阶段以read_timeout为上限
    utils::Result<size_t> read_with_timeout(TcpConnection& conn) const;

    // 完整的一轮请求
    RequestOutcome run_cycle(const Message& message) const;

private:
    config::TargetAddress target_;
    uint32_t connect_timeout_ms_;
    uint32_t read_timeout_ms_;
    mutable std::vector<char> read_buffer_;
};

} // namespace client
} // namespace clobber

// 文件结束
