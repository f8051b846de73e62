// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: connection_driver.cpp
//  描述: ConnectionDriver单次请求周期实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "client/connection_driver.hpp"
#include "utils/logger.hpp"
#include "utils/time.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>

namespace clobber {
namespace client {

using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace details {

constexpr size_t kReadBufferSize = 16 * 1024;

// 等待fd就绪
// return: >0-就绪，0-超时，<0-poll出错（errno有效）
int WaitFor(int fd, short events, const utils::TimeoutChecker& timeout) {
    while (true) {
        uint64_t remaining = timeout.remaining_ms();
        if (remaining == 0) {
            return 0;
        }
        pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0 && errno == EINTR) {
            continue;
        }
        return ret;
    }
}

} // namespace details

const char* request_phase_to_string(RequestPhase phase) {
    switch (phase) {
        case RequestPhase::NONE: return "NONE";
        case RequestPhase::CONNECT: return "CONNECT";
        case RequestPhase::WRITE: return "WRITE";
        case RequestPhase::READ: return "READ";
        default: return "UNKNOWN";
    }
}

void record_outcome(utils::LoadStatistics& stats, const RequestOutcome& outcome) {
    stats.record_iteration();
    if (outcome.connected) {
        stats.record_connect();
    }
    stats.record_bytes_written(outcome.bytes_written);
    stats.record_bytes_read(outcome.bytes_read);
    if (outcome.behind) {
        stats.record_pacing_shortfall();
    }

    switch (outcome.failed_phase) {
        case RequestPhase::NONE:
            stats.record_success(outcome.latency_us);
            break;
        case RequestPhase::CONNECT:
            if (outcome.error == ErrorCode::TIMEOUT) {
                stats.record_connect_timeout();
            } else {
                stats.record_connect_error();
            }
            break;
        case RequestPhase::WRITE:
            stats.record_write_error();
            break;
        case RequestPhase::READ:
            if (outcome.error == ErrorCode::TIMEOUT) {
                stats.record_read_timeout();
            } else {
                stats.record_read_error();
            }
            break;
    }
}

ConnectionDriver::ConnectionDriver(const config::TargetAddress& target,
                                   uint32_t connect_timeout_ms,
                                   uint32_t read_timeout_ms)
    : target_(target)
    , connect_timeout_ms_(connect_timeout_ms)
    , read_timeout_ms_(read_timeout_ms)
    , read_buffer_(details::kReadBufferSize)
{
}

Result<void> ConnectionDriver::connect_with_timeout(TcpConnection& conn) const {
    utils::TimeoutChecker timeout(connect_timeout_ms_);

    ConnectStatus status = conn.start_connect(target_);
    if (status == ConnectStatus::IN_PROGRESS) {
        int ready = details::WaitFor(conn.fd(), POLLOUT, timeout);
        if (ready == 0) {
            conn.close();
            LOG_DEBUG("Connection", "connect timeout: %s", target_.to_string().c_str());
            return make_err(ErrorCode::TIMEOUT, "connect timeout");
        }
        if (ready < 0) {
            int err = errno;
            conn.close();
            LOG_ERROR("Connection", "poll error while connecting: '%s'", std::strerror(err));
            return make_err(ErrorCode::NETWORK_POLL_ERROR, std::strerror(err));
        }
        if (conn.finish_connect() != 0) {
            status = ConnectStatus::FAILED;
        } else {
            status = ConnectStatus::CONNECTED;
        }
    }

    if (status == ConnectStatus::FAILED) {
        std::string reason = conn.last_error_string();
        if (conn.last_error() == ETIMEDOUT) {
            conn.close();
            LOG_DEBUG("Connection", "connect timeout: %s", target_.to_string().c_str());
            return make_err(ErrorCode::TIMEOUT, reason);
        }
        conn.close();
        LOG_ERROR("Connection", "unknown connect error: '%s'", reason.c_str());
        return make_err(ErrorCode::NETWORK_CONNECT_ERROR, reason);
    }

    LOG_DEBUG("Connection", "connected to %s", target_.to_string().c_str());
    return make_ok();
}

Result<size_t> ConnectionDriver::write(TcpConnection& conn, const Message& message) const {
    utils::TimeoutChecker timeout(read_timeout_ms_);
    size_t total = 0;

    while (total < message.size()) {
        size_t written = 0;
        IoStatus status = conn.write_some(message.data() + total, message.size() - total, written);
        total += written;
        if (status == IoStatus::OK) {
            break;
        }
        if (status == IoStatus::WOULD_BLOCK) {
            int ready = details::WaitFor(conn.fd(), POLLOUT, timeout);
            if (ready > 0) {
                continue;
            }
            if (ready == 0) {
                LOG_ERROR("Connection", "write error: 'timed out after %zu bytes'", total);
                return make_err<size_t>(ErrorCode::TIMEOUT, "write timeout");
            }
            std::string reason = std::strerror(errno);
            LOG_ERROR("Connection", "poll error while writing: '%s'", reason.c_str());
            return make_err<size_t>(ErrorCode::NETWORK_POLL_ERROR, reason);
        }
        std::string reason = conn.last_error_string();
        LOG_ERROR("Connection", "write error: '%s'", reason.c_str());
        return make_err<size_t>(ErrorCode::NETWORK_WRITE_ERROR, reason);
    }

    LOG_DEBUG("Connection", "%zu bytes written", total);
    return make_ok(total);
}

Result<size_t> ConnectionDriver::read_with_timeout(TcpConnection& conn) const {
    utils::TimeoutChecker timeout(read_timeout_ms_);
    size_t total = 0;

    while (true) {
        size_t n = 0;
        IoStatus status = conn.read_some(read_buffer_.data(), read_buffer_.size(), n);
        // 响应内容不做校验，直接丢弃
        total += n;
        if (status == IoStatus::OK) {
            continue;
        }
        if (status == IoStatus::CLOSED) {
            LOG_DEBUG("Connection", "%zu bytes read", total);
            return make_ok(total);
        }
        if (status == IoStatus::WOULD_BLOCK) {
            int ready = details::WaitFor(conn.fd(), POLLIN, timeout);
            if (ready > 0) {
                continue;
            }
            if (ready == 0) {
                LOG_WARN("Connection", "read timeout: %s (%zu bytes read)",
                         target_.to_string().c_str(), total);
                return make_err<size_t>(ErrorCode::TIMEOUT, "read timeout");
            }
            std::string reason = std::strerror(errno);
            LOG_ERROR("Connection", "poll error while reading: '%s'", reason.c_str());
            return make_err<size_t>(ErrorCode::NETWORK_POLL_ERROR, reason);
        }
        std::string reason = conn.last_error_string();
        LOG_ERROR("Connection", "read error: '%s'", reason.c_str());
        return make_err<size_t>(ErrorCode::NETWORK_READ_ERROR, reason);
    }
}

RequestOutcome ConnectionDriver::run_cycle(const Message& message) const {
    RequestOutcome outcome;
    utils::StopWatch watch;
    TcpConnection conn;

    Result<void> connected = connect_with_timeout(conn);
    if (connected.is_err()) {
        outcome.failed_phase = RequestPhase::CONNECT;
        outcome.error = connected.error_code();
        return outcome;
    }
    outcome.connected = true;

    Result<size_t> written = write(conn, message);
    if (written.is_err()) {
        outcome.failed_phase = RequestPhase::WRITE;
        outcome.error = written.error_code();
        return outcome;
    }
    outcome.bytes_written = written.value();

    Result<size_t> read = read_with_timeout(conn);
    if (read.is_err()) {
        outcome.failed_phase = RequestPhase::READ;
        outcome.error = read.error_code();
        return outcome;
    }
    outcome.bytes_read = read.value();
    outcome.latency_us = static_cast<uint32_t>(watch.elapsed_us());
    return outcome;
}

} // namespace client
} // namespace clobber

// 文件结束
