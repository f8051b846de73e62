// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: slot.cpp
//  描述: Slot连接槽位状态机实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "client/slot.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <cstring>
#include <sys/epoll.h>

namespace clobber {
namespace client {

using utils::ErrorCode;

namespace details {

constexpr size_t kSlotReadBufferSize = 16 * 1024;

} // namespace details

const char* slot_state_to_string(SlotState state) {
    switch (state) {
        case SlotState::IDLE: return "IDLE";
        case SlotState::STAGGERING: return "STAGGERING";
        case SlotState::CONNECTING: return "CONNECTING";
        case SlotState::WRITING: return "WRITING";
        case SlotState::READING: return "READING";
        case SlotState::PACING: return "PACING";
        case SlotState::TERMINATED: return "TERMINATED";
        default: return "UNKNOWN";
    }
}

// ============================================================================
//  SlotContext
// ============================================================================

SlotContext::SlotContext(const config::LoadConfig& config,
                         const Message& message,
                         const Pacer& pacer,
                         utils::TimePoint run_start,
                         utils::LoadStatistics& stats)
    : target(config.target)
    , message(message)
    , pacer(pacer)
    , run_start(run_start)
    , has_duration(config.has_duration())
    , duration(std::chrono::milliseconds(config.duration_ms))
    , connect_timeout(std::chrono::milliseconds(config.connect_timeout_ms))
    , read_timeout(std::chrono::milliseconds(config.read_timeout_ms))
    , stats(stats)
    , read_buffer(details::kSlotReadBufferSize)
{
}

bool SlotContext::expired(utils::TimePoint now) const {
    return has_duration && now >= run_start + duration;
}

// ============================================================================
//  Slot
// ============================================================================

Slot::Slot(LocalScheduler& scheduler, SlotContext& context, uint32_t slot_index)
    : scheduler_(scheduler)
    , context_(context)
    , slot_index_(slot_index)
    , state_(SlotState::IDLE)
    , watching_(false)
    , watched_events_(0)
    , written_(0)
    , iterations_(0)
{
}

void Slot::start() {
    state_ = SlotState::STAGGERING;
    utils::TimePoint now = utils::SteadyClock::now();
    if (context_.pacer.has_rate()) {
        scheduler_.set_timer(this, now + context_.pacer.stagger_delay(slot_index_));
    } else {
        scheduler_.set_timer(this, now);
    }
}

void Slot::on_timer() {
    switch (state_) {
        case SlotState::STAGGERING:
        case SlotState::PACING:
            begin_iteration();
            break;
        case SlotState::CONNECTING:
            LOG_DEBUG("Slot", "connect timeout: %s", context_.target.to_string().c_str());
            fail(RequestPhase::CONNECT, ErrorCode::TIMEOUT);
            break;
        case SlotState::WRITING:
            LOG_ERROR("Slot", "write error: 'timed out after %zu bytes'", written_);
            fail(RequestPhase::WRITE, ErrorCode::TIMEOUT);
            break;
        case SlotState::READING:
            LOG_WARN("Slot", "read timeout: %s (%llu bytes read)",
                     context_.target.to_string().c_str(),
                     static_cast<unsigned long long>(outcome_.bytes_read));
            fail(RequestPhase::READ, ErrorCode::TIMEOUT);
            break;
        default:
            break;
    }
}

void Slot::on_io(uint32_t events) {
    // 同一批事件里可能有已处理完的旧fd事件，按当前状态过滤
    (void)events;
    switch (state_) {
        case SlotState::CONNECTING:
            on_connect_ready();
            break;
        case SlotState::WRITING:
            continue_write();
            break;
        case SlotState::READING:
            continue_read();
            break;
        default:
            break;
    }
}

void Slot::begin_iteration() {
    utils::TimePoint now = utils::SteadyClock::now();
    if (context_.expired(now)) {
        terminate();
        return;
    }

    outcome_ = RequestOutcome();
    request_start_ = now;
    written_ = 0;

    ConnectStatus status = conn_.start_connect(context_.target);
    if (status == ConnectStatus::CONNECTED) {
        outcome_.connected = true;
        LOG_DEBUG("Slot", "connected to %s", context_.target.to_string().c_str());
        start_write();
        return;
    }

    if (status == ConnectStatus::FAILED) {
        int err = conn_.last_error();
        if (is_resource_exhaustion(err)) {
            LOG_ERROR("Slot", "unknown connect error: '%s' (local resources exhausted)",
                      std::strerror(err));
        } else {
            LOG_ERROR("Slot", "unknown connect error: '%s'", std::strerror(err));
        }
        fail(RequestPhase::CONNECT, ErrorCode::NETWORK_CONNECT_ERROR);
        return;
    }

    state_ = SlotState::CONNECTING;
    if (!ensure_watch(EPOLLOUT, RequestPhase::CONNECT)) {
        return;
    }
    scheduler_.set_timer(this, now + context_.connect_timeout);
}

void Slot::on_connect_ready() {
    int err = conn_.finish_connect();
    if (err != 0) {
        if (err == ETIMEDOUT) {
            LOG_DEBUG("Slot", "connect timeout: %s", context_.target.to_string().c_str());
            fail(RequestPhase::CONNECT, ErrorCode::TIMEOUT);
        } else {
            LOG_ERROR("Slot", "unknown connect error: '%s'", std::strerror(err));
            fail(RequestPhase::CONNECT, ErrorCode::NETWORK_CONNECT_ERROR);
        }
        return;
    }

    outcome_.connected = true;
    LOG_DEBUG("Slot", "connected to %s", context_.target.to_string().c_str());
    start_write();
}

void Slot::start_write() {
    state_ = SlotState::WRITING;
    // 写阶段同样以read_timeout为上限
    scheduler_.set_timer(this, utils::SteadyClock::now() + context_.read_timeout);
    continue_write();
}

void Slot::continue_write() {
    const Message& message = context_.message;
    size_t n = 0;
    IoStatus status = conn_.write_some(message.data() + written_, message.size() - written_, n);
    written_ += n;

    if (status == IoStatus::OK) {
        outcome_.bytes_written = written_;
        LOG_DEBUG("Slot", "%zu bytes written", written_);
        start_read();
        return;
    }
    if (status == IoStatus::WOULD_BLOCK) {
        ensure_watch(EPOLLOUT, RequestPhase::WRITE);
        return;
    }

    LOG_ERROR("Slot", "write error: '%s'", conn_.last_error_string().c_str());
    fail(RequestPhase::WRITE, ErrorCode::NETWORK_WRITE_ERROR);
}

void Slot::start_read() {
    state_ = SlotState::READING;
    // 超时覆盖整个读阶段，读到数据不顺延
    scheduler_.set_timer(this, utils::SteadyClock::now() + context_.read_timeout);
    continue_read();
}

void Slot::continue_read() {
    std::vector<char>& buffer = context_.read_buffer;
    while (true) {
        size_t n = 0;
        IoStatus status = conn_.read_some(buffer.data(), buffer.size(), n);
        outcome_.bytes_read += n;

        if (status == IoStatus::OK) {
            continue;
        }
        if (status == IoStatus::CLOSED) {
            LOG_DEBUG("Slot", "%llu bytes read",
                      static_cast<unsigned long long>(outcome_.bytes_read));
            outcome_.latency_us = static_cast<uint32_t>(
                std::chrono::duration_cast<std::chrono::microseconds>(
                    utils::SteadyClock::now() - request_start_).count());
            finish_iteration();
            return;
        }
        if (status == IoStatus::WOULD_BLOCK) {
            ensure_watch(EPOLLIN | EPOLLRDHUP, RequestPhase::READ);
            return;
        }

        LOG_ERROR("Slot", "read error: '%s'", conn_.last_error_string().c_str());
        fail(RequestPhase::READ, ErrorCode::NETWORK_READ_ERROR);
        return;
    }
}

bool Slot::ensure_watch(uint32_t events, RequestPhase phase) {
    if (watching_ && watched_events_ == events) {
        return true;
    }

    utils::Result<void> ret = watching_
        ? scheduler_.modify(conn_.fd(), events, this)
        : scheduler_.watch(conn_.fd(), events, this);
    if (ret.is_err()) {
        LOG_ERROR("Slot", "failed to watch fd=%d: %s", conn_.fd(), ret.error_message().c_str());
        fail(phase, ret.error_code());
        return false;
    }
    watching_ = true;
    watched_events_ = events;
    return true;
}

void Slot::fail(RequestPhase phase, ErrorCode error) {
    outcome_.failed_phase = phase;
    outcome_.error = error;
    finish_iteration();
}

void Slot::finish_iteration() {
    release_connection();

    utils::TimePoint now = utils::SteadyClock::now();
    utils::Nanos remaining(0);
    if (context_.pacer.has_rate()) {
        bool behind = false;
        remaining = context_.pacer.remaining_delay(now - request_start_, behind);
        if (behind) {
            LOG_WARN("Slot", "running behind; consider adding more connections");
            outcome_.behind = true;
        }
    }

    record_outcome(context_.stats, outcome_);
    ++iterations_;

    // 下一轮总是经定时器进入，不在回调里递归
    state_ = SlotState::PACING;
    scheduler_.set_timer(this, now + remaining);
}

void Slot::release_connection() {
    scheduler_.cancel_timer(this);
    if (watching_) {
        scheduler_.unwatch(conn_.fd());
        watching_ = false;
        watched_events_ = 0;
    }
    conn_.close();
}

void Slot::terminate() {
    release_connection();
    state_ = SlotState::TERMINATED;
    scheduler_.finish(this);
    LOG_DEBUG("Slot", "slot %u finished after %llu iterations",
              slot_index_, static_cast<unsigned long long>(iterations_));
}

} // namespace client
} // namespace clobber

// 文件结束
