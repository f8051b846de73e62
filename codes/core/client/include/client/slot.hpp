// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: slot.hpp
//  描述: Slot连接槽位状态机（connect -> write -> read -> pacing循环）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <vector>
#include "client/connection_driver.hpp"
#include "client/local_scheduler.hpp"
#include "client/message.hpp"
#include "client/pacer.hpp"
#include "client/tcp_connection.hpp"
#include "config/config.hpp"
#include "utils/statistics.hpp"
#include "utils/time.hpp"

namespace clobber {
namespace client {

// 槽位状态
enum class SlotState : uint8_t {
    IDLE = 0,
    STAGGERING = 1,   // 启动前错峰等待
    CONNECTING = 2,
    WRITING = 3,
    READING = 4,
    PACING = 5,       // 两轮之间的限速等待
    TERMINATED = 6
};

const char* slot_state_to_string(SlotState state);

/**
 * @brief 同一压测线程内所有槽位共享的只读上下文与统计
 * 只在所属线程内访问
 */
struct SlotContext {
    SlotContext(const config::LoadConfig& config,
                const Message& message,
                const Pacer& pacer,
                utils::TimePoint run_start,
                utils::LoadStatistics& stats);

    // 压测时长已到
    bool expired(utils::TimePoint now) const;

    config::TargetAddress target;
    Message message;
    Pacer pacer;
    utils::TimePoint run_start;
    bool has_duration;
    utils::Nanos duration;
    utils::Nanos connect_timeout;
    utils::Nanos read_timeout;
    utils::LoadStatistics& stats;
    std::vector<char> read_buffer;   // 响应直接丢弃，所有槽位共用
};

/**
 * @brief 一个连接槽位
 *
 * 反复执行 connect -> 写完整负载 -> 读到EOF，每一轮都新建连接。
 * 所有等待（错峰、超时、限速）都挂在LocalScheduler的定时器上，不阻塞线程。
 * 压测时长只在每轮开始前检查，进行中的一轮会完整结束。
 */
class Slot : public SchedulerTask {
public:
    Slot(LocalScheduler& scheduler, SlotContext& context, uint32_t slot_index);
    ~Slot() override = default;

    // 禁止拷贝
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;

    void start() override;
    void on_timer() override;
    void on_io(uint32_t events) override;

    SlotState state() const { return state_; }
    uint32_t slot_index() const { return slot_index_; }
    uint64_t iterations() const { return iterations_; }

private:
    void begin_iteration();
    void on_connect_ready();
    void start_write();
    void continue_write();
    void start_read();
    void continue_read();
    bool ensure_watch(uint32_t events, RequestPhase phase);
    void fail(RequestPhase phase, utils::ErrorCode error);
    void finish_iteration();
    void release_connection();
    void terminate();

    LocalScheduler& scheduler_;
    SlotContext& context_;
    uint32_t slot_index_;
    SlotState state_;
    TcpConnection conn_;
    bool watching_;
    uint32_t watched_events_;
    size_t written_;
    utils::TimePoint request_start_;
    RequestOutcome outcome_;
    uint64_t iterations_;
};

} // namespace client
} // namespace clobber

// 文件结束
