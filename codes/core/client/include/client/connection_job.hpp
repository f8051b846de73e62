// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: connection_job.hpp
//  描述: ConnectionJobRunner与PooledTrafficGenerator（基于WorkerPool的槽位）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include <memory>
#include "client/connection_driver.hpp"
#include "client/message.hpp"
#include "client/traffic_generator.hpp"
#include "config/config.hpp"
#include "pool/job.hpp"
#include "pool/worker_pool.hpp"
#include "utils/error.hpp"
#include "utils/time.hpp"

namespace clobber {
namespace client {

// 交给WorkerPool的输入项：一个槽位
struct SlotTask {
    config::LoadConfig config;
    Message message;
    utils::TimePoint run_start;
    uint32_t slot_index = 0;
    uint32_t num_slots = 1;   // 全局槽位数，用于错峰
};

using ConnectionJob = Job<SlotTask, RequestOutcome>;
using ConnectionWorkerPool = WorkerPool<SlotTask, RequestOutcome>;

/**
 * @brief 在WorkerPool的worker中跑一个槽位循环
 *
 * 使用阻塞的ConnectionDriver，每轮开始前检查一次停止请求，
 * 每轮产出一个RequestOutcome。所有槽位在同一个池中，错峰按全局槽位下标计算。
 */
class ConnectionJobRunner : public JobRunner<SlotTask, RequestOutcome> {
public:
    ConnectionJobRunner() = default;
    ~ConnectionJobRunner() override = default;

    JobStatus run(ConnectionJob& job) override;

private:
    // 分段休眠，期间收到停止请求返回false
    static bool sleep_unless_stopped(ConnectionJob& job, utils::Nanos delay);
};

/**
 * @brief 以WorkerPool承载全部槽位的压测
 *
 * 每个连接一个worker。run()在调用线程上驱动WorkerPool，
 * 另起一个线程把结果汇总到LoadStatistics。
 * 任意线程可通过command_channel()发送STOP提前结束，或调整worker数量。
 */
class PooledTrafficGenerator {
public:
    PooledTrafficGenerator(const config::LoadConfig& config, const Message& message);
    ~PooledTrafficGenerator();

    // 禁止拷贝
    PooledTrafficGenerator(const PooledTrafficGenerator&) = delete;
    PooledTrafficGenerator& operator=(const PooledTrafficGenerator&) = delete;

    CommandChannel command_channel() const;

    /**
     * @brief 运行直到所有槽位到时结束，或收到STOP
     * @param report [out] 可选，运行报告（threads_spawned为槽位数）
     */
    utils::Result<void> run(RunReport* report = nullptr);

private:
    config::LoadConfig config_;
    Message message_;
    uint32_t num_slots_;
    std::shared_ptr<Channel<RequestOutcome>> output_;
    std::unique_ptr<ConnectionWorkerPool> pool_;
};

} // namespace client
} // namespace clobber

// 文件结束
