// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: traffic_generator.hpp
//  描述: TrafficGenerator多线程限速压测入口
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include "client/message.hpp"
#include "client/pacer.hpp"
#include "config/config.hpp"
#include "utils/error.hpp"
#include "utils/statistics.hpp"
#include "utils/time.hpp"

namespace clobber {
namespace client {

// 一次压测的运行报告
struct RunReport {
    uint32_t threads_spawned = 0;
    uint32_t slots_per_thread = 0;
    utils::LoadStatistics statistics;   // 各线程统计合并后的结果
    utils::Nanos wall_time{0};
};

/**
 * @brief 尽可能多地发起TCP请求，同时尽量平滑地贴近目标速率
 *
 * connections个槽位平均分到num_threads个线程（每线程至少1个），
 * 每个线程一个LocalScheduler驱动本线程的全部槽位，线程之间没有任何同步，
 * 统计在各线程内单独累计，join之后合并。
 * 线程启动间隔1个tick，线程内槽位按Pacer错峰。
 *
 * 不限速时槽位背靠背循环；不限时则一直运行，run()不返回。
 */
class TrafficGenerator {
public:
    TrafficGenerator(const config::LoadConfig& config, const Message& message);
    ~TrafficGenerator() = default;

    // 禁止拷贝
    TrafficGenerator(const TrafficGenerator&) = delete;
    TrafficGenerator& operator=(const TrafficGenerator&) = delete;

    /**
     * @brief 运行压测直到所有槽位结束
     * @param report [out] 可选，运行报告
     * @return 单个请求的失败不影响返回值；
     *         目标地址无效返回INVALID_ARGUMENT，
     *         线程或调度器无法创建时返回对应错误（已启动的线程仍会跑完）
     */
    utils::Result<void> run(RunReport* report = nullptr);

    uint32_t num_threads() const { return num_threads_; }
    uint32_t slots_per_thread() const { return slots_per_thread_; }
    const Pacer& pacer() const { return pacer_; }

private:
    // 单个压测线程的主体
    void run_thread(uint32_t thread_index,
                    utils::TimePoint run_start,
                    utils::LoadStatistics& stats,
                    utils::Result<void>& result) const;

    config::LoadConfig config_;
    Message message_;
    uint32_t num_threads_;
    uint32_t slots_per_thread_;
    Pacer pacer_;
};

} // namespace client
} // namespace clobber

// 文件结束
