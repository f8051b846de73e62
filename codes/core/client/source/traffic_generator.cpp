// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: traffic_generator.cpp
//  描述: TrafficGenerator多线程限速压测实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "client/traffic_generator.hpp"
#include "client/local_scheduler.hpp"
#include "client/slot.hpp"
#include "utils/logger.hpp"
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

namespace clobber {
namespace client {

using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

TrafficGenerator::TrafficGenerator(const config::LoadConfig& config, const Message& message)
    : config_(config)
    , message_(message)
    , num_threads_(config.resolved_threads())
    , slots_per_thread_(config.connections_per_thread())
    , pacer_(config.rate, num_threads_, slots_per_thread_)
{
}

Result<void> TrafficGenerator::run(RunReport* report) {
    if (!config_.target.is_valid()) {
        LOG_ERROR("Traffic", "no valid target address");
        return make_err(ErrorCode::INVALID_ARGUMENT, "no valid target address");
    }
    if (config_.has_duration() && config_.duration_ms > config::kMaxDurationMs) {
        LOG_ERROR("Traffic", "duration %llums is too long",
                  static_cast<unsigned long long>(config_.duration_ms));
        return make_err(ErrorCode::CONFIG_INVALID_DURATION, "duration exceeds 100 years");
    }

    LOG_INFO("Traffic", "Starting: target=%s, rate=%u, duration=%llums, threads=%u, "
             "connections=%u (%u per thread), connect_timeout=%ums, read_timeout=%ums",
             config_.target.to_string().c_str(), config_.rate,
             static_cast<unsigned long long>(config_.duration_ms),
             num_threads_, config_.connections, slots_per_thread_,
             config_.connect_timeout_ms, config_.read_timeout_ms);

    utils::StopWatch watch;
    utils::TimePoint run_start = utils::SteadyClock::now();

    // 预先分配，线程内只写自己的那一份
    std::vector<utils::LoadStatistics> thread_stats(num_threads_);
    std::vector<Result<void>> thread_results(num_threads_);
    std::vector<std::thread> threads;
    threads.reserve(num_threads_);

    Result<void> spawn_result = make_ok();
    for (uint32_t i = 0; i < num_threads_; ++i) {
        try {
            threads.emplace_back(&TrafficGenerator::run_thread, this, i, run_start,
                                 std::ref(thread_stats[i]), std::ref(thread_results[i]));
        } catch (const std::system_error& e) {
            LOG_ERROR("Traffic", "failed to spawn thread %u of %u: %s",
                      i + 1, num_threads_, e.what());
            spawn_result = make_err(ErrorCode::RESOURCE_EXHAUSTED,
                                    std::string("thread creation failed: ") + e.what());
            break;
        }

        // 相邻线程错开1个tick启动
        std::this_thread::sleep_for(pacer_.thread_launch_gap());
    }

    if (threads.empty()) {
        return spawn_result;
    }
    if (threads.size() < num_threads_) {
        LOG_WARN("Traffic", "running degraded with %zu of %u threads",
                 threads.size(), num_threads_);
    }

    for (std::thread& t : threads) {
        t.join();
    }

    utils::LoadStatistics merged;
    Result<void> final_result = spawn_result;
    for (size_t i = 0; i < threads.size(); ++i) {
        merged.merge(thread_stats[i]);
        if (thread_results[i].is_err() && final_result.is_ok()) {
            final_result = thread_results[i];
        }
    }

    LOG_INFO("Traffic", "Finished in %s: %s",
             utils::format_duration(watch.elapsed()).c_str(), merged.to_string().c_str());

    if (report != nullptr) {
        report->threads_spawned = static_cast<uint32_t>(threads.size());
        report->slots_per_thread = slots_per_thread_;
        report->statistics = merged;
        report->wall_time = watch.elapsed();
    }
    return final_result;
}

void TrafficGenerator::run_thread(uint32_t thread_index,
                                  utils::TimePoint run_start,
                                  utils::LoadStatistics& stats,
                                  Result<void>& result) const {
    LocalScheduler scheduler;
    Result<void> ret = scheduler.init();
    if (ret.is_err()) {
        LOG_ERROR("Traffic", "thread %u: failed to create scheduler: %s",
                  thread_index, ret.error_message().c_str());
        result = ret;
        return;
    }

    SlotContext context(config_, message_, pacer_, run_start, stats);
    std::vector<std::unique_ptr<Slot>> slots;
    slots.reserve(slots_per_thread_);
    for (uint32_t i = 0; i < slots_per_thread_; ++i) {
        slots.emplace_back(new Slot(scheduler, context, i));
        scheduler.add_task(slots.back().get());
    }

    LOG_DEBUG("Traffic", "thread %u running %u slots", thread_index, slots_per_thread_);
    result = scheduler.run();
    if (result.is_err()) {
        LOG_ERROR("Traffic", "thread %u stopped: %s",
                  thread_index, result.error_message().c_str());
    }
}

} // namespace client
} // namespace clobber

// 文件结束
