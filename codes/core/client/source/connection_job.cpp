// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: connection_job.cpp
//  描述: ConnectionJobRunner与PooledTrafficGenerator实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "client/connection_job.hpp"
#include "client/pacer.hpp"
#include "utils/logger.hpp"
#include "utils/statistics.hpp"
#include <algorithm>
#include <system_error>
#include <thread>

namespace clobber {
namespace client {

using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace details {

// 休眠期间检查停止请求的间隔
constexpr std::chrono::milliseconds kStopPollInterval(10);

} // namespace details

// ============================================================================
//  ConnectionJobRunner
// ============================================================================

JobStatus ConnectionJobRunner::run(ConnectionJob& job) {
    const SlotTask& task = job.task();
    const config::LoadConfig& cfg = task.config;

    // 所有槽位在一个池里，相当于单线程K个槽位
    Pacer pacer(cfg.rate, 1, task.num_slots);
    ConnectionDriver driver(cfg.target, cfg.connect_timeout_ms, cfg.read_timeout_ms);
    utils::Nanos duration = std::chrono::milliseconds(cfg.duration_ms);

    if (pacer.has_rate() && !sleep_unless_stopped(job, pacer.stagger_delay(task.slot_index))) {
        return JobStatus::STOPPED;
    }

    while (true) {
        utils::TimePoint request_start = utils::SteadyClock::now();
        if (cfg.has_duration() && request_start >= task.run_start + duration) {
            return JobStatus::DONE;
        }
        if (job.stop_requested()) {
            return JobStatus::STOPPED;
        }

        RequestOutcome outcome = driver.run_cycle(task.message);

        utils::Nanos remaining(0);
        if (pacer.has_rate()) {
            bool behind = false;
            remaining = pacer.remaining_delay(utils::SteadyClock::now() - request_start, behind);
            if (behind) {
                LOG_WARN("Slot", "running behind; consider adding more connections");
                outcome.behind = true;
            }
        }

        if (!job.send(outcome)) {
            return JobStatus::STOPPED;
        }
        if (remaining.count() > 0 && !sleep_unless_stopped(job, remaining)) {
            return JobStatus::STOPPED;
        }
    }
}

bool ConnectionJobRunner::sleep_unless_stopped(ConnectionJob& job, utils::Nanos delay) {
    utils::TimePoint deadline = utils::SteadyClock::now() + delay;
    while (true) {
        if (job.stop_requested()) {
            return false;
        }
        utils::TimePoint now = utils::SteadyClock::now();
        if (now >= deadline) {
            return true;
        }
        utils::Nanos step = std::min<utils::Nanos>(deadline - now, details::kStopPollInterval);
        std::this_thread::sleep_for(step);
    }
}

// ============================================================================
//  PooledTrafficGenerator
// ============================================================================

PooledTrafficGenerator::PooledTrafficGenerator(const config::LoadConfig& config,
                                               const Message& message)
    : config_(config)
    , message_(message)
    , num_slots_(std::max<uint32_t>(1, config.connections))
    , output_(std::make_shared<Channel<RequestOutcome>>(num_slots_))
    , pool_(new ConnectionWorkerPool(std::make_shared<ConnectionJobRunner>(), output_, num_slots_))
{
}

PooledTrafficGenerator::~PooledTrafficGenerator() {
    pool_.reset();
    output_->close();
}

CommandChannel PooledTrafficGenerator::command_channel() const {
    return pool_->command_channel();
}

Result<void> PooledTrafficGenerator::run(RunReport* report) {
    if (!config_.target.is_valid()) {
        LOG_ERROR("Traffic", "no valid target address");
        return make_err(ErrorCode::INVALID_ARGUMENT, "no valid target address");
    }
    if (config_.has_duration() && config_.duration_ms > config::kMaxDurationMs) {
        LOG_ERROR("Traffic", "duration %llums is too long",
                  static_cast<unsigned long long>(config_.duration_ms));
        return make_err(ErrorCode::CONFIG_INVALID_DURATION, "duration exceeds 100 years");
    }

    LOG_INFO("Traffic", "Starting pooled run: target=%s, rate=%u, duration=%llums, slots=%u, "
             "connect_timeout=%ums, read_timeout=%ums",
             config_.target.to_string().c_str(), config_.rate,
             static_cast<unsigned long long>(config_.duration_ms), num_slots_,
             config_.connect_timeout_ms, config_.read_timeout_ms);

    utils::StopWatch watch;
    utils::TimePoint run_start = utils::SteadyClock::now();
    for (uint32_t i = 0; i < num_slots_; ++i) {
        SlotTask task;
        task.config = config_;
        task.message = message_;
        task.run_start = run_start;
        task.slot_index = i;
        task.num_slots = num_slots_;
        pool_->push(std::move(task));
    }

    // 结果汇总线程：直到output关闭且取空
    utils::LoadStatistics stats;
    std::thread consumer;
    try {
        consumer = std::thread([this, &stats]() {
            RequestOutcome outcome;
            while (output_->recv(outcome)) {
                record_outcome(stats, outcome);
            }
        });
    } catch (const std::system_error& e) {
        LOG_ERROR("Traffic", "failed to spawn result consumer: %s", e.what());
        return make_err(ErrorCode::RESOURCE_EXHAUSTED,
                        std::string("thread creation failed: ") + e.what());
    }

    pool_->work();
    pool_->shutdown();
    output_->close();
    consumer.join();

    LOG_INFO("Traffic", "Finished in %s: %s",
             utils::format_duration(watch.elapsed()).c_str(), stats.to_string().c_str());

    if (report != nullptr) {
        report->threads_spawned = num_slots_;
        report->slots_per_thread = 1;
        report->statistics = stats;
        report->wall_time = watch.elapsed();
    }
    return make_ok();
}

} // namespace client
} // namespace clobber

// 文件结束
