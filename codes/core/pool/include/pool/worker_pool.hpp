// =============================================================================
//  Clobber TCP Load Generator - Pool Module
//  文件: worker_pool.hpp
//  描述: WorkerPool动态工作池（运行时可增减worker数量）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "pool/channel.hpp"
#include "pool/job.hpp"
#include "utils/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <deque>
#include <memory>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

namespace clobber {

/**
 * @brief 面向通道的动态工作池
 *
 * 适用于长时间运行、把输出写到同一个结果通道的job。worker数量是尽力而为的
 * 目标值，可以在运行中通过命令通道调大或调小：调小时只发送停止信号，
 * 由worker自己在合适的时机退出，不会强杀正在执行的job。
 *
 * 结果按完成顺序（而非入队顺序）转发到下游output通道。转发时阻塞，
 * 下游消费慢会拖慢整个池子的节拍。
 *
 * 线程模型：push/set_target_workers/try_next/work只能在持有WorkerPool的
 * 线程上调用；跨线程控制一律通过command_channel()。
 */
template<typename In, typename Out>
class WorkerPool {
public:
    using Runner = JobRunner<In, Out>;

    /**
     * @brief 构造函数
     * @param runner job执行策略，不可为nullptr
     * @param output 下游输出通道
     * @param num_workers 初始目标worker数量
     */
    WorkerPool(std::shared_ptr<Runner> runner,
               std::shared_ptr<Channel<Out>> output,
               size_t num_workers)
        : num_workers_(num_workers)
        , cur_workers_(0)
        , outstanding_stops_(0)
        , next_worker_id_(0)
        , output_(std::move(output))
        , runner_(std::move(runner))
        , results_(std::make_shared<Channel<Out>>(num_workers == 0 ? 1 : num_workers))
        , close_(std::make_shared<Channel<StopSignal>>(num_workers == 0 ? 1 : num_workers))
        , worker_events_(std::make_shared<Channel<WorkerEvent>>())
        , command_events_(std::make_shared<Channel<WorkerPoolCommand>>())
    {}

    /**
     * @brief 析构函数：通知所有worker停止并等待其退出
     */
    ~WorkerPool() {
        shutdown();
    }

    // 禁止拷贝
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // ==================== 状态查询 ====================

    /**
     * @brief 有效worker数：已启动的worker减去已通知停止但尚未确认的
     */
    size_t cur_workers() const {
        return cur_workers_ > outstanding_stops_ ? cur_workers_ - outstanding_stops_ : 0;
    }

    size_t target_workers() const { return num_workers_; }

    size_t outstanding_stops() const { return outstanding_stops_; }

    size_t queued() const { return queue_.size(); }

    bool at_target_worker_count() const {
        return cur_workers() == target_workers();
    }

    bool working() const {
        return cur_workers() > 0;
    }

    // ==================== 控制接口 ====================

    /**
     * @brief 设置目标worker数，下一个tick生效，不打断已在运行的worker
     */
    void set_target_workers(size_t n) {
        num_workers_ = n;
    }

    /**
     * @brief 把一个输入项放到队尾（不阻塞，队列无界）
     */
    void push(In task) {
        queue_.push_back(std::move(task));
    }

    /**
     * @brief 非阻塞地取一个已完成的结果
     * @return true-取到，false-当前没有结果
     */
    bool try_next(Out& out) {
        return results_->try_recv(out);
    }

    /**
     * @brief 获取命令通道，供WorkerPool所在线程之外的调用方发送STOP/SET_WORKER_COUNT
     */
    CommandChannel command_channel() const {
        return command_events_;
    }

    /**
     * @brief 运行工作池直到收到STOP，或没有worker且队列为空
     *
     * 每个tick依次：转发结果 -> 处理事件与命令 -> 调整worker数量（一次最多加减一个）。
     */
    void work() {
        while (true) {
            bool progressed = flush_output() > 0;

            bool events_seen = false;
            if (!event_loop(events_seen)) {
                LOG_INFO("WorkerPool", "Stop command received, leaving %zu worker(s) running",
                         cur_workers_);
                return;
            }
            progressed = progressed || events_seen;

            progressed = balance_workers() || progressed;

            if (!working()) {
                break;
            }

            if (!progressed) {
                // 本轮无事可做，短暂休眠避免空转
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }

        // 最后一个worker退出前可能刚投递过结果
        flush_output();
    }

    /**
     * @brief 关闭工作池：结果与停止通道关闭后，所有worker都会看到停止请求，
     *        阻塞在结果通道上的worker也会被唤醒，然后逐一join
     */
    void shutdown() {
        results_->close();
        close_->close();
        for (auto& entry : workers_) {
            if (entry.second.joinable()) {
                entry.second.join();
            }
        }
        workers_.clear();
    }

private:
    /**
     * @brief 把结果通道中当前可取的结果全部转发到output（逐个阻塞发送）
     * @return 转发的结果数
     */
    size_t flush_output() {
        size_t count = 0;
        Out out;
        while (results_->try_recv(out)) {
            if (!output_->send(std::move(out))) {
                LOG_WARN("WorkerPool", "Output channel closed, dropping result");
            }
            ++count;
        }
        return count;
    }

    /**
     * @brief 处理worker事件与外部命令
     * @param events_seen [out] 本轮是否处理过任何事件或命令
     * @return false-收到STOP，应退出；true-继续
     */
    bool event_loop(bool& events_seen) {
        WorkerEvent event;
        while (worker_events_->try_recv(event)) {
            events_seen = true;
            if (cur_workers_ > 0) {
                --cur_workers_;
            }
            if (event.type == WorkerEventType::WORKER_STOPPED && outstanding_stops_ > 0) {
                --outstanding_stops_;
            }
            // 未确认的停止请求不可能多于存活worker
            if (outstanding_stops_ > cur_workers_) {
                outstanding_stops_ = cur_workers_;
            }
            join_worker(event.worker_id);
        }

        WorkerPoolCommand command;
        while (command_events_->try_recv(command)) {
            events_seen = true;
            switch (command.type) {
                case PoolCommandType::STOP:
                    return false;
                case PoolCommandType::SET_WORKER_COUNT: {
                    // 通过命令不允许把worker数降到0
                    size_t n = command.worker_count == 0 ? 1 : command.worker_count;
                    LOG_DEBUG("WorkerPool", "Target worker count %zu -> %zu", num_workers_, n);
                    num_workers_ = n;
                    break;
                }
            }
        }
        return true;
    }

    /**
     * @brief 根据目标数量启动或停止一个worker
     * @return 本轮是否采取了动作
     */
    bool balance_workers() {
        if (cur_workers() < target_workers()) {
            return start_worker();
        }
        if (cur_workers() > target_workers()) {
            return send_stop_work_message();
        }
        return false;
    }

    /**
     * @brief 队列非空时弹出队首，启动一个worker
     */
    bool start_worker() {
        if (queue_.empty()) {
            return false;
        }

        uint64_t worker_id = next_worker_id_++;
        std::shared_ptr<Runner> runner = runner_;
        std::shared_ptr<Channel<WorkerEvent>> events = worker_events_;
        auto job = std::make_shared<Job<In, Out>>(std::move(queue_.front()), close_, results_);
        queue_.pop_front();

        try {
            workers_.emplace(worker_id, std::thread([runner, events, job, worker_id]() {
                JobStatus status = JobStatus::DONE;
                try {
                    status = runner->run(*job);
                } catch (const std::exception& e) {
                    LOG_ERROR("WorkerPool", "Worker %llu job threw exception: %s",
                              static_cast<unsigned long long>(worker_id), e.what());
                }

                WorkerEvent event;
                event.worker_id = worker_id;
                switch (status) {
                    case JobStatus::DONE:
                        event.type = WorkerEventType::WORKER_DONE;
                        break;
                    case JobStatus::STOPPED:
                        event.type = WorkerEventType::WORKER_STOPPED;
                        break;
                    default:
                        // JobRunner实现错误，不是运行时条件
                        LOG_ERROR("WorkerPool", "Job returned %s, which is not a terminal status",
                                  job_status_to_string(status));
                        std::abort();
                }
                events->send(event);
            }));
        } catch (const std::system_error& e) {
            LOG_ERROR("WorkerPool", "Failed to start worker: %s", e.what());
            queue_.push_front(std::move(job->task()));
            return false;
        }

        ++cur_workers_;
        return true;
    }

    /**
     * @brief 通知任意一个正在监听的worker停止（不强杀）
     *
     * 停止通道已满时不阻塞本线程，下一个tick再发。
     * @return true-已发出
     */
    bool send_stop_work_message() {
        if (!close_->try_send(StopSignal())) {
            return false;
        }
        ++outstanding_stops_;
        return true;
    }

    void join_worker(uint64_t worker_id) {
        auto it = workers_.find(worker_id);
        if (it == workers_.end()) {
            return;
        }
        if (it->second.joinable()) {
            it->second.join();
        }
        workers_.erase(it);
    }

    size_t num_workers_;         // 目标worker数
    size_t cur_workers_;         // 已启动、尚未确认结束的worker数
    size_t outstanding_stops_;   // 已发出、尚未确认的停止请求数
    uint64_t next_worker_id_;

    std::deque<In> queue_;
    std::shared_ptr<Channel<Out>> output_;
    std::shared_ptr<Runner> runner_;

    // 数据面：有界，提供反压
    std::shared_ptr<Channel<Out>> results_;
    std::shared_ptr<Channel<StopSignal>> close_;
    // 控制面：无界，永不阻塞
    std::shared_ptr<Channel<WorkerEvent>> worker_events_;
    std::shared_ptr<Channel<WorkerPoolCommand>> command_events_;

    std::unordered_map<uint64_t, std::thread> workers_;
};

} // namespace clobber

// 文件结束
