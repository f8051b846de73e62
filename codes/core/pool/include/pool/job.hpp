// =============================================================================
//  Clobber TCP Load Generator - Pool Module
//  文件: job.hpp
//  描述: Job、JobStatus、WorkerEvent、WorkerPoolCommand与JobRunner定义
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include "pool/channel.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace clobber {

// 停止信号（close通道里的元素）
struct StopSignal {};

// Job的结束状态
enum class JobStatus : uint8_t {
    DONE = 0,     // 自己的工作做完了
    STOPPED = 1,  // 收到停止请求后提前退出
    RUNNING = 2   // 不允许作为返回值，出现即为JobRunner实现错误
};

inline const char* job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::DONE: return "DONE";
        case JobStatus::STOPPED: return "STOPPED";
        case JobStatus::RUNNING: return "RUNNING";
        default: return "UNKNOWN";
    }
}

// Worker结束事件类型
enum class WorkerEventType : uint8_t {
    WORKER_DONE = 0,
    WORKER_STOPPED = 1
};

// Worker结束事件：每个worker结束时恰好投递一次
struct WorkerEvent {
    WorkerEventType type;
    uint64_t worker_id;
};

// 外部控制命令类型
enum class PoolCommandType : uint8_t {
    STOP = 0,
    SET_WORKER_COUNT = 1
};

// 外部控制命令
struct WorkerPoolCommand {
    PoolCommandType type;
    size_t worker_count;

    static WorkerPoolCommand stop() {
        WorkerPoolCommand cmd;
        cmd.type = PoolCommandType::STOP;
        cmd.worker_count = 0;
        return cmd;
    }

    static WorkerPoolCommand set_worker_count(size_t n) {
        WorkerPoolCommand cmd;
        cmd.type = PoolCommandType::SET_WORKER_COUNT;
        cmd.worker_count = n;
        return cmd;
    }
};

// 外部控制句柄：任意线程可向其发送命令，无界，永不阻塞
using CommandChannel = std::shared_ptr<Channel<WorkerPoolCommand>>;

/**
 * @brief 一个工作单元：输入项 + 停止信号接收端 + 结果发送端
 *
 * Job由执行它的worker独占，JobRunner::run返回后随worker一起销毁。
 */
template<typename In, typename Out>
class Job {
public:
    Job(In task,
        std::shared_ptr<Channel<StopSignal>> close,
        std::shared_ptr<Channel<Out>> results)
        : task_(std::move(task))
        , close_(std::move(close))
        , results_(std::move(results))
    {}

    Job(Job&&) = default;
    Job& operator=(Job&&) = default;
    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    const In& task() const { return task_; }
    In& task() { return task_; }

    /**
     * @brief 非阻塞检查是否被要求停止
     *
     * 取走一个停止信号即返回true，调用方必须随即退出并返回STOPPED。
     * 通道被关闭（WorkerPool析构）时所有worker都会看到true。
     */
    bool stop_requested() {
        StopSignal signal;
        return close_->try_recv(signal) || close_->is_closed();
    }

    /**
     * @brief 投递一个结果（结果通道满时阻塞）
     * @return true-成功，false-WorkerPool已关闭，调用方应尽快退出
     */
    bool send(Out value) {
        return results_->send(std::move(value));
    }

private:
    In task_;
    std::shared_ptr<Channel<StopSignal>> close_;
    std::shared_ptr<Channel<Out>> results_;
};

/**
 * @brief Job执行策略接口
 *
 * run在worker线程中执行，应在循环中自行选择时机调用job.stop_requested()。
 * 返回值只能是DONE或STOPPED。
 */
template<typename In, typename Out>
class JobRunner {
public:
    virtual ~JobRunner() = default;
    virtual JobStatus run(Job<In, Out>& job) = 0;
};

// 以可调用对象实现的JobRunner
template<typename In, typename Out>
class FunctionJobRunner : public JobRunner<In, Out> {
public:
    using Function = std::function<JobStatus(Job<In, Out>&)>;

    explicit FunctionJobRunner(Function fn)
        : fn_(std::move(fn))
    {}

    JobStatus run(Job<In, Out>& job) override {
        return fn_(job);
    }

private:
    Function fn_;
};

} // namespace clobber

// 文件结束
