// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: local_scheduler.hpp
//  描述: LocalScheduler单线程协作式调度器（epoll + timerfd）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>
#include "utils/error.hpp"
#include "utils/time.hpp"

namespace clobber {
namespace client {

class LocalScheduler;

/**
 * @brief 可被LocalScheduler驱动的任务
 *
 * 任务在调度线程上被回调，回调里不得阻塞。
 * 每个任务同一时刻最多挂一个定时器。
 */
class SchedulerTask {
public:
    SchedulerTask() = default;
    virtual ~SchedulerTask() = default;

    // 调度器开始运行时回调一次
    virtual void start() = 0;

    // 定时器到期
    virtual void on_timer() = 0;

    // 监听的fd就绪，events为epoll事件位
    virtual void on_io(uint32_t events) = 0;

private:
    friend class LocalScheduler;

    bool has_timer_ = false;
    std::multimap<utils::TimePoint, SchedulerTask*>::iterator timer_it_;
};

/**
 * @brief 单线程调度器
 *
 * 一个压测线程持有一个实例，线程内所有连接槽位共享，不跨线程通信。
 * 定时器按截止时间排序，最早的截止时间写入timerfd（纳秒精度），
 * 与socket一起在同一个epoll上等待。
 * 所有任务调用finish()后run()返回。
 */
class LocalScheduler {
public:
    LocalScheduler();
    ~LocalScheduler();

    // 禁止拷贝
    LocalScheduler(const LocalScheduler&) = delete;
    LocalScheduler& operator=(const LocalScheduler&) = delete;

    /**
     * @brief 创建epoll与timerfd
     * @return 失败返回NETWORK_POLL_ERROR或RESOURCE_EXHAUSTED
     */
    utils::Result<void> init();

    /**
     * @brief 添加任务，run()时依次调用其start()
     * 任务生命周期由调用方保证长于run()
     */
    void add_task(SchedulerTask* task);

    // 设置（替换）任务的定时器
    void set_timer(SchedulerTask* task, utils::TimePoint deadline);
    void cancel_timer(SchedulerTask* task);

    // fd监听管理
    utils::Result<void> watch(int fd, uint32_t events, SchedulerTask* task);
    utils::Result<void> modify(int fd, uint32_t events, SchedulerTask* task);
    void unwatch(int fd);

    // 任务结束，取消其定时器
    void finish(SchedulerTask* task);

    /**
     * @brief 运行直到所有任务结束
     * @return epoll_wait失败时返回NETWORK_POLL_ERROR
     */
    utils::Result<void> run();

    size_t live_tasks() const { return live_tasks_; }
    size_t pending_timers() const { return timers_.size(); }

private:
    bool arm_timerfd();
    void fire_due_timers();
    void close_fds();

    int epoll_fd_;
    int timer_fd_;
    size_t live_tasks_;
    std::vector<SchedulerTask*> pending_start_;
    std::multimap<utils::TimePoint, SchedulerTask*> timers_;
};

} // namespace client
} // namespace clobber

// 文件结束
