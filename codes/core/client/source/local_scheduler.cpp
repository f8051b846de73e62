// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: local_scheduler.cpp
//  描述: LocalScheduler单线程协作式调度器实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "client/local_scheduler.hpp"
#include "utils/logger.hpp"
#include <cerrno>
#include <cstring>
#include <sys/epoll.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace clobber {
namespace client {

using utils::ErrorCode;
using utils::Result;
using utils::make_err;
using utils::make_ok;

namespace details {

constexpr int kMaxEvents = 256;

inline ErrorCode ErrnoToCode(int err) {
    if (err == EMFILE || err == ENFILE || err == ENOMEM || err == ENOSPC) {
        return ErrorCode::RESOURCE_EXHAUSTED;
    }
    return ErrorCode::NETWORK_POLL_ERROR;
}

} // namespace details

LocalScheduler::LocalScheduler()
    : epoll_fd_(-1)
    , timer_fd_(-1)
    , live_tasks_(0)
{
}

LocalScheduler::~LocalScheduler() {
    close_fds();
}

Result<void> LocalScheduler::init() {
    if (epoll_fd_ >= 0) {
        return make_ok();
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        int err = errno;
        return make_err(details::ErrnoToCode(err), std::string("epoll_create1: ") + std::strerror(err));
    }

    timer_fd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        int err = errno;
        close_fds();
        return make_err(details::ErrnoToCode(err), std::string("timerfd_create: ") + std::strerror(err));
    }

    // timerfd的事件以空指针区分
    epoll_event ev;
    ev.events = EPOLLIN;
    ev.data.ptr = nullptr;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, timer_fd_, &ev) != 0) {
        int err = errno;
        close_fds();
        return make_err(details::ErrnoToCode(err), std::string("epoll_ctl: ") + std::strerror(err));
    }
    return make_ok();
}

void LocalScheduler::add_task(SchedulerTask* task) {
    pending_start_.push_back(task);
    ++live_tasks_;
}

void LocalScheduler::set_timer(SchedulerTask* task, utils::TimePoint deadline) {
    cancel_timer(task);
    task->timer_it_ = timers_.emplace(deadline, task);
    task->has_timer_ = true;
}

void LocalScheduler::cancel_timer(SchedulerTask* task) {
    if (task->has_timer_) {
        timers_.erase(task->timer_it_);
        task->has_timer_ = false;
    }
}

Result<void> LocalScheduler::watch(int fd, uint32_t events, SchedulerTask* task) {
    epoll_event ev;
    ev.events = events;
    ev.data.ptr = task;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
        int err = errno;
        return make_err(details::ErrnoToCode(err), std::strerror(err));
    }
    return make_ok();
}

Result<void> LocalScheduler::modify(int fd, uint32_t events, SchedulerTask* task) {
    epoll_event ev;
    ev.events = events;
    ev.data.ptr = task;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) != 0) {
        int err = errno;
        return make_err(details::ErrnoToCode(err), std::strerror(err));
    }
    return make_ok();
}

void LocalScheduler::unwatch(int fd) {
    if (fd < 0 || epoll_fd_ < 0) {
        return;
    }
    epoll_event ev;
    ev.events = 0;
    ev.data.ptr = nullptr;
    // fd即将关闭，删除失败不影响后续
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, &ev) != 0) {
        LOG_DEBUG("Scheduler", "epoll_ctl DEL fd=%d failed: %s", fd, std::strerror(errno));
    }
}

void LocalScheduler::finish(SchedulerTask* task) {
    cancel_timer(task);
    if (live_tasks_ > 0) {
        --live_tasks_;
    }
}

Result<void> LocalScheduler::run() {
    if (epoll_fd_ < 0) {
        Result<void> ret = init();
        if (ret.is_err()) {
            return ret;
        }
    }

    // start()里可能立即finish，先取出待启动列表
    std::vector<SchedulerTask*> starting;
    starting.swap(pending_start_);
    for (SchedulerTask* task : starting) {
        task->start();
    }

    epoll_event events[details::kMaxEvents];
    while (live_tasks_ > 0) {
        // timerfd设置失败时退化为1ms轮询
        int wait_ms = arm_timerfd() ? -1 : 1;

        int n = ::epoll_wait(epoll_fd_, events, details::kMaxEvents, wait_ms);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            LOG_ERROR("Scheduler", "epoll_wait failed: %s", std::strerror(err));
            return make_err(ErrorCode::NETWORK_POLL_ERROR, std::strerror(err));
        }

        for (int i = 0; i < n; ++i) {
            SchedulerTask* task = static_cast<SchedulerTask*>(events[i].data.ptr);
            if (task == nullptr) {
                uint64_t expirations = 0;
                // 未到期时读返回EAGAIN，忽略即可
                ssize_t ret = ::read(timer_fd_, &expirations, sizeof(expirations));
                (void)ret;
                continue;
            }
            task->on_io(events[i].events);
        }

        fire_due_timers();
    }
    return make_ok();
}

bool LocalScheduler::arm_timerfd() {
    itimerspec spec;
    std::memset(&spec, 0, sizeof(spec));

    if (!timers_.empty()) {
        // steady_clock在Linux上即CLOCK_MONOTONIC
        int64_t ns = std::chrono::duration_cast<utils::Nanos>(
            timers_.begin()->first.time_since_epoch()).count();
        // it_value全0表示解除，已过期的截止时间至少取1ns让其立即触发
        if (ns <= 0) {
            ns = 1;
        }
        spec.it_value.tv_sec = static_cast<time_t>(ns / 1000000000LL);
        spec.it_value.tv_nsec = static_cast<long>(ns % 1000000000LL);
    }

    if (::timerfd_settime(timer_fd_, TFD_TIMER_ABSTIME, &spec, nullptr) != 0) {
        LOG_ERROR("Scheduler", "timerfd_settime failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

void LocalScheduler::fire_due_timers() {
    utils::TimePoint now = utils::SteadyClock::now();

    // 先摘下本轮到期的任务，回调里新设的定时器留到下一轮
    std::vector<SchedulerTask*> due;
    auto it = timers_.begin();
    while (it != timers_.end() && it->first <= now) {
        SchedulerTask* task = it->second;
        task->has_timer_ = false;
        due.push_back(task);
        it = timers_.erase(it);
    }

    for (SchedulerTask* task : due) {
        task->on_timer();
    }
}

void LocalScheduler::close_fds() {
    if (timer_fd_ >= 0) {
        ::close(timer_fd_);
        timer_fd_ = -1;
    }
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }
}

} // namespace client
} // namespace clobber

// 文件结束
