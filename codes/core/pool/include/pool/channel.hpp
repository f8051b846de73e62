// =============================================================================
//  Clobber TCP Load Generator - Pool Module
//  文件: channel.hpp
//  描述: Channel多生产者多消费者通道（有界/无界）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace clobber {

/**
 * @brief 线程安全的FIFO通道
 *
 * capacity为0表示无界：send永不阻塞。有界时send在通道满时阻塞，
 * 从而把消费者的速度反压给生产者。close之后send全部失败，
 * recv在取完剩余元素后返回false。
 */
template<typename T>
class Channel {
public:
    static constexpr size_t kUnbounded = 0;

    /**
     * @brief 构造函数
     * @param capacity 容量上限，kUnbounded表示无界
     */
    explicit Channel(size_t capacity = kUnbounded)
        : capacity_(capacity)
        , closed_(false)
    {}

    ~Channel() = default;

    // 禁止拷贝
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief 发送（通道满时阻塞）
     * @return true-发送成功，false-通道已关闭
     */
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() {
            return closed_ || !is_full_locked();
        });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief 发送（非阻塞）
     * @return true-发送成功，false-通道已满或已关闭
     */
    bool try_send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || is_full_locked()) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief 接收（阻塞）
     * @param out [out] 接收到的元素
     * @return true-接收成功，false-通道已关闭且为空
     */
    bool recv(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() {
            return closed_ || !queue_.empty();
        });
        return pop_locked(out, lock);
    }

    /**
     * @brief 带超时的接收
     * @return true-接收成功，false-超时或通道已关闭且为空
     */
    template<typename Rep, typename Period>
    bool recv_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() {
            return closed_ || !queue_.empty();
        });
        return pop_locked(out, lock);
    }

    /**
     * @brief 接收（非阻塞）
     * @return true-接收成功，false-通道为空
     */
    bool try_recv(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        return pop_locked(out, lock);
    }

    /**
     * @brief 关闭通道，唤醒所有等待的发送方与接收方
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t capacity() const { return capacity_; }

private:
    bool is_full_locked() const {
        return capacity_ != kUnbounded && queue_.size() >= capacity_;
    }

    bool pop_locked(T& out, std::unique_lock<std::mutex>& lock) {
        if (queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    std::deque<T> queue_;
    const size_t capacity_;
    bool closed_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

template<typename T>
constexpr size_t Channel<T>::kUnbounded;

} // namespace clobber

// 文件结束
