// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: pacer.hpp
//  描述: Pacer速率节拍计算（错峰启动与每轮休眠时长）
//  版权: Copyright (c) 2026
// =============================================================================
#pragma once

#include <cstdint>
#include "utils/time.hpp"

namespace clobber {
namespace client {

/**
 * @brief 根据目标速率计算各种等待时长
 *
 * tick = 1e9 / rate 纳秒，是整个压测两次请求之间的名义间隔。
 * T个线程、每线程K个槽位时：
 *   - 线程之间启动间隔1个tick
 *   - 线程内第i个槽位启动前等待 tick * T * i
 *   - 同一个槽位两次请求之间至少间隔 tick * K * T
 * 这样所有槽位的起始时间按tick轮转交错，避免瞬时突发。
 *
 *   4 threads, 8 connections:
 *   --------------------------------------------------
 *   thread 1:  a       e       a       e
 *   thread 2:    b       f       b       f
 *   thread 3:      c       g       c       g
 *   thread 4:        d       h       d       h
 *   --------------------------------------------------
 */
class Pacer {
public:
    /**
     * @param rate 每秒请求数，0表示不限速（所有时长均为0）
     * @param num_threads 线程数（已解析，非0）
     * @param slots_per_thread 每线程槽位数（非0）
     */
    Pacer(uint32_t rate, uint32_t num_threads, uint32_t slots_per_thread);

    bool has_rate() const { return rate_ != 0; }

    // 名义请求间隔
    utils::Nanos tick() const { return tick_; }

    // 相邻线程启动间隔
    utils::Nanos thread_launch_gap() const { return tick_; }

    // 线程内第slot_index个槽位的错峰等待
    utils::Nanos stagger_delay(uint32_t slot_index) const;

    // 同一槽位两次请求开始之间的目标间隔
    utils::Nanos iteration_delay() const;

    /**
     * @brief 本轮结束后还需等待多久
     * @param elapsed 本轮已耗时
     * @param behind [out] 本轮耗时已超过目标间隔（速率跟不上）时置true
     * @return 剩余等待时长，跟不上或不限速时为0
     */
    utils::Nanos remaining_delay(utils::Nanos elapsed, bool& behind) const;

private:
    uint32_t rate_;
    uint32_t num_threads_;
    uint32_t slots_per_thread_;
    utils::Nanos tick_;
};

} // namespace client
} // namespace clobber

// 文件结束
