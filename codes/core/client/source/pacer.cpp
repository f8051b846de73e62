// =============================================================================
//  Clobber TCP Load Generator - Client Module
//  文件: pacer.cpp
//  描述: Pacer速率节拍计算实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "client/pacer.hpp"

namespace clobber {
namespace client {

Pacer::Pacer(uint32_t rate, uint32_t num_threads, uint32_t slots_per_thread)
    : rate_(rate)
    , num_threads_(num_threads == 0 ? 1 : num_threads)
    , slots_per_thread_(slots_per_thread == 0 ? 1 : slots_per_thread)
    , tick_(rate == 0 ? 0 : 1000000000LL / static_cast<int64_t>(rate))
{
}

utils::Nanos Pacer::stagger_delay(uint32_t slot_index) const {
    return tick_ * static_cast<int64_t>(num_threads_) * static_cast<int64_t>(slot_index);
}

utils::Nanos Pacer::iteration_delay() const {
    return tick_ * static_cast<int64_t>(slots_per_thread_) * static_cast<int64_t>(num_threads_);
}

utils::Nanos Pacer::remaining_delay(utils::Nanos elapsed, bool& behind) const {
    behind = false;
    if (!has_rate()) {
        return utils::Nanos(0);
    }
    utils::Nanos delay = iteration_delay();
    if (elapsed < delay) {
        return delay - elapsed;
    }
    behind = true;
    return utils::Nanos(0);
}

} // namespace client
} // namespace clobber

// 文件结束
