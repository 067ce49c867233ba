//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/sched/timer_service.hpp
// Purpose: Contract for one-shot and repeating millisecond timers.
// Key invariants: A cancelled timer never fires again; ids are never reused.
// Ownership/Lifetime: The service owns registered callbacks until they are
//                     cancelled or, for one-shot timers, have fired.
// Links: include/clockface/sched/event_loop.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clockface/support/result.hpp"

#include <cstdint>
#include <functional>

namespace clockface::sched
{

using TimerId = std::uint64_t;
using TimerCallback = std::function<void()>;

/// @brief Timer facility consumed by the heartbeat.
class TimerService
{
  public:
    virtual ~TimerService() = default;

    /// @brief Run @p cb once after @p delayMs milliseconds.
    /// @return Timer id or a TimerUnavailable error.
    virtual support::Result<TimerId> scheduleOnce(std::int64_t delayMs, TimerCallback cb) = 0;

    /// @brief Run @p cb every @p periodMs milliseconds until cancelled.
    /// @return Timer id or a TimerUnavailable error.
    virtual support::Result<TimerId> scheduleRepeating(std::int64_t periodMs, TimerCallback cb) = 0;

    /// @brief Cancel timer @p id.
    /// @return True if a pending timer was removed.
    virtual bool cancel(TimerId id) = 0;
};

} // namespace clockface::sched
