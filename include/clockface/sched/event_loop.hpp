//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/sched/event_loop.hpp
// Purpose: Single-threaded, poll-based TimerService driven by a monotonic clock.
//
// Key invariants:
//   - Poll-based, not thread-based; callbacks run only inside pollDue().
//   - Due timers fire in deadline order; equal deadlines fire in creation order.
//   - Repeating timers are fixed-rate: each firing advances the deadline by
//     exactly one period.
//   - After shutdown() no timer fires and every schedule call fails.
//
// Ownership/Lifetime:
//   - The loop owns timer callbacks and borrows the MonotonicClock, which must
//     outlive it.
//
// Links: src/sched/event_loop.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clockface/sched/monotonic_clock.hpp"
#include "clockface/sched/timer_service.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <optional>

namespace clockface::sched
{

class EventLoop final : public TimerService
{
  public:
    explicit EventLoop(MonotonicClock &clock);

    support::Result<TimerId> scheduleOnce(std::int64_t delayMs, TimerCallback cb) override;
    support::Result<TimerId> scheduleRepeating(std::int64_t periodMs, TimerCallback cb) override;
    bool cancel(TimerId id) override;

    /// @brief Fire every timer whose deadline is at or before the current time.
    /// @return Number of callbacks invoked.
    std::size_t pollDue();

    /// @brief Milliseconds until the earliest deadline (0 if already due).
    /// @return std::nullopt when no timer is pending.
    [[nodiscard]] std::optional<std::int64_t> msUntilNext() const;

    /// @brief Sleep and poll until @p stop is set, the loop is shut down or no
    ///        timer remains.
    /// @param maxSleepMs Upper bound of a single sleep so @p stop is observed.
    void run(const std::atomic<bool> &stop, std::int64_t maxSleepMs = 100);

    /// @brief Cancel every timer and reject further scheduling.
    void shutdown();

    [[nodiscard]] bool isShutdown() const
    {
        return shutdown_;
    }

    /// @brief Number of timers that are scheduled and not cancelled.
    [[nodiscard]] std::size_t pending() const
    {
        return timers_.size();
    }

  private:
    struct Timer
    {
        std::int64_t deadline = 0;
        std::int64_t period = 0; ///< 0 for one-shot timers
        TimerCallback callback;
    };

    support::Result<TimerId> add(std::int64_t delayMs, std::int64_t periodMs, TimerCallback cb);

    MonotonicClock &clock_;
    std::map<TimerId, Timer> timers_;
    TimerId nextId_ = 1;
    bool shutdown_ = false;
};

} // namespace clockface::sched
