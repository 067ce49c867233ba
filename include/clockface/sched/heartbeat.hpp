//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/sched/heartbeat.hpp
// Purpose: Phase-aligned one-second heartbeat built on a TimerService.
//
// Key invariants:
//   - start() schedules exactly one alignment timer landing 1 ms after the
//     next second boundary; there is no later re-alignment.
//   - The repeating timer exists only after startRepeating() succeeded.
//   - Once stop() has begun no message reaches the sink.
//
// Ownership/Lifetime:
//   - Borrows the TimerService, which must outlive the heartbeat.
//   - Timer callbacks hold a weak liveness token, never a strong reference.
//
// Links: src/sched/heartbeat.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clockface/sched/timer_service.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace clockface::sched
{

inline constexpr std::int64_t kHeartbeatPeriodMs = 1000;
inline constexpr std::int64_t kAlignmentOffsetMs = 1;

/// @brief Messages the heartbeat delivers to its owner.
enum class HeartbeatMessage
{
    StartHeartbeat, ///< Alignment timer fired; owner should start ticking
    Tick            ///< One period of the repeating timer elapsed
};

/// @brief Delay from a point @p msIntoSecond milliseconds into the current
///        second until 1 ms past the next second boundary.
/// @details Equals 1001 - ms for ms in [0, 1000]; larger values are reduced
///          modulo one second and negative values count as 0, so the result
///          is always strictly positive.
std::int64_t alignmentDelayMs(int msIntoSecond);

class Heartbeat
{
  public:
    using Sink = std::function<void(HeartbeatMessage)>;

    Heartbeat(TimerService &timers, Sink sink);
    ~Heartbeat();

    Heartbeat(const Heartbeat &) = delete;
    Heartbeat &operator=(const Heartbeat &) = delete;

    /// @brief Schedule the one-shot alignment timer.
    /// @param msIntoSecond Millisecond offset of "now" within its second.
    /// @return TimerUnavailable when already started, stopped, or when the
    ///         timer service refuses the timer.
    support::Status start(int msIntoSecond);

    /// @brief Create the repeating one-second timer; no-op if it exists.
    support::Status startRepeating();

    /// @brief Cancel all timers; later firings are dropped.
    void stop();

    [[nodiscard]] bool isAligning() const
    {
        return alignTimer_.has_value();
    }

    [[nodiscard]] bool isTicking() const
    {
        return tickTimer_.has_value();
    }

    [[nodiscard]] bool isStopped() const
    {
        return stopped_;
    }

  private:
    void deliver(HeartbeatMessage msg);

    TimerService &timers_;
    Sink sink_;
    std::optional<TimerId> alignTimer_;
    std::optional<TimerId> tickTimer_;
    std::shared_ptr<bool> alive_;
    bool stopped_ = false;
};

} // namespace clockface::sched
