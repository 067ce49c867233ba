//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sched/event_loop.cpp
// Purpose: Implement the poll-based timer loop that drives the clock.
// Key invariants: A callback may cancel or schedule timers, including itself,
//                 while it runs.
// Ownership/Lifetime: Timer records are owned by the loop's id-ordered map.
// Links: include/clockface/sched/event_loop.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements `clockface::sched::EventLoop`.
/// @details Timers live in a map keyed by id so iteration order doubles as
///          creation order.  pollDue() repeatedly selects the earliest due
///          timer against a single snapshot of the clock, copies its callback
///          out before invoking it, and therefore tolerates callbacks that
///          mutate the timer table.

#include "clockface/sched/event_loop.hpp"

#include "clockface/support/log.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace clockface::sched
{

EventLoop::EventLoop(MonotonicClock &clock) : clock_(clock) {}

support::Result<TimerId> EventLoop::scheduleOnce(std::int64_t delayMs, TimerCallback cb)
{
    if (delayMs < 0)
    {
        return support::makeError(support::ErrorKind::TimerUnavailable,
                                  "negative timer delay " + std::to_string(delayMs) + " ms");
    }
    return add(delayMs, 0, std::move(cb));
}

support::Result<TimerId> EventLoop::scheduleRepeating(std::int64_t periodMs, TimerCallback cb)
{
    if (periodMs <= 0)
    {
        return support::makeError(support::ErrorKind::TimerUnavailable,
                                  "non-positive timer period " + std::to_string(periodMs) +
                                      " ms");
    }
    return add(periodMs, periodMs, std::move(cb));
}

support::Result<TimerId> EventLoop::add(std::int64_t delayMs, std::int64_t periodMs, TimerCallback cb)
{
    if (shutdown_)
    {
        return support::makeError(support::ErrorKind::TimerUnavailable, "event loop is shut down");
    }
    if (!cb)
    {
        return support::makeError(support::ErrorKind::TimerUnavailable, "empty timer callback");
    }

    const std::int64_t now = clock_.nowMs();
    if (delayMs > std::numeric_limits<std::int64_t>::max() - now)
    {
        return support::makeError(support::ErrorKind::TimerUnavailable,
                                  "timer delay " + std::to_string(delayMs) + " ms out of range");
    }

    const TimerId id = nextId_++;
    timers_.emplace(id, Timer{now + delayMs, periodMs, std::move(cb)});
    return id;
}

bool EventLoop::cancel(TimerId id)
{
    return timers_.erase(id) != 0;
}

std::size_t EventLoop::pollDue()
{
    std::size_t fired = 0;
    const std::int64_t now = clock_.nowMs();
    while (!shutdown_)
    {
        auto due = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it)
        {
            if (it->second.deadline > now)
            {
                continue;
            }
            if (due == timers_.end() || it->second.deadline < due->second.deadline)
            {
                due = it;
            }
        }
        if (due == timers_.end())
        {
            break;
        }

        TimerCallback callback;
        if (due->second.period > 0)
        {
            due->second.deadline += due->second.period;
            callback = due->second.callback;
        }
        else
        {
            callback = std::move(due->second.callback);
            timers_.erase(due);
        }
        callback();
        ++fired;
    }
    return fired;
}

std::optional<std::int64_t> EventLoop::msUntilNext() const
{
    if (timers_.empty())
    {
        return std::nullopt;
    }
    auto earliest = std::min_element(timers_.begin(),
                                     timers_.end(),
                                     [](const auto &a, const auto &b)
                                     { return a.second.deadline < b.second.deadline; });
    return std::max<std::int64_t>(0, earliest->second.deadline - clock_.nowMs());
}

void EventLoop::run(const std::atomic<bool> &stop, std::int64_t maxSleepMs)
{
    while (!stop.load() && !shutdown_)
    {
        auto wait = msUntilNext();
        if (!wait)
        {
            support::logDebug("event loop idle, leaving run()");
            return;
        }
        if (*wait > 0)
        {
            clock_.sleepForMs(std::min(*wait, maxSleepMs));
        }
        pollDue();
    }
}

void EventLoop::shutdown()
{
    shutdown_ = true;
    timers_.clear();
}

} // namespace clockface::sched
