//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sched/heartbeat.cpp
// Purpose: Implement the phase-aligned heartbeat.
// Key invariants: Firing slightly after a second boundary is preferred over
//                 firing before it, which would show the previous second.
// Ownership/Lifetime: Callbacks capture `this` guarded by a weak token that
//                     stop() releases.
// Links: include/clockface/sched/heartbeat.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements `clockface::sched::Heartbeat`.
/// @details The heartbeat locks phase once: a single alignment timer is
///          scheduled so that it lands just after the next second boundary,
///          and the owner then starts a fixed-rate one-second timer.  Drift
///          of the repeating timer is bounded only by the timer service.

#include "clockface/sched/heartbeat.hpp"

#include "clockface/support/log.hpp"

#include <string>
#include <utility>

namespace clockface::sched
{

std::int64_t alignmentDelayMs(int msIntoSecond)
{
    int ms = msIntoSecond < 0 ? 0 : msIntoSecond;
    if (ms > 1000)
    {
        ms %= 1000;
    }
    return 1000 + kAlignmentOffsetMs - ms;
}

Heartbeat::Heartbeat(TimerService &timers, Sink sink)
    : timers_(timers), sink_(std::move(sink)), alive_(std::make_shared<bool>(true))
{
}

Heartbeat::~Heartbeat()
{
    stop();
}

support::Status Heartbeat::start(int msIntoSecond)
{
    if (stopped_)
    {
        return support::makeError(support::ErrorKind::TimerUnavailable, "heartbeat already stopped");
    }
    if (alignTimer_ || tickTimer_)
    {
        return support::makeError(support::ErrorKind::TimerUnavailable, "heartbeat already started");
    }

    const std::int64_t delay = alignmentDelayMs(msIntoSecond);
    std::weak_ptr<bool> token = alive_;
    auto id = timers_.scheduleOnce(delay,
                                   [this, token]()
                                   {
                                       if (token.expired())
                                       {
                                           return;
                                       }
                                       alignTimer_.reset();
                                       deliver(HeartbeatMessage::StartHeartbeat);
                                   });
    if (!id)
    {
        return id.error();
    }
    alignTimer_ = id.value();
    support::logDebug("heartbeat aligning in " + std::to_string(delay) + " ms");
    return {};
}

support::Status Heartbeat::startRepeating()
{
    if (stopped_)
    {
        return support::makeError(support::ErrorKind::TimerUnavailable, "heartbeat already stopped");
    }
    if (tickTimer_)
    {
        return {};
    }

    std::weak_ptr<bool> token = alive_;
    auto id = timers_.scheduleRepeating(kHeartbeatPeriodMs,
                                        [this, token]()
                                        {
                                            if (!token.expired())
                                            {
                                                deliver(HeartbeatMessage::Tick);
                                            }
                                        });
    if (!id)
    {
        return id.error();
    }
    tickTimer_ = id.value();
    support::logDebug("heartbeat phase locked, ticking every " +
                      std::to_string(kHeartbeatPeriodMs) + " ms");
    return {};
}

void Heartbeat::stop()
{
    if (stopped_)
    {
        return;
    }
    stopped_ = true;
    alive_.reset();
    if (alignTimer_)
    {
        (void)timers_.cancel(*alignTimer_);
        alignTimer_.reset();
    }
    if (tickTimer_)
    {
        (void)timers_.cancel(*tickTimer_);
        tickTimer_.reset();
    }
}

void Heartbeat::deliver(HeartbeatMessage msg)
{
    if (!stopped_ && sink_)
    {
        sink_(msg);
    }
}

} // namespace clockface::sched
