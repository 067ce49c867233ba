//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/app.cpp
// Purpose: Implement the clock actor that turns heartbeat messages into
//          patched drawings.
// Key invariants: The inbox is drained strictly FIFO and never re-entrantly;
//                 no message is handled once stop() has begun.
// Ownership/Lifetime: ClockApp owns the drawing, engine and heartbeat while
//                     borrowing the timer service, time source and sink.
// Links: include/clockface/app.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements `clockface::ClockApp`.
/// @details Timer callbacks never touch clock state.  They post a message to
///          the inbox; post() then drains the inbox unless a drain is already
///          in progress further up the stack, in which case the message waits
///          its turn.  Each message runs to completion, including applying
///          its patch and committing the engine state, before the next one is
///          looked at.

#include "clockface/app.hpp"

#include "clockface/support/log.hpp"

#include <string>
#include <utility>

namespace clockface
{

support::Result<std::unique_ptr<ClockApp>> ClockApp::create(const config::ClockOptions &options,
                                                            sched::TimerService &timers,
                                                            time::TimeSource &clock,
                                                            DrawingSink &sink)
{
    auto cfg = config::resolveOptions(options);
    if (!cfg)
    {
        return cfg.error();
    }

    std::unique_ptr<ClockApp> app(new ClockApp(cfg.value(), timers, clock, sink));
    if (auto started = app->start(); !started)
    {
        return started.error();
    }
    return std::move(app);
}

ClockApp::ClockApp(const config::ClockConfig &cfg,
                   sched::TimerService &timers,
                   time::TimeSource &clock,
                   DrawingSink &sink)
    : config_(cfg),
      clock_(clock),
      sink_(sink),
      drawing_(draw::buildInitialDrawing(
          draw::makeGeometry(cfg.radius), cfg.palette, cfg.showSeconds, cfg.showTicks)),
      engine_(draw::makeGeometry(cfg.radius), cfg.showSeconds, clock),
      heartbeat_(timers, [this](sched::HeartbeatMessage msg) { post(msg); })
{
}

ClockApp::~ClockApp()
{
    stop();
}

support::Status ClockApp::start()
{
    int msIntoSecond = 0;
    if (auto reading = clock_.now())
    {
        msIntoSecond = reading.value().millisecond;
    }
    else
    {
        support::logWarn("cannot read clock for alignment: " + reading.error().message);
    }

    // Show the current time right away rather than waiting for alignment.
    if (update() == engine::TickOutcome::Failed)
    {
        support::logDebug("initial clock update failed, hands stay at 12 until the next tick");
    }

    if (auto aligned = heartbeat_.start(msIntoSecond); !aligned)
    {
        support::logError("clock heartbeat failed to start: " + aligned.error().message);
        stopped_ = true;
        return aligned;
    }
    sink_.push(drawing_);

    support::logInfo("clock started: radius " + std::to_string(config_.radius) +
                     (config_.showSeconds ? ", seconds" : "") +
                     (config_.showTicks ? ", ticks" : ""));
    return {};
}

void ClockApp::post(sched::HeartbeatMessage msg)
{
    if (stopped_)
    {
        return;
    }
    inbox_.push_back(msg);
    if (draining_)
    {
        return;
    }

    // Cleared on every exit so a throwing sink does not wedge the inbox.
    struct DrainScope
    {
        bool &flag;

        ~DrainScope()
        {
            flag = false;
        }
    };

    draining_ = true;
    DrainScope scope{draining_};
    while (!inbox_.empty() && !stopped_)
    {
        const sched::HeartbeatMessage next = inbox_.front();
        inbox_.pop_front();
        handle(next);
    }
}

void ClockApp::handle(sched::HeartbeatMessage msg)
{
    switch (msg)
    {
        case sched::HeartbeatMessage::StartHeartbeat:
            if (auto ticking = heartbeat_.startRepeating(); !ticking)
            {
                fail(ticking.error());
                return;
            }
            if (update() == engine::TickOutcome::Applied)
            {
                sink_.push(drawing_);
            }
            break;
        case sched::HeartbeatMessage::Tick:
            if (update() == engine::TickOutcome::Applied)
            {
                sink_.push(drawing_);
            }
            break;
    }
}

engine::TickOutcome ClockApp::update()
{
    return engine_.tick([this](const engine::Patch &patch)
                        { return draw::applyPatch(drawing_, patch); });
}

void ClockApp::stop()
{
    if (stopped_ && heartbeat_.isStopped())
    {
        return;
    }
    stopped_ = true;
    inbox_.clear();
    heartbeat_.stop();
    support::logDebug("clock stopped");
}

void ClockApp::setFatalHandler(FatalHandler handler)
{
    onFatal_ = std::move(handler);
}

void ClockApp::fail(const support::Error &error)
{
    support::logError("clock heartbeat failed: " + error.message);
    failure_ = error;
    stop();
    if (onFatal_)
    {
        onFatal_(error);
    }
}

} // namespace clockface
