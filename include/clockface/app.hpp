// include/clockface/app.hpp
// @brief Clock actor owning the engine, the drawing and the heartbeat.
// @invariant Messages are handled one at a time in arrival order; a drawing is
//            pushed only after its patch was applied and committed.
// @ownership ClockApp owns engine, drawing and heartbeat; it borrows the timer
//            service, the time source and the sink, which must outlive it.
#pragma once

#include "clockface/config/config.hpp"
#include "clockface/draw/drawing.hpp"
#include "clockface/engine/clock_engine.hpp"
#include "clockface/sched/heartbeat.hpp"
#include "clockface/sched/timer_service.hpp"
#include "clockface/support/result.hpp"
#include "clockface/time/time_source.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <optional>

namespace clockface
{

/// @brief Receiver of every drawing the clock wants displayed.
class DrawingSink
{
  public:
    virtual ~DrawingSink() = default;
    virtual void push(const draw::Drawing &drawing) = 0;
};

/// @brief Live analog clock driven by a phase-aligned heartbeat.
class ClockApp
{
  public:
    using FatalHandler = std::function<void(const support::Error &)>;

    /// @brief Validate @p options, build and push the initial drawing and
    ///        schedule heartbeat alignment.
    /// @return InvalidConfig for bad options, TimerUnavailable when the
    ///         alignment timer cannot be created.
    static support::Result<std::unique_ptr<ClockApp>> create(const config::ClockOptions &options,
                                                             sched::TimerService &timers,
                                                             time::TimeSource &clock,
                                                             DrawingSink &sink);

    ~ClockApp();

    ClockApp(const ClockApp &) = delete;
    ClockApp &operator=(const ClockApp &) = delete;

    /// @brief Queue @p msg and drain the inbox unless already draining.
    void post(sched::HeartbeatMessage msg);

    /// @brief Begin teardown: cancel timers and drop queued messages.
    void stop();

    /// @brief Called once if the heartbeat cannot be started after alignment.
    void setFatalHandler(FatalHandler handler);

    /// @brief Error that stopped the clock, if any.
    [[nodiscard]] const std::optional<support::Error> &failure() const
    {
        return failure_;
    }

    [[nodiscard]] bool isStopped() const
    {
        return stopped_;
    }

    [[nodiscard]] bool isTicking() const
    {
        return heartbeat_.isTicking();
    }

    [[nodiscard]] const draw::Drawing &drawing() const
    {
        return drawing_;
    }

    [[nodiscard]] const engine::ClockEngine &engine() const
    {
        return engine_;
    }

    [[nodiscard]] const config::ClockConfig &config() const
    {
        return config_;
    }

  private:
    ClockApp(const config::ClockConfig &cfg,
             sched::TimerService &timers,
             time::TimeSource &clock,
             DrawingSink &sink);

    support::Status start();
    void handle(sched::HeartbeatMessage msg);
    /// @brief Run one engine tick against the owned drawing.
    engine::TickOutcome update();
    void fail(const support::Error &error);

    config::ClockConfig config_;
    time::TimeSource &clock_;
    DrawingSink &sink_;
    draw::Drawing drawing_;
    engine::ClockEngine engine_;
    sched::Heartbeat heartbeat_;
    std::deque<sched::HeartbeatMessage> inbox_;
    bool draining_ = false;
    bool stopped_ = false;
    std::optional<support::Error> failure_;
    FatalHandler onFatal_;
};

} // namespace clockface
