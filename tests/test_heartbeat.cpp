// File: tests/test_heartbeat.cpp
// Purpose: Verify phase alignment, the switch to the repeating timer, timer
//          failure reporting and teardown of the heartbeat.
// Key invariants: Alignment lands 1 ms after the next second boundary; nothing
//                 is delivered after stop().
// Ownership/Lifetime: Each test owns its loop, clock and heartbeat.
// Links: src/sched/heartbeat.cpp

#include "clockface/sched/event_loop.hpp"
#include "clockface/sched/heartbeat.hpp"

#include "tests/common/ManualClock.hpp"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

using clockface::sched::alignmentDelayMs;
using clockface::sched::EventLoop;
using clockface::sched::Heartbeat;
using clockface::sched::HeartbeatMessage;
using clockface::sched::TimerCallback;
using clockface::sched::TimerId;
using clockface::sched::TimerService;
using clockface::support::ErrorKind;
using clockface::support::makeError;
using clockface::support::Result;
using clockface::test::ManualClock;

namespace
{
/// Timer service that refuses repeating timers.
class NoRepeatTimers final : public TimerService
{
  public:
    explicit NoRepeatTimers(EventLoop &loop) : loop_(loop) {}

    Result<TimerId> scheduleOnce(std::int64_t delayMs, TimerCallback cb) override
    {
        return loop_.scheduleOnce(delayMs, std::move(cb));
    }

    Result<TimerId> scheduleRepeating(std::int64_t, TimerCallback) override
    {
        return makeError(ErrorKind::TimerUnavailable, "no repeating timers");
    }

    bool cancel(TimerId id) override
    {
        return loop_.cancel(id);
    }

  private:
    EventLoop &loop_;
};
} // namespace

TEST(Heartbeat, AlignmentDelayLandsJustAfterBoundary)
{
    for (int ms = 0; ms <= 1000; ++ms)
    {
        ASSERT_EQ(alignmentDelayMs(ms), 1001 - ms);
        ASSERT_GT(alignmentDelayMs(ms), 0);
    }
    EXPECT_EQ(alignmentDelayMs(0), 1001);
    EXPECT_EQ(alignmentDelayMs(999), 2);
    EXPECT_EQ(alignmentDelayMs(-5), 1001);
    EXPECT_EQ(alignmentDelayMs(1250), 751);
}

TEST(Heartbeat, AlignsOnceThenTicksEverySecond)
{
    ManualClock clock;
    EventLoop loop(clock);
    std::vector<HeartbeatMessage> got;
    Heartbeat heartbeat(loop,
                        [&](HeartbeatMessage msg)
                        {
                            got.push_back(msg);
                            if (msg == HeartbeatMessage::StartHeartbeat)
                            {
                                ASSERT_TRUE(heartbeat.startRepeating());
                            }
                        });

    ASSERT_TRUE(heartbeat.start(250));
    EXPECT_TRUE(heartbeat.isAligning());
    EXPECT_EQ(loop.msUntilNext().value_or(-1), 751);

    clock.advance(750);
    loop.pollDue();
    EXPECT_TRUE(got.empty());

    clock.advance(1);
    loop.pollDue();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0], HeartbeatMessage::StartHeartbeat);
    EXPECT_FALSE(heartbeat.isAligning());
    EXPECT_TRUE(heartbeat.isTicking());

    clock.advance(3000);
    loop.pollDue();
    ASSERT_EQ(got.size(), 4u);
    EXPECT_EQ(got[1], HeartbeatMessage::Tick);
    EXPECT_EQ(got[3], HeartbeatMessage::Tick);
}

TEST(Heartbeat, StartTwiceIsRejected)
{
    ManualClock clock;
    EventLoop loop(clock);
    Heartbeat heartbeat(loop, [](HeartbeatMessage) {});

    ASSERT_TRUE(heartbeat.start(0));
    auto again = heartbeat.start(0);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().kind, ErrorKind::TimerUnavailable);
    EXPECT_EQ(loop.pending(), 1u);
}

TEST(Heartbeat, TimerFailureIsSurfaced)
{
    ManualClock clock;
    EventLoop loop(clock);
    loop.shutdown();
    Heartbeat heartbeat(loop, [](HeartbeatMessage) {});

    auto started = heartbeat.start(100);
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().kind, ErrorKind::TimerUnavailable);
    EXPECT_FALSE(heartbeat.isAligning());
}

TEST(Heartbeat, RepeatingFailureIsSurfaced)
{
    ManualClock clock;
    EventLoop loop(clock);
    NoRepeatTimers timers(loop);
    Heartbeat heartbeat(timers, [](HeartbeatMessage) {});

    ASSERT_TRUE(heartbeat.start(0));
    auto ticking = heartbeat.startRepeating();
    ASSERT_FALSE(ticking);
    EXPECT_EQ(ticking.error().kind, ErrorKind::TimerUnavailable);
    EXPECT_FALSE(heartbeat.isTicking());
}

TEST(Heartbeat, StopCancelsTimersAndSilencesSink)
{
    ManualClock clock;
    EventLoop loop(clock);
    int delivered = 0;
    Heartbeat heartbeat(loop, [&](HeartbeatMessage) { ++delivered; });

    ASSERT_TRUE(heartbeat.start(0));
    ASSERT_TRUE(heartbeat.startRepeating());
    EXPECT_EQ(loop.pending(), 2u);

    heartbeat.stop();
    EXPECT_TRUE(heartbeat.isStopped());
    EXPECT_EQ(loop.pending(), 0u);
    clock.advance(5000);
    loop.pollDue();
    EXPECT_EQ(delivered, 0);
    EXPECT_FALSE(heartbeat.startRepeating());
}

TEST(Heartbeat, DestructionCancelsTimers)
{
    ManualClock clock;
    EventLoop loop(clock);
    {
        Heartbeat heartbeat(loop, [](HeartbeatMessage) {});
        ASSERT_TRUE(heartbeat.start(500));
        EXPECT_EQ(loop.pending(), 1u);
    }
    EXPECT_EQ(loop.pending(), 0u);
    clock.advance(2000);
    EXPECT_EQ(loop.pollDue(), 0u);
}
