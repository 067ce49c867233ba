// File: tests/test_clock_engine.cpp
// Purpose: Verify the diff-and-patch transition and the commit rules of
//          ClockEngine.
// Key invariants: Unchanged resolved samples never produce a patch; failed
//                 reads or applies never advance the cached sample.
// Ownership/Lifetime: Engine and fake time source are owned by each test.
// Links: src/engine/clock_engine.cpp

#include "clockface/engine/clock_engine.hpp"

#include "tests/common/FakeTimeSource.hpp"

#include <gtest/gtest.h>

#include <vector>

using clockface::draw::makeGeometry;
using clockface::engine::ClockEngine;
using clockface::engine::ClockState;
using clockface::engine::HandId;
using clockface::engine::Patch;
using clockface::engine::rotationFor;
using clockface::engine::step;
using clockface::engine::TickOutcome;
using clockface::support::ErrorKind;
using clockface::support::makeError;
using clockface::support::Status;
using clockface::test::at;
using clockface::test::FakeTimeSource;

namespace
{
struct Recorder
{
    std::vector<Patch> patches;

    ClockEngine::ApplyFn fn()
    {
        return [this](const Patch &patch) -> Status
        {
            patches.push_back(patch);
            return {};
        };
    }
};
} // namespace

TEST(ClockEngineStep, FirstSampleAlwaysProducesPatch)
{
    ClockState state;
    state.showSeconds = true;
    auto result = step(state, at(6, 30, 30));
    ASSERT_TRUE(result.patch.has_value());
    ASSERT_EQ(result.patch->size(), 3u);
    EXPECT_EQ((*result.patch)[0].hand, HandId::Hour);
    EXPECT_EQ((*result.patch)[1].hand, HandId::Minute);
    EXPECT_EQ((*result.patch)[2].hand, HandId::Second);
    ASSERT_TRUE(result.next.lastResolved.has_value());
    EXPECT_EQ(result.next.lastResolved->second, 30);
}

TEST(ClockEngineStep, SameResolvedSampleIsNoOp)
{
    ClockState state;
    state.showSeconds = true;
    auto first = step(state, at(9, 0, 5));
    auto second = step(first.next, at(9, 0, 5));
    EXPECT_FALSE(second.patch.has_value());
    EXPECT_EQ(second.next.lastResolved, first.next.lastResolved);
}

TEST(ClockEngineStep, HiddenSecondsOmitSecondHand)
{
    ClockState state;
    state.showSeconds = false;
    auto result = step(state, at(6, 30, 30));
    ASSERT_TRUE(result.patch.has_value());
    ASSERT_EQ(result.patch->size(), 2u);
    EXPECT_FALSE(rotationFor(*result.patch, HandId::Second).has_value());
    EXPECT_FALSE(result.next.lastResolved->second.has_value());
}

TEST(ClockEngine, IdempotentWithoutClockChange)
{
    FakeTimeSource clock;
    clock.set(at(10, 15, 1));
    ClockEngine engine(makeGeometry(50), true, clock);
    Recorder rec;

    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Applied);
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Unchanged);
    EXPECT_EQ(rec.patches.size(), 1u);
}

TEST(ClockEngine, HiddenSecondsSkipTicksWithinMinute)
{
    FakeTimeSource clock;
    ClockEngine engine(makeGeometry(10), false, clock);
    Recorder rec;

    clock.set(at(10, 15, 0));
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Applied);
    clock.set(at(10, 15, 1));
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Unchanged);
    clock.set(at(10, 15, 2));
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Unchanged);
    clock.set(at(10, 16, 0));
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Applied);

    ASSERT_EQ(rec.patches.size(), 2u);
    EXPECT_GT(*rotationFor(rec.patches[1], HandId::Minute),
              *rotationFor(rec.patches[0], HandId::Minute));
}

TEST(ClockEngine, ShownSecondsPatchEverySecond)
{
    FakeTimeSource clock;
    ClockEngine engine(makeGeometry(10), true, clock);
    Recorder rec;

    for (int s = 0; s < 5; ++s)
    {
        clock.set(at(10, 15, s));
        EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Applied);
    }
    EXPECT_EQ(rec.patches.size(), 5u);
}

TEST(ClockEngine, DayChangeAtSameTimeRedraws)
{
    FakeTimeSource clock;
    ClockEngine engine(makeGeometry(10), false, clock);
    Recorder rec;

    clock.set(at(0, 0, 0, {2024, 3, 9}));
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Applied);
    clock.set(at(0, 0, 0, {2024, 3, 10}));
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Applied);
}

TEST(ClockEngine, ClockFailurePreservesState)
{
    FakeTimeSource clock;
    ClockEngine engine(makeGeometry(10), true, clock);
    Recorder rec;

    clock.set(at(8, 0, 0));
    ASSERT_EQ(engine.tick(rec.fn()), TickOutcome::Applied);
    const auto before = engine.state().lastResolved;

    clock.setFailing(true);
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Failed);
    EXPECT_EQ(engine.state().lastResolved, before);

    clock.setFailing(false);
    clock.set(at(8, 0, 1));
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Applied);
    EXPECT_EQ(rec.patches.size(), 2u);
}

TEST(ClockEngine, FailedApplyDoesNotAdvanceState)
{
    FakeTimeSource clock;
    ClockEngine engine(makeGeometry(10), true, clock);
    clock.set(at(8, 0, 0));

    auto reject = [](const Patch &) -> Status
    { return makeError(ErrorKind::UnknownElement, "rejected"); };
    EXPECT_EQ(engine.tick(reject), TickOutcome::Failed);
    EXPECT_FALSE(engine.state().lastResolved.has_value());

    Recorder rec;
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Applied);
    EXPECT_EQ(rec.patches.size(), 1u);
}

TEST(ClockEngine, OutOfRangeSampleIsRejected)
{
    FakeTimeSource clock;
    ClockEngine engine(makeGeometry(10), true, clock);
    Recorder rec;

    clock.set(at(24, 0, 0));
    EXPECT_EQ(engine.tick(rec.fn()), TickOutcome::Failed);
    EXPECT_TRUE(rec.patches.empty());
}

TEST(ClockEngine, GeometryIsFixedAtConstruction)
{
    FakeTimeSource clock;
    const auto geometry = makeGeometry(60);
    ClockEngine engine(geometry, false, clock);
    Recorder rec;

    clock.set(at(1, 2, 3));
    (void)engine.tick(rec.fn());
    EXPECT_EQ(engine.geometry(), geometry);
    EXPECT_EQ(engine.geometry().thickness, 2.0);
}
