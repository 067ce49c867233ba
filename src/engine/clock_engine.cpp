//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/engine/clock_engine.cpp
// Purpose: Implement the sample, diff, patch and commit cycle of the clock.
// Key invariants: State is committed only after the patch was applied, so the
//                 cached sample is never ahead of or behind the drawing.
// Ownership/Lifetime: Borrows the TimeSource for the engine's lifetime.
// Links: include/clockface/engine/clock_engine.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the clock state engine.
/// @details Every tick starts from a fresh wall-clock reading.  A failed read
///          or a failed apply only costs that one tick: the previous state is
///          kept and the next tick recomputes everything from scratch.

#include "clockface/engine/clock_engine.hpp"

#include "clockface/support/log.hpp"

#include <string>
#include <utility>

namespace clockface::engine
{

StepResult step(const ClockState &state, const time::TimeSample &sample)
{
    time::ResolvedTimeSample resolved = time::resolve(sample, state.showSeconds);
    if (state.lastResolved && *state.lastResolved == resolved)
    {
        return StepResult{state, std::nullopt};
    }

    StepResult result{state, makePatch(computeHandAngles(sample), state.showSeconds)};
    result.next.lastResolved = std::move(resolved);
    return result;
}

ClockEngine::ClockEngine(const draw::Geometry &geometry, bool showSeconds, time::TimeSource &source)
    : source_(source)
{
    state_.showSeconds = showSeconds;
    state_.geometry = geometry;
}

TickOutcome ClockEngine::tick(const ApplyFn &apply)
{
    auto reading = source_.now();
    if (!reading)
    {
        support::logWarn("clock tick skipped: " + reading.error().message);
        return TickOutcome::Failed;
    }
    return update(reading.value().sample, apply);
}

TickOutcome ClockEngine::update(const time::TimeSample &sample, const ApplyFn &apply)
{
    if (!time::isValid(sample))
    {
        support::logWarn("clock tick skipped: out-of-range sample " + time::toString(sample));
        return TickOutcome::Failed;
    }

    StepResult result = step(state_, sample);
    if (!result.patch)
    {
        return TickOutcome::Unchanged;
    }

    if (auto applied = apply(*result.patch); !applied)
    {
        support::logWarn("clock tick skipped: " + applied.error().message);
        return TickOutcome::Failed;
    }

    state_.lastResolved = std::move(result.next.lastResolved);
    return TickOutcome::Applied;
}

} // namespace clockface::engine
