//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/engine/clock_engine.hpp
// Purpose: Clock state and the tick transition that turns a fresh time sample
//          into at most one patch.
// Key invariants: lastResolved always equals the sample whose patch was last
//                 applied; it never advances when applying fails.
// Ownership/Lifetime: ClockEngine owns its ClockState and borrows the
//                     TimeSource, which must outlive it.
// Links: src/engine/clock_engine.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clockface/draw/geometry.hpp"
#include "clockface/engine/patch.hpp"
#include "clockface/support/result.hpp"
#include "clockface/time/time_source.hpp"

#include <functional>
#include <optional>

namespace clockface::engine
{

/// @brief Everything the engine remembers between ticks.
struct ClockState
{
    std::optional<time::ResolvedTimeSample> lastResolved;
    bool showSeconds = false;
    draw::Geometry geometry{};
};

/// @brief Outcome of the pure transition.
struct StepResult
{
    ClockState next;
    std::optional<Patch> patch; ///< Empty when the resolved sample is unchanged
};

/// @brief Pure transition: diff @p sample against @p state and build a patch.
/// @details Returns @p state unchanged and no patch when the resolved sample
///          equals the last one applied.
StepResult step(const ClockState &state, const time::TimeSample &sample);

/// @brief Result of one ClockEngine::tick.
enum class TickOutcome
{
    Applied,   ///< A patch was produced and applied
    Unchanged, ///< Resolved sample matched the last one; nothing to do
    Failed     ///< Clock read or patch application failed; state preserved
};

/// @brief Samples a TimeSource and keeps the drawing in sync through patches.
class ClockEngine
{
  public:
    /// @brief Callback applying a patch to the drawing model.
    using ApplyFn = std::function<support::Status(const Patch &)>;

    ClockEngine(const draw::Geometry &geometry, bool showSeconds, time::TimeSource &source);

    /// @brief Sample the clock, diff and, if needed, apply one patch.
    TickOutcome tick(const ApplyFn &apply);

    /// @brief Run step() for an explicit sample, applying through @p apply.
    TickOutcome update(const time::TimeSample &sample, const ApplyFn &apply);

    [[nodiscard]] const ClockState &state() const
    {
        return state_;
    }

    [[nodiscard]] const draw::Geometry &geometry() const
    {
        return state_.geometry;
    }

  private:
    ClockState state_;
    time::TimeSource &source_;
};

} // namespace clockface::engine
