//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/sched/monotonic_clock.hpp
// Purpose: Millisecond monotonic time and sleeping, abstracted so the event
//          loop can run against a manual clock in tests.
// Key invariants: nowMs() never decreases.
// Ownership/Lifetime: Clocks are borrowed by the event loop.
// Links: src/sched/monotonic_clock.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace clockface::sched
{

class MonotonicClock
{
  public:
    virtual ~MonotonicClock() = default;

    /// @brief Milliseconds since an arbitrary fixed origin.
    virtual std::int64_t nowMs() const = 0;

    /// @brief Block the calling thread for @p ms milliseconds.
    virtual void sleepForMs(std::int64_t ms) = 0;
};

/// @brief MonotonicClock backed by std::chrono::steady_clock.
class SteadyMonotonicClock final : public MonotonicClock
{
  public:
    std::int64_t nowMs() const override;
    void sleepForMs(std::int64_t ms) override;
};

} // namespace clockface::sched
