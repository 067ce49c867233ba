//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/sched/monotonic_clock.cpp
// Purpose: steady_clock implementation of MonotonicClock.
// Key invariants: Immune to wall-clock adjustments.
// Ownership/Lifetime: Stateless.
// Links: include/clockface/sched/monotonic_clock.hpp
//
//===----------------------------------------------------------------------===//

#include "clockface/sched/monotonic_clock.hpp"

#include <chrono>
#include <thread>

namespace clockface::sched
{

std::int64_t SteadyMonotonicClock::nowMs() const
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

void SteadyMonotonicClock::sleepForMs(std::int64_t ms)
{
    if (ms > 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
}

} // namespace clockface::sched
