// File: tests/common/ManualClock.hpp
// Purpose: MonotonicClock whose time only moves when a test advances it.
// Key invariants: sleepForMs advances time instead of blocking.
// Ownership/Lifetime: Owned by the test; borrowed by the EventLoop under test.
// Links: include/clockface/sched/monotonic_clock.hpp
#pragma once

#include "clockface/sched/monotonic_clock.hpp"

#include <cstdint>

namespace clockface::test
{

class ManualClock final : public sched::MonotonicClock
{
  public:
    std::int64_t nowMs() const override
    {
        return now_;
    }

    void sleepForMs(std::int64_t ms) override
    {
        if (ms > 0)
        {
            now_ += ms;
        }
    }

    void advance(std::int64_t ms)
    {
        now_ += ms;
    }

  private:
    std::int64_t now_ = 0;
};

} // namespace clockface::test
