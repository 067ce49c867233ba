// File: tests/common/FakeTimeSource.hpp
// Purpose: Scriptable TimeSource for engine and app tests.
// Key invariants: now() returns exactly what the test last set, or a
//                 ClockUnavailable error while failing is set.
// Ownership/Lifetime: Owned by the test; borrowed by the code under test.
// Links: include/clockface/time/time_source.hpp
#pragma once

#include "clockface/time/time_source.hpp"

namespace clockface::test
{

inline time::TimeSample at(int hour, int minute, int second, time::CalendarDate day = {2024, 3, 9})
{
    time::TimeSample sample;
    sample.hour = hour;
    sample.minute = minute;
    sample.second = second;
    sample.day = day;
    return sample;
}

class FakeTimeSource final : public time::TimeSource
{
  public:
    support::Result<time::WallClockReading> now() override
    {
        ++reads_;
        if (failing_)
        {
            return support::makeError(support::ErrorKind::ClockUnavailable, "fake clock offline");
        }
        return reading_;
    }

    void set(const time::TimeSample &sample, int millisecond = 0)
    {
        reading_.sample = sample;
        reading_.millisecond = millisecond;
    }

    void setFailing(bool failing)
    {
        failing_ = failing;
    }

    int reads() const
    {
        return reads_;
    }

  private:
    time::WallClockReading reading_{};
    bool failing_ = false;
    int reads_ = 0;
};

} // namespace clockface::test
