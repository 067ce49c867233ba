//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/time/time_sample.cpp
// Purpose: Resolution, validation and formatting of time samples.
// Key invariants: resolve() keeps the day, hour and minute unconditionally.
// Ownership/Lifetime: Stateless helpers.
// Links: include/clockface/time/time_sample.hpp
//
//===----------------------------------------------------------------------===//

#include "clockface/time/time_sample.hpp"

#include <cstdio>

namespace clockface::time
{

ResolvedTimeSample resolve(const TimeSample &sample, bool showSeconds)
{
    ResolvedTimeSample resolved;
    resolved.day = sample.day;
    resolved.hour = sample.hour;
    resolved.minute = sample.minute;
    if (showSeconds)
    {
        resolved.second = sample.second;
    }
    return resolved;
}

bool isValid(const TimeSample &sample)
{
    return sample.hour >= 0 && sample.hour <= 23 && sample.minute >= 0 && sample.minute <= 59 &&
           sample.second >= 0 && sample.second <= 59 && sample.day.month >= 1 &&
           sample.day.month <= 12 && sample.day.day >= 1 && sample.day.day <= 31;
}

std::string toString(const TimeSample &sample)
{
    char buf[32];
    std::snprintf(buf,
                  sizeof(buf),
                  "%04d-%02d-%02d %02d:%02d:%02d",
                  sample.day.year,
                  sample.day.month,
                  sample.day.day,
                  sample.hour,
                  sample.minute,
                  sample.second);
    return std::string(buf);
}

} // namespace clockface::time
