//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/time/time_source.cpp
// Purpose: Read the local wall clock into a WallClockReading.
// Key invariants: Leap seconds (tm_sec == 60) are reported as second 59.
// Ownership/Lifetime: SystemTimeSource is stateless.
// Links: include/clockface/time/time_source.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the system-clock TimeSource.
/// @details The hour, minute and second come from the local calendar time,
///          the millisecond offset from the same system_clock instant so that
///          both describe one moment.

#include "clockface/time/time_source.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>

namespace clockface::time
{

support::Result<WallClockReading> SystemTimeSource::now()
{
    const auto instant = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(instant);
    const auto sinceEpoch = instant.time_since_epoch();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch) -
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch));

    std::tm local{};
#if defined(_WIN32)
    if (localtime_s(&local, &seconds) != 0)
#else
    if (localtime_r(&seconds, &local) == nullptr)
#endif
    {
        return support::makeError(support::ErrorKind::ClockUnavailable,
                                  "failed to convert system time to local time");
    }

    WallClockReading reading;
    reading.sample.hour = local.tm_hour;
    reading.sample.minute = local.tm_min;
    reading.sample.second = std::min(local.tm_sec, 59);
    reading.sample.day = CalendarDate{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
    reading.millisecond = std::clamp(static_cast<int>(millis.count()), 0, 999);
    return reading;
}

} // namespace clockface::time
