//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/time/time_sample.hpp
// Purpose: Snapshot types describing a local wall-clock reading and its
//          reduction to the granularity a clock face displays.
// Key invariants: hour in [0, 23], minute in [0, 59], second in [0, 59].
// Ownership/Lifetime: Plain value types.
// Links: src/time/time_sample.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>

namespace clockface::time
{

/// @brief Calendar day of a sample.
struct CalendarDate
{
    int year = 1970;
    int month = 1; ///< 1-12
    int day = 1;   ///< 1-31

    bool operator==(const CalendarDate &) const = default;
};

/// @brief Local wall-clock time captured at one instant.
struct TimeSample
{
    int hour = 0;
    int minute = 0;
    int second = 0;
    CalendarDate day{};

    bool operator==(const TimeSample &) const = default;
};

/// @brief TimeSample plus the millisecond offset within its second.
/// @details Only phase alignment of the heartbeat reads @ref millisecond.
struct WallClockReading
{
    TimeSample sample{};
    int millisecond = 0; ///< 0-999
};

/// @brief TimeSample reduced to the fields a clock actually displays.
/// @details @ref second is empty when the second hand is hidden so that two
///          samples within the same minute compare equal.
struct ResolvedTimeSample
{
    CalendarDate day{};
    int hour = 0;
    int minute = 0;
    std::optional<int> second;

    bool operator==(const ResolvedTimeSample &) const = default;
};

/// @brief Reduce @p sample to the comparison key for a face that does or does
///        not display seconds.
ResolvedTimeSample resolve(const TimeSample &sample, bool showSeconds);

/// @brief Check that every field of @p sample lies in its documented range.
bool isValid(const TimeSample &sample);

/// @brief Format @p sample as "YYYY-MM-DD HH:MM:SS".
std::string toString(const TimeSample &sample);

} // namespace clockface::time
