//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/engine/hand_angles.cpp
// Purpose: Compute hand percents and angles from a time sample.
// Key invariants: Angles are recomputed from the sample every time and never
//                 accumulated across ticks.
// Ownership/Lifetime: Stateless.
// Links: include/clockface/engine/hand_angles.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the hand-angle math of the clock engine.
/// @details The minute hand interpolates with the seconds and the hour hand
///          with the minutes, so both sweep continuously instead of jumping.

#include "clockface/engine/hand_angles.hpp"

namespace clockface::engine
{

double secondPercent(const time::TimeSample &sample)
{
    return sample.second / 60.0;
}

double minutePercent(const time::TimeSample &sample)
{
    return (sample.minute + secondPercent(sample)) / 60.0;
}

double hourPercent(const time::TimeSample &sample)
{
    const int hour12 = sample.hour % 12;
    return (hour12 + minutePercent(sample)) / 12.0;
}

HandPercents computeHandPercents(const time::TimeSample &sample)
{
    HandPercents percents;
    percents.second = secondPercent(sample);
    percents.minute = minutePercent(sample);
    percents.hour = hourPercent(sample);
    return percents;
}

HandAngles computeHandAngles(const time::TimeSample &sample)
{
    const HandPercents percents = computeHandPercents(sample);
    HandAngles angles;
    angles.hourRadians = kTwoPi * percents.hour;
    angles.minuteRadians = kTwoPi * percents.minute;
    angles.secondRadians = kTwoPi * percents.second;
    return angles;
}

} // namespace clockface::engine
