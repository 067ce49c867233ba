//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/engine/hand_angles.hpp
// Purpose: Map a time sample to the fraction of a revolution and the rotation
//          of each clock hand.
// Key invariants: For valid samples every percent lies in [0, 1) and every
//                 angle in [0, 2*pi). Zero fields map to exactly 0.0.
// Ownership/Lifetime: Pure functions over value types.
// Links: src/engine/hand_angles.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clockface/time/time_sample.hpp"

namespace clockface::engine
{

inline constexpr double kTwoPi = 6.283185307179586476925286766559;

/// @brief Fraction of a full revolution for each hand.
struct HandPercents
{
    double hour = 0.0;
    double minute = 0.0;
    double second = 0.0;
};

/// @brief Rotation of each hand in radians, clockwise from 12 o'clock.
struct HandAngles
{
    double hourRadians = 0.0;
    double minuteRadians = 0.0;
    double secondRadians = 0.0;
};

/// @brief second / 60.
double secondPercent(const time::TimeSample &sample);

/// @brief (minute + secondPercent) / 60; creeps continuously with seconds.
double minutePercent(const time::TimeSample &sample);

/// @brief ((hour mod 12) + minutePercent) / 12; noon and midnight are 0.
double hourPercent(const time::TimeSample &sample);

HandPercents computeHandPercents(const time::TimeSample &sample);

HandAngles computeHandAngles(const time::TimeSample &sample);

} // namespace clockface::engine
