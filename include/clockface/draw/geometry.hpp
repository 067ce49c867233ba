//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/draw/geometry.hpp
// Purpose: Size parameters of a clock face derived from its radius.
// Key invariants: Fixed once computed; hand sizes are negative because hands
//                 point up (towards -y) before rotation.
// Ownership/Lifetime: Plain value type.
// Links: src/draw/geometry.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

namespace clockface::draw
{

inline constexpr double kBackSizeRatio = 0.1;
inline constexpr double kHourSizeRatio = -0.6;
inline constexpr double kMinuteSizeRatio = -0.9;
inline constexpr double kSecondSizeRatio = -0.9;
inline constexpr double kTickRatio = 0.08;
/// Radii strictly above this use the thick stroke.
inline constexpr double kThickStrokeRadius = 40.0;
inline constexpr double kThinStroke = 1.2;
inline constexpr double kThickStroke = 2.0;

struct Geometry
{
    double radius = 0.0;
    double backSize = 0.0; ///< Tail of each hand behind the pin
    double hourSize = 0.0;
    double minuteSize = 0.0;
    double secondSize = 0.0;
    double tickSize = 0.0;
    double thickness = kThinStroke;

    bool operator==(const Geometry &) const = default;
};

/// @brief Derive every size of the face from @p radius.
Geometry makeGeometry(double radius);

} // namespace clockface::draw
