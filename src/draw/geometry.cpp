//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/draw/geometry.cpp
// Purpose: Derive clock-face sizes from the radius.
// Key invariants: Every size scales linearly with the radius except the
//                 stroke thickness, which has two steps.
// Ownership/Lifetime: Stateless.
// Links: include/clockface/draw/geometry.hpp
//
//===----------------------------------------------------------------------===//

#include "clockface/draw/geometry.hpp"

namespace clockface::draw
{

Geometry makeGeometry(double radius)
{
    Geometry g;
    g.radius = radius;
    g.backSize = radius * kBackSizeRatio;
    g.hourSize = radius * kHourSizeRatio;
    g.minuteSize = radius * kMinuteSizeRatio;
    g.secondSize = radius * kSecondSizeRatio;
    g.tickSize = radius * kTickRatio;
    g.thickness = radius > kThickStrokeRadius ? kThickStroke : kThinStroke;
    return g;
}

} // namespace clockface::draw
