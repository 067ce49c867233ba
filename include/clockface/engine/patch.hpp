//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/engine/patch.hpp
// Purpose: Named-hand rotation updates produced by one engine step.
// Key invariants: Entries are ordered hour, minute, then second when present.
// Ownership/Lifetime: Patch owns its entries; it is built fresh per update.
// Links: src/engine/patch.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clockface/engine/hand_angles.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace clockface::engine
{

/// @brief Identifier of a rotatable hand in the drawing.
enum class HandId
{
    Hour,
    Minute,
    Second
};

/// @brief Drawing element id for @p hand ("hour_hand", "minute_hand", "second_hand").
std::string_view elementId(HandId hand);

/// @brief Replace the rotation of one hand.
struct HandRotation
{
    HandId hand;
    double radians;
};

/// @brief Ordered rotation updates; two entries or three with the second hand.
using Patch = std::vector<HandRotation>;

/// @brief Build the patch for @p angles, including the second hand only when
///        @p showSeconds is set.
Patch makePatch(const HandAngles &angles, bool showSeconds);

/// @brief Rotation assigned to @p hand by @p patch, if any.
std::optional<double> rotationFor(const Patch &patch, HandId hand);

} // namespace clockface::engine
