//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/engine/patch.cpp
// Purpose: Patch construction and lookup helpers.
// Key invariants: makePatch emits hour and minute entries unconditionally.
// Ownership/Lifetime: Stateless.
// Links: include/clockface/engine/patch.hpp
//
//===----------------------------------------------------------------------===//

#include "clockface/engine/patch.hpp"

namespace clockface::engine
{

std::string_view elementId(HandId hand)
{
    switch (hand)
    {
        case HandId::Hour:
            return "hour_hand";
        case HandId::Minute:
            return "minute_hand";
        case HandId::Second:
            return "second_hand";
    }
    return {};
}

Patch makePatch(const HandAngles &angles, bool showSeconds)
{
    Patch patch;
    patch.reserve(showSeconds ? 3 : 2);
    patch.push_back(HandRotation{HandId::Hour, angles.hourRadians});
    patch.push_back(HandRotation{HandId::Minute, angles.minuteRadians});
    if (showSeconds)
    {
        patch.push_back(HandRotation{HandId::Second, angles.secondRadians});
    }
    return patch;
}

std::optional<double> rotationFor(const Patch &patch, HandId hand)
{
    for (const auto &entry : patch)
    {
        if (entry.hand == hand)
        {
            return entry.radians;
        }
    }
    return std::nullopt;
}

} // namespace clockface::engine
