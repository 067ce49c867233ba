//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/draw/style.hpp
// Purpose: Colours, strokes and the resolved palette of a clock face.
// Key invariants: None.
// Ownership/Lifetime: Plain value types.
// Links: include/clockface/draw/drawing.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace clockface::draw
{

/// @brief 8-bit per channel colour.
struct RGBA
{
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const RGBA &) const = default;
};

/// @brief "#rrggbbaa" form of @p color.
std::string toHex(RGBA color);

struct Stroke
{
    double width = 1.0;
    RGBA color{};

    bool operator==(const Stroke &) const = default;
};

/// @brief Fully resolved colours used to build a drawing.
struct Palette
{
    RGBA background{};
    RGBA border{};
    RGBA hours{};
    RGBA minutes{};
    RGBA second{};

    bool operator==(const Palette &) const = default;
};

} // namespace clockface::draw
