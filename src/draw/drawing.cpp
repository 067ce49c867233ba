//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/draw/drawing.cpp
// Purpose: Build the initial clock drawing and apply hand patches to it.
// Key invariants: applyPatch validates every id before mutating anything.
// Ownership/Lifetime: Functions operate on caller-owned drawings.
// Links: include/clockface/draw/drawing.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the clock drawing model.
/// @details Layout in paint order: the face circle, the hour hand, the minute
///          hand, the optional second hand, then twelve optional tick marks.
///          Every hand is a line from a short tail below the pin up to its
///          tip, pinned at the origin so a rotation spins it about the centre.

#include "clockface/draw/drawing.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

namespace clockface::draw
{

std::string toHex(RGBA color)
{
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", color.r, color.g, color.b, color.a);
    return std::string(buf);
}

void Drawing::add(Primitive primitive)
{
    primitives_.push_back(std::move(primitive));
}

Primitive *Drawing::find(std::string_view id)
{
    if (id.empty())
    {
        return nullptr;
    }
    auto it = std::find_if(
        primitives_.begin(), primitives_.end(), [&](const Primitive &p) { return p.id == id; });
    return it == primitives_.end() ? nullptr : &*it;
}

const Primitive *Drawing::find(std::string_view id) const
{
    return const_cast<Drawing *>(this)->find(id);
}

namespace
{
Primitive makeHand(std::string_view id, const Geometry &g, double size, RGBA color)
{
    Primitive hand;
    hand.kind = PrimitiveKind::Line;
    hand.id = std::string(id);
    hand.from = Point{0.0, g.backSize};
    hand.to = Point{0.0, size};
    hand.stroke = Stroke{g.thickness, color};
    hand.pin = Point{0.0, 0.0};
    return hand;
}

void appendNumber(std::string &out, const char *label, double value)
{
    char buf[48];
    std::snprintf(buf, sizeof(buf), " %s=%.6g", label, value);
    out += buf;
}

void appendPoint(std::string &out, const char *label, Point p)
{
    char buf[80];
    std::snprintf(buf, sizeof(buf), " %s=(%.6g,%.6g)", label, p.x, p.y);
    out += buf;
}
} // namespace

Drawing buildInitialDrawing(const Geometry &geometry,
                            const Palette &palette,
                            bool showSeconds,
                            bool showTicks)
{
    Drawing drawing;

    Primitive face;
    face.kind = PrimitiveKind::Circle;
    face.radius = geometry.radius;
    face.fill = palette.background;
    face.stroke = Stroke{geometry.thickness, palette.border};
    drawing.add(face);

    drawing.add(makeHand(engine::elementId(engine::HandId::Hour),
                         geometry,
                         geometry.hourSize,
                         palette.hours));
    drawing.add(makeHand(engine::elementId(engine::HandId::Minute),
                         geometry,
                         geometry.minuteSize,
                         palette.minutes));
    if (showSeconds)
    {
        drawing.add(makeHand(engine::elementId(engine::HandId::Second),
                             geometry,
                             geometry.secondSize,
                             palette.second));
    }

    if (showTicks)
    {
        const double step = engine::kTwoPi / kTickCount;
        for (int n = 1; n <= kTickCount; ++n)
        {
            Primitive tick;
            tick.kind = PrimitiveKind::Line;
            tick.from = Point{0.0, geometry.radius - geometry.tickSize};
            tick.to = Point{0.0, geometry.radius};
            tick.stroke = Stroke{geometry.thickness, palette.border};
            tick.pin = Point{0.0, 0.0};
            tick.rotation = n * step;
            drawing.add(tick);
        }
    }

    return drawing;
}

support::Status applyPatch(Drawing &drawing, const engine::Patch &patch)
{
    for (const auto &entry : patch)
    {
        if (!drawing.find(engine::elementId(entry.hand)))
        {
            return support::makeError(support::ErrorKind::UnknownElement,
                                      "drawing has no element '" +
                                          std::string(engine::elementId(entry.hand)) + "'");
        }
    }
    for (const auto &entry : patch)
    {
        drawing.find(engine::elementId(entry.hand))->rotation = entry.radians;
    }
    return {};
}

std::string describe(const Drawing &drawing)
{
    std::string out;
    for (const auto &p : drawing.primitives())
    {
        out += p.kind == PrimitiveKind::Circle ? "circle" : "line";
        if (!p.id.empty())
        {
            out += " id=" + p.id;
        }
        if (p.kind == PrimitiveKind::Circle)
        {
            appendNumber(out, "r", p.radius);
        }
        else
        {
            appendPoint(out, "from", p.from);
            appendPoint(out, "to", p.to);
        }
        if (p.pin)
        {
            appendPoint(out, "pin", *p.pin);
        }
        appendNumber(out, "rotate", p.rotation);
        if (p.fill)
        {
            out += " fill=" + toHex(*p.fill);
        }
        if (p.stroke)
        {
            appendNumber(out, "stroke", p.stroke->width);
            out += "/" + toHex(p.stroke->color);
        }
        out += '\n';
    }
    return out;
}

} // namespace clockface::draw
