//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/draw/drawing.hpp
// Purpose: In-memory drawing of a clock face and the operations the engine
//          needs on it: build once, then rotate named hands.
// Key invariants: Element ids are unique; applyPatch changes nothing but the
//                 rotation of the named elements.
// Ownership/Lifetime: Drawing owns its primitives by value.
// Links: src/draw/drawing.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clockface/draw/geometry.hpp"
#include "clockface/draw/style.hpp"
#include "clockface/engine/patch.hpp"
#include "clockface/support/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clockface::draw
{

inline constexpr int kTickCount = 12;

struct Point
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point &) const = default;
};

enum class PrimitiveKind
{
    Circle,
    Line
};

/// @brief One shape of the drawing.
/// @details Circles use @ref radius and are centred on the origin; lines use
///          @ref from and @ref to.  @ref rotation is applied around @ref pin.
struct Primitive
{
    PrimitiveKind kind = PrimitiveKind::Line;
    std::string id; ///< Empty for anonymous shapes
    double radius = 0.0;
    Point from{};
    Point to{};
    std::optional<RGBA> fill;
    std::optional<Stroke> stroke;
    std::optional<Point> pin;
    double rotation = 0.0;

    bool operator==(const Primitive &) const = default;
};

/// @brief Ordered list of primitives, painted first to last.
class Drawing
{
  public:
    void add(Primitive primitive);

    /// @brief Element with id @p id, or nullptr.
    Primitive *find(std::string_view id);
    const Primitive *find(std::string_view id) const;

    [[nodiscard]] const std::vector<Primitive> &primitives() const
    {
        return primitives_;
    }

    [[nodiscard]] std::size_t size() const
    {
        return primitives_.size();
    }

  private:
    std::vector<Primitive> primitives_;
};

/// @brief Build the face, the hands and optionally the tick marks.
/// @details Hands start unrotated (pointing at 12); the first engine update
///          rotates them into place.
Drawing buildInitialDrawing(const Geometry &geometry,
                            const Palette &palette,
                            bool showSeconds,
                            bool showTicks);

/// @brief Replace the rotation of every hand named in @p patch.
/// @return UnknownElement if any hand is missing; @p drawing is then untouched.
support::Status applyPatch(Drawing &drawing, const engine::Patch &patch);

/// @brief One line of text per primitive, in paint order.
std::string describe(const Drawing &drawing);

} // namespace clockface::draw
