//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/config/theme.hpp
// Purpose: Theme presets and per-colour overrides of a clock face.
// Key invariants: Hand colours fall back to the border colour.
// Ownership/Lifetime: Plain value types; presets have static storage.
// Links: src/config/theme.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clockface/draw/style.hpp"
#include "clockface/support/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace clockface::config
{

inline constexpr std::string_view kDefaultThemePreset = "dark";

/// @brief Base colours a preset contributes.
struct ThemePreset
{
    draw::RGBA background{};
    draw::RGBA border{};
};

/// @brief Theme as given by the host; every field may be absent.
struct ThemeOptions
{
    std::optional<std::string> preset;
    std::optional<draw::RGBA> background;
    std::optional<draw::RGBA> border;
    std::optional<draw::RGBA> hours;
    std::optional<draw::RGBA> minutes;
    std::optional<draw::RGBA> second;
};

/// @brief Look up preset @p name ("dark" or "light", case-insensitive).
std::optional<ThemePreset> findThemePreset(std::string_view name);

/// @brief Parse "#rrggbb" or "#rrggbbaa"; the leading '#' is optional.
std::optional<draw::RGBA> parseColor(std::string_view text);

/// @brief Merge @p theme over its preset into a complete palette.
/// @return InvalidConfig for an unknown preset name.
support::Result<draw::Palette> resolvePalette(const ThemeOptions &theme);

} // namespace clockface::config
