//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/config/config.hpp
// Purpose: Clock construction options, their INI loader and the pure merge
//          that turns them into a complete configuration.
// Key invariants: Reads sections [clock] and [theme]; anything else is an
//                 error. resolveOptions is deterministic and side-effect free
//                 apart from logging fallbacks.
// Ownership/Lifetime: Loader does not own external resources beyond the path.
// Links: src/config/config.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clockface/config/theme.hpp"
#include "clockface/draw/style.hpp"
#include "clockface/support/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace clockface::config
{

inline constexpr double kDefaultRadius = 10.0;
/// Radius from which tick marks are shown when ticks are left on auto.
inline constexpr double kMinRadiusForDefaultTicks = 30.0;

enum class TicksMode
{
    Auto, ///< Shown iff radius >= kMinRadiusForDefaultTicks
    On,
    Off
};

/// @brief Options as supplied by the host; absent fields take defaults.
struct ClockOptions
{
    std::optional<double> radius;
    std::optional<bool> showSeconds;
    TicksMode ticks = TicksMode::Auto;
    ThemeOptions theme;
};

/// @brief Complete configuration with every default applied.
struct ClockConfig
{
    double radius = kDefaultRadius;
    bool showSeconds = false;
    bool showTicks = false;
    draw::Palette palette{};
};

/// @brief Merge @p options with the documented defaults.
/// @details A radius that is not finite or not positive falls back to
///          kDefaultRadius with a warning.
/// @return InvalidConfig when the theme cannot be resolved.
support::Result<ClockConfig> resolveOptions(const ClockOptions &options);

/// @brief Parse INI text into options.
/// @return InvalidConfig naming the offending line for malformed input.
support::Result<ClockOptions> parseOptions(std::string_view text);

/// @brief Read and parse the INI file at @p path.
support::Result<ClockOptions> loadFromFile(const std::string &path);

} // namespace clockface::config
