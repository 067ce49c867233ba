//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/theme.cpp
// Purpose: Theme preset table, colour parsing and palette resolution.
// Key invariants: resolvePalette never leaves a palette entry unset.
// Ownership/Lifetime: Stateless.
// Links: include/clockface/config/theme.hpp
//
//===----------------------------------------------------------------------===//

#include "clockface/config/theme.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace clockface::config
{

namespace
{
constexpr draw::RGBA kBlack{0, 0, 0, 255};
constexpr draw::RGBA kWhite{255, 255, 255, 255};
constexpr draw::RGBA kLightGrey{211, 211, 211, 255};
constexpr draw::RGBA kDarkGrey{169, 169, 169, 255};

std::string lowercase(std::string_view sv)
{
    std::string out(sv);
    std::transform(
        out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

int hexDigit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}
} // namespace

std::optional<ThemePreset> findThemePreset(std::string_view name)
{
    const std::string lower = lowercase(name);
    if (lower == "dark")
    {
        return ThemePreset{kBlack, kLightGrey};
    }
    if (lower == "light")
    {
        return ThemePreset{kWhite, kDarkGrey};
    }
    return std::nullopt;
}

std::optional<draw::RGBA> parseColor(std::string_view text)
{
    if (!text.empty() && text.front() == '#')
    {
        text.remove_prefix(1);
    }
    if (text.size() != 6 && text.size() != 8)
    {
        return std::nullopt;
    }

    uint8_t channels[4] = {0, 0, 0, 255};
    for (size_t i = 0; i < text.size(); i += 2)
    {
        const int hi = hexDigit(text[i]);
        const int lo = hexDigit(text[i + 1]);
        if (hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        channels[i / 2] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return draw::RGBA{channels[0], channels[1], channels[2], channels[3]};
}

support::Result<draw::Palette> resolvePalette(const ThemeOptions &theme)
{
    const std::string presetName = theme.preset.value_or(std::string(kDefaultThemePreset));
    auto preset = findThemePreset(presetName);
    if (!preset)
    {
        return support::makeError(support::ErrorKind::InvalidConfig,
                                  "unknown theme preset '" + presetName + "'");
    }

    draw::Palette palette;
    palette.background = theme.background.value_or(preset->background);
    palette.border = theme.border.value_or(preset->border);
    palette.hours = theme.hours.value_or(palette.border);
    palette.minutes = theme.minutes.value_or(palette.border);
    palette.second = theme.second.value_or(palette.border);
    return palette;
}

} // namespace clockface::config
