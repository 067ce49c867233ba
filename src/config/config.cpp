//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/config.cpp
// Purpose: INI-like loader for clock options and the merge with defaults.
// Key invariants: Reads sections [clock] and [theme]; unknown sections, keys
//                 and malformed values are rejected rather than skipped.
// Ownership/Lifetime: Loader does not own external resources beyond the path.
// Links: include/clockface/config/config.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements clock option parsing and resolution.
/// @details Lines are trimmed; blank lines and lines starting with '#' or ';'
///          are ignored, and a ';' ends the value of a key.  Section and key
///          names are case-insensitive.  Parsing only records what the file
///          states; defaults are applied afterwards by resolveOptions so the
///          same merge serves options built in code.

#include "clockface/config/config.hpp"

#include "clockface/support/log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace clockface::config
{

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::optional<bool> parseBool(const std::string &s)
{
    const std::string lower = lowercase(s);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
        return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

std::optional<double> parseNumber(const std::string &s)
{
    try
    {
        size_t parsed = 0;
        const double value = std::stod(s, &parsed);
        if (parsed != s.size())
        {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::invalid_argument &)
    {
        return std::nullopt;
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

support::Error lineError(int lineNo, const std::string &what)
{
    return support::makeError(support::ErrorKind::InvalidConfig,
                              "line " + std::to_string(lineNo) + ": " + what);
}

std::optional<support::Error> applyClockKey(int lineNo,
                                            const std::string &key,
                                            const std::string &value,
                                            ClockOptions &out)
{
    if (key == "radius")
    {
        auto radius = parseNumber(value);
        if (!radius)
        {
            return lineError(lineNo, "radius '" + value + "' is not a number");
        }
        out.radius = *radius;
    }
    else if (key == "seconds")
    {
        auto seconds = parseBool(value);
        if (!seconds)
        {
            return lineError(lineNo, "seconds '" + value + "' is not a boolean");
        }
        out.showSeconds = *seconds;
    }
    else if (key == "ticks")
    {
        if (lowercase(value) == "auto")
        {
            out.ticks = TicksMode::Auto;
        }
        else if (auto ticks = parseBool(value))
        {
            out.ticks = *ticks ? TicksMode::On : TicksMode::Off;
        }
        else
        {
            return lineError(lineNo, "ticks '" + value + "' is neither 'auto' nor a boolean");
        }
    }
    else
    {
        return lineError(lineNo, "unknown key '" + key + "' in [clock]");
    }
    return std::nullopt;
}

std::optional<support::Error> applyThemeKey(int lineNo,
                                            const std::string &key,
                                            const std::string &value,
                                            ThemeOptions &out)
{
    if (key == "preset")
    {
        if (!findThemePreset(value))
        {
            return lineError(lineNo, "unknown theme preset '" + value + "'");
        }
        out.preset = lowercase(value);
        return std::nullopt;
    }

    std::optional<draw::RGBA> *slot = nullptr;
    if (key == "background")
        slot = &out.background;
    else if (key == "border")
        slot = &out.border;
    else if (key == "hours")
        slot = &out.hours;
    else if (key == "minutes")
        slot = &out.minutes;
    else if (key == "second")
        slot = &out.second;
    else
        return lineError(lineNo, "unknown key '" + key + "' in [theme]");

    auto color = parseColor(value);
    if (!color)
    {
        return lineError(lineNo, key + " '" + value + "' is not a #rrggbb[aa] colour");
    }
    *slot = *color;
    return std::nullopt;
}
} // namespace

support::Result<ClockConfig> resolveOptions(const ClockOptions &options)
{
    ClockConfig cfg;

    if (options.radius)
    {
        const double radius = *options.radius;
        if (std::isfinite(radius) && radius > 0.0)
        {
            cfg.radius = radius;
        }
        else
        {
            support::logWarn("invalid clock radius " + std::to_string(radius) +
                             ", using default " + std::to_string(kDefaultRadius));
        }
    }

    cfg.showSeconds = options.showSeconds.value_or(false);

    switch (options.ticks)
    {
        case TicksMode::Auto:
            cfg.showTicks = cfg.radius >= kMinRadiusForDefaultTicks;
            break;
        case TicksMode::On:
            cfg.showTicks = true;
            break;
        case TicksMode::Off:
            cfg.showTicks = false;
            break;
    }

    auto palette = resolvePalette(options.theme);
    if (!palette)
    {
        return palette.error();
    }
    cfg.palette = palette.value();
    return cfg;
}

support::Result<ClockOptions> parseOptions(std::string_view text)
{
    ClockOptions out;
    std::istringstream in{std::string(text)};
    std::string line;
    std::string section;
    int lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[')
        {
            if (trimmed.back() != ']')
            {
                return lineError(lineNo, "unterminated section header");
            }
            section = lowercase(trim(std::string_view(trimmed).substr(1, trimmed.size() - 2)));
            if (section != "clock" && section != "theme")
            {
                return lineError(lineNo, "unknown section [" + section + "]");
            }
            continue;
        }

        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            return lineError(lineNo, "expected key = value");
        }
        std::string key = lowercase(trim(std::string_view(trimmed).substr(0, eq)));
        std::string_view rest = std::string_view(trimmed).substr(eq + 1);
        if (auto comment = rest.find(';'); comment != std::string_view::npos)
        {
            rest = rest.substr(0, comment);
        }
        std::string value = trim(rest);
        if (key.empty() || value.empty())
        {
            return lineError(lineNo, "empty key or value");
        }

        std::optional<support::Error> err;
        if (section == "clock")
        {
            err = applyClockKey(lineNo, key, value, out);
        }
        else if (section == "theme")
        {
            err = applyThemeKey(lineNo, key, value, out.theme);
        }
        else
        {
            err = lineError(lineNo, "key '" + key + "' outside of a section");
        }
        if (err)
        {
            return *err;
        }
    }
    return out;
}

support::Result<ClockOptions> loadFromFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
    {
        return support::makeError(support::ErrorKind::InvalidConfig,
                                  "cannot open config file '" + path + "'");
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    auto parsed = parseOptions(contents.str());
    if (!parsed)
    {
        return support::makeError(support::ErrorKind::InvalidConfig,
                                  path + ": " + parsed.error().message);
    }
    return parsed;
}

} // namespace clockface::config
