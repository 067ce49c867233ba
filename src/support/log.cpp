//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/log.cpp
// Purpose: Implement the leveled logger declared in support/log.hpp.
// Key invariants: Each accepted message produces exactly one line.
// Ownership/Lifetime: The active stream is borrowed, never owned.
// Links: include/clockface/support/log.hpp
//
//===----------------------------------------------------------------------===//

#include "clockface/support/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <string>

namespace clockface::support
{

namespace
{
LogLevel g_level = LogLevel::Info;
std::ostream *g_stream = nullptr;

const char *levelTag(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Off:
            break;
    }
    return "";
}

void write(LogLevel level, std::string_view message)
{
    if (!logEnabled(level))
    {
        return;
    }

    std::time_t now = std::time(nullptr);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    char stamp[9];
    std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d", local.tm_hour, local.tm_min, local.tm_sec);

    std::ostream &os = g_stream ? *g_stream : std::cerr;
    os << '[' << levelTag(level) << "] " << stamp << ' ' << message << '\n';
    os.flush();
}
} // namespace

void logDebug(std::string_view message)
{
    write(LogLevel::Debug, message);
}

void logInfo(std::string_view message)
{
    write(LogLevel::Info, message);
}

void logWarn(std::string_view message)
{
    write(LogLevel::Warn, message);
}

void logError(std::string_view message)
{
    write(LogLevel::Error, message);
}

LogLevel logLevel()
{
    return g_level;
}

void setLogLevel(LogLevel level)
{
    g_level = level;
}

bool logEnabled(LogLevel level)
{
    return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(g_level);
}

void setLogStream(std::ostream *os)
{
    g_stream = os;
}

std::optional<LogLevel> parseLogLevel(std::string_view name)
{
    std::string lower(name);
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "off")
        return LogLevel::Off;
    return std::nullopt;
}

} // namespace clockface::support
