//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/support/log.hpp
// Purpose: Leveled logging writing timestamped messages to a process-wide
//          stream with DEBUG/INFO/WARN/ERROR levels and a minimum level filter.
//
// Key invariants:
//   - Levels are ordered: Debug < Info < Warn < Error < Off.
//   - Messages below the current minimum level are discarded.
//   - Output format is: [LEVEL] HH:MM:SS message
//   - The default minimum level is Info and the default stream is stderr.
//
// Ownership/Lifetime:
//   - Log functions do not retain message text.
//   - The stream installed by setLogStream is borrowed and must outlive its use.
//   - Level and stream are process-wide state without thread safety guarantees.
//
// Links: src/support/log.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace clockface::support
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

void logDebug(std::string_view message);
void logInfo(std::string_view message);
void logWarn(std::string_view message);
void logError(std::string_view message);

/// @brief Current minimum level.
LogLevel logLevel();

/// @brief Set the minimum level; messages below it are dropped.
void setLogLevel(LogLevel level);

/// @brief Check whether a message at @p level would be written.
bool logEnabled(LogLevel level);

/// @brief Redirect log output to @p os; pass nullptr to restore stderr.
void setLogStream(std::ostream *os);

/// @brief Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
/// @return Matching level or std::nullopt for unknown names.
std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace clockface::support
