// include/clockface/version.hpp
#pragma once

/// @brief Returns the ClockFace version string.
/// @invariant The returned pointer is non-null and points to a null-terminated string.
/// @ownership The returned string has static storage duration and must not be freed.
/// @notes Matches the project version recorded in CMakeLists.txt.
namespace clockface
{
const char *clockface_version() noexcept;
} // namespace clockface
