//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/time/time_source.hpp
// Purpose: Abstract wall-clock source and the system-clock implementation.
// Key invariants: A successful read always yields a sample with isValid() true.
// Ownership/Lifetime: Sources are borrowed by the engine and the app.
// Links: src/time/time_source.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "clockface/support/result.hpp"
#include "clockface/time/time_sample.hpp"

namespace clockface::time
{

/// @brief Provider of local wall-clock readings.
class TimeSource
{
  public:
    virtual ~TimeSource() = default;

    /// @brief Read the current local time.
    /// @return Reading or a ClockUnavailable error.
    virtual support::Result<WallClockReading> now() = 0;
};

/// @brief TimeSource backed by std::chrono::system_clock and the local zone.
class SystemTimeSource final : public TimeSource
{
  public:
    support::Result<WallClockReading> now() override;
};

} // namespace clockface::time
