//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/version.cpp
// Purpose: Provide the version query printed by `clockface_demo --version`.
// Key invariants: Returned string remains valid for the process lifetime and
//                 matches the version recorded in CMake metadata.
// Ownership/Lifetime: Returns a pointer to a string with static storage
//                     duration; callers must not attempt to free it.
// Links: CMakeLists.txt
//
//===----------------------------------------------------------------------===//

#include "clockface/version.hpp"

namespace clockface
{
/// @brief Report the "major.minor.patch" version of the ClockFace library.
const char *clockface_version() noexcept
{
    return "0.1.0";
}
} // namespace clockface
