//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the out-of-line parts of the Result<void> specialization and the
// error formatting helpers.  Every module reports failures through these
// helpers so the demo host and the tests see one consistent wording.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies `Result<void>` and the error printing helpers.

#include "clockface/support/result.hpp"

namespace clockface::support
{
/// @brief Construct a Result<void> that stores @p error.
/// @details A default-constructed Result<void> holds no error and represents
///          success; this constructor moves the error into the optional slot
///          and thereby marks the instance as failed.
Result<void>::Result(Error error) : error_(std::move(error))
{
}

/// @brief Report whether the Result<void> represents success.
/// @return True if no error is stored.
bool Result<void>::hasValue() const
{
    return !error_.has_value();
}

Result<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the stored error; callers must check hasValue() first.
const Error &Result<void>::error() const &
{
    return *error_;
}

Error makeError(ErrorKind kind, std::string msg)
{
    return Error{kind, std::move(msg)};
}

/// @brief Map an error category to the name used in printed messages.
/// @details New enumerators must extend this switch so that printed errors
///          keep a stable vocabulary.
const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::InvalidConfig:
            return "invalid_config";
        case ErrorKind::TimerUnavailable:
            return "timer_unavailable";
        case ErrorKind::ClockUnavailable:
            return "clock_unavailable";
        case ErrorKind::UnknownElement:
            return "unknown_element";
    }
    return "";
}

void printError(const Error &error, std::ostream &os)
{
    os << errorKindName(error.kind) << ": " << error.message << '\n';
}
} // namespace clockface::support
