//===----------------------------------------------------------------------===//
//
// Part of the ClockFace project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/clockface/support/result.hpp
// Purpose: Error values and an expected-like Result container shared by every
//          ClockFace module.
// Key invariants: A Result holds exactly one of a value or an Error.
// Ownership/Lifetime: Result owns the contained value or error.
// Links: src/support/result.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace clockface::support
{

/// @brief Broad failure categories reported across module boundaries.
enum class ErrorKind
{
    InvalidConfig,    ///< Construction input was malformed.
    TimerUnavailable, ///< The timer service refused to create a timer.
    ClockUnavailable, ///< The wall clock could not be read.
    UnknownElement    ///< A patch named an element missing from the drawing.
};

/// @brief Single error with its category and a human-readable message.
struct Error
{
    ErrorKind kind;      ///< Failure category
    std::string message; ///< Human-readable text
};

/// @brief Expected-style container pairing a value with an Error on failure.
/// @tparam T Stored value type when the operation succeeds.
template <class T> class Result
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Disabled for Error and Result so the constructors never collide.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Error> &&
                                       !std::is_same_v<std::decay_t<U>, Result>>>
    Result(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct a failed result holding @p error.
    Result(Error error) : error_(std::move(error)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the error describing the failure; requires !hasValue().
    const Error &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Error> error_;
};

/// @brief Result specialization for operations with no success payload.
template <> class Result<void>
{
  public:
    /// @brief Construct a successful result.
    Result() = default;

    /// @brief Construct a failed result holding @p error.
    Result(Error error);

    [[nodiscard]] bool hasValue() const;

    explicit operator bool() const;

    const Error &error() const &;

  private:
    std::optional<Error> error_;
};

using Status = Result<void>;

/// @brief Build an Error of @p kind with message @p msg.
Error makeError(ErrorKind kind, std::string msg);

/// @brief Lowercase, underscore-separated name of @p kind.
const char *errorKindName(ErrorKind kind);

/// @brief Print @p error as "<kind>: <message>" followed by a newline.
void printError(const Error &error, std::ostream &os);

} // namespace clockface::support
