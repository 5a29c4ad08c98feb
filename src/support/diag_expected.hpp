//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides the Expected container and the kind-tagged Error it carries.
// Key invariants: An Expected holds exactly one of a value or an Error.
// Ownership/Lifetime: Expected owns the contained value or error.
// Links: support/error_kind.hpp, support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/error_kind.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace glossa::support
{

/// @brief Failure payload: a shared error kind plus a human-readable message.
struct Error
{
    ErrorKind kind;
    std::string message;
};

/// @brief Expected-style container pairing a value with an Error on failure.
/// @tparam T Stored value type when the operation succeeds.
/// @note Mirrors a subset of std::expected.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @param value Value produced by a successful computation.
    /// @details Enabled only when the provided value does not decay to Error to
    ///          avoid colliding with the error constructor below, and never
    ///          for Expected itself so copies use the copy constructor.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Error> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p error.
    /// @param error Error to return to the caller.
    Expected(Error error) : error_(std::move(error)) {}

    /// @brief Check whether a value is present.
    /// @return True when the Expected stores a value.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
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

/// @brief Expected specialization for void success type.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    /// @param error Error describing the failure.
    Expected(Error error);

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const;

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const;

    /// @brief Access the error describing the failure.
    const Error &error() const &;

  private:
    std::optional<Error> error_;
};

/// @brief Create an Error of @p kind with message @p msg.
Error makeError(ErrorKind kind, std::string msg);

/// @brief Wrap @p error in an Error-severity diagnostic.
/// @details The error kind is attached as the leading "kind" field, followed
///          by @p fields.
Diagnostic toDiagnostic(const Error &error, std::vector<DiagField> fields = {});

} // namespace glossa::support
