//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Expected helpers used across the support library.  The
// utilities defined here wrap kind-tagged errors in an Expected<void> type,
// provide the error-kind to string mapping, and convert errors into structured
// diagnostics so every subsystem reports failures in a uniform format.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers and error conversions.

#include "diag_expected.hpp"

namespace glossa::support
{
/// @brief Construct an Expected<void> that stores an error state.
///
/// @details A default-constructed `Expected` contains no error payload and
///          represents success.
///
/// @param error Error to transfer into the payload.
Expected<void>::Expected(Error error) : error_(std::move(error))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
/// @return True if the instance holds no error (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the error that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor; doing so is undefined behaviour otherwise.
const Error &Expected<void>::error() const &
{
    return *error_;
}

/// @brief Map an error kind to the lowercase name used in diagnostics.
///
/// @details New kinds should extend this switch to maintain predictable
///          wording across tools and logs.
const char *errorKindName(ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::OutOfMemory:
            return "out-of-memory";
        case ErrorKind::InvalidHandle:
            return "invalid-handle";
        case ErrorKind::UnbalancedRelease:
            return "unbalanced-release";
        case ErrorKind::InvalidUtf8:
            return "invalid-utf8";
        case ErrorKind::InvalidUtf16:
            return "invalid-utf16";
    }
    return "";
}

Error makeError(ErrorKind kind, std::string msg)
{
    return Error{kind, std::move(msg)};
}

Diagnostic toDiagnostic(const Error &error, std::vector<DiagField> fields)
{
    Diagnostic d{Severity::Error, error.message, {}};
    d.fields.reserve(fields.size() + 1);
    d.fields.push_back({"kind", errorKindName(error.kind)});
    for (auto &field : fields)
        d.fields.push_back(std::move(field));
    return d;
}
} // namespace glossa::support
