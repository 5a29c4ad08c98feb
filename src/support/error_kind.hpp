//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/error_kind.hpp
// Purpose: Declares the error kinds shared by every Glossa subsystem.
// Key invariants: Enumerator values are stable; new kinds are appended.
// Ownership/Lifetime: Plain enumeration, no ownership semantics.
// Links: support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace glossa::support
{

/// @brief Classifies the failures reported through Expected results.
enum class ErrorKind : uint8_t
{
    OutOfMemory,       ///< Allocation or registry capacity exhausted.
    InvalidHandle,     ///< Handle was not produced by the resolving registry.
    UnbalancedRelease, ///< Release without a matching tracked reference.
    InvalidUtf8,       ///< Byte sequence is not well-formed UTF-8.
    InvalidUtf16,      ///< Code unit sequence contains an unpaired surrogate.
};

/// @brief Stable, lowercase name for @p kind used in diagnostics.
const char *errorKindName(ErrorKind kind) noexcept;

} // namespace glossa::support
