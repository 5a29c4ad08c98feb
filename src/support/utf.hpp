//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/utf.hpp
// Purpose: Declares UTF-8 validation and UTF-16 to UTF-8 conversion helpers.
// Key invariants: Lossy conversions replace each maximal invalid subpart with
//                 U+FFFD; strict conversions never produce partial output.
// Ownership/Lifetime: Stateless functions; returned strings are owned by callers.
// Links: intern/NameTable.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace glossa::support
{

/// @brief Outcome of validating a byte sequence as UTF-8.
struct Utf8Check
{
    /// True when the whole input is well-formed.
    bool valid = true;
    /// Length of the longest well-formed prefix.
    size_t validUpTo = 0;
    /// Length of the invalid sequence at validUpTo, or empty when the input
    /// ended in the middle of an otherwise valid sequence.
    std::optional<size_t> errorLength;
};

/// @brief Validate @p bytes as UTF-8.
Utf8Check checkUtf8(std::string_view bytes) noexcept;

/// @brief Copy @p bytes, replacing invalid sequences with U+FFFD.
std::string utf8Lossy(std::string_view bytes);

/// @brief Append the UTF-8 encoding of @p codepoint to @p out.
/// @details Surrogates and values above U+10FFFF are not scalar values and
///          are written as U+FFFD.
void appendUtf8(std::string &out, uint32_t codepoint);

/// @brief Convert UTF-16 code units to UTF-8.
/// @return Empty optional if @p units contains an unpaired surrogate.
std::optional<std::string> utf16ToUtf8(std::u16string_view units);

/// @brief Convert UTF-16 code units to UTF-8, replacing unpaired surrogates
///        with U+FFFD.
std::string utf16ToUtf8Lossy(std::u16string_view units);

} // namespace glossa::support
