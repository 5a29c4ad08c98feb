// File: src/intern/Name.hpp
// Purpose: Declares Name, an interned base string paired with an optional
//          numeric suffix, and the helpers that split and rebuild it.
// Key invariants: number 0 means "no suffix"; formatName(splitNumericSuffix(t))
//                 reproduces t exactly.
// Ownership/Lifetime: Name is a value type; its text lives in a registry.
// Links: src/intern/NameTable.hpp
#pragma once

#include "support/handle.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace glossa::intern
{

/// @brief Interned base text plus a numeric suffix.
/// @details Names such as "mesh_1" and "mesh_2" share the stored record for
///          "mesh_" and differ only in @ref number.  Comparison is by identity
///          (base handle, then number), never by text.
struct Name
{
    support::Handle base;
    /// Suffix value; 0 when the text had no suffix.
    uint32_t number = 0;

    bool hasNumber() const noexcept
    {
        return number != 0;
    }
};

inline bool operator==(const Name &a, const Name &b) noexcept
{
    return a.base == b.base && a.number == b.number;
}

inline bool operator!=(const Name &a, const Name &b) noexcept
{
    return !(a == b);
}

inline bool operator<(const Name &a, const Name &b) noexcept
{
    if (a.base != b.base)
        return a.base < b.base;
    return a.number < b.number;
}

/// @brief Text split into base and suffix.
struct NameParts
{
    std::string_view base;
    uint32_t number = 0;
};

/// @brief Split the trailing digit run of @p text into a number.
///
/// The suffix starts at the leftmost non-'0' digit of the trailing run, so
/// leading zeros stay with the base ("hello-010" gives "hello-0" and 10).
/// Text is left whole when the run has no non-zero digit or the digits do not
/// fit in 32 bits.
NameParts splitNumericSuffix(std::string_view text) noexcept;

/// @brief Rebuild the text of a name from its parts.
std::string formatName(std::string_view base, uint32_t number);

/// @brief Number of decimal digits in @p number, 0 for 0.
size_t suffixLength(uint32_t number) noexcept;

} // namespace glossa::intern

namespace std
{
template <> struct hash<glossa::intern::Name>
{
    size_t operator()(const glossa::intern::Name &name) const noexcept
    {
        const size_t h = hash<glossa::support::Handle>{}(name.base);
        return h ^ (static_cast<size_t>(name.number) * 0x9E3779B9u);
    }
};
} // namespace std
