//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/handle.hpp
// Purpose: Defines the Handle type identifying an interned string.
// Key invariants: Index 0 or registry tag 0 denotes an invalid handle.
// Ownership/Lifetime: Handles are value types.
// Links: intern/StringRegistry.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <functional>

namespace glossa::support
{

/// @brief Opaque identifier for interned strings.
/// @details @c index is the 1-based slot in the owning registry's entry table;
///          @c registry is the tag of the registry instance that issued it.
///          Ordering follows the slot index, never the text.
/// @invariant 0 in either field denotes an invalid handle.
/// @ownership Value type, no ownership semantics.
struct Handle
{
    uint32_t index = 0;
    uint32_t registry = 0;

    [[nodiscard]] explicit operator bool() const noexcept;
};

bool operator==(Handle a, Handle b) noexcept;
bool operator!=(Handle a, Handle b) noexcept;
bool operator<(Handle a, Handle b) noexcept;
bool operator<=(Handle a, Handle b) noexcept;
bool operator>(Handle a, Handle b) noexcept;
bool operator>=(Handle a, Handle b) noexcept;
} // namespace glossa::support

namespace std
{
template <> struct hash<glossa::support::Handle>
{
    size_t operator()(glossa::support::Handle h) const noexcept;
};
} // namespace std
