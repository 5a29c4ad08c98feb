/**
 * @file handle.cpp
 * @brief Provides comparison helpers and hashing for the `Handle` type.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     Handles are lightweight pairs of a 32-bit slot index and the tag of the
 *     registry that produced them.  Identifier value `0` is reserved to
 *     indicate the absence of a handle.
 */

#include "support/handle.hpp"

namespace glossa::support
{
/**
 * @brief Tests whether two handles refer to the same interned string.
 *
 * Because `Handle` stores only numeric identifiers, equality reduces to
 * comparing them.  Handles from different registries never compare equal.
 */
bool operator==(Handle a, Handle b) noexcept
{
    return a.index == b.index && a.registry == b.registry;
}

bool operator!=(Handle a, Handle b) noexcept
{
    return !(a == b);
}

/**
 * @brief Orders handles by slot index, breaking ties by registry tag.
 *
 * The order reflects interning order within a registry and is unrelated to
 * lexical order of the underlying text.
 */
bool operator<(Handle a, Handle b) noexcept
{
    if (a.index != b.index)
        return a.index < b.index;
    return a.registry < b.registry;
}

bool operator<=(Handle a, Handle b) noexcept
{
    return !(b < a);
}

bool operator>(Handle a, Handle b) noexcept
{
    return b < a;
}

bool operator>=(Handle a, Handle b) noexcept
{
    return !(a < b);
}

/**
 * @brief Converts the handle to a boolean indicating whether it is valid.
 *
 * @return `true` when both the slot index and the registry tag are non-zero.
 */
Handle::operator bool() const noexcept
{
    return index != 0 && registry != 0;
}
} // namespace glossa::support

namespace std
{
/**
 * @brief Computes a hash code for a `Handle` so it can be stored in unordered containers.
 *
 * The registry tag occupies the upper half of the value so handles from
 * distinct registries with the same index do not collide.
 */
size_t hash<glossa::support::Handle>::operator()(glossa::support::Handle h) const noexcept
{
    const uint64_t packed = (static_cast<uint64_t>(h.registry) << 32) | h.index;
    return std::hash<uint64_t>{}(packed);
}
} // namespace std
