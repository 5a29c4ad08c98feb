// File: src/support/string_hash.hpp
// Purpose: FNV-1a hashing of byte strings for registry shard selection.
// Key invariants: Deterministic across runs and platforms.
// Ownership/Lifetime: Stateless helpers.
// Links: intern/StringRegistry.cpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace glossa::support
{

/// @brief 64-bit FNV-1a hash of @p data.
inline uint64_t fnv1a(std::string_view data) noexcept
{
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : data)
    {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

/// @brief Transparent hasher so maps keyed by string_view hash consistently.
struct TextHash
{
    size_t operator()(std::string_view text) const noexcept
    {
        return static_cast<size_t>(fnv1a(text));
    }
};

} // namespace glossa::support
