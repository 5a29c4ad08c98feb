// File: src/support/arena.cpp
// License: GNU GPL v3. See LICENSE in the project root for details.
// Purpose: Implement the paged bump-pointer arena that stores interned text.
// Key invariants: The cursor never passes the end of the current page and
//                 alignment requests must be non-zero powers of two.
// Ownership/Lifetime: Arena owns its pages; memory is released only when the
//                     arena is destroyed.
// Links: support/arena.hpp

#include "arena.hpp"

#include <cstdint>
#include <limits>
#include <new>

namespace glossa::support
{
Arena::Arena(size_t pageSize) : pageSize_(pageSize == 0 ? kDefaultPageSize : pageSize) {}

void Arena::addPage(size_t bytes)
{
    pages_.push_back(std::make_unique<std::byte[]>(bytes));
    cursor_ = pages_.back().get();
    end_ = cursor_ + bytes;
    reserved_ += bytes;
}

void *Arena::allocate(size_t size, size_t align)
{
    // Reject zero or non power-of-two alignments.
    if (align == 0 || (align & (align - 1)) != 0)
        return nullptr;

    const std::uintptr_t mask = static_cast<std::uintptr_t>(align - 1);

    if (cursor_ != nullptr)
    {
        const std::uintptr_t current = reinterpret_cast<std::uintptr_t>(cursor_);
        const std::uintptr_t limit = reinterpret_cast<std::uintptr_t>(end_);
        if (current <= std::numeric_limits<std::uintptr_t>::max() - mask)
        {
            const std::uintptr_t aligned = (current + mask) & ~mask;
            if (aligned <= limit && size <= static_cast<size_t>(limit - aligned))
            {
                cursor_ = reinterpret_cast<std::byte *>(aligned + size);
                return reinterpret_cast<void *>(aligned);
            }
        }
    }

    // Oversized requests get a page of their own, padded for alignment.
    if (size > std::numeric_limits<size_t>::max() - align)
        throw std::bad_alloc();
    size_t bytes = pageSize_;
    if (size + align > bytes)
        bytes = size + align;
    addPage(bytes);

    const std::uintptr_t start = reinterpret_cast<std::uintptr_t>(cursor_);
    const std::uintptr_t aligned = (start + mask) & ~mask;
    cursor_ = reinterpret_cast<std::byte *>(aligned + size);
    return reinterpret_cast<void *>(aligned);
}
} // namespace glossa::support
