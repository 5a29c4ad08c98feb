//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/arena.hpp
// Purpose: Declares the paged bump allocator backing interned text.
// Key invariants: Returned memory stays valid and unmoved for the arena's life.
// Ownership/Lifetime: Arena owns all allocated pages.
// Links: intern/StringRegistry.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace glossa::support
{
/// @brief Growing bump allocator that hands out memory from fixed-size pages.
///
/// Each call to allocate() advances the cursor within the current page by the
/// requested size and alignment.  When the page cannot satisfy a request a new
/// page is appended; requests larger than a page receive a dedicated page of
/// their own.  Individual allocations are never freed and pages never move, so
/// pointers into the arena remain stable until the arena is destroyed.
/// @invariant Allocations are not individually freed.
/// @ownership Owns its pages.
/// @note Not synchronised; callers serialise access.
class Arena
{
  public:
    /// @brief Default page size used by the string registry.
    static constexpr size_t kDefaultPageSize = 64 * 1024;

    /// @brief Create an arena that grows in pages of @p pageSize bytes.
    explicit Arena(size_t pageSize = kDefaultPageSize);

    Arena(const Arena &) = delete;
    Arena &operator=(const Arena &) = delete;

    /// @brief Allocate @p size bytes with alignment @p align.
    /// @param size Number of bytes to allocate.
    /// @param align Alignment requirement.
    /// @return Pointer to allocated memory or nullptr when @p align is zero or
    ///         not a power of two.
    /// @throws std::bad_alloc when a new page cannot be obtained.
    void *allocate(size_t size, size_t align);

    /// @brief Total bytes held in pages, used or not.
    size_t bytesReserved() const noexcept
    {
        return reserved_;
    }

    /// @brief Number of pages obtained so far.
    size_t pageCount() const noexcept
    {
        return pages_.size();
    }

    size_t pageSize() const noexcept
    {
        return pageSize_;
    }

  private:
    void addPage(size_t bytes);

    size_t pageSize_;
    std::vector<std::unique_ptr<std::byte[]>> pages_;
    std::byte *cursor_ = nullptr;
    std::byte *end_ = nullptr;
    size_t reserved_ = 0;
};
} // namespace glossa::support
