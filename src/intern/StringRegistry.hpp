//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/intern/StringRegistry.hpp
// Purpose: Declares the concurrent deduplicating store that maps text to
//          Handle values and back.
// Key invariants:
//   - Equal text interned into one registry always yields the same Handle and
//     is stored exactly once.
//   - A Handle's text never changes and is never removed while the registry
//     lives.
//   - Handles carry the producing registry's tag; any other registry rejects
//     them with InvalidHandle.
// Ownership/Lifetime: The registry owns every byte of interned text in
//                     per-shard page arenas.  Views returned by resolve()
//                     stay valid for the registry's lifetime.
// Links: src/intern/NameTable.hpp, src/support/arena.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/arena.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/handle.hpp"
#include "support/string_hash.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace glossa::intern
{

using support::Handle;

/// @brief Construction-time tuning for a StringRegistry.
/// @details Values are normalised by the registry: the shard count is rounded
///          up to a power of two (minimum 1) and the page size is raised to
///          at least kMinPageSize.  maxStrings is bounded by the 32-bit index.
struct RegistryOptions
{
    static constexpr size_t kMinPageSize = 4 * 1024;

    /// Maximum number of distinct strings the registry accepts.
    uint32_t maxStrings = 1u << 20;
    /// Number of independently locked shards.
    size_t shardCount = 64;
    /// Size of each text arena page in bytes.
    size_t pageSize = support::Arena::kDefaultPageSize;
};

/// @brief Point-in-time storage statistics.
struct RegistryStats
{
    size_t strings = 0;       ///< Distinct strings stored.
    size_t textBytes = 0;     ///< Sum of stored string lengths.
    size_t bytesReserved = 0; ///< Arena bytes obtained, used or not.
    size_t pages = 0;         ///< Arena pages obtained across all shards.
    size_t shards = 0;        ///< Shard count after normalisation.
    double averageLength = 0.0;
};

/// @brief Canonical record for one interned string.
/// @details Lives in a shard arena directly in front of its text bytes and is
///          immutable once published.
struct TextEntry
{
    size_t size;
    const char *data;

    std::string_view view() const noexcept
    {
        return {data, size};
    }
};

/// @brief Thread-safe string interning registry.
///
/// Text is distributed across shards by the high bits of its FNV-1a hash.
/// Each shard owns a map from text to index guarded by a reader/writer lock
/// plus the arena holding that shard's text.  Indices are allocated from one
/// registry-wide counter and published into a paged entry table that resolve()
/// reads without taking any lock.
class StringRegistry
{
  public:
    /// @brief Create a registry.
    /// @param options Capacity and layout tuning; normalised on construction.
    /// @param sink Receives start-up, shutdown and error diagnostics.  Must
    ///             outlive the registry.
    explicit StringRegistry(RegistryOptions options = {},
                            support::DiagnosticSink &sink = support::nullDiagnosticSink());

    /// @brief Emits the shutdown note and releases all storage.
    ~StringRegistry();

    StringRegistry(const StringRegistry &) = delete;
    StringRegistry &operator=(const StringRegistry &) = delete;

    /// @brief Intern @p text, returning its canonical Handle.
    /// @details Equal text returns the existing Handle without allocating.
    ///          Empty text is a valid value like any other.
    /// @return Handle or OutOfMemory when capacity or memory is exhausted.
    support::Expected<Handle> intern(std::string_view text);

    /// @brief Look up the text for @p handle without locking.
    /// @return Stable view of the text, or InvalidHandle.
    support::Expected<std::string_view> resolve(Handle handle) const;

    /// @brief Return the Handle for @p text if it was interned already.
    std::optional<Handle> find(std::string_view text) const;

    bool contains(std::string_view text) const
    {
        return find(text).has_value();
    }

    /// @brief Number of distinct strings stored.
    size_t size() const noexcept
    {
        return count_.load(std::memory_order_acquire);
    }

    RegistryStats stats() const;

    /// @brief Tag stamped into every Handle this registry produces.
    uint32_t tag() const noexcept
    {
        return tag_;
    }

    const RegistryOptions &options() const noexcept
    {
        return options_;
    }

  private:
    static constexpr size_t kEntriesPerPage = 1024;

    struct Shard
    {
        explicit Shard(size_t pageSize) : arena(pageSize) {}

        mutable std::shared_mutex mutex;
        std::unordered_map<std::string_view, uint32_t, support::TextHash> map;
        support::Arena arena;
    };

    struct EntryPage
    {
        EntryPage();

        std::atomic<const TextEntry *> slots[kEntriesPerPage];
    };

    Shard &shardFor(std::string_view text) const;
    const TextEntry *storeText(Shard &shard, std::string_view text);
    std::optional<uint32_t> reserveIndex();
    EntryPage &pageFor(size_t slot);
    support::Error reportInvalidHandle(Handle handle, const char *reason) const;
    support::Error reportOutOfMemory(std::string_view text, const char *reason) const;

    RegistryOptions options_;
    support::DiagnosticSink &sink_;
    uint32_t tag_;
    unsigned shardShift_;
    std::vector<std::unique_ptr<Shard>> shards_;
    size_t pageSlots_;
    std::unique_ptr<std::atomic<EntryPage *>[]> pages_;
    std::atomic<uint32_t> next_{0};
    std::atomic<size_t> count_{0};
    std::atomic<size_t> textBytes_{0};
};

/// @brief Registry shared by the whole process.
/// @details Constructed on first use with default options and a sink that
///          writes warnings and errors to stderr.  Never destroyed, so views it
///          hands out remain valid during static destruction.
StringRegistry &processGlobalStringRegistry();

} // namespace glossa::intern
