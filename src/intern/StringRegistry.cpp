//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the sharded string registry.  Insertion follows a find-then-lock
// pattern: a shared lock answers the common "already interned" case, and only
// a miss escalates to the shard's exclusive lock where the lookup is repeated
// before anything is stored.  Resolution never locks; it walks the paged entry
// table with acquire loads that pair with the release stores made by intern().
//
//===----------------------------------------------------------------------===//

#include "intern/StringRegistry.hpp"

#include <cstring>
#include <mutex>
#include <new>
#include <string>

namespace glossa::intern
{
namespace
{
constexpr size_t kMaxShards = size_t{1} << 16;

RegistryOptions normalise(RegistryOptions options)
{
    size_t shards = 1;
    while (shards < options.shardCount && shards < kMaxShards)
        shards <<= 1;
    options.shardCount = shards;
    if (options.pageSize < RegistryOptions::kMinPageSize)
        options.pageSize = RegistryOptions::kMinPageSize;
    return options;
}

unsigned log2Exact(size_t value)
{
    unsigned bits = 0;
    while ((size_t{1} << bits) < value)
        ++bits;
    return bits;
}

/// Registry tags start at 1; 0 marks a Handle with no registry.
uint32_t nextRegistryTag()
{
    static std::atomic<uint32_t> counter{1};
    uint32_t tag = counter.fetch_add(1, std::memory_order_relaxed);
    while (tag == 0)
        tag = counter.fetch_add(1, std::memory_order_relaxed);
    return tag;
}

support::DiagField field(const char *key, size_t value)
{
    return {key, std::to_string(value)};
}
} // namespace

StringRegistry::EntryPage::EntryPage()
{
    for (auto &slot : slots)
        slot.store(nullptr, std::memory_order_relaxed);
}

StringRegistry::StringRegistry(RegistryOptions options, support::DiagnosticSink &sink)
    : options_(normalise(options)), sink_(sink), tag_(nextRegistryTag()), shardShift_(0),
      pageSlots_((static_cast<size_t>(options_.maxStrings) + kEntriesPerPage - 1) /
                 kEntriesPerPage),
      pages_(std::make_unique<std::atomic<EntryPage *>[]>(pageSlots_))
{
    const unsigned bits = log2Exact(options_.shardCount);
    shardShift_ = 64 - bits;
    shards_.reserve(options_.shardCount);
    for (size_t i = 0; i < options_.shardCount; ++i)
        shards_.push_back(std::make_unique<Shard>(options_.pageSize));
    for (size_t i = 0; i < pageSlots_; ++i)
        pages_[i].store(nullptr, std::memory_order_relaxed);

    sink_.report({support::Severity::Note,
                  "string registry started",
                  {{"subsystem", "string"},
                   field("registry", tag_),
                   field("shards", options_.shardCount),
                   field("max_strings", options_.maxStrings),
                   field("page_size", options_.pageSize)}});
}

StringRegistry::~StringRegistry()
{
    const RegistryStats s = stats();
    sink_.report({support::Severity::Note,
                  "string registry shut down",
                  {{"subsystem", "string"},
                   field("registry", tag_),
                   field("strings", s.strings),
                   field("memory", s.bytesReserved),
                   field("chunks", s.pages),
                   {"average_length", std::to_string(s.averageLength)}}});

    for (size_t i = 0; i < pageSlots_; ++i)
        delete pages_[i].load(std::memory_order_acquire);
}

StringRegistry::Shard &StringRegistry::shardFor(std::string_view text) const
{
    if (shards_.size() == 1)
        return *shards_.front();
    return *shards_[static_cast<size_t>(support::fnv1a(text) >> shardShift_)];
}

support::Expected<Handle> StringRegistry::intern(std::string_view text)
{
    Shard &shard = shardFor(text);
    {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.map.find(text);
        if (it != shard.map.end())
            return Handle{it->second, tag_};
    }

    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    // Another thread may have inserted between the two locks.
    auto it = shard.map.find(text);
    if (it != shard.map.end())
        return Handle{it->second, tag_};

    const std::optional<uint32_t> index = reserveIndex();
    if (!index)
        return reportOutOfMemory(text, "string registry capacity exhausted");

    try
    {
        const TextEntry *entry = storeText(shard, text);
        EntryPage &page = pageFor(*index - 1);
        shard.map.emplace(entry->view(), *index);
        page.slots[(*index - 1) % kEntriesPerPage].store(entry, std::memory_order_release);
    }
    catch (const std::bad_alloc &)
    {
        // The reserved index stays unpublished and resolves as invalid.
        return reportOutOfMemory(text, "string registry allocation failed");
    }

    textBytes_.fetch_add(text.size(), std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_release);
    return Handle{*index, tag_};
}

support::Expected<std::string_view> StringRegistry::resolve(Handle handle) const
{
    if (handle.registry != tag_)
        return reportInvalidHandle(handle, "handle belongs to another registry");
    if (handle.index == 0 || handle.index > options_.maxStrings)
        return reportInvalidHandle(handle, "handle index out of range");

    const size_t slot = handle.index - 1;
    const EntryPage *page = pages_[slot / kEntriesPerPage].load(std::memory_order_acquire);
    const TextEntry *entry =
        page ? page->slots[slot % kEntriesPerPage].load(std::memory_order_acquire) : nullptr;
    if (!entry)
        return reportInvalidHandle(handle, "handle does not name an interned string");
    return entry->view();
}

std::optional<Handle> StringRegistry::find(std::string_view text) const
{
    const Shard &shard = shardFor(text);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.map.find(text);
    if (it == shard.map.end())
        return std::nullopt;
    return Handle{it->second, tag_};
}

RegistryStats StringRegistry::stats() const
{
    RegistryStats s;
    s.shards = shards_.size();
    for (const auto &shard : shards_)
    {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        s.bytesReserved += shard->arena.bytesReserved();
        s.pages += shard->arena.pageCount();
    }
    s.strings = count_.load(std::memory_order_acquire);
    s.textBytes = textBytes_.load(std::memory_order_relaxed);
    if (s.strings != 0)
        s.averageLength = static_cast<double>(s.textBytes) / static_cast<double>(s.strings);
    return s;
}

/// @brief Copy @p text into the shard arena behind a TextEntry header.
/// @throws std::bad_alloc when the arena cannot grow.
const TextEntry *StringRegistry::storeText(Shard &shard, std::string_view text)
{
    void *raw = shard.arena.allocate(sizeof(TextEntry) + text.size(), alignof(TextEntry));
    if (!raw)
        throw std::bad_alloc();
    char *bytes = static_cast<char *>(raw) + sizeof(TextEntry);
    if (!text.empty())
        std::memcpy(bytes, text.data(), text.size());
    return new (raw) TextEntry{text.size(), bytes};
}

/// @brief Claim the next 1-based index, or nothing once capacity is reached.
std::optional<uint32_t> StringRegistry::reserveIndex()
{
    uint32_t current = next_.load(std::memory_order_relaxed);
    do
    {
        if (current >= options_.maxStrings)
            return std::nullopt;
    } while (!next_.compare_exchange_weak(current, current + 1, std::memory_order_relaxed));
    return current + 1;
}

/// @brief Entry page holding @p slot, created on first use.
/// @details Racing creators agree on one page through compare-exchange; the
///          loser frees its copy.
StringRegistry::EntryPage &StringRegistry::pageFor(size_t slot)
{
    std::atomic<EntryPage *> &cell = pages_[slot / kEntriesPerPage];
    EntryPage *page = cell.load(std::memory_order_acquire);
    if (page)
        return *page;
    auto fresh = std::make_unique<EntryPage>();
    if (cell.compare_exchange_strong(
            page, fresh.get(), std::memory_order_acq_rel, std::memory_order_acquire))
        return *fresh.release();
    return *page;
}

support::Error StringRegistry::reportInvalidHandle(Handle handle, const char *reason) const
{
    support::Error error = support::makeError(support::ErrorKind::InvalidHandle, reason);
    sink_.report(support::toDiagnostic(error,
                                       {{"subsystem", "string"},
                                        field("index", handle.index),
                                        field("registry", handle.registry),
                                        field("expected_registry", tag_)}));
    return error;
}

support::Error StringRegistry::reportOutOfMemory(std::string_view text, const char *reason) const
{
    support::Error error = support::makeError(support::ErrorKind::OutOfMemory, reason);
    sink_.report(support::toDiagnostic(error,
                                       {{"subsystem", "string"},
                                        field("length", text.size()),
                                        field("strings", count_.load(std::memory_order_acquire)),
                                        field("max_strings", options_.maxStrings)}));
    return error;
}

StringRegistry &processGlobalStringRegistry()
{
    static StringRegistry *registry =
        new StringRegistry(RegistryOptions{}, support::processDiagnosticSink());
    return *registry;
}

} // namespace glossa::intern
