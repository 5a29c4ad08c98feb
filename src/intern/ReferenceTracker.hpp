//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/intern/ReferenceTracker.hpp
//
// Purpose:
//   Provenance tracking for interned handles.  A tracker records, per Handle,
//   which owner contexts currently hold a reference and how many times.
//
// Variants:
//   - NullReferenceTracker: every operation is an inline no-op that reports
//     success.  Used when string tracking is compiled out.
//   - RecordingReferenceTracker: keeps live counts in lock-striped maps and
//     reports unbalanced releases through a DiagnosticSink.
//
//   GLOSSA_ENABLE_STRING_TRACKING selects DefaultReferenceTracker.  Both
//   variants are always available so tests and tools may pick either.
//
// Entry lifecycle:
//   absent -> tracked(1) -> tracked(N) on track,
//   tracked(N) -> ... -> absent on release.  An entry is removed as soon as
//   its count returns to zero.  Releasing an absent pair is an error.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/feature_flags.hpp"
#include "support/handle.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace glossa::intern
{

using support::Handle;

/// @brief Opaque label identifying who holds a reference.
class OwnerContext
{
  public:
    OwnerContext() = default;

    explicit OwnerContext(std::string label) : label_(std::move(label)) {}

    /// @brief Build a context of the form "file:line".
    static OwnerContext fromLocation(const char *file, int line);

    const std::string &label() const noexcept
    {
        return label_;
    }

  private:
    std::string label_;
};

inline bool operator==(const OwnerContext &a, const OwnerContext &b) noexcept
{
    return a.label() == b.label();
}

inline bool operator!=(const OwnerContext &a, const OwnerContext &b) noexcept
{
    return !(a == b);
}

inline bool operator<(const OwnerContext &a, const OwnerContext &b) noexcept
{
    return a.label() < b.label();
}

} // namespace glossa::intern

namespace std
{
template <> struct hash<glossa::intern::OwnerContext>
{
    size_t operator()(const glossa::intern::OwnerContext &owner) const noexcept
    {
        return hash<string>{}(owner.label());
    }
};
} // namespace std

/// Owner context naming the current source location.
#define GLOSSA_OWNER_HERE ::glossa::intern::OwnerContext::fromLocation(__FILE__, __LINE__)

namespace glossa::intern
{

struct OwnerCount
{
    OwnerContext owner;
    uint64_t count = 0;
};

/// @brief Outstanding references to one handle.
struct TrackingReportEntry
{
    Handle handle;
    uint64_t total = 0;
    std::vector<OwnerCount> owners; ///< Sorted by owner label.
};

/// Entries sorted by handle; only handles with a non-zero count appear.
using TrackingReport = std::vector<TrackingReportEntry>;

struct TrackerOptions
{
    /// Number of independently locked stripes; values below 1 become 1.
    size_t stripeCount = 16;
};

/// @brief Capability interface for reference provenance tracking.
class ReferenceTracker
{
  public:
    virtual ~ReferenceTracker() = default;

    /// @brief Count one more reference to @p handle held by @p owner.
    /// @return OutOfMemory when the count cannot be recorded; counts are then
    ///         left as they were.
    virtual support::Expected<void> trackReference(Handle handle, const OwnerContext &owner) = 0;

    /// @brief Drop one reference previously recorded for (@p handle, @p owner).
    /// @return UnbalancedRelease when no such reference is outstanding.
    virtual support::Expected<void> releaseReference(Handle handle,
                                                     const OwnerContext &owner) = 0;

    /// @brief Snapshot of all outstanding references.
    /// @details Assembled stripe by stripe, so concurrent updates may be
    ///          partially reflected.
    virtual TrackingReport report() const = 0;

    virtual uint64_t outstanding(Handle handle, const OwnerContext &owner) const = 0;

    /// @brief Total outstanding references to @p handle across all owners.
    virtual uint64_t outstanding(Handle handle) const = 0;
};

class NullReferenceTracker final : public ReferenceTracker
{
  public:
    support::Expected<void> trackReference(Handle, const OwnerContext &) override
    {
        return {};
    }

    support::Expected<void> releaseReference(Handle, const OwnerContext &) override
    {
        return {};
    }

    TrackingReport report() const override
    {
        return {};
    }

    uint64_t outstanding(Handle, const OwnerContext &) const override
    {
        return 0;
    }

    uint64_t outstanding(Handle) const override
    {
        return 0;
    }
};

/// @brief Tracker that records live reference counts per owner.
/// @details Handles are spread over mutex-protected stripes by hash; an
///          operation locks exactly one stripe.
class RecordingReferenceTracker final : public ReferenceTracker
{
  public:
    /// @param sink Receives UnbalancedRelease errors; must outlive the tracker.
    explicit RecordingReferenceTracker(TrackerOptions options = {},
                                       support::DiagnosticSink &sink =
                                           support::nullDiagnosticSink());

    RecordingReferenceTracker(const RecordingReferenceTracker &) = delete;
    RecordingReferenceTracker &operator=(const RecordingReferenceTracker &) = delete;

    support::Expected<void> trackReference(Handle handle, const OwnerContext &owner) override;
    support::Expected<void> releaseReference(Handle handle, const OwnerContext &owner) override;
    TrackingReport report() const override;
    uint64_t outstanding(Handle handle, const OwnerContext &owner) const override;
    uint64_t outstanding(Handle handle) const override;

  private:
    struct TrackingEntry
    {
        std::unordered_map<OwnerContext, uint64_t> owners;
        uint64_t total = 0;
    };

    struct Stripe
    {
        mutable std::mutex mutex;
        std::unordered_map<Handle, TrackingEntry> entries;
    };

    Stripe &stripeFor(Handle handle) const;

    std::vector<std::unique_ptr<Stripe>> stripes_;
    support::DiagnosticSink &sink_;
};

#if GLOSSA_ENABLE_STRING_TRACKING
using DefaultReferenceTracker = RecordingReferenceTracker;
#else
using DefaultReferenceTracker = NullReferenceTracker;
#endif

/// @brief Tracker shared by the whole process; constructed on first use and
///        never destroyed.
DefaultReferenceTracker &processGlobalReferenceTracker();

} // namespace glossa::intern
