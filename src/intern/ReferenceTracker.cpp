/**
 * @file ReferenceTracker.cpp
 * @brief Implements the recording reference tracker.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     Counts are kept per (handle, owner) pair inside lock stripes.  Every
 *     mutation touches a single stripe, so unrelated handles never contend.
 *     Reports copy one stripe at a time and are sorted after all locks are
 *     released.
 */

#include "intern/ReferenceTracker.hpp"

#include <algorithm>
#include <functional>
#include <new>
#include <tuple>

namespace glossa::intern
{

OwnerContext OwnerContext::fromLocation(const char *file, int line)
{
    std::string label = file ? file : "<unknown>";
    label += ':';
    label += std::to_string(line);
    return OwnerContext(std::move(label));
}

RecordingReferenceTracker::RecordingReferenceTracker(TrackerOptions options,
                                                     support::DiagnosticSink &sink)
    : sink_(sink)
{
    const size_t count = options.stripeCount == 0 ? 1 : options.stripeCount;
    stripes_.reserve(count);
    for (size_t i = 0; i < count; ++i)
        stripes_.push_back(std::make_unique<Stripe>());
}

RecordingReferenceTracker::Stripe &RecordingReferenceTracker::stripeFor(Handle handle) const
{
    return *stripes_[std::hash<Handle>{}(handle) % stripes_.size()];
}

support::Expected<void> RecordingReferenceTracker::trackReference(Handle handle,
                                                                  const OwnerContext &owner)
{
    Stripe &stripe = stripeFor(handle);
    std::unique_lock<std::mutex> lock(stripe.mutex);
    auto entryIt = stripe.entries.end();
    bool insertedEntry = false;
    try
    {
        // Both map insertions happen before any count changes.
        std::tie(entryIt, insertedEntry) = stripe.entries.try_emplace(handle);
        auto ownerIt = entryIt->second.owners.try_emplace(owner, 0).first;
        ++ownerIt->second;
        ++entryIt->second.total;
        return {};
    }
    catch (const std::bad_alloc &)
    {
        if (insertedEntry)
            stripe.entries.erase(entryIt);
    }
    lock.unlock();

    support::Error error = support::makeError(support::ErrorKind::OutOfMemory,
                                              "reference tracking allocation failed");
    sink_.report(support::toDiagnostic(error,
                                       {{"subsystem", "string"},
                                        {"index", std::to_string(handle.index)},
                                        {"registry", std::to_string(handle.registry)},
                                        {"owner", owner.label()}}));
    return error;
}

/**
 * @brief Drop one reference for the pair, erasing emptied owners and entries.
 *
 * A release with nothing outstanding for the pair is reported as an error
 * diagnostic and returned as UnbalancedRelease; counts are left untouched.
 */
support::Expected<void> RecordingReferenceTracker::releaseReference(Handle handle,
                                                                    const OwnerContext &owner)
{
    Stripe &stripe = stripeFor(handle);
    std::unique_lock<std::mutex> lock(stripe.mutex);
    auto entryIt = stripe.entries.find(handle);
    if (entryIt != stripe.entries.end())
    {
        TrackingEntry &entry = entryIt->second;
        auto ownerIt = entry.owners.find(owner);
        if (ownerIt != entry.owners.end())
        {
            if (--ownerIt->second == 0)
                entry.owners.erase(ownerIt);
            if (--entry.total == 0)
                stripe.entries.erase(entryIt);
            return {};
        }
    }
    lock.unlock();

    support::Error error = support::makeError(support::ErrorKind::UnbalancedRelease,
                                              "release without a matching reference");
    sink_.report(support::toDiagnostic(error,
                                       {{"subsystem", "string"},
                                        {"index", std::to_string(handle.index)},
                                        {"registry", std::to_string(handle.registry)},
                                        {"owner", owner.label()}}));
    return error;
}

TrackingReport RecordingReferenceTracker::report() const
{
    TrackingReport result;
    for (const auto &stripe : stripes_)
    {
        std::lock_guard<std::mutex> lock(stripe->mutex);
        result.reserve(result.size() + stripe->entries.size());
        for (const auto &[handle, entry] : stripe->entries)
        {
            TrackingReportEntry row;
            row.handle = handle;
            row.total = entry.total;
            row.owners.reserve(entry.owners.size());
            for (const auto &[owner, count] : entry.owners)
                row.owners.push_back({owner, count});
            result.push_back(std::move(row));
        }
    }

    for (auto &row : result)
    {
        std::sort(row.owners.begin(),
                  row.owners.end(),
                  [](const OwnerCount &a, const OwnerCount &b) { return a.owner < b.owner; });
    }
    std::sort(result.begin(),
              result.end(),
              [](const TrackingReportEntry &a, const TrackingReportEntry &b)
              { return a.handle < b.handle; });
    return result;
}

uint64_t RecordingReferenceTracker::outstanding(Handle handle, const OwnerContext &owner) const
{
    const Stripe &stripe = stripeFor(handle);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto entryIt = stripe.entries.find(handle);
    if (entryIt == stripe.entries.end())
        return 0;
    auto ownerIt = entryIt->second.owners.find(owner);
    return ownerIt == entryIt->second.owners.end() ? 0 : ownerIt->second;
}

uint64_t RecordingReferenceTracker::outstanding(Handle handle) const
{
    const Stripe &stripe = stripeFor(handle);
    std::lock_guard<std::mutex> lock(stripe.mutex);
    auto entryIt = stripe.entries.find(handle);
    return entryIt == stripe.entries.end() ? 0 : entryIt->second.total;
}

DefaultReferenceTracker &processGlobalReferenceTracker()
{
#if GLOSSA_ENABLE_STRING_TRACKING
    static DefaultReferenceTracker *tracker =
        new DefaultReferenceTracker(TrackerOptions{}, support::processDiagnosticSink());
#else
    static DefaultReferenceTracker *tracker = new DefaultReferenceTracker();
#endif
    return *tracker;
}

} // namespace glossa::intern
