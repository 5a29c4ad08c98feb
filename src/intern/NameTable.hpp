//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/intern/NameTable.hpp
// Purpose: Single interning entry point combining a StringRegistry with a
//          reference tracker.
// Key invariants:
//   - Handles and resolved text are identical whichever tracker is used.
//   - With NullReferenceTracker every tracking call inlines to a no-op that
//     reports success.
// Ownership/Lifetime: The table borrows its registry and tracker; both must
//                     outlive it.
// Links: src/intern/StringRegistry.hpp, src/intern/ReferenceTracker.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "intern/Name.hpp"
#include "intern/ReferenceTracker.hpp"
#include "intern/StringRegistry.hpp"
#include "support/diag_expected.hpp"
#include "support/utf.hpp"

#include <cstddef>
#include <new>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

namespace glossa::intern
{

/// @brief Interning facade parameterised on the concrete tracker type.
///
/// Calls reach the tracker through its final type, so the null variant's
/// members inline away and callers never test whether tracking is enabled.
/// A recording tracker only accepts handles that resolve in this table's
/// registry; tracking or releasing any other handle fails with InvalidHandle.
/// Members that build new strings report allocation failure as OutOfMemory.
template <class Tracker> class BasicNameTable
{
    static_assert(std::is_base_of_v<ReferenceTracker, Tracker>,
                  "Tracker must implement ReferenceTracker");

  public:
    using TrackerType = Tracker;

    /// True when the tracker records references.
    static constexpr bool kTracking = !std::is_same_v<Tracker, NullReferenceTracker>;

    BasicNameTable(StringRegistry &registry, Tracker &tracker)
        : registry_(registry), tracker_(tracker)
    {
    }

    support::Expected<Handle> intern(std::string_view text)
    {
        return registry_.intern(text);
    }

    support::Expected<std::string_view> resolve(Handle handle) const
    {
        return registry_.resolve(handle);
    }

    bool contains(std::string_view text) const
    {
        return registry_.contains(text);
    }

    std::optional<Handle> find(std::string_view text) const
    {
        return registry_.find(text);
    }

    size_t size() const noexcept
    {
        return registry_.size();
    }

    RegistryStats stats() const
    {
        return registry_.stats();
    }

    support::Expected<void> trackReference(Handle handle, const OwnerContext &owner)
    {
        if constexpr (kTracking)
        {
            auto text = registry_.resolve(handle);
            if (!text)
                return text.error();
        }
        return tracker_.trackReference(handle, owner);
    }

    support::Expected<void> releaseReference(Handle handle, const OwnerContext &owner)
    {
        if constexpr (kTracking)
        {
            auto text = registry_.resolve(handle);
            if (!text)
                return text.error();
        }
        return tracker_.releaseReference(handle, owner);
    }

    TrackingReport report() const
    {
        return tracker_.report();
    }

    /// @brief Write every outstanding handle with its text and owners to @p os.
    /// @details One line per handle followed by one indented line per owner.
    ///          Handles that no longer resolve are printed as "<invalid>".
    void printReport(std::ostream &os) const;

    /// @brief Intern @p text as a Name, splitting off any numeric suffix.
    support::Expected<Name> makeName(std::string_view text)
    {
        const NameParts parts = splitNumericSuffix(text);
        auto base = registry_.intern(parts.base);
        if (!base)
            return base.error();
        return Name{base.value(), parts.number};
    }

    /// @brief Full text of @p name, suffix included.
    support::Expected<std::string> toString(const Name &name) const
    {
        auto base = registry_.resolve(name.base);
        if (!base)
            return base.error();
        try
        {
            return formatName(base.value(), name.number);
        }
        catch (const std::bad_alloc &)
        {
            return outOfMemory("name text allocation failed");
        }
    }

    /// @brief Length in bytes of the full text of @p name.
    support::Expected<size_t> length(const Name &name) const
    {
        auto base = registry_.resolve(name.base);
        if (!base)
            return base.error();
        return base.value().size() + suffixLength(name.number);
    }

    support::Expected<bool> isEmpty(const Name &name) const
    {
        if (name.hasNumber())
            return false;
        auto base = registry_.resolve(name.base);
        if (!base)
            return base.error();
        return base.value().empty();
    }

    /// @brief Intern @p bytes after validating them as UTF-8.
    /// @return InvalidUtf8 naming the length of the valid prefix on failure.
    support::Expected<Handle> internUtf8(std::string_view bytes)
    {
        const support::Utf8Check check = support::checkUtf8(bytes);
        if (!check.valid)
        {
            try
            {
                std::string msg = "invalid utf-8 sequence: valid_up_to=" +
                                  std::to_string(check.validUpTo);
                if (check.errorLength)
                    msg += " error_len=" + std::to_string(*check.errorLength);
                else
                    msg += " (incomplete sequence at end of input)";
                return support::makeError(support::ErrorKind::InvalidUtf8, std::move(msg));
            }
            catch (const std::bad_alloc &)
            {
                return outOfMemory("utf-8 error message allocation failed");
            }
        }
        return registry_.intern(bytes);
    }

    /// @brief Intern @p bytes, replacing each invalid sequence with U+FFFD.
    support::Expected<Handle> internUtf8Lossy(std::string_view bytes)
    {
        if (support::checkUtf8(bytes).valid)
            return registry_.intern(bytes);
        std::string repaired;
        try
        {
            repaired = support::utf8Lossy(bytes);
        }
        catch (const std::bad_alloc &)
        {
            return outOfMemory("utf-8 repair allocation failed");
        }
        return registry_.intern(repaired);
    }

    /// @brief Intern UTF-16 @p units.
    /// @return InvalidUtf16 when an unpaired surrogate is present.
    support::Expected<Handle> internUtf16(std::u16string_view units)
    {
        std::optional<std::string> text;
        try
        {
            text = support::utf16ToUtf8(units);
        }
        catch (const std::bad_alloc &)
        {
            return outOfMemory("utf-16 conversion allocation failed");
        }
        if (!text)
            return support::makeError(support::ErrorKind::InvalidUtf16,
                                      "invalid utf-16: lone surrogate found");
        return registry_.intern(*text);
    }

    support::Expected<Handle> internUtf16Lossy(std::u16string_view units)
    {
        std::string text;
        try
        {
            text = support::utf16ToUtf8Lossy(units);
        }
        catch (const std::bad_alloc &)
        {
            return outOfMemory("utf-16 conversion allocation failed");
        }
        return registry_.intern(text);
    }

    StringRegistry &registry() noexcept
    {
        return registry_;
    }

    Tracker &tracker() noexcept
    {
        return tracker_;
    }

  private:
    static support::Error outOfMemory(const char *reason)
    {
        return support::makeError(support::ErrorKind::OutOfMemory, reason);
    }

    StringRegistry &registry_;
    Tracker &tracker_;
};

template <class Tracker> void BasicNameTable<Tracker>::printReport(std::ostream &os) const
{
    for (const TrackingReportEntry &entry : tracker_.report())
    {
        auto text = registry_.resolve(entry.handle);
        if (text)
            os << '"' << text.value() << '"';
        else
            os << "<invalid>";
        os << " index=" << entry.handle.index << " registry=" << entry.handle.registry
           << " total=" << entry.total << '\n';
        for (const OwnerCount &owner : entry.owners)
            os << "  " << owner.owner.label() << ": " << owner.count << '\n';
    }
}

extern template class BasicNameTable<NullReferenceTracker>;
extern template class BasicNameTable<RecordingReferenceTracker>;

/// Facade using the tracker selected by GLOSSA_ENABLE_STRING_TRACKING.
using NameTable = BasicNameTable<DefaultReferenceTracker>;

/// @brief Facade over processGlobalStringRegistry() and
///        processGlobalReferenceTracker(); never destroyed.
NameTable &processGlobalNameTable();

} // namespace glossa::intern
