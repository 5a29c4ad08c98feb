//===----------------------------------------------------------------------===//
//
// Part of the Glossa project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares structured diagnostic records and the sinks receiving them.
// Key invariants: Counts reflect reported diagnostics; sinks are thread-safe.
// Ownership/Lifetime: Engine owns collected diagnostics; emitters never own sinks.
// Links: support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <vector>

/// @brief Records diagnostics and forwards them to an embedder-chosen sink.
/// @invariant Counts reflect reported diagnostics.
/// @ownership Owns stored diagnostic messages.
namespace glossa::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Key/value pair attached to a diagnostic for structured context.
struct DiagField
{
    std::string key;
    std::string value;
};

/// @brief Single diagnostic message with structured context.
struct Diagnostic
{
    Severity severity;              ///< Message severity
    std::string message;            ///< Human-readable text
    std::vector<DiagField> fields;  ///< Ordered key/value context
};

/// @brief Destination for diagnostics emitted by library code.
/// @details Implementations decide formatting and destination.  report() may
///          be called concurrently from any thread.
class DiagnosticSink
{
  public:
    virtual ~DiagnosticSink() = default;

    /// @brief Deliver diagnostic @p d.
    virtual void report(const Diagnostic &d) = 0;
};

/// @brief Sink that discards every diagnostic.
class NullDiagnosticSink final : public DiagnosticSink
{
  public:
    void report(const Diagnostic &) override {}
};

/// @brief Sink that prints diagnostics to a stream as they arrive.
class StreamDiagnosticSink final : public DiagnosticSink
{
  public:
    /// @param os Stream receiving formatted text; must outlive the sink.
    /// @param minimum Diagnostics below this severity are dropped.
    explicit StreamDiagnosticSink(std::ostream &os, Severity minimum = Severity::Note);

    void report(const Diagnostic &d) override;

  private:
    std::ostream &os_;
    Severity minimum_;
    std::mutex mutex_;
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine final : public DiagnosticSink
{
  public:
    /// @brief Record diagnostic @p d.
    /// @param d Diagnostic to store.
    void report(const Diagnostic &d) override;

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    void printAll(std::ostream &os) const;

    /// @brief Copy of the recorded diagnostics in report order.
    std::vector<Diagnostic> diagnostics() const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

  private:
    mutable std::mutex mutex_;
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

/// @brief Process-wide fallback sink used when no sink is supplied.
/// @return Reference to a shared NullDiagnosticSink.
DiagnosticSink &nullDiagnosticSink();

/// @brief Sink used by the process-global interning objects.
/// @details Writes warnings and errors to stderr; never destroyed.
DiagnosticSink &processDiagnosticSink();

/// @brief Print a single diagnostic to the provided stream.
/// @details Format: "<severity>: <message> [key=value ...]" plus newline.
void printDiag(const Diagnostic &diag, std::ostream &os);

/// @brief Convert diagnostic severity to lowercase string.
const char *severityToString(Severity severity);

} // namespace glossa::support
