/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic sinks used to surface library diagnostics.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The diagnostic engine aggregates messages emitted by the interning
 *     subsystem and keeps track of severity counts.  The stream sink formats
 *     records immediately.  Both may be shared between threads.
 */

#include "diagnostics.hpp"

#include <iostream>

namespace glossa::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * The diagnostic is appended to the internal vector for later inspection.  The
 * method increments the error or warning counter depending on the diagnostic's
 * severity, leaving other severities (e.g. notes) unchanged.
 *
 * @param d Diagnostic to record; copied into the engine's storage.
 */
void DiagnosticEngine::report(const Diagnostic &d)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(d);
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * The function iterates through the recorded messages and delegates formatting
 * to `printDiag`.
 *
 * @param os Output stream that receives the formatted diagnostics.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

std::vector<Diagnostic> DiagnosticEngine::diagnostics() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return diags_;
}

/**
 * @brief Returns the number of error-severity diagnostics recorded so far.
 *
 * @return Number of stored diagnostics with severity `Error`.
 */
size_t DiagnosticEngine::errorCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

/**
 * @brief Returns the number of warning-severity diagnostics recorded so far.
 *
 * @return Number of stored diagnostics with severity `Warning`.
 */
size_t DiagnosticEngine::warningCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

StreamDiagnosticSink::StreamDiagnosticSink(std::ostream &os, Severity minimum)
    : os_(os), minimum_(minimum)
{
}

/**
 * @brief Formats @p d onto the wrapped stream unless it is below the threshold.
 *
 * Writes are serialised so records emitted from different threads never
 * interleave within a line.
 */
void StreamDiagnosticSink::report(const Diagnostic &d)
{
    if (static_cast<int>(d.severity) < static_cast<int>(minimum_))
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    printDiag(d, os_);
}

DiagnosticSink &nullDiagnosticSink()
{
    static NullDiagnosticSink sink;
    return sink;
}

DiagnosticSink &processDiagnosticSink()
{
    static StreamDiagnosticSink *sink = new StreamDiagnosticSink(std::cerr, Severity::Warning);
    return *sink;
}

const char *severityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details The severity prefix comes from severityToString() so wording stays
///          consistent.  Structured fields follow the message as
///          space-separated key=value pairs.  A trailing newline is always
///          emitted so multiple diagnostics appear as a contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
void printDiag(const Diagnostic &diag, std::ostream &os)
{
    os << severityToString(diag.severity) << ": " << diag.message;
    for (const auto &field : diag.fields)
    {
        os << ' ' << field.key << '=' << field.value;
    }
    os << '\n';
}
} // namespace glossa::support
