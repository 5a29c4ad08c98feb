// File: tests/unit/SupportDiagnosticsTests.cpp
// Purpose: Cover diagnostic formatting, sinks and the Expected error helpers.
// Key invariants: Error diagnostics lead with the error kind field.
// Ownership/Lifetime: Tests own sinks and streams.
// Links: src/support/diagnostics.hpp, src/support/diag_expected.hpp

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <sstream>
#include <string>

using namespace glossa::support;

TEST(Diagnostics, PrintsSeverityMessageAndFields)
{
    std::ostringstream os;
    printDiag({Severity::Warning, "slow path", {{"subsystem", "string"}, {"shard", "3"}}}, os);
    EXPECT_EQ(os.str(), "warning: slow path subsystem=string shard=3\n");
}

TEST(Diagnostics, StreamSinkDropsBelowMinimum)
{
    std::ostringstream os;
    StreamDiagnosticSink sink(os, Severity::Warning);
    sink.report({Severity::Note, "hidden", {}});
    sink.report({Severity::Error, "shown", {}});
    EXPECT_EQ(os.str(), "error: shown\n");
}

TEST(Diagnostics, EngineCountsBySeverity)
{
    DiagnosticEngine engine;
    engine.report({Severity::Note, "n", {}});
    engine.report({Severity::Warning, "w", {}});
    engine.report({Severity::Error, "e1", {}});
    engine.report({Severity::Error, "e2", {}});
    EXPECT_EQ(engine.errorCount(), 2u);
    EXPECT_EQ(engine.warningCount(), 1u);
    ASSERT_EQ(engine.diagnostics().size(), 4u);

    std::ostringstream os;
    engine.printAll(os);
    EXPECT_EQ(os.str(), "note: n\nwarning: w\nerror: e1\nerror: e2\n");
}

TEST(Diagnostics, ErrorBecomesDiagnosticWithKindFirst)
{
    const Error error = makeError(ErrorKind::InvalidHandle, "bad handle");
    const Diagnostic d = toDiagnostic(error, {{"index", "4"}});
    EXPECT_EQ(d.severity, Severity::Error);
    EXPECT_EQ(d.message, "bad handle");
    ASSERT_EQ(d.fields.size(), 2u);
    EXPECT_EQ(d.fields[0].key, "kind");
    EXPECT_EQ(d.fields[0].value, "invalid-handle");
    EXPECT_EQ(d.fields[1].key, "index");
}

TEST(Diagnostics, ErrorKindNames)
{
    EXPECT_STREQ(errorKindName(ErrorKind::OutOfMemory), "out-of-memory");
    EXPECT_STREQ(errorKindName(ErrorKind::UnbalancedRelease), "unbalanced-release");
    EXPECT_STREQ(errorKindName(ErrorKind::InvalidUtf8), "invalid-utf8");
    EXPECT_STREQ(errorKindName(ErrorKind::InvalidUtf16), "invalid-utf16");
}

TEST(Expected, CarriesValueOrError)
{
    Expected<int> value = 7;
    ASSERT_TRUE(value.hasValue());
    EXPECT_EQ(value.value(), 7);

    const Expected<int> copy = value;
    EXPECT_EQ(copy.value(), 7);

    Expected<int> failed = makeError(ErrorKind::OutOfMemory, "full");
    ASSERT_FALSE(failed.hasValue());
    EXPECT_EQ(failed.error().kind, ErrorKind::OutOfMemory);
    EXPECT_EQ(failed.error().message, "full");

    Expected<void> ok;
    EXPECT_TRUE(ok.hasValue());
    Expected<void> bad = makeError(ErrorKind::UnbalancedRelease, "twice");
    EXPECT_FALSE(static_cast<bool>(bad));
    EXPECT_EQ(bad.error().kind, ErrorKind::UnbalancedRelease);
}
