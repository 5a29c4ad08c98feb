// File: tests/unit/UtfTests.cpp
// Purpose: Validate UTF-8 checking and the UTF-16 conversions.
// Key invariants: Each maximal ill-formed subpart becomes one U+FFFD.
// Ownership/Lifetime: Pure functions; no state.
// Links: src/support/utf.hpp

#include <gtest/gtest.h>

#include "support/utf.hpp"

#include <string>

using namespace glossa::support;

TEST(Utf8, WellFormedInput)
{
    const Utf8Check check = checkUtf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x92\x96");
    EXPECT_TRUE(check.valid);
    EXPECT_EQ(check.validUpTo, 14u);
    EXPECT_FALSE(check.errorLength.has_value());
}

TEST(Utf8, RejectsOverlongsAndSurrogates)
{
    Utf8Check check = checkUtf8("a\xC0\xAF");
    EXPECT_FALSE(check.valid);
    EXPECT_EQ(check.validUpTo, 1u);
    ASSERT_TRUE(check.errorLength.has_value());
    EXPECT_EQ(*check.errorLength, 1u);

    check = checkUtf8("\xED\xA0\x80");
    EXPECT_FALSE(check.valid);
    EXPECT_EQ(check.validUpTo, 0u);
    EXPECT_EQ(check.errorLength.value_or(0), 1u);

    check = checkUtf8("\xF4\x90\x80\x80");
    EXPECT_FALSE(check.valid);
}

TEST(Utf8, TruncatedSequenceHasNoErrorLength)
{
    const Utf8Check check = checkUtf8("ok\xE2\x82");
    EXPECT_FALSE(check.valid);
    EXPECT_EQ(check.validUpTo, 2u);
    EXPECT_FALSE(check.errorLength.has_value());
}

TEST(Utf8, LossyReplacesEachSubpartOnce)
{
    EXPECT_EQ(utf8Lossy("Hello \xF0\x90\x80World"), "Hello \xEF\xBF\xBDWorld");
    EXPECT_EQ(utf8Lossy("\xFF\xFE"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(utf8Lossy("tail\xE2\x82"), "tail\xEF\xBF\xBD");
    EXPECT_EQ(utf8Lossy("clean"), "clean");
}

TEST(Utf8, AppendReplacesNonScalarValues)
{
    std::string out;
    appendUtf8(out, 0x41);
    appendUtf8(out, 0xE9);
    appendUtf8(out, 0x1F496);
    EXPECT_EQ(out, "A\xC3\xA9\xF0\x9F\x92\x96");

    out.clear();
    appendUtf8(out, 0xD800);
    appendUtf8(out, 0x110000);
    EXPECT_EQ(out, "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(Utf16, ConvertsPairsAndRejectsLoneSurrogates)
{
    const std::u16string pair{static_cast<char16_t>(0xD834), static_cast<char16_t>(0xDD1E)};
    auto text = utf16ToUtf8(pair);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "\xF0\x9D\x84\x9E");

    const std::u16string reversed{static_cast<char16_t>(0xDD1E), static_cast<char16_t>(0xD834)};
    EXPECT_FALSE(utf16ToUtf8(reversed).has_value());
    EXPECT_EQ(utf16ToUtf8Lossy(reversed), "\xEF\xBF\xBD\xEF\xBF\xBD");

    EXPECT_EQ(utf16ToUtf8Lossy(u"plain"), "plain");
}
