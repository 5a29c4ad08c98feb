// File: tests/unit/NameSuffixTests.cpp
// Purpose: Check how trailing digits are split from name text.
// Key invariants: Leading zeros of the digit run stay in the base; a run that
//                 is all zeros or overflows 32 bits is not split.
// Ownership/Lifetime: Pure functions; no state.
// Links: src/intern/Name.hpp

#include <gtest/gtest.h>

#include "intern/Name.hpp"

#include <string>

using namespace glossa::intern;

TEST(NameSuffix, SplitsTrailingNumber)
{
    const NameParts parts = splitNumericSuffix("mesh_12");
    EXPECT_EQ(parts.base, "mesh_");
    EXPECT_EQ(parts.number, 12u);
}

TEST(NameSuffix, LeadingZerosStayInBase)
{
    NameParts parts = splitNumericSuffix("hello-010");
    EXPECT_EQ(parts.base, "hello-0");
    EXPECT_EQ(parts.number, 10u);

    parts = splitNumericSuffix("string-01");
    EXPECT_EQ(parts.base, "string-0");
    EXPECT_EQ(parts.number, 1u);
}

TEST(NameSuffix, AllDigitText)
{
    const NameParts parts = splitNumericSuffix("10");
    EXPECT_TRUE(parts.base.empty());
    EXPECT_EQ(parts.number, 10u);
}

TEST(NameSuffix, TextWithoutUsableSuffixIsWhole)
{
    for (const char *text : {"x", "", "file_0", "000", "v2x", "mesh_"})
    {
        const NameParts parts = splitNumericSuffix(text);
        EXPECT_EQ(parts.base, text);
        EXPECT_EQ(parts.number, 0u) << text;
    }
}

TEST(NameSuffix, OverflowingSuffixIsWhole)
{
    NameParts parts = splitNumericSuffix("id_4294967295");
    EXPECT_EQ(parts.base, "id_");
    EXPECT_EQ(parts.number, 4294967295u);

    parts = splitNumericSuffix("id_4294967296");
    EXPECT_EQ(parts.base, "id_4294967296");
    EXPECT_EQ(parts.number, 0u);
}

TEST(NameSuffix, FormatRebuildsText)
{
    for (const char *text : {"mesh_12", "hello-010", "10", "file_0", ""})
    {
        const NameParts parts = splitNumericSuffix(text);
        EXPECT_EQ(formatName(parts.base, parts.number), text);
    }
    EXPECT_EQ(suffixLength(0), 0u);
    EXPECT_EQ(suffixLength(7), 1u);
    EXPECT_EQ(suffixLength(4294967295u), 10u);
}
