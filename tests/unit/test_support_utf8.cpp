// File: tests/unit/test_support_utf8.cpp
// Purpose: Verify replacement decoding of malformed UTF-8 input.
// Key invariants: Valid input is untouched; each maximal invalid subpart
//                 becomes exactly one U+FFFD.
// Ownership/Lifetime: N/A (test).
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "support/utf8.hpp"

#include <string>

using namespace texguard::support;

TEST(Utf8RepairTest, ValidTextIsUnchanged)
{
    const std::string text = "caf\xC3\xA9 \xE2\x80\x93 na\xC3\xAFve \xF0\x9F\x98\x80";
    std::size_t replaced = 99;
    EXPECT_EQ(repairUtf8(text, &replaced), text);
    EXPECT_EQ(replaced, 0u);
}

TEST(Utf8RepairTest, TruncatedSequenceYieldsOneReplacement)
{
    std::size_t replaced = 0;
    EXPECT_EQ(repairUtf8("a\xE2\x82" "b", &replaced), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(replaced, 1u);

    EXPECT_EQ(repairUtf8("end\xC3", &replaced), "end\xEF\xBF\xBD");
    EXPECT_EQ(replaced, 1u);
}

TEST(Utf8RepairTest, InvalidLeadBytesAreReplacedIndividually)
{
    std::size_t replaced = 0;
    // Overlong encoding of '/'.
    EXPECT_EQ(repairUtf8("\xC0\xAF", &replaced), "\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(replaced, 2u);

    // Encoded surrogate: the lead is rejected by its second-byte range.
    EXPECT_EQ(repairUtf8("\xED\xA0\x80", &replaced), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    EXPECT_EQ(replaced, 3u);
}

TEST(Utf8RepairTest, CountsCodePoints)
{
    EXPECT_EQ(countCodePoints(""), 0u);
    EXPECT_EQ(countCodePoints("abc"), 3u);
    EXPECT_EQ(countCodePoints("h\xC3\xA9llo"), 5u);
    EXPECT_EQ(countCodePoints("\xE2\x80\x9Cq\xE2\x80\x9D"), 3u);
}
