// File: tests/unit/test_latex_text_edit.cpp
// Purpose: Verify that recorded edits never touch protected regions and apply
//          in a deterministic order.
// Key invariants: Rejected edits leave the builder unchanged.
// Ownership/Lifetime: N/A (test).
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "latex/Segmenter.hpp"
#include "latex/TextEdit.hpp"

#include <string>

using namespace texguard::latex;

TEST(TextEditTest, ReplacementsStayInPlainText)
{
    const std::string text = "a $x$ b";
    const SpanList spans = segment(text);
    EditBuilder edits(text, spans);

    EXPECT_FALSE(edits.replace(2, 1, "!"));
    EXPECT_FALSE(edits.replace(1, 2, "!"));
    EXPECT_TRUE(edits.empty());

    EXPECT_TRUE(edits.replace(0, 1, "A"));
    EXPECT_TRUE(edits.replace(6, 1, "B"));
    EXPECT_EQ(edits.apply(), "A $x$ B");
}

TEST(TextEditTest, InsertionsAllowedAtRegionBoundaries)
{
    const std::string text = "a $x$ b";
    const SpanList spans = segment(text);
    const EditBuilder edits(text, spans);

    EXPECT_TRUE(edits.canReplace(2, 0));
    EXPECT_FALSE(edits.canReplace(3, 0));
    EXPECT_TRUE(edits.canReplace(text.size(), 0));
    EXPECT_FALSE(edits.canReplace(text.size() + 1, 0));
}

TEST(TextEditTest, OverlappingEditsAreRefused)
{
    const std::string text = "abcdef";
    const SpanList spans = segment(text);
    EditBuilder edits(text, spans);

    EXPECT_TRUE(edits.replace(0, 3, "X"));
    EXPECT_FALSE(edits.replace(2, 2, "Y"));
    EXPECT_FALSE(edits.replace(1, 0, "Z"));
    EXPECT_TRUE(edits.replace(3, 0, "Z"));
    EXPECT_EQ(edits.apply(), "XZdef");
}

TEST(TextEditTest, InsertionsKeepRecordingOrder)
{
    const std::string text = "body";
    const SpanList spans = segment(text);
    EditBuilder edits(text, spans);

    EXPECT_TRUE(edits.replace(0, 1, "B"));
    EXPECT_TRUE(edits.replace(0, 0, "1"));
    EXPECT_TRUE(edits.replace(0, 0, "2"));
    EXPECT_EQ(edits.apply(), "12Body");
}

TEST(TextEditTest, LinePrefixInsideFigureEnvironment)
{
    const std::string text = "\\begin{figure}\n\\includegraphics{a}\n\\end{figure}";
    const SpanList spans = segment(text);
    ASSERT_EQ(spans.size(), 1u);
    EditBuilder edits(text, spans);

    EXPECT_FALSE(edits.insertLinePrefix(3, "% "));
    EXPECT_TRUE(edits.insertLinePrefix(15, "% "));
    EXPECT_EQ(edits.apply(), "\\begin{figure}\n% \\includegraphics{a}\n\\end{figure}");
}

TEST(TextEditTest, LinePrefixRefusedInsideOtherEnvironments)
{
    const std::string text = "\\begin{equation}\nx\n\\end{equation}";
    const SpanList spans = segment(text);
    EditBuilder edits(text, spans);

    EXPECT_FALSE(edits.insertLinePrefix(17, "% "));
    EXPECT_TRUE(edits.insertLinePrefix(0, "% "));
    EXPECT_EQ(edits.edits().size(), 1u);
}
