// File: tests/unit/test_latex_sanitizer.cpp
// Purpose: Verify character escaping in prose and tabular cells.
// Key invariants: Protected regions are emitted verbatim; sanitizing an
//                 already sanitized document changes nothing.
// Ownership/Lifetime: N/A (test).
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "latex/Sanitizer.hpp"
#include "latex/Segmenter.hpp"

#include <string>
#include <vector>

using namespace texguard::latex;

namespace
{
const SanitizerTables &tables()
{
    return defaultSanitizerTables();
}
} // namespace

TEST(SubstitutionTableTest, LongestKeyWins)
{
    const SubstitutionTable table{{"a", "1"}, {"ab", "2"}};
    const auto *entry = table.matchAt("abc", 0);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->replacement, "2");
    EXPECT_EQ(table.matchAt("xyz", 0), nullptr);
    ASSERT_NE(table.lookup("a"), nullptr);
    EXPECT_EQ(*table.lookup("a"), "1");
}

TEST(SubstitutionTableTest, DefaultTablesArePopulated)
{
    EXPECT_EQ(tables().tableCell.size(), 4u);
    ASSERT_NE(tables().special.lookup("_"), nullptr);
    EXPECT_EQ(*tables().special.lookup("_"), "\\_");
    ASSERT_NE(tables().special.lookup("\xE2\x80\x8B"), nullptr);
    EXPECT_TRUE(tables().special.lookup("\xE2\x80\x8B")->empty());
    EXPECT_EQ(tables().nonAscii.lookup("\xE2\x80\x8B"), nullptr);
}

TEST(SanitizerTest, EscapesProseSpecials)
{
    EXPECT_EQ(escapePlain("50% of cases & 3#items", tables()), "50\\% of cases \\& 3\\#items");
    EXPECT_EQ(escapePlain("a_b^c | d", tables()), "a\\_b\\textasciicircum{}c \\textbar{} d");
}

TEST(SanitizerTest, AlreadyEscapedCharactersAreKept)
{
    EXPECT_EQ(escapePlain("\\& and \\_ and \\%", tables()), "\\& and \\_ and \\%");
}

TEST(SanitizerTest, TableCellsUseTheReducedTable)
{
    EXPECT_EQ(escapeTableCell("50% of cases & 3#items", tables()), "50% of cases & 3#items");
    EXPECT_EQ(escapeTableCell("a < b = c | d > e", tables()),
              "a $<$ b $=$ c \\textbar{} d $>$ e");
}

TEST(SanitizerTest, NormalizesTypography)
{
    EXPECT_EQ(normalizeNonAscii("caf\xC3\xA9 \xE2\x80\x93 done", tables().nonAscii),
              "caf\\'e -- done");
    EXPECT_EQ(normalizeNonAscii("\xE2\x80\x9Cq\xE2\x80\x9D\xE2\x80\xA6", tables().nonAscii),
              "``q''\\ldots{}");
}

TEST(SanitizerTest, ProtectedSpanIsReturnedVerbatim)
{
    const std::string text = "$x_1 & y$";
    const SpanList spans = segment(text);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(sanitizeSpan(text, spans[0], SanitizeContext::General, tables()), text);
}

TEST(SanitizerTest, PlainSpanFollowsContext)
{
    const std::string text = "a & b < c";
    const SpanList spans = segment(text);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(sanitizeSpan(text, spans[0], SanitizeContext::General, tables()),
              "a \\& b $<$ c");
    EXPECT_EQ(sanitizeSpan(text, spans[0], SanitizeContext::TableCell, tables()),
              "a & b $<$ c");
}

TEST(SanitizerTest, DocumentKeepsMathAndCommandsIntact)
{
    EXPECT_EQ(sanitizeDocument("a_b $x_1^2$ c&d \\cite{k_1}", tables()),
              "a\\_b $x_1^2$ c\\&d \\cite{k_1}");
}

TEST(SanitizerTest, TabularBodyGetsCellEscaping)
{
    const std::string in = "x_y\n\\begin{tabular}{|l|c|}\na & b < c \\\\\n\\end{tabular}\n";
    const std::string out = "x\\_y\n\\begin{tabular}{|l|c|}\na & b $<$ c \\\\\n\\end{tabular}\n";
    EXPECT_EQ(sanitizeDocument(in, tables()), out);
}

TEST(SanitizerTest, TablesOnlyLeavesProseAlone)
{
    EXPECT_EQ(sanitizeDocument("a_b\n\\begin{tabular}{l}x>y\\end{tabular}",
                               tables(),
                               SanitizeMode::TablesOnly),
              "a_b\n\\begin{tabular}{l}x$>$y\\end{tabular}");
}

TEST(SanitizerTest, ProtectedRegionsSurviveUnchanged)
{
    const std::string text = "Cost & value % raw & comment\n"
                             "\\begin{equation}a_1 & b\\end{equation} "
                             "\\newcommand{\\x}{a_b} \\url{http://a_b.org/#x} \\(p_q\\)";
    const std::string out = sanitizeDocument(text, tables());
    for (const auto &span : segment(text))
    {
        if (span.isProtected())
        {
            EXPECT_NE(out.find(spanText(text, span)), std::string::npos) << spanText(text, span);
        }
    }
    EXPECT_EQ(out.substr(0, 14), "Cost \\& value ");
}

TEST(SanitizerTest, SanitizingTwiceChangesNothing)
{
    const std::vector<std::string> docs = {
        "50\\% of cases & 3#items < 4",
        "Price: a_b^c | d",
        "\\begin{tabular}{l|r}\na & b < c = d \\\\\n\\end{tabular}",
        "caf\xC3\xA9 \xE2\x80\x93 \xE2\x80\x9Cquoted\xE2\x80\x9D \xE2\x89\xA4 5",
        "$x$ and $$y$$ and \\(z\\) and \\ref{a_b}",
        "$$x$$<",
        "a<$$x$$",
        "$$x$$\xC2\xB2 y",
        "\xC2\xB2<$y$ and \\$<",
        "\\begin{tabular}{l}$$x$$>\\end{tabular}",
    };
    for (const auto &doc : docs)
    {
        const std::string once = sanitizeDocument(doc, tables());
        EXPECT_EQ(sanitizeDocument(once, tables()), once) << doc;
    }
}

TEST(SanitizerTest, InsertedMathStaysApartFromDisplayMath)
{
    EXPECT_EQ(sanitizeDocument("$$x$$<", tables()), "$$x$${}$<$");
    EXPECT_EQ(sanitizeDocument("a<$$x$$", tables()), "a$<${}$$x$$");
    EXPECT_EQ(sanitizeDocument("$$x$$\xC2\xB2 y", tables()), "$$x$${}$^2$ y");
    EXPECT_EQ(sanitizeDocument("\xC2\xB2<", tables()), "$^2${}$<$");
    EXPECT_EQ(escapePlain("<<", tables()), "$<${}$<$");
}

TEST(SanitizerTest, InsertedMathIsSegmentedAsInlineMath)
{
    const std::string out = sanitizeDocument("$$x$$\xC2\xB2 y", tables());
    const SpanList spans = segment(out);
    ASSERT_EQ(spans.size(), 4u);
    EXPECT_EQ(spans[0].kind, SpanKind::DisplayMath);
    EXPECT_EQ(spans[2].kind, SpanKind::InlineMath);
    EXPECT_EQ(spanText(out, spans[2]), "$^2$");
}
