// File: tests/unit/test_latex_repair.cpp
// Purpose: Verify the repair passes and their reports.
// Key invariants: Protected regions are never edited; a repaired document has
//                 no environment imbalance when every closer was reachable; a
//                 second run over repaired text applies nothing.
// Ownership/Lifetime: Tests own temporary directories used as figure roots.
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "texguard/latex/Pipeline.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace texguard::latex;
namespace fs = std::filesystem;

namespace
{
/// @brief Fresh empty directory named after the running test.
fs::path scratchDir()
{
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    const fs::path dir =
        fs::temp_directory_path() / (std::string("texguard_repair_") + info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::string> fixNames(const RepairReport &report)
{
    std::vector<std::string> names;
    for (const auto &fix : report.fixes)
        names.push_back(fix.name);
    return names;
}
} // namespace

TEST(RepairEngineTest, AppendsMissingEnd)
{
    const RepairEngine engine;
    const auto report = engine.run("\\begin{equation}\nx = 1\n", scratchDir());
    EXPECT_EQ(report.text, "\\begin{equation}\nx = 1\n\\end{equation}\n");
    ASSERT_EQ(report.fixes.size(), 1u);
    EXPECT_EQ(report.fixes[0].name, "add_end_equation");
    EXPECT_EQ(report.fixes[0].description, "Added missing \\end{equation}");
    EXPECT_FALSE(report.noFixesNeeded);
    EXPECT_TRUE(report.residual.empty());
    EXPECT_TRUE(checkDocument(report.text).empty());
}

TEST(RepairEngineTest, AppendsClosersSortedByName)
{
    const RepairEngine engine;
    const auto report = engine.run("\\begin{b}\\begin{a}\n", scratchDir());
    EXPECT_EQ(report.text, "\\begin{b}\\begin{a}\n\\end{a}\n\\end{b}\n");
    EXPECT_EQ(fixNames(report), (std::vector<std::string>{"add_end_a", "add_end_b"}));
}

TEST(RepairEngineTest, RemovesExtraEnd)
{
    const RepairEngine engine;
    const auto report = engine.run("a\n\\end{itemize}\nb\n", scratchDir());
    EXPECT_EQ(report.text, "a\n\nb\n");
    EXPECT_EQ(fixNames(report), (std::vector<std::string>{"remove_end_itemize"}));
    EXPECT_TRUE(report.residual.empty());
}

TEST(RepairEngineTest, ExtraEndInsideMathIsLeftAlone)
{
    const RepairEngine engine;
    const std::string text = "$\\end{foo}$";
    const auto report = engine.run(text, scratchDir());
    EXPECT_EQ(report.text, text);
    EXPECT_TRUE(report.noFixesNeeded);
    ASSERT_EQ(report.fixes.size(), 1u);
    EXPECT_FALSE(report.fixes[0].applied);
    ASSERT_EQ(report.residual.size(), 1u);
    EXPECT_EQ(report.residual[0].kind, IssueKind::EnvironmentImbalance);
    EXPECT_EQ(report.residual[0].environment, "foo");
}

TEST(RepairEngineTest, ReplacesHtmlTags)
{
    const RepairEngine engine;
    const auto report = engine.run("<b>bold</b> and <I>it</I><br/>end</p>", scratchDir());
    EXPECT_EQ(report.text, "\\textbf{bold} and \\textit{it}\\\\end");
    EXPECT_EQ(fixNames(report),
              (std::vector<std::string>{"html_bold", "html_italic", "html_br", "html_p_close"}));
    EXPECT_EQ(report.fixes[0].description, "Replaced 1 HTML html_bold tags");
}

TEST(RepairEngineTest, HtmlInsideMathIsUntouched)
{
    const RepairEngine engine;
    const std::string text = "$<b>x</b>$";
    const auto report = engine.run(text, scratchDir());
    EXPECT_EQ(report.text, text);
    EXPECT_TRUE(report.noFixesNeeded);
    EXPECT_TRUE(report.fixes.empty());
}

TEST(RepairEngineTest, BlockTagsNeedAWordBoundary)
{
    const RepairEngine engine;
    const auto report = engine.run("<div class=\"x\">a</div><spanish>", scratchDir());
    EXPECT_EQ(report.text, "a<spanish>");
    ASSERT_EQ(report.fixes.size(), 1u);
    EXPECT_EQ(report.fixes[0].description, "Replaced 2 HTML html_block tags");
}

TEST(RepairEngineTest, SubscriptAndSuperscript)
{
    const RepairEngine engine;
    const auto report = engine.run("H<sub>2</sub>O x<sup>2</sup>", scratchDir());
    EXPECT_EQ(report.text, "H$_{2}$O x$^{2}$");
}

TEST(RepairEngineTest, CommentsOutMissingFigure)
{
    const RepairEngine engine;
    const auto report =
        engine.run("Intro\n\\includegraphics[width=3cm]{plots/fig1}\nEnd\n", scratchDir());
    EXPECT_EQ(report.text,
              "Intro\n% FIXME: missing file - \\includegraphics[width=3cm]{plots/fig1}\nEnd\n");
    ASSERT_EQ(report.fixes.size(), 1u);
    EXPECT_EQ(report.fixes[0].name, "comment_missing_figure");
    EXPECT_EQ(report.fixes[0].description, "Commented out missing figure: plots/fig1");
    EXPECT_TRUE(report.fixes[0].applied);
}

TEST(RepairEngineTest, PresentFigureNeedsNoFix)
{
    const fs::path dir = scratchDir();
    fs::create_directories(dir / "plots");
    std::ofstream(dir / "plots" / "fig1.png") << "png";

    const RepairEngine engine;
    const std::string text = "Intro\n\\includegraphics[width=3cm]{plots/fig1}\nEnd\n";
    const auto report = engine.run(text, dir);
    EXPECT_TRUE(report.noFixesNeeded);
    EXPECT_TRUE(report.fixes.empty());
    EXPECT_EQ(report.text, text);
}

TEST(RepairEngineTest, ConfiguredMarkerAndExtensions)
{
    const fs::path dir = scratchDir();
    std::ofstream(dir / "chart.svg") << "svg";

    RepairOptions options;
    options.imageExtensions = {".svg"};
    options.missingFigureMarker = "%% ";
    const RepairEngine engine(options);
    const auto report = engine.run("\\includegraphics{chart}\n\\includegraphics{gone}\n", dir);
    EXPECT_EQ(report.text, "\\includegraphics{chart}\n%% \\includegraphics{gone}\n");
}

TEST(RepairEngineTest, FigureInsideFigureEnvironment)
{
    const RepairEngine engine;
    const auto report = engine.run(
        "\\begin{figure}\n\\centering\n\\includegraphics{nofile}\n\\end{figure}\n", scratchDir());
    EXPECT_EQ(report.text,
              "\\begin{figure}\n\\centering\n% FIXME: missing file - "
              "\\includegraphics{nofile}\n\\end{figure}\n");
}

TEST(RepairEngineTest, FigureOnDelimiterLineIsReportedOnly)
{
    const RepairEngine engine;
    const std::string text = "\\begin{center}\\includegraphics{nofile}\\end{center}\n";
    const auto report = engine.run(text, scratchDir());
    EXPECT_EQ(report.text, text);
    EXPECT_TRUE(report.noFixesNeeded);
    ASSERT_EQ(report.fixes.size(), 1u);
    EXPECT_FALSE(report.fixes[0].applied);
}

TEST(RepairEngineTest, ResidualDropsResolvedIssues)
{
    Issue missing;
    missing.kind = IssueKind::MissingFile;
    missing.message = "LaTeX Error: File `plots/fig1' not found.";
    Issue citation;
    citation.kind = IssueKind::UndefinedCitation;
    citation.severity = texguard::support::Severity::Warning;
    citation.key = "k";
    const std::vector<Issue> issues{missing, citation};

    const RepairEngine engine;
    const auto report = engine.run("\\includegraphics{plots/fig1}\n", scratchDir(), &issues);
    ASSERT_EQ(report.residual.size(), 1u);
    EXPECT_EQ(report.residual[0].kind, IssueKind::UndefinedCitation);
}

TEST(RepairEngineTest, MissingFileIssueNeedsTheQuotedFigureName)
{
    Issue exact;
    exact.kind = IssueKind::MissingFile;
    exact.message = "LaTeX Error: File `a.pdf' not found.";
    Issue unrelated;
    unrelated.kind = IssueKind::MissingFile;
    unrelated.message = "LaTeX Error: File `data.csv' not found.";
    Issue longer;
    longer.kind = IssueKind::MissingFile;
    longer.message = "LaTeX Error: File `ab' not found.";
    const std::vector<Issue> issues{exact, unrelated, longer};

    const RepairEngine engine;
    const auto report = engine.run("\\includegraphics{a}\n", scratchDir(), &issues);
    ASSERT_EQ(report.residual.size(), 2u);
    EXPECT_EQ(report.residual[0].message, unrelated.message);
    EXPECT_EQ(report.residual[1].message, longer.message);
}

TEST(RepairEngineTest, CleanDocumentNeedsNothing)
{
    const RepairEngine engine;
    const std::string text = "Plain model_name text with $x_1$.\n";
    const auto report = engine.run(text, scratchDir());
    EXPECT_TRUE(report.noFixesNeeded);
    EXPECT_TRUE(report.fixes.empty());
    EXPECT_TRUE(report.residual.empty());
    EXPECT_EQ(report.text, text);
}

TEST(RepairEngineTest, SecondRunAppliesNothing)
{
    const fs::path dir = scratchDir();
    const RepairEngine engine;
    const auto first = engine.run(
        "<b>x</b>\n\\begin{figure}\n\\includegraphics{none}\n\\end{itemize}\n", dir);
    EXPECT_FALSE(first.noFixesNeeded);
    const auto second = engine.run(first.text, dir);
    EXPECT_TRUE(second.noFixesNeeded);
    EXPECT_EQ(second.text, first.text);
}

TEST(RepairEngineTest, MergedReportListsUndoneFixOnce)
{
    const std::string text = "\\begin{figure}\\includegraphics{gone}\\end{figure}\n<b>x</b>\n";
    const RepairEngine engine;
    const auto first = engine.run(text, scratchDir());
    const auto second = engine.run(text, scratchDir());

    std::vector<Fix> fixes;
    mergeFixes(fixes, first.fixes);
    mergeFixes(fixes, second.fixes);

    std::size_t undone = 0;
    std::size_t applied = 0;
    for (const auto &fix : fixes)
    {
        if (fix.applied)
            ++applied;
        else
            ++undone;
    }
    EXPECT_EQ(undone, 1u);
    EXPECT_EQ(applied, first.appliedCount() + second.appliedCount());
    EXPECT_GT(applied, 0u);
}
