// File: tests/unit/test_latex_submission.cpp
// Purpose: Verify \input expansion and the pre-submission content checks.
// Key invariants: Comments never produce findings; offsets of an expanded
//                 text map back to the file that holds them.
// Ownership/Lifetime: N/A (test).
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "latex/Document.hpp"
#include "latex/InputExpansion.hpp"
#include "latex/SubmissionChecks.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace texguard::latex;
using texguard::support::Severity;

TEST(InputExpansionTest, FindsDirectivesOutsideComments)
{
    const std::string text = "A\n\\input{intro}\nB % \\input{skip}\n\\input {missing}\n";
    const auto directives = findInputDirectives(text);
    ASSERT_EQ(directives.size(), 2u);
    EXPECT_EQ(directives[0].name, "intro");
    EXPECT_EQ(directives[0].start, 2u);
    EXPECT_EQ(directives[0].end, 15u);
    EXPECT_EQ(directives[1].name, "missing");
    EXPECT_TRUE(findInputDirectives("\\inputenc{x}").empty());
}

TEST(InputExpansionTest, FileNameGetsTexExtension)
{
    EXPECT_EQ(inputFileName("intro"), "intro.tex");
    EXPECT_EQ(inputFileName("sections/a.tex"), "sections/a.tex");
}

TEST(InputExpansionTest, OffsetsMapBackToTheirFile)
{
    const SourceDocument mainDoc("A\n\\input{intro}\nB\n\\input{missing}\n", "/p/main.tex", 1);
    const SourceDocument intro("Hello\nTODO x\n", "/p/intro.tex", 2);
    const auto directives = findInputDirectives(mainDoc.text());
    ASSERT_EQ(directives.size(), 2u);

    const ExpandedDocument expanded(mainDoc, {{directives[0], &intro}, {directives[1], nullptr}});
    EXPECT_EQ(expanded.text(), "A\nHello\nTODO x\n\nB\n\\input{missing}\n");
    EXPECT_EQ(expanded.includedCount(), 1u);

    EXPECT_EQ(expanded.origin(0).document, &mainDoc);
    EXPECT_EQ(expanded.origin(8).document, &intro);
    EXPECT_EQ(expanded.origin(8).offset, 6u);
    EXPECT_EQ(expanded.origin(15).document, &mainDoc);
    EXPECT_EQ(expanded.origin(15).offset, 15u);

    const auto todos = findTodoMarkers(expanded.text());
    ASSERT_EQ(todos.size(), 1u);
    const auto [local, origin] = expanded.localize(todos[0]);
    ASSERT_EQ(origin, &intro);
    ASSERT_TRUE(local.offset.has_value());
    const auto loc = origin->locate(*local.offset);
    EXPECT_EQ(loc.line, 2u);
    EXPECT_EQ(loc.column, 1u);
}

TEST(InputExpansionTest, IssueWithoutOffsetBelongsToMainDocument)
{
    const SourceDocument mainDoc("no directives\n", "m.tex", 1);
    const ExpandedDocument expanded(mainDoc, {});
    Issue issue;
    issue.message = "document level";
    EXPECT_EQ(expanded.localize(issue).second, &mainDoc);
    EXPECT_EQ(expanded.text(), mainDoc.text());
}

TEST(SubmissionChecksTest, TodoMarkersAreWholeWordsOutsideComments)
{
    const std::string text = "Intro TODO: cite\n"
                             "% FIXME later\n"
                             "A todo-list and tbd.\n"
                             "mastodon XXXL\n"
                             "\\todo{x}\n";
    const auto issues = findTodoMarkers(text);
    ASSERT_EQ(issues.size(), 4u);
    EXPECT_EQ(issues[0].kind, IssueKind::TodoMarker);
    EXPECT_EQ(issues[0].severity, Severity::Warning);
    EXPECT_EQ(issues[0].offset, std::optional<std::size_t>(6));
    EXPECT_EQ(issues[0].message, "TODO marker: Intro TODO: cite");
    EXPECT_EQ(issues[1].offset, std::optional<std::size_t>(33));
    EXPECT_EQ(issues[2].key, "TBD");
    EXPECT_EQ(issues[2].message, "TBD marker: A todo-list and tbd.");
    EXPECT_EQ(issues[3].offset, std::optional<std::size_t>(67));
}

TEST(SubmissionChecksTest, CompleteDocumentHasNoSectionFindings)
{
    const std::string text = "\\begin{document}\n"
                             "\\begin{abstract}A\\end{abstract}\n"
                             "\\section{Introduction}\n"
                             "\\section*{Related Work}\n"
                             "\\section{Our Method}\n"
                             "\\section{Experiments and Results}\n"
                             "\\section{Conclusion}\n"
                             "\\end{document}\n";
    EXPECT_TRUE(isStandaloneDocument(text));
    EXPECT_TRUE(checkSections(text).empty());
}

TEST(SubmissionChecksTest, MissingRequiredSectionsAreErrors)
{
    const auto issues = checkSections("\\section{Intro}\n% \\section{Introduction}\n");
    ASSERT_EQ(issues.size(), 7u);
    EXPECT_EQ(issues[0].kind, IssueKind::MissingSection);
    EXPECT_EQ(issues[0].severity, Severity::Error);
    EXPECT_EQ(issues[0].key, "Abstract");
    EXPECT_EQ(issues[1].severity, Severity::Error);
    EXPECT_EQ(issues[1].key, "Introduction");
    EXPECT_EQ(issues[2].severity, Severity::Note);
    EXPECT_EQ(issues[2].message, "missing expected section: Related Work");
    EXPECT_EQ(issues[6].key, "Conclusion");
}

TEST(SubmissionChecksTest, AbstractAsSectionIsOnlyANote)
{
    const auto issues = checkSections("\\section{Abstract}\n\\section{Introduction}\n");
    ASSERT_EQ(issues.size(), 6u);
    EXPECT_EQ(issues[0].severity, Severity::Note);
    EXPECT_EQ(issues[0].key, "Abstract");
    EXPECT_FALSE(isStandaloneDocument("% \\begin{document}\n"));
}

TEST(SubmissionChecksTest, SectionHeadingsSkipOptionalTitles)
{
    const auto sections = findSections("\\section[short]{Long Title}\n\\subsection{No}\n\\section*{ Star }");
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].title, "Long Title");
    EXPECT_EQ(sections[0].offset, 0u);
    EXPECT_EQ(sections[1].title, "Star");
}

TEST(SubmissionChecksTest, AnonymizationFindings)
{
    const std::string text = "\\author{Jane Doe \\\\ Example University}\n"
                             "As shown by our previous\nwork, the method holds.\n"
                             "Code: https://github.com/jdoe/tool and \\url{https://example.org/x}\n"
                             "See \\url{https://arxiv.org/abs/1234}.\n"
                             "\\section*{Acknowledgments}\nThanks.\n";
    const auto issues = checkAnonymization(text);
    ASSERT_EQ(issues.size(), 5u);
    for (const auto &issue : issues)
    {
        EXPECT_EQ(issue.kind, IssueKind::Anonymization);
        EXPECT_EQ(issue.severity, Severity::Warning);
    }
    EXPECT_EQ(issues[0].message, "author field names the authors: Jane Doe \\\\ Example University");
    EXPECT_EQ(issues[0].offset, std::optional<std::size_t>(0));
    EXPECT_EQ(issues[1].message, "possible self-citation: \"our previous work\"");
    EXPECT_EQ(issues[2].message, "GitHub link found: github.com/jdoe/");
    EXPECT_EQ(issues[3].message, "non-anonymous URL found: https://example.org/x");
    EXPECT_EQ(issues[4].message, "acknowledgments section present; remove it for anonymous review");
}

TEST(SubmissionChecksTest, AnonymousSubmissionIsClean)
{
    const std::string text = "\\author{Anonymous Authors}\n"
                             "See \\url{https://doi.org/10.1/x}.\n"
                             "% github.com/me/repo/ and our previous work\n"
                             "Your previous work is cited.\n";
    EXPECT_TRUE(checkAnonymization(text).empty());
}

TEST(SubmissionChecksTest, VenueTable)
{
    ASSERT_NE(findVenue("neurips"), nullptr);
    EXPECT_TRUE(findVenue("neurips")->anonymous);
    ASSERT_NE(findVenue("arxiv"), nullptr);
    EXPECT_FALSE(findVenue("arxiv")->anonymous);
    EXPECT_EQ(findVenue("NeurIPS 2024"), nullptr);
    EXPECT_EQ(knownVenues().size(), 9u);
}

TEST(SubmissionChecksTest, ContentStatistics)
{
    const std::string text = "\\begin{document}\n"
                             "We cite \\cite{a} and \\citep[p.~2]{b,c} and \\citeauthor{d}.\n"
                             "% \\cite{hidden} \\begin{figure}\n"
                             "\\begin{figure}\\end{figure}\\begin{figure*}\\end{figure*}\n"
                             "\\begin{table}\\begin{tabular}{l}x\\end{tabular}\\end{table}\n"
                             "\\begin{equation}x\\end{equation}\\begin{align*}y\\end{align*}\n"
                             "\\section{Intro}\n"
                             "\\end{document}\n";
    const auto stats = collectStats(text);
    EXPECT_EQ(stats.citations, 3u);
    EXPECT_EQ(stats.figures, 2u);
    EXPECT_EQ(stats.tables, 1u);
    EXPECT_EQ(stats.equations, 2u);
    ASSERT_EQ(stats.sections.size(), 1u);
    EXPECT_EQ(stats.sections[0].title, "Intro");
}

TEST(SubmissionChecksTest, WordCountSkipsMathCommandsAndComments)
{
    const auto stats = collectStats("Hello brave new world. \\textbf{Bold} move $x + y$ % not counted\n");
    EXPECT_EQ(stats.words, 6u);
}
