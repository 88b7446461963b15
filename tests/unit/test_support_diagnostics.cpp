// File: tests/unit/test_support_diagnostics.cpp
// Purpose: Check diagnostic formatting, counting and file registration.
// Key invariants: Location prefixes appear only for registered files; notes
//                 are stored but not counted.
// Ownership/Lifetime: N/A (test).
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "latex/Document.hpp"
#include "latex/Issue.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <sstream>

using namespace texguard;
using namespace texguard::support;

TEST(DiagnosticsTest, PrintsLocationSeverityAndCode)
{
    SourceManager sm;
    const uint32_t fid = sm.addFile("paper/./main.tex").value();
    ASSERT_EQ(fid, 1u);
    EXPECT_EQ(sm.getPath(fid), "paper/main.tex");

    std::ostringstream os;
    printDiag(Diagnostic{Severity::Warning, "citation missing", {fid, 12, 3}, "undefined-citation"},
              os,
              &sm);
    EXPECT_EQ(os.str(), "paper/main.tex:12:3: warning: [undefined-citation] citation missing\n");
}

TEST(DiagnosticsTest, OmitsUnknownLocationParts)
{
    SourceManager sm;
    const uint32_t fid = sm.addFile("a.tex").value();

    std::ostringstream withFile;
    printDiag(makeError({fid, 0, 0}, "broken"), withFile, &sm);
    EXPECT_EQ(withFile.str(), "a.tex: error: broken\n");

    std::ostringstream noManager;
    printDiag(makeError({fid, 4, 1}, "broken"), noManager);
    EXPECT_EQ(noManager.str(), "error: broken\n");
}

TEST(SourceManagerTest, SameFileKeepsItsIdentifierAndRole)
{
    SourceManager sm;
    const uint32_t first = sm.addFile("doc.tex").value();
    const uint32_t second = sm.addFile("doc.log", SourceRole::Log).value();
    EXPECT_NE(first, second);
    EXPECT_EQ(sm.addFile("./doc.tex", SourceRole::Input).value(), first);
    EXPECT_EQ(sm.roleOf(first), SourceRole::Document);
    EXPECT_EQ(sm.roleOf(second), SourceRole::Log);
    EXPECT_TRUE(sm.getPath(42).empty());
    EXPECT_FALSE(sm.roleOf(0).has_value());
    EXPECT_EQ(sm.fileCount(), 2u);
}

TEST(SourceManagerTest, FindsFilesAndCountsRoles)
{
    SourceManager sm;
    const uint32_t mainId = sm.addFile("paper/main.tex").value();
    ASSERT_TRUE(sm.addFile("paper/sections/intro.tex", SourceRole::Input));
    ASSERT_TRUE(sm.addFile("paper/sections/method.tex", SourceRole::Input));
    ASSERT_TRUE(sm.addFile("paper/main.log", SourceRole::Log));

    EXPECT_EQ(sm.findFile("paper/sections/../main.tex"), mainId);
    EXPECT_EQ(sm.findFile("paper/other.tex"), 0u);
    EXPECT_EQ(sm.countRole(SourceRole::Document), 1u);
    EXPECT_EQ(sm.countRole(SourceRole::Input), 2u);
    EXPECT_EQ(sm.countRole(SourceRole::Log), 1u);
    EXPECT_EQ(sourceRoleName(SourceRole::Input), "input");
}

TEST(DiagnosticsTest, EngineCountsErrorsAndWarnings)
{
    DiagnosticEngine de;
    de.report({Severity::Error, "e1", {}});
    de.report({Severity::Warning, "w1", {}});
    de.report({Severity::Note, "n1", {}});
    de.report({Severity::Error, "e2", {}});
    EXPECT_EQ(de.errorCount(), 2u);
    EXPECT_EQ(de.warningCount(), 1u);
    EXPECT_EQ(de.noteCount(), 1u);
    EXPECT_TRUE(de.hasErrors());
    EXPECT_EQ(de.diagnostics().size(), 4u);

    std::ostringstream os;
    de.printAll(os);
    EXPECT_EQ(os.str(), "error: e1\nwarning: w1\nnote: n1\nerror: e2\n");
}

TEST(DiagnosticsTest, SeverityNames)
{
    EXPECT_EQ(severityName(Severity::Note), "note");
    EXPECT_EQ(severityName(Severity::Warning), "warning");
    EXPECT_EQ(severityName(Severity::Error), "error");
    EXPECT_FALSE(DiagnosticEngine().hasErrors());
}

TEST(DiagnosticsTest, IssueOffsetResolvesToLineAndColumn)
{
    SourceManager sm;
    const uint32_t fid = sm.addFile("x.tex").value();
    const latex::SourceDocument doc("first\nsecond \\begin{figure}\n", "x.tex", fid);

    const latex::Issue issue = latex::makeImbalanceIssue("figure", 1, 0, 13);
    std::ostringstream os;
    latex::printIssues({issue}, os, &sm, fid, &doc);
    EXPECT_EQ(os.str(),
              "x.tex:2:8: error: [environment-imbalance] environment 'figure' has 1 "
              "\\begin and 0 \\end\n");
}

TEST(DiagnosticsTest, IssueLineUsedWithoutDocument)
{
    SourceManager sm;
    const uint32_t fid = sm.addFile("x.tex").value();
    latex::Issue issue;
    issue.kind = latex::IssueKind::UndefinedCommand;
    issue.message = "Undefined control sequence.";
    issue.line = 7;

    const Diagnostic d = latex::issueToDiagnostic(issue, fid);
    EXPECT_EQ(d.loc.line, 7u);
    EXPECT_EQ(d.loc.column, 0u);
    EXPECT_EQ(d.code, "undefined-command");
}

TEST(ExpectedTest, CarriesValueOrDiagnostic)
{
    Expected<int> ok(5);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 5);

    Expected<int> bad(makeError({}, "nope"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "nope");
    EXPECT_EQ(bad.error().severity, Severity::Error);

    Expected<void> fine;
    EXPECT_TRUE(fine);
}
