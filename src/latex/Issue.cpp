//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/Issue.cpp
// Purpose: Issue naming and conversion into support diagnostics.
// Key invariants: Offsets take precedence over explicit lines when a document
//                 is available to resolve them.
// Ownership/Lifetime: Conversions copy message text.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/Issue.hpp"

#include "latex/Document.hpp"
#include "support/diag_expected.hpp"

namespace texguard::latex
{

std::string_view issueKindName(IssueKind kind)
{
    switch (kind)
    {
        case IssueKind::UndefinedCommand:
            return "undefined-command";
        case IssueKind::MissingMath:
            return "missing-math";
        case IssueKind::MissingBrace:
            return "missing-brace";
        case IssueKind::UndefinedEnvironment:
            return "undefined-environment";
        case IssueKind::MissingFile:
            return "missing-file";
        case IssueKind::MisplacedAlignTab:
            return "misplaced-align-tab";
        case IssueKind::UndefinedCitation:
            return "undefined-citation";
        case IssueKind::UndefinedReference:
            return "undefined-reference";
        case IssueKind::EnvironmentImbalance:
            return "environment-imbalance";
        case IssueKind::BadBox:
            return "bad-box";
        case IssueKind::TodoMarker:
            return "todo-marker";
        case IssueKind::MissingSection:
            return "missing-section";
        case IssueKind::Anonymization:
            return "anonymization";
        case IssueKind::Other:
            return "other";
    }
    return "other";
}

Issue makeImbalanceIssue(std::string name,
                         std::size_t beginCount,
                         std::size_t endCount,
                         std::size_t offset)
{
    Issue issue;
    issue.kind = IssueKind::EnvironmentImbalance;
    issue.severity = support::Severity::Error;
    issue.message = "environment '" + name + "' has " + std::to_string(beginCount) +
                    " \\begin and " + std::to_string(endCount) + " \\end";
    issue.offset = offset;
    issue.environment = std::move(name);
    issue.beginCount = beginCount;
    issue.endCount = endCount;
    return issue;
}

support::Diagnostic issueToDiagnostic(const Issue &issue,
                                      uint32_t fileId,
                                      const SourceDocument *doc)
{
    support::SourceLoc loc{};
    loc.file_id = fileId;
    if (doc && issue.offset)
    {
        loc = doc->locate(*issue.offset);
        loc.file_id = fileId;
    }
    else if (issue.line)
    {
        loc.line = static_cast<uint32_t>(*issue.line);
    }
    return support::Diagnostic{
        issue.severity, issue.message, loc, std::string(issueKindName(issue.kind))};
}

void printIssues(const std::vector<Issue> &issues,
                 std::ostream &os,
                 const support::SourceManager *sm,
                 uint32_t fileId,
                 const SourceDocument *doc)
{
    for (const auto &issue : issues)
        support::printDiag(issueToDiagnostic(issue, fileId, doc), os, sm);
}

} // namespace texguard::latex
