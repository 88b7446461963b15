//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/Issue.hpp
// Purpose: Typed findings shared by the balance validator, the log
//          classifier and the repair engine.
// Key invariants: issueKindName() returns a stable kebab-case name for every
//                 kind; printed diagnostics carry it as their code.
// Ownership/Lifetime: Issues are value types owned by the producing pass.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace texguard::support
{
class SourceManager;
} // namespace texguard::support

namespace texguard::latex
{

class SourceDocument;

/// @brief Category of a finding.
enum class IssueKind
{
    UndefinedCommand,
    MissingMath,
    MissingBrace,
    UndefinedEnvironment,
    MissingFile,
    MisplacedAlignTab,
    UndefinedCitation,    ///< Carries the citation key.
    UndefinedReference,   ///< Carries the label key.
    EnvironmentImbalance, ///< Carries the name and both counts.
    BadBox,               ///< Overfull or underfull box warning.
    TodoMarker,           ///< Leftover TODO, FIXME and similar words.
    MissingSection,       ///< Carries the section name.
    Anonymization,        ///< Identifying content in a blind submission.
    Other,
};

/// @brief One finding from validation or log classification.
struct Issue
{
    IssueKind kind = IssueKind::Other;
    support::Severity severity = support::Severity::Error;
    std::string message;
    std::optional<std::size_t> line;   ///< 1-based source line when known.
    std::optional<std::size_t> offset; ///< Byte offset into the document.
    std::string key;                   ///< Citation, reference, marker or section.
    std::string environment;           ///< Environment name for imbalances.
    std::size_t beginCount = 0;
    std::size_t endCount = 0;
    std::vector<std::string> context; ///< Log lines following an error.
};

/// @brief Stable kebab-case name, e.g. "environment-imbalance".
std::string_view issueKindName(IssueKind kind);

/// @brief Build the imbalance finding for environment @p name.
Issue makeImbalanceIssue(std::string name,
                         std::size_t beginCount,
                         std::size_t endCount,
                         std::size_t offset);

/// @brief Convert @p issue into a printable diagnostic.
/// @param fileId File the issue refers to; 0 when unknown.
/// @param doc When non-null, used to turn an offset into line and column.
support::Diagnostic issueToDiagnostic(const Issue &issue,
                                      uint32_t fileId,
                                      const SourceDocument *doc = nullptr);

/// @brief Print every issue in @p issues using support::printDiag.
void printIssues(const std::vector<Issue> &issues,
                 std::ostream &os,
                 const support::SourceManager *sm,
                 uint32_t fileId,
                 const SourceDocument *doc = nullptr);

} // namespace texguard::latex
