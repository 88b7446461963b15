//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/EnvironmentBalance.cpp
// Purpose: Delimiter collection over a segmentation and count comparison.
// Key invariants: A token is attributed to the span holding its backslash.
// Ownership/Lifetime: Results are returned by value.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/EnvironmentBalance.hpp"

#include "latex/Segmenter.hpp"

namespace texguard::latex
{
namespace
{

bool countsDelimiters(const Span &span)
{
    return span.kind != SpanKind::Comment && span.kind != SpanKind::CommandDefinition;
}

} // namespace

std::vector<EnvironmentDelimiter> collectDelimiters(std::string_view text, const SpanList &spans)
{
    std::vector<EnvironmentDelimiter> delimiters;
    for (const auto &span : spans)
    {
        if (!countsDelimiters(span))
            continue;
        std::size_t pos = span.start;
        while (pos < span.end)
        {
            pos = text.find('\\', pos);
            if (pos == std::string_view::npos || pos >= span.end)
                break;
            if (auto tok = environmentTokenAt(text, pos))
            {
                delimiters.push_back(
                    EnvironmentDelimiter{std::string(tok->name), tok->role, tok->start});
                pos = tok->end;
                continue;
            }
            // Skip the escaped character so "\\begin" is read as a line break.
            pos += 2;
        }
    }
    return delimiters;
}

std::map<std::string, BalanceCount> tallyDelimiters(
    const std::vector<EnvironmentDelimiter> &delimiters)
{
    std::map<std::string, BalanceCount> counts;
    for (const auto &d : delimiters)
    {
        auto &count = counts[d.name];
        if (d.role == DelimiterRole::Begin)
            ++count.begins;
        else
            ++count.ends;
        count.lastPosition = d.position;
    }
    return counts;
}

std::vector<Issue> validateBalance(const std::vector<EnvironmentDelimiter> &delimiters)
{
    std::vector<Issue> issues;
    for (const auto &[name, count] : tallyDelimiters(delimiters))
    {
        if (count.balanced())
            continue;
        issues.push_back(makeImbalanceIssue(name, count.begins, count.ends, count.lastPosition));
    }
    return issues;
}

std::vector<Issue> checkDocument(std::string_view text)
{
    return validateBalance(collectDelimiters(text, segment(text)));
}

} // namespace texguard::latex
