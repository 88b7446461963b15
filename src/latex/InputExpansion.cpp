//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/InputExpansion.cpp
// Purpose: \input directive scan and the piece table of an expanded text.
// Key invariants: pieces_ is sorted by start and starts at offset 0.
// Ownership/Lifetime: Documents are borrowed.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/InputExpansion.hpp"

#include "latex/Segmenter.hpp"
#include "latex/TextScan.hpp"

#include <algorithm>
#include <iterator>

namespace texguard::latex
{
namespace
{

constexpr std::string_view kInputCommand = "\\input";

bool mayHoldDirective(const Span &span)
{
    return span.kind != SpanKind::Comment && span.kind != SpanKind::CommandDefinition;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n'))
        s.remove_suffix(1);
    return s;
}

} // namespace

std::vector<InputDirective> findInputDirectives(std::string_view text)
{
    std::vector<InputDirective> directives;
    for (const auto &span : segment(text))
    {
        if (!mayHoldDirective(span))
            continue;
        std::size_t pos = span.start;
        while ((pos = text.find(kInputCommand, pos)) != std::string_view::npos && pos < span.end)
        {
            const std::size_t at = pos;
            pos += kInputCommand.size();
            if (controlWordAt(text, at) != kInputCommand.substr(1) || isEscaped(text, at))
                continue;

            std::size_t p = pos;
            while (p < text.size() && (text[p] == ' ' || text[p] == '\t'))
                ++p;
            if (p >= text.size() || text[p] != '{')
                continue;
            auto close = flatGroupEnd(text, p, '{', '}');
            if (!close)
                continue;
            const std::string_view name = trim(text.substr(p + 1, *close - p - 2));
            if (name.empty())
                continue;
            directives.push_back(InputDirective{std::string(name), at, *close});
            pos = *close;
        }
    }
    return directives;
}

std::string inputFileName(std::string_view name)
{
    std::string file(name);
    if (!file.ends_with(".tex"))
        file += ".tex";
    return file;
}

ExpandedDocument::ExpandedDocument(const SourceDocument &main,
                                   const std::vector<Inclusion> &inclusions)
    : main_(main)
{
    std::size_t cursor = 0;
    for (const auto &inclusion : inclusions)
    {
        const InputDirective &d = inclusion.directive;
        if (!inclusion.document || d.start < cursor || d.end > main.size())
            continue;
        append(main, cursor, d.start);
        append(*inclusion.document, 0, inclusion.document->size());
        ++included_;
        cursor = d.end;
    }
    append(main, cursor, main.size());
}

void ExpandedDocument::append(const SourceDocument &doc, std::size_t from, std::size_t to)
{
    pieces_.push_back(Piece{text_.size(), &doc, from});
    text_ += doc.text().substr(from, to - from);
}

ExpandedDocument::Origin ExpandedDocument::origin(std::size_t offset) const
{
    offset = std::min(offset, text_.size());
    auto it = std::upper_bound(pieces_.begin(),
                               pieces_.end(),
                               offset,
                               [](std::size_t value, const Piece &piece)
                               { return value < piece.start; });
    const Piece &piece = *std::prev(it);
    return Origin{piece.document, piece.sourceStart + (offset - piece.start)};
}

std::pair<Issue, const SourceDocument *> ExpandedDocument::localize(const Issue &issue) const
{
    Issue local = issue;
    if (!issue.offset)
        return {std::move(local), &main_};
    const Origin where = origin(*issue.offset);
    local.offset = where.offset;
    return {std::move(local), where.document};
}

} // namespace texguard::latex
