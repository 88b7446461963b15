//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/TextEdit.cpp
// Purpose: Protection checks and back-to-front application of edits.
// Key invariants: Insertions at the same offset keep their recording order.
// Ownership/Lifetime: See TextEdit.hpp.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/TextEdit.hpp"

#include "latex/TextScan.hpp"

#include <algorithm>
#include <numeric>

namespace texguard::latex
{
EditBuilder::EditBuilder(std::string_view text, const SpanList &spans) : text_(text), spans_(spans)
{
}

bool EditBuilder::canReplace(std::size_t offset, std::size_t length) const
{
    if (offset > text_.size() || length > text_.size() - offset)
        return false;
    if (length == 0)
    {
        if (offset == text_.size())
            return true;
        const Span *span = findSpanAt(spans_, offset);
        return span && (span->kind == SpanKind::Plain || span->start == offset);
    }
    const Span *span = findSpanAt(spans_, offset);
    return span && span->kind == SpanKind::Plain && offset + length <= span->end;
}

bool EditBuilder::overlaps(std::size_t offset, std::size_t length) const
{
    for (const auto &e : edits_)
    {
        if (length == 0 || e.length == 0)
        {
            // An insertion conflicts only with a replacement strictly covering it.
            const std::size_t point = length == 0 ? offset : e.offset;
            const std::size_t start = length == 0 ? e.offset : offset;
            const std::size_t len = length == 0 ? e.length : length;
            if (point > start && point < start + len)
                return true;
            continue;
        }
        if (offset < e.offset + e.length && e.offset < offset + length)
            return true;
    }
    return false;
}

bool EditBuilder::accepts(std::size_t offset, std::size_t length) const
{
    return canReplace(offset, length) && !overlaps(offset, length);
}

bool EditBuilder::replace(std::size_t offset, std::size_t length, std::string replacement)
{
    if (!accepts(offset, length))
        return false;
    edits_.push_back(TextEdit{offset, length, std::move(replacement)});
    return true;
}

bool EditBuilder::insertLinePrefix(std::size_t lineStart, std::string prefix)
{
    if (lineStart > text_.size() || (lineStart > 0 && text_[lineStart - 1] != '\n'))
        return false;
    if (overlaps(lineStart, 0))
        return false;
    if (!canReplace(lineStart, 0))
    {
        const Span *span = findSpanAt(spans_, lineStart);
        if (!span || span->kind != SpanKind::NamedEnvironment ||
            !isFigureEnvironment(span->name))
            return false;
    }
    edits_.push_back(TextEdit{lineStart, 0, std::move(prefix)});
    return true;
}

std::string EditBuilder::apply() const
{
    std::vector<std::size_t> order(edits_.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    // Last offset first. At equal offsets a replacement goes before the
    // insertions, and later insertions before earlier ones, so insertions
    // land in recording order ahead of the replaced bytes.
    std::sort(order.begin(),
              order.end(),
              [this](std::size_t a, std::size_t b)
              {
                  if (edits_[a].offset != edits_[b].offset)
                      return edits_[a].offset > edits_[b].offset;
                  if ((edits_[a].length == 0) != (edits_[b].length == 0))
                      return edits_[a].length != 0;
                  return a > b;
              });

    std::string out(text_);
    for (std::size_t idx : order)
    {
        const TextEdit &e = edits_[idx];
        out.replace(e.offset, e.length, e.replacement);
    }
    return out;
}

} // namespace texguard::latex
