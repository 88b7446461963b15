//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/Span.cpp
// Purpose: Helpers over segmentations: naming, lookup and partition checks.
// Key invariants: findSpanAt relies on spans being sorted by start.
// Ownership/Lifetime: Functions borrow the span list.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/Span.hpp"

#include <algorithm>

namespace texguard::latex
{

std::string_view spanKindName(SpanKind kind)
{
    switch (kind)
    {
        case SpanKind::Plain:
            return "plain";
        case SpanKind::Comment:
            return "comment";
        case SpanKind::InlineMath:
            return "inline-math";
        case SpanKind::DisplayMath:
            return "display-math";
        case SpanKind::DelimitedMath:
            return "delimited-math";
        case SpanKind::Command:
            return "command";
        case SpanKind::NamedEnvironment:
            return "environment";
        case SpanKind::CommandDefinition:
            return "definition";
    }
    return "unknown";
}

std::string_view spanText(std::string_view text, const Span &span)
{
    return text.substr(span.start, span.end - span.start);
}

const Span *findSpanAt(const SpanList &spans, std::size_t offset)
{
    auto it = std::upper_bound(spans.begin(),
                               spans.end(),
                               offset,
                               [](std::size_t value, const Span &s) { return value < s.start; });
    if (it == spans.begin())
        return nullptr;
    --it;
    return it->contains(offset) ? &*it : nullptr;
}

/// @brief Check contiguity, ordering and coverage of a segmentation.
///
/// @details The checks run in document order so the reported problem is the
///          first one a reader would encounter. An empty document must
///          produce an empty list.
support::Expected<void> checkPartition(const SpanList &spans, std::size_t length)
{
    if (spans.empty())
    {
        if (length == 0)
            return {};
        return support::makeError({}, "empty segmentation for non-empty document");
    }

    std::size_t expected = 0;
    for (std::size_t i = 0; i < spans.size(); ++i)
    {
        const Span &s = spans[i];
        if (s.start != expected)
        {
            return support::makeError({},
                                      "span " + std::to_string(i) + " starts at " +
                                          std::to_string(s.start) + ", expected " +
                                          std::to_string(expected));
        }
        if (s.end <= s.start)
        {
            return support::makeError({}, "span " + std::to_string(i) + " is empty");
        }
        if (i > 0 && s.kind == SpanKind::Plain && spans[i - 1].kind == SpanKind::Plain)
        {
            return support::makeError({},
                                      "plain spans " + std::to_string(i - 1) + " and " +
                                          std::to_string(i) + " are not merged");
        }
        expected = s.end;
    }

    if (expected != length)
    {
        return support::makeError({},
                                  "segmentation ends at " + std::to_string(expected) +
                                      ", document length is " + std::to_string(length));
    }
    return {};
}

} // namespace texguard::latex
