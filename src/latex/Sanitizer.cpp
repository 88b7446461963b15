//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/Sanitizer.cpp
// Purpose: Substitution passes and the span-aware document driver.
// Key invariants: Output for a protected span is byte-identical to its input.
// Ownership/Lifetime: Borrowed inputs, owned outputs.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/Sanitizer.hpp"

#include "latex/Segmenter.hpp"
#include "latex/TextScan.hpp"

namespace texguard::latex
{
namespace
{

/// Placed between an inserted math group and a neighbouring `$` so the two
/// dollars never read as a `$$` display delimiter.
constexpr std::string_view kMathSeparator = "{}";

bool opensMath(std::string_view s)
{
    return !s.empty() && s.front() == '$';
}

bool closesMath(std::string_view s)
{
    return !s.empty() && s.back() == '$';
}

/// @brief Single left-to-right substitution pass over `text[begin, end)`.
/// @details Bytes outside the range are only consulted as neighbours: the
///          escape test and the dollar adjacency test look across the range
///          boundary, keys never match across it.
/// @param skipEscaped Leave keys preceded by an escaping backslash untouched.
std::string substitute(std::string_view text,
                       std::size_t begin,
                       std::size_t end,
                       const SubstitutionTable &table,
                       bool skipEscaped)
{
    const std::string_view frame = text.substr(0, end);
    std::string out;
    out.reserve((end - begin) + (end - begin) / 8);
    // True while `out` ends with a `$` that a replacement produced.
    bool insertedTail = false;
    std::size_t pos = begin;
    while (pos < end)
    {
        const auto *entry = table.matchAt(frame, pos);
        if (entry && !(skipEscaped && isEscaped(text, pos)))
        {
            const char previous = !out.empty() ? out.back() : (begin > 0 ? text[begin - 1] : '\0');
            if (opensMath(entry->replacement) && previous == '$')
                out += kMathSeparator;
            out += entry->replacement;
            if (!entry->replacement.empty())
                insertedTail = closesMath(entry->replacement);
            pos += entry->key.size();
            continue;
        }
        if (insertedTail && text[pos] == '$')
            out += kMathSeparator;
        out.push_back(text[pos++]);
        insertedTail = false;
    }
    if (insertedTail && end < text.size() && text[end] == '$')
        out += kMathSeparator;
    return out;
}

/// @brief Offset just past `\begin{name}` and the arguments of a tabular.
/// @details `tabular` takes `[pos]{cols}`; `tabular*` takes
///          `{width}[pos]{cols}`. Parsing stops at the first byte that does
///          not continue the header.
std::size_t tabularHeaderEnd(std::string_view env, std::string_view name)
{
    auto open = environmentTokenAt(env, 0);
    if (!open)
        return 0;
    std::size_t p = open->end;
    int bracesLeft = name == "tabular*" ? 2 : 1;
    while (bracesLeft > 0 && p < env.size())
    {
        std::optional<std::size_t> groupEnd;
        if (env[p] == '[')
        {
            groupEnd = flatGroupEnd(env, p, '[', ']');
        }
        else if (env[p] == '{')
        {
            groupEnd = braceGroupEnd(env, p, 2);
            --bracesLeft;
        }
        if (!groupEnd)
            break;
        p = *groupEnd;
    }
    return p;
}

/// @brief Sanitize a tabular NamedEnvironment span text.
std::string sanitizeTabular(std::string_view env,
                            std::string_view name,
                            const SanitizerTables &tables)
{
    const std::string closer = "\\end{" + std::string(name) + "}";
    const std::size_t bodyStart = tabularHeaderEnd(env, name);
    if (env.size() < closer.size() || bodyStart > env.size() - closer.size())
        return std::string(env);
    const std::size_t bodyEnd = env.size() - closer.size();

    const std::string_view body = env.substr(bodyStart, bodyEnd - bodyStart);
    std::string out(env.substr(0, bodyStart));
    for (const auto &span : segment(body))
        out += sanitizeSpan(body, span, SanitizeContext::TableCell, tables);
    out += env.substr(bodyEnd);
    return out;
}

} // namespace

std::string normalizeNonAscii(std::string_view text, const SubstitutionTable &table)
{
    return substitute(text, 0, text.size(), table, false);
}

std::string escapePlain(std::string_view text, const SanitizerTables &tables)
{
    return substitute(text, 0, text.size(), tables.special, true);
}

std::string escapeTableCell(std::string_view text, const SanitizerTables &tables)
{
    return substitute(text, 0, text.size(), tables.tableCell, true);
}

std::string sanitizeSpan(std::string_view text,
                         const Span &span,
                         SanitizeContext context,
                         const SanitizerTables &tables)
{
    if (span.isProtected())
        return std::string(spanText(text, span));
    if (context == SanitizeContext::TableCell)
        return substitute(text, span.start, span.end, tables.tableCell, true);
    return substitute(text, span.start, span.end, tables.special, true);
}

std::string sanitizeDocument(std::string_view text,
                             const SanitizerTables &tables,
                             SanitizeMode mode)
{
    std::string normalized;
    if (mode == SanitizeMode::Full)
        normalized = normalizeNonAscii(text, tables.nonAscii);
    else
        normalized = std::string(text);

    std::string out;
    out.reserve(normalized.size() + normalized.size() / 8);
    for (const auto &span : segment(normalized))
    {
        if (span.kind == SpanKind::NamedEnvironment && isTabularEnvironment(span.name))
        {
            out += sanitizeTabular(spanText(normalized, span), span.name, tables);
        }
        else if (mode == SanitizeMode::Full)
        {
            out += sanitizeSpan(normalized, span, SanitizeContext::General, tables);
        }
        else
        {
            out += spanText(normalized, span);
        }
    }
    return out;
}

} // namespace texguard::latex
