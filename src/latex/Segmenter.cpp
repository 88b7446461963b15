//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/Segmenter.cpp
// Purpose: Priority-ordered matcher table and the left-to-right scan loop.
// Key invariants: A matcher either claims [pos, end) with end > pos or
//                 declines; the scan never revisits claimed offsets. Every
//                 region introduced by a backslash requires that backslash to
//                 be unescaped.
// Ownership/Lifetime: The segmenter borrows its text; matchers are stateless.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/Segmenter.hpp"

#include "latex/TextScan.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace texguard::latex
{
namespace
{
constexpr std::array<std::string_view, 14> kProtectedEnvironments{{
    "equation",
    "equation*",
    "align",
    "align*",
    "gather",
    "gather*",
    "math",
    "displaymath",
    "figure",
    "figure*",
    "lstlisting",
    "tabular",
    "tabular*",
    "array",
}};

constexpr std::array<std::string_view, 4> kDefinitionCommands{{
    "newcommand",
    "renewcommand",
    "providecommand",
    "DeclareMathOperator",
}};

/// Skip commands taking exactly one flat brace argument.
constexpr std::array<std::string_view, 8> kSingleArgumentSkipCommands{{
    "ref",
    "eqref",
    "autoref",
    "pageref",
    "cref",
    "Cref",
    "label",
    "url",
}};

/// @brief Region claimed by a matcher: end offset and optional name.
struct Claim
{
    std::size_t end;
    std::string_view name{};
};

using MatchFn = std::optional<Claim> (*)(std::string_view, std::size_t);

struct MatcherEntry
{
    SpanKind kind;
    MatchFn match;
};

template <std::size_t N>
bool contains(const std::array<std::string_view, N> &table, std::string_view word)
{
    return std::find(table.begin(), table.end(), word) != table.end();
}

bool isLowerAscii(std::string_view s)
{
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= 'a' && c <= 'z'; });
}

std::optional<Claim> matchComment(std::string_view text, std::size_t pos)
{
    if (text[pos] != '%' || isEscaped(text, pos))
        return std::nullopt;
    const std::size_t eol = text.find('\n', pos);
    return Claim{eol == std::string_view::npos ? text.size() : eol};
}

/// @brief `\newcommand*{\name}[n][default]{body}` and its siblings.
/// @details Adjacent `{...}` / `[...]` groups are consumed greedily; the
///          claim ends after the last brace group. Brace bodies may contain
///          one level of nested braces.
std::optional<Claim> matchNewCommand(std::string_view text, std::size_t pos)
{
    const std::string_view word = controlWordAt(text, pos);
    if (!contains(kDefinitionCommands, word) || isEscaped(text, pos))
        return std::nullopt;

    std::size_t p = pos + 1 + word.size();
    if (p < text.size() && text[p] == '*')
        ++p;

    std::optional<std::size_t> lastBrace;
    while (p < text.size())
    {
        std::optional<std::size_t> groupEnd;
        if (text[p] == '{')
        {
            groupEnd = braceGroupEnd(text, p, 1);
            if (groupEnd)
                lastBrace = groupEnd;
        }
        else if (text[p] == '[')
        {
            groupEnd = flatGroupEnd(text, p, '[', ']');
        }
        if (!groupEnd)
            break;
        p = *groupEnd;
    }
    if (!lastBrace)
        return std::nullopt;
    return Claim{*lastBrace};
}

/// @brief `\def\name<parameter text>{body}`.
std::optional<Claim> matchDef(std::string_view text, std::size_t pos)
{
    if (controlWordAt(text, pos) != "def" || isEscaped(text, pos))
        return std::nullopt;

    std::size_t p = pos + 4;
    if (p >= text.size() || text[p] != '\\')
        return std::nullopt;
    const std::size_t nameStart = ++p;
    while (p < text.size() &&
           (std::isalpha(static_cast<unsigned char>(text[p])) || text[p] == '@'))
        ++p;
    if (p == nameStart)
        return std::nullopt;

    const std::size_t open = text.find('{', p);
    if (open == std::string_view::npos)
        return std::nullopt;
    auto end = braceGroupEnd(text, open, 1);
    if (!end)
        return std::nullopt;
    return Claim{*end};
}

std::optional<Claim> matchDisplayMath(std::string_view text, std::size_t pos)
{
    if (text.compare(pos, 2, "$$") != 0 || isEscaped(text, pos))
        return std::nullopt;

    std::size_t q = pos + 2;
    while ((q = text.find("$$", q)) != std::string_view::npos)
    {
        if (!isEscaped(text, q))
            return Claim{q + 2};
        ++q;
    }
    return std::nullopt;
}

/// @brief True when the `$` at @p pos is not adjacent to another `$`.
bool isSingleDollar(std::string_view text, std::size_t pos)
{
    if (pos > 0 && text[pos - 1] == '$')
        return false;
    if (pos + 1 < text.size() && text[pos + 1] == '$')
        return false;
    return !isEscaped(text, pos);
}

std::optional<Claim> matchInlineMath(std::string_view text, std::size_t pos)
{
    if (text[pos] != '$' || !isSingleDollar(text, pos) || pos + 1 >= text.size())
        return std::nullopt;

    std::size_t q = pos + 1;
    while ((q = text.find('$', q)) != std::string_view::npos)
    {
        if (isSingleDollar(text, q))
            return Claim{q + 1};
        ++q;
    }
    return std::nullopt;
}

/// @brief `\<open> ... \<close>` with the nearest unescaped closer.
std::optional<Claim> matchEscapedPair(std::string_view text,
                                      std::size_t pos,
                                      std::string_view opener,
                                      std::string_view closer)
{
    if (text.compare(pos, opener.size(), opener) != 0 || isEscaped(text, pos))
        return std::nullopt;

    std::size_t q = pos + opener.size();
    while ((q = text.find(closer, q)) != std::string_view::npos)
    {
        if (!isEscaped(text, q))
            return Claim{q + closer.size()};
        ++q;
    }
    return std::nullopt;
}

std::optional<Claim> matchParenMath(std::string_view text, std::size_t pos)
{
    return matchEscapedPair(text, pos, "\\(", "\\)");
}

std::optional<Claim> matchBracketMath(std::string_view text, std::size_t pos)
{
    return matchEscapedPair(text, pos, "\\[", "\\]");
}

/// @brief `\begin{name}` ... nearest `\end{name}` for allow-listed names.
/// @note Flat matching: a nested environment of the same name closes the
///       outer one early.
std::optional<Claim> matchNamedEnvironment(std::string_view text, std::size_t pos)
{
    auto open = environmentTokenAt(text, pos);
    if (!open || open->role != DelimiterRole::Begin || !isProtectedEnvironment(open->name))
        return std::nullopt;
    auto close = findEnvironmentEnd(text, open->name, open->end);
    if (!close)
        return std::nullopt;
    return Claim{close->end, open->name};
}

std::optional<Claim> matchSkipCommand(std::string_view text, std::size_t pos)
{
    const std::string_view word = controlWordAt(text, pos);
    if (word.empty() || isEscaped(text, pos))
        return std::nullopt;

    std::size_t p = pos + 1 + word.size();
    if (contains(kSingleArgumentSkipCommands, word))
    {
        auto end = flatGroupEnd(text, p, '{', '}');
        return end ? std::optional<Claim>(Claim{*end}) : std::nullopt;
    }
    if (word.starts_with("cite") && isLowerAscii(word.substr(4)))
    {
        // natbib-style \citep[see][p.~3]{key}
        for (int optional = 0; optional < 2 && p < text.size() && text[p] == '['; ++optional)
        {
            auto close = flatGroupEnd(text, p, '[', ']');
            if (!close)
                return std::nullopt;
            p = *close;
        }
        auto end = flatGroupEnd(text, p, '{', '}');
        return end ? std::optional<Claim>(Claim{*end}) : std::nullopt;
    }
    if (word == "href")
    {
        auto first = flatGroupEnd(text, p, '{', '}');
        if (!first)
            return std::nullopt;
        auto second = flatGroupEnd(text, *first, '{', '}');
        return second ? std::optional<Claim>(Claim{*second}) : std::nullopt;
    }
    return std::nullopt;
}

/// Matchers in priority order; the first success at an offset wins.
constexpr std::array<MatcherEntry, 9> kMatchers{{
    {SpanKind::Comment, matchComment},
    {SpanKind::CommandDefinition, matchNewCommand},
    {SpanKind::CommandDefinition, matchDef},
    {SpanKind::DisplayMath, matchDisplayMath},
    {SpanKind::InlineMath, matchInlineMath},
    {SpanKind::DelimitedMath, matchParenMath},
    {SpanKind::DelimitedMath, matchBracketMath},
    {SpanKind::NamedEnvironment, matchNamedEnvironment},
    {SpanKind::Command, matchSkipCommand},
}};

} // namespace

std::span<const std::string_view> protectedEnvironmentNames()
{
    return kProtectedEnvironments;
}

bool isProtectedEnvironment(std::string_view name)
{
    return contains(kProtectedEnvironments, name);
}

Segmenter::Segmenter(std::string_view text) : text_(text) {}

std::optional<Segmenter::Match> Segmenter::matchAt(std::size_t pos) const
{
    const char c = text_[pos];
    if (c != '%' && c != '\\' && c != '$')
        return std::nullopt;

    for (const auto &entry : kMatchers)
    {
        if (auto claim = entry.match(text_, pos))
            return Match{entry.kind, claim->end, std::string(claim->name)};
    }
    return std::nullopt;
}

void Segmenter::flushPlain(std::size_t upTo)
{
    if (upTo > plainStart_)
        spans_.push_back(Span{plainStart_, upTo, SpanKind::Plain});
}

/// @brief Scan left to right, claiming protected regions as they are found.
///
/// @details Plain bytes are buffered between claims so consecutive unclaimed
///          bytes always form a single maximal Plain span.
SpanList Segmenter::run()
{
    spans_.clear();
    plainStart_ = 0;
    std::size_t pos = 0;
    while (pos < text_.size())
    {
        auto match = matchAt(pos);
        if (!match)
        {
            ++pos;
            continue;
        }
        flushPlain(pos);
        spans_.push_back(Span{pos, match->end, match->kind, std::move(match->name)});
        pos = match->end;
        plainStart_ = pos;
    }
    flushPlain(text_.size());
    return std::move(spans_);
}

SpanList segment(std::string_view text)
{
    return Segmenter(text).run();
}

} // namespace texguard::latex
