//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/RepairEngine.cpp
// Purpose: HTML tag, environment mismatch, missing figure and math-mode
//          repair passes plus residual issue bookkeeping.
// Key invariants: Each pass segments its own input and applies its edits in
//                 one step; fixes are reported in pass order.
// Ownership/Lifetime: Passes return new strings; inputs are not modified.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/RepairEngine.hpp"

#include "latex/EnvironmentBalance.hpp"
#include "latex/Segmenter.hpp"
#include "latex/TextEdit.hpp"
#include "latex/TextScan.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <set>
#include <system_error>

namespace texguard::latex
{
namespace
{

/// Returns the length of the tag at @p pos, or 0 when none starts there.
using TagMatcher = std::size_t (*)(std::string_view, std::size_t);

bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isAlnum(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

/// `<br>`, `<br/>`, `<br />`.
std::size_t matchBreakTag(std::string_view text, std::size_t pos)
{
    if (!startsWithNoCase(text, pos, "<br"))
        return 0;
    std::size_t p = pos + 3;
    while (p < text.size() && isSpace(text[p]))
        ++p;
    if (p < text.size() && text[p] == '/')
        ++p;
    if (p < text.size() && text[p] == '>')
        return p + 1 - pos;
    return 0;
}

/// Opening or closing `div`, `span`, `section` or `h1`..`h6`, with attributes.
std::size_t matchBlockTag(std::string_view text, std::size_t pos)
{
    static constexpr std::array<std::string_view, 9> kBlockNames{
        {"div", "span", "section", "h1", "h2", "h3", "h4", "h5", "h6"}};

    if (pos >= text.size() || text[pos] != '<')
        return 0;
    std::size_t p = pos + 1;
    if (p < text.size() && text[p] == '/')
        ++p;
    for (auto name : kBlockNames)
    {
        if (!startsWithNoCase(text, p, name))
            continue;
        std::size_t q = p + name.size();
        if (q < text.size() && isAlnum(text[q]))
            continue;
        while (q < text.size() && text[q] != '>' && text[q] != '\n')
            ++q;
        if (q < text.size() && text[q] == '>')
            return q + 1 - pos;
        return 0;
    }
    return 0;
}

struct HtmlTagRule
{
    std::string_view fixName;
    std::string_view openTag; ///< Literal tag; empty when matcher is set.
    TagMatcher matcher;
    std::string_view openReplacement;
    std::string_view closeTag{}; ///< Set for paired tags.
    std::string_view closeReplacement{};
};

constexpr std::array<HtmlTagRule, 10> kHtmlRules{{
    {"html_bold", "<b>", nullptr, "\\textbf{", "</b>", "}"},
    {"html_italic", "<i>", nullptr, "\\textit{", "</i>", "}"},
    {"html_emphasis", "<em>", nullptr, "\\emph{", "</em>", "}"},
    {"html_br", "", matchBreakTag, "\\\\"},
    {"html_p_open", "<p>", nullptr, "\n\n"},
    {"html_p_close", "</p>", nullptr, ""},
    {"html_code", "<code>", nullptr, "\\texttt{", "</code>", "}"},
    {"html_subscript", "<sub>", nullptr, "$_{", "</sub>", "}$"},
    {"html_superscript", "<sup>", nullptr, "$^{", "</sup>", "}$"},
    {"html_block", "", matchBlockTag, ""},
}};

std::size_t openTagLength(const HtmlTagRule &rule, std::string_view text, std::size_t pos)
{
    if (rule.matcher)
        return rule.matcher(text, pos);
    return startsWithNoCase(text, pos, rule.openTag) ? rule.openTag.size() : 0;
}

/// Case-insensitive search for @p needle starting in [from, to).
std::optional<std::size_t> findNoCase(std::string_view text,
                                      std::string_view needle,
                                      std::size_t from,
                                      std::size_t to)
{
    for (std::size_t p = from; p < to; ++p)
    {
        if (p + needle.size() <= to && startsWithNoCase(text, p, needle))
            return p;
    }
    return std::nullopt;
}

std::size_t lineStartOf(std::string_view text, std::size_t pos)
{
    const std::size_t nl = pos == 0 ? std::string_view::npos : text.rfind('\n', pos - 1);
    return nl == std::string_view::npos ? 0 : nl + 1;
}

std::size_t lineEndOf(std::string_view text, std::size_t pos)
{
    const std::size_t nl = text.find('\n', pos);
    return nl == std::string_view::npos ? text.size() : nl;
}

std::string_view trimLeft(std::string_view s)
{
    while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
    return s;
}

/// @brief True when the quoted file of a "File `name' not found" message
///        names @p path, with or without an extension added by TeX.
bool namesFigure(std::string_view message, std::string_view path)
{
    const std::size_t open = message.find('`');
    if (open == std::string_view::npos)
        return false;
    const std::size_t close = message.find('\'', open + 1);
    if (close == std::string_view::npos)
        return false;
    const std::string_view name = message.substr(open + 1, close - open - 1);
    if (name == path)
        return true;
    return name.size() > path.size() + 1 && name.substr(0, path.size()) == path &&
           name[path.size()] == '.' && name.find('/', path.size()) == std::string_view::npos;
}

std::string endToken(std::string_view name)
{
    return "\\end{" + std::string(name) + "}";
}

} // namespace

void mergeFixes(std::vector<Fix> &into, const std::vector<Fix> &from)
{
    for (const auto &fix : from)
    {
        const bool repeated =
            !fix.applied && std::any_of(into.begin(),
                                        into.end(),
                                        [&](const Fix &seen)
                                        {
                                            return !seen.applied && seen.name == fix.name &&
                                                   seen.description == fix.description;
                                        });
        if (!repeated)
            into.push_back(fix);
    }
}

std::size_t RepairReport::appliedCount() const
{
    return static_cast<std::size_t>(
        std::count_if(fixes.begin(), fixes.end(), [](const Fix &f) { return f.applied; }));
}

RepairEngine::RepairEngine(RepairOptions options) : options_(std::move(options)) {}

/// @brief Replace HTML-like tags in Plain text with LaTeX markup.
///
/// @details A paired tag closes at the nearest closer on the same line and
///          both tags must be replaceable; the bytes between them are kept.
///          One fix summarizes each rule that fired.
std::string RepairEngine::fixHtmlTags(const std::string &text, std::vector<Fix> &fixes) const
{
    const SpanList spans = segment(text);
    EditBuilder edits(text, spans);
    std::array<std::size_t, kHtmlRules.size()> counts{};

    for (const auto &span : spans)
    {
        if (span.kind != SpanKind::Plain)
            continue;
        for (std::size_t pos = span.start; pos < span.end; ++pos)
        {
            if (text[pos] != '<')
                continue;
            for (std::size_t r = 0; r < kHtmlRules.size(); ++r)
            {
                const HtmlTagRule &rule = kHtmlRules[r];
                const std::size_t len = openTagLength(rule, text, pos);
                if (len == 0)
                    continue;

                if (rule.closeTag.empty())
                {
                    if (edits.replace(pos, len, std::string(rule.openReplacement)))
                    {
                        ++counts[r];
                        pos += len - 1;
                    }
                    break;
                }

                auto close = findNoCase(text, rule.closeTag, pos + len, lineEndOf(text, pos));
                if (!close)
                    continue;
                if (edits.accepts(pos, len) && edits.accepts(*close, rule.closeTag.size()))
                {
                    edits.replace(pos, len, std::string(rule.openReplacement));
                    edits.replace(*close, rule.closeTag.size(), std::string(rule.closeReplacement));
                    ++counts[r];
                    pos += len - 1;
                }
                break;
            }
        }
    }

    for (std::size_t r = 0; r < kHtmlRules.size(); ++r)
    {
        if (counts[r] == 0)
            continue;
        const std::string name(kHtmlRules[r].fixName);
        fixes.push_back(
            Fix{name, "Replaced " + std::to_string(counts[r]) + " HTML " + name + " tags"});
    }
    return edits.empty() ? text : edits.apply();
}

/// @brief Append missing closers and drop surplus ones, per environment name.
///
/// @details Missing closers are appended after the trailing whitespace of the
///          document is stripped, one `\end{name}` per line. Surplus closers
///          are removed starting from the last occurrence that lies in Plain
///          text.
std::string RepairEngine::fixEnvironmentMismatch(const std::string &text,
                                                 std::vector<Fix> &fixes) const
{
    const SpanList spans = segment(text);
    const auto delimiters = collectDelimiters(text, spans);
    EditBuilder edits(text, spans);
    std::string appendix;

    for (const auto &[name, count] : tallyDelimiters(delimiters))
    {
        const std::string closer = endToken(name);
        if (count.begins > count.ends)
        {
            for (std::size_t i = count.ends; i < count.begins; ++i)
            {
                appendix += "\n" + closer;
                fixes.push_back(Fix{"add_end_" + name, "Added missing " + closer});
            }
            continue;
        }

        std::size_t excess = count.ends - count.begins;
        for (auto it = delimiters.rbegin(); it != delimiters.rend() && excess > 0; ++it)
        {
            if (it->role != DelimiterRole::End || it->name != name)
                continue;
            if (edits.replace(it->position, closer.size(), std::string()))
            {
                fixes.push_back(Fix{"remove_end_" + name, "Removed extra " + closer});
                --excess;
            }
        }
        for (; excess > 0; --excess)
        {
            fixes.push_back(Fix{"remove_end_" + name,
                                "Extra " + closer + " lies inside a protected region",
                                false});
        }
    }

    if (!appendix.empty())
    {
        std::size_t trimFrom = text.size();
        if (!spans.empty() && spans.back().kind == SpanKind::Plain)
        {
            while (trimFrom > spans.back().start && isSpace(text[trimFrom - 1]))
                --trimFrom;
        }
        appendix += "\n";
        edits.replace(trimFrom, text.size() - trimFrom, std::move(appendix));
    }
    return edits.empty() ? text : edits.apply();
}

bool RepairEngine::figureExists(const std::filesystem::path &baseDir, std::string_view path) const
{
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path full = baseDir / fs::path(std::string(path));
    if (fs::exists(full, ec))
        return true;
    for (const auto &ext : options_.imageExtensions)
    {
        if (fs::exists(fs::path(full.string() + ext), ec))
            return true;
    }
    return false;
}

/// @brief Comment out lines whose \includegraphics file cannot be found.
///
/// @details Only commands in Plain text or directly inside a figure
///          environment are considered. The marker is inserted at the line
///          start and the original line follows it unchanged. A line holding
///          an environment delimiter is left alone and its fix recorded as not
///          applied.
std::string RepairEngine::fixMissingFigures(const std::string &text,
                                            const std::filesystem::path &baseDir,
                                            std::vector<Fix> &fixes,
                                            std::vector<std::string> &commentedPaths) const
{
    static constexpr std::string_view kCommand = "\\includegraphics";

    const SpanList spans = segment(text);
    EditBuilder edits(text, spans);
    std::set<std::size_t> commentedLines;

    std::size_t pos = 0;
    while ((pos = text.find(kCommand, pos)) != std::string::npos)
    {
        const std::size_t at = pos;
        pos += kCommand.size();
        if (controlWordAt(text, at) != kCommand.substr(1) || isEscaped(text, at))
            continue;
        const Span *span = findSpanAt(spans, at);
        if (!span)
            continue;
        const bool eligible =
            span->kind == SpanKind::Plain ||
            (span->kind == SpanKind::NamedEnvironment && isFigureEnvironment(span->name));
        if (!eligible)
            continue;

        std::size_t p = pos;
        if (p < text.size() && text[p] == '[')
        {
            auto optEnd = flatGroupEnd(text, p, '[', ']');
            if (!optEnd)
                continue;
            p = *optEnd;
        }
        auto argEnd = flatGroupEnd(text, p, '{', '}');
        if (!argEnd || *argEnd == p + 2)
            continue;
        const std::string figure(text.substr(p + 1, *argEnd - p - 2));
        pos = *argEnd;

        if (figureExists(baseDir, figure))
            continue;

        const std::size_t lineStart = lineStartOf(text, at);
        const std::string_view line =
            std::string_view(text).substr(lineStart, lineEndOf(text, at) - lineStart);
        if (trimLeft(line).starts_with("%"))
            continue;

        Fix fix{"comment_missing_figure", "Commented out missing figure: " + figure};
        if (commentedLines.count(lineStart) == 0)
        {
            if (line.find("\\begin{") != std::string_view::npos ||
                line.find("\\end{") != std::string_view::npos)
            {
                fix.applied = false;
                fix.description =
                    "Missing figure " + figure + " left in place: line holds an environment delimiter";
                fixes.push_back(std::move(fix));
                continue;
            }
            if (!edits.insertLinePrefix(lineStart, options_.missingFigureMarker))
            {
                fix.applied = false;
                fix.description =
                    "Missing figure " + figure + " left in place: line starts in a protected region";
                fixes.push_back(std::move(fix));
                continue;
            }
            commentedLines.insert(lineStart);
        }
        commentedPaths.push_back(figure);
        fixes.push_back(std::move(fix));
    }
    return edits.empty() ? text : edits.apply();
}

std::string RepairEngine::fixMathModeEscapes(const std::string &text,
                                             std::vector<Fix> & /*fixes*/) const
{
    // TODO: detect identifiers with bare underscores (model_name) in Plain
    // spans and escape them; the pass records no fixes until then.
    return text;
}

RepairReport RepairEngine::run(std::string_view text,
                               const std::filesystem::path &baseDir,
                               const std::vector<Issue> *issues) const
{
    std::vector<Issue> derived;
    if (!issues)
    {
        derived = checkDocument(text);
        issues = &derived;
    }

    RepairReport report;
    std::vector<std::string> commentedPaths;
    std::string current(text);
    current = fixHtmlTags(current, report.fixes);
    current = fixEnvironmentMismatch(current, report.fixes);
    current = fixMissingFigures(current, baseDir, report.fixes, commentedPaths);
    current = fixMathModeEscapes(current, report.fixes);

    report.noFixesNeeded = report.appliedCount() == 0;
    report.text = report.noFixesNeeded ? std::string(text) : std::move(current);

    for (const auto &issue : *issues)
    {
        // Imbalances are recomputed below from the repaired text.
        if (issue.kind == IssueKind::EnvironmentImbalance)
            continue;
        if (issue.kind == IssueKind::MissingFile)
        {
            const bool resolved =
                std::any_of(commentedPaths.begin(),
                            commentedPaths.end(),
                            [&](const std::string &path)
                            { return namesFigure(issue.message, path); });
            if (resolved)
                continue;
        }
        report.residual.push_back(issue);
    }
    for (auto &issue : checkDocument(report.text))
        report.residual.push_back(std::move(issue));
    return report;
}

} // namespace texguard::latex
