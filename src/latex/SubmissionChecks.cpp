//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/SubmissionChecks.cpp
// Purpose: Marker, section, anonymization and statistics scans.
// Key invariants: Every scan runs over the comment-free copy of the text, so
//                 offsets stay valid for the original.
// Ownership/Lifetime: Results are returned by value.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/SubmissionChecks.hpp"

#include "latex/Segmenter.hpp"
#include "latex/TextScan.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>

namespace texguard::latex
{
namespace
{

using support::Severity;

constexpr std::array<VenueRules, 9> kVenues{{
    {"neurips", true},
    {"icml", true},
    {"iclr", true},
    {"aaai", true},
    {"acl", true},
    {"emnlp", true},
    {"cvpr", true},
    {"icbinb", true},
    {"arxiv", false},
}};

/// Space-separated word slots; `|` separates the alternatives of a slot.
constexpr std::array<std::string_view, 3> kSelfCitationPatterns{{
    "our previous|prior|earlier|recent work|paper|study",
    "we previously|earlier|recently proposed|showed|demonstrated",
    "in our previous|prior|earlier work|paper",
}};

/// `\url` targets that do not identify the authors.
constexpr std::array<std::string_view, 3> kNeutralUrlHosts{{"arxiv", "doi", "paperswithcode"}};

struct ExpectedSection
{
    std::string_view phrase;
    std::string_view display;
};

constexpr std::array<ExpectedSection, 5> kExpectedSections{{
    {"related work", "Related Work"},
    {"method", "Method"},
    {"experiment", "Experiment"},
    {"result", "Result"},
    {"conclusion", "Conclusion"},
}};

constexpr std::size_t kExcerptBytes = 60;
constexpr std::size_t kAuthorExcerptBytes = 50;

bool isAlpha(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool isAlnum(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool isSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string asciiLower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back()))
        s.remove_suffix(1);
    return s;
}

/// @brief @p s with whitespace runs collapsed, cut to @p limit bytes on a
///        code point boundary.
std::string excerpt(std::string_view s, std::size_t limit = kExcerptBytes)
{
    std::string out;
    bool pendingSpace = false;
    for (char c : trim(s))
    {
        if (isSpace(c))
        {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace)
            out.push_back(' ');
        pendingSpace = false;
        out.push_back(c);
    }
    if (out.size() > limit)
    {
        std::size_t cut = limit;
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80)
            --cut;
        out.resize(cut);
        out += "...";
    }
    return out;
}

std::string_view lineAt(std::string_view text, std::size_t pos)
{
    const std::size_t nl = pos == 0 ? std::string_view::npos : text.rfind('\n', pos - 1);
    const std::size_t start = nl == std::string_view::npos ? 0 : nl + 1;
    std::size_t end = text.find('\n', pos);
    if (end == std::string_view::npos)
        end = text.size();
    return text.substr(start, end - start);
}

bool isWholeWord(std::string_view text, std::size_t pos, std::size_t length)
{
    const bool startOk = pos == 0 || !isAlnum(text[pos - 1]);
    const bool endOk = pos + length >= text.size() || !isAlnum(text[pos + length]);
    return startOk && endOk;
}

bool isLowerWord(std::string_view s)
{
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= 'a' && c <= 'z'; });
}

Issue makeIssue(IssueKind kind,
                Severity severity,
                std::string message,
                std::optional<std::size_t> offset,
                std::string key = {})
{
    Issue issue;
    issue.kind = kind;
    issue.severity = severity;
    issue.message = std::move(message);
    issue.offset = offset;
    issue.key = std::move(key);
    return issue;
}

/// @brief Call @p fn with the offset of every unescaped `\word`.
template <typename Fn> void forEachCommand(std::string_view text, std::string_view word, Fn &&fn)
{
    const std::string token = "\\" + std::string(word);
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string_view::npos)
    {
        const std::size_t at = pos;
        pos += token.size();
        if (controlWordAt(text, at) == word && !isEscaped(text, at))
            fn(at);
    }
}

/// @brief Body of the mandatory argument of the command `\word` at @p pos.
/// @details Skips a star and one optional `[...]` argument.
std::optional<std::string_view> commandArgument(std::string_view text,
                                                std::size_t pos,
                                                std::string_view word)
{
    std::size_t p = pos + 1 + word.size();
    if (p < text.size() && text[p] == '*')
        ++p;
    while (p < text.size() && (text[p] == ' ' || text[p] == '\t'))
        ++p;
    if (p < text.size() && text[p] == '[')
    {
        auto optEnd = flatGroupEnd(text, p, '[', ']');
        if (!optEnd)
            return std::nullopt;
        p = *optEnd;
    }
    if (p >= text.size() || text[p] != '{')
        return std::nullopt;
    auto end = braceGroupEnd(text, p, 4);
    if (!end)
        end = flatGroupEnd(text, p, '{', '}');
    if (!end)
        return std::nullopt;
    return text.substr(p + 1, *end - p - 2);
}

/// @brief End of @p pattern matched at @p pos of lower-cased @p text.
/// @details Slots are separated by at least one whitespace character; the
///          last slot may be a prefix of a longer word ("works").
std::optional<std::size_t> matchPhraseAt(std::string_view text,
                                         std::size_t pos,
                                         std::string_view pattern)
{
    std::size_t p = pos;
    bool firstSlot = true;
    while (!pattern.empty())
    {
        const std::size_t gap = pattern.find(' ');
        std::string_view slot = pattern.substr(0, gap);
        pattern = gap == std::string_view::npos ? std::string_view{} : pattern.substr(gap + 1);

        if (!firstSlot)
        {
            if (p >= text.size() || !isSpace(text[p]))
                return std::nullopt;
            while (p < text.size() && isSpace(text[p]))
                ++p;
        }
        firstSlot = false;

        bool matched = false;
        while (!slot.empty() && !matched)
        {
            const std::size_t bar = slot.find('|');
            const std::string_view alternative = slot.substr(0, bar);
            slot = bar == std::string_view::npos ? std::string_view{} : slot.substr(bar + 1);
            if (text.compare(p, alternative.size(), alternative) == 0)
            {
                p += alternative.size();
                matched = true;
            }
        }
        if (!matched)
            return std::nullopt;
    }
    return p;
}

/// @brief First `<host>/<name>/` link in lower-cased @p lower.
std::optional<std::pair<std::size_t, std::size_t>> findRepositoryLink(std::string_view lower,
                                                                      std::string_view host)
{
    std::size_t pos = 0;
    while ((pos = lower.find(host, pos)) != std::string_view::npos)
    {
        const std::size_t nameStart = pos + host.size();
        std::size_t q = nameStart;
        while (q < lower.size() && (isAlnum(lower[q]) || lower[q] == '_' || lower[q] == '-'))
            ++q;
        if (q > nameStart && q < lower.size() && lower[q] == '/')
            return std::pair{pos, q + 1};
        pos = nameStart;
    }
    return std::nullopt;
}

std::size_t countWords(std::string_view s)
{
    std::size_t count = 0;
    bool inWord = false;
    std::size_t i = 0;
    while (i < s.size())
    {
        const char c = s[i];
        if (c == '\\')
        {
            // Control words and symbols separate words and are not counted.
            std::size_t j = i + 1;
            while (j < s.size() && isAlpha(s[j]))
                ++j;
            if (j == i + 1 && j < s.size())
                ++j;
            inWord = false;
            i = j;
            continue;
        }
        if (isSpace(c) || c == '{' || c == '}' || c == '~')
        {
            inWord = false;
            ++i;
            continue;
        }
        if (!inWord)
            ++count;
        inWord = true;
        ++i;
    }
    return count;
}

} // namespace

std::span<const VenueRules> knownVenues()
{
    return kVenues;
}

const VenueRules *findVenue(std::string_view name)
{
    for (const auto &venue : kVenues)
    {
        if (venue.name == name)
            return &venue;
    }
    return nullptr;
}

std::string withoutComments(std::string_view text)
{
    std::string out(text);
    for (const auto &span : segment(text))
    {
        if (span.kind == SpanKind::Comment)
            std::fill(out.begin() + span.start, out.begin() + span.end, ' ');
    }
    return out;
}

bool isStandaloneDocument(std::string_view text)
{
    return withoutComments(text).find("\\begin{document}") != std::string::npos;
}

std::vector<SectionHeading> findSections(std::string_view text)
{
    const std::string visible = withoutComments(text);
    std::vector<SectionHeading> sections;
    forEachCommand(visible,
                   "section",
                   [&](std::size_t at)
                   {
                       if (auto title = commandArgument(visible, at, "section"))
                           sections.push_back(SectionHeading{std::string(trim(*title)), at});
                   });
    return sections;
}

std::vector<Issue> findTodoMarkers(std::string_view text)
{
    const std::string visible = withoutComments(text);
    const std::string lower = asciiLower(visible);

    std::vector<std::pair<std::size_t, std::string_view>> hits;
    for (const auto marker : kTodoMarkers)
    {
        const std::string needle = asciiLower(marker);
        std::size_t pos = 0;
        while ((pos = lower.find(needle, pos)) != std::string::npos)
        {
            if (isWholeWord(lower, pos, needle.size()))
                hits.emplace_back(pos, marker);
            pos += needle.size();
        }
    }
    std::sort(hits.begin(), hits.end());

    std::vector<Issue> issues;
    issues.reserve(hits.size());
    for (const auto &[offset, marker] : hits)
    {
        issues.push_back(makeIssue(IssueKind::TodoMarker,
                                   Severity::Warning,
                                   std::string(marker) + " marker: " +
                                       excerpt(lineAt(visible, offset)),
                                   offset,
                                   std::string(marker)));
    }
    return issues;
}

std::vector<Issue> checkSections(std::string_view text)
{
    std::vector<std::string> titles;
    for (const auto &section : findSections(text))
        titles.push_back(asciiLower(section.title));
    const auto anyTitleHas = [&](std::string_view phrase)
    {
        return std::any_of(titles.begin(),
                           titles.end(),
                           [&](const std::string &t) { return t.find(phrase) != std::string::npos; });
    };

    const bool hasAbstractEnvironment =
        withoutComments(text).find("\\begin{abstract}") != std::string::npos;
    const bool abstractMissing =
        !hasAbstractEnvironment && std::find(titles.begin(), titles.end(), "abstract") == titles.end();
    const bool introductionMissing = !anyTitleHas("introduction");

    std::vector<Issue> issues;
    if (abstractMissing)
    {
        issues.push_back(makeIssue(IssueKind::MissingSection,
                                   Severity::Error,
                                   "missing required section: Abstract",
                                   std::nullopt,
                                   "Abstract"));
    }
    if (introductionMissing)
    {
        issues.push_back(makeIssue(IssueKind::MissingSection,
                                   Severity::Error,
                                   "missing required section: Introduction",
                                   std::nullopt,
                                   "Introduction"));
    }

    if (!hasAbstractEnvironment && !abstractMissing)
    {
        issues.push_back(makeIssue(IssueKind::MissingSection,
                                   Severity::Note,
                                   "abstract is a section, not an abstract environment",
                                   std::nullopt,
                                   "Abstract"));
    }
    for (const auto &expected : kExpectedSections)
    {
        if (anyTitleHas(expected.phrase))
            continue;
        issues.push_back(makeIssue(IssueKind::MissingSection,
                                   Severity::Note,
                                   "missing expected section: " + std::string(expected.display),
                                   std::nullopt,
                                   std::string(expected.display)));
    }
    return issues;
}

std::vector<Issue> checkAnonymization(std::string_view text)
{
    const std::string visible = withoutComments(text);
    const std::string lower = asciiLower(visible);
    std::vector<Issue> issues;

    bool authorSeen = false;
    forEachCommand(visible,
                   "author",
                   [&](std::size_t at)
                   {
                       if (authorSeen)
                           return;
                       auto body = commandArgument(visible, at, "author");
                       if (!body)
                           return;
                       authorSeen = true;
                       const std::string names = asciiLower(*body);
                       if (names.find("anonymous") != std::string::npos ||
                           names.find("author") != std::string::npos)
                           return;
                       issues.push_back(makeIssue(IssueKind::Anonymization,
                                                  Severity::Warning,
                                                  "author field names the authors: " +
                                                      excerpt(*body, kAuthorExcerptBytes),
                                                  at));
                   });

    for (const auto pattern : kSelfCitationPatterns)
    {
        for (std::size_t pos = 0; pos < lower.size(); ++pos)
        {
            if (pos > 0 && isAlpha(lower[pos - 1]))
                continue;
            if (auto end = matchPhraseAt(lower, pos, pattern))
            {
                issues.push_back(makeIssue(IssueKind::Anonymization,
                                           Severity::Warning,
                                           "possible self-citation: \"" +
                                               excerpt(std::string_view(visible).substr(pos, *end - pos)) +
                                               "\"",
                                           pos));
                break;
            }
        }
    }

    for (const auto &[host, label] : {std::pair<std::string_view, std::string_view>{"github.com/", "GitHub"},
                                      std::pair<std::string_view, std::string_view>{"gitlab.com/", "GitLab"}})
    {
        if (auto link = findRepositoryLink(lower, host))
        {
            issues.push_back(makeIssue(IssueKind::Anonymization,
                                       Severity::Warning,
                                       std::string(label) + " link found: " +
                                           visible.substr(link->first, link->second - link->first),
                                       link->first));
        }
    }

    bool urlSeen = false;
    forEachCommand(visible,
                   "url",
                   [&](std::size_t at)
                   {
                       if (urlSeen)
                           return;
                       auto body = commandArgument(visible, at, "url");
                       if (!body)
                           return;
                       const std::string target = asciiLower(trim(*body));
                       std::size_t hostStart = 0;
                       if (target.starts_with("https://"))
                           hostStart = 8;
                       else if (target.starts_with("http://"))
                           hostStart = 7;
                       else
                           return;
                       const std::string_view host = std::string_view(target).substr(hostStart);
                       const bool neutral =
                           std::any_of(kNeutralUrlHosts.begin(),
                                       kNeutralUrlHosts.end(),
                                       [&](std::string_view h) { return host.starts_with(h); });
                       if (neutral)
                           return;
                       urlSeen = true;
                       issues.push_back(makeIssue(IssueKind::Anonymization,
                                                  Severity::Warning,
                                                  "non-anonymous URL found: " + excerpt(*body),
                                                  at));
                   });

    for (const auto &section : findSections(text))
    {
        if (asciiLower(section.title).starts_with("acknowledg"))
        {
            issues.push_back(makeIssue(IssueKind::Anonymization,
                                       Severity::Warning,
                                       "acknowledgments section present; remove it for anonymous review",
                                       section.offset));
            break;
        }
    }
    return issues;
}

ContentStats collectStats(std::string_view text)
{
    const std::string visible = withoutComments(text);
    ContentStats stats;
    stats.sections = findSections(text);

    for (std::size_t pos = 0; pos < visible.size(); ++pos)
    {
        if (visible[pos] != '\\' || isEscaped(visible, pos))
            continue;
        if (auto token = environmentTokenAt(visible, pos))
        {
            if (token->role != DelimiterRole::Begin)
                continue;
            const std::string_view name = token->name;
            if (name == "figure" || name == "figure*")
                ++stats.figures;
            else if (name == "table" || name == "table*")
                ++stats.tables;
            else if (name.starts_with("equation") || name.starts_with("align"))
                ++stats.equations;
            continue;
        }
        const std::string_view word = controlWordAt(visible, pos);
        if (word.starts_with("cite") && isLowerWord(word.substr(4)))
        {
            std::size_t p = pos + 1 + word.size();
            if (p < visible.size() && visible[p] == '*')
                ++p;
            if (p < visible.size() && (visible[p] == '{' || visible[p] == '['))
                ++stats.citations;
        }
    }

    for (const auto &span : segment(visible))
    {
        if (span.kind == SpanKind::Plain)
            stats.words += countWords(spanText(visible, span));
    }
    return stats;
}

} // namespace texguard::latex
