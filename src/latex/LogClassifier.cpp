//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/LogClassifier.cpp
// Purpose: Rule table and line scan for compiler logs.
// Key invariants: Lines are split on '\n' with a trailing '\r' removed.
// Ownership/Lifetime: Issues own copies of the log lines they quote.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/LogClassifier.hpp"

#include <array>
#include <cctype>
#include <iterator>
#include <limits>
#include <string>

namespace texguard::latex
{
namespace
{

/// @brief A message matches when it contains every non-empty needle.
struct ClassificationRule
{
    IssueKind kind;
    std::string_view needle;
    std::string_view alsoNeedle{};
};

constexpr std::array<ClassificationRule, 7> kErrorRules{{
    {IssueKind::UndefinedCommand, "Undefined control sequence"},
    {IssueKind::MissingMath, "Missing $ inserted"},
    {IssueKind::MissingBrace, "Missing } inserted"},
    {IssueKind::MissingBrace, "Missing { inserted"},
    {IssueKind::UndefinedEnvironment, "Environment", "undefined"},
    {IssueKind::MissingFile, "File", "not found"},
    {IssueKind::MisplacedAlignTab, "Misplaced alignment tab"},
}};

constexpr std::array<std::string_view, 4> kBadBoxMarkers{{
    "Overfull \\hbox",
    "Overfull \\vbox",
    "Underfull \\hbox",
    "Underfull \\vbox",
}};

bool contains(std::string_view haystack, std::string_view needle)
{
    return haystack.find(needle) != std::string_view::npos;
}

bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

std::string_view trim(std::string_view s)
{
    const auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && isSpace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back()))
        s.remove_suffix(1);
    return s;
}

/// @brief Parse the run of digits at @p pos, if any.
/// @return nullopt when there is no digit or the value overflows size_t.
std::optional<std::size_t> digitsAt(std::string_view s, std::size_t pos)
{
    if (pos >= s.size() || !isDigit(s[pos]))
        return std::nullopt;
    constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
    std::size_t value = 0;
    while (pos < s.size() && isDigit(s[pos]))
    {
        const auto digit = static_cast<std::size_t>(s[pos++] - '0');
        if (value > (kMax - digit) / 10)
            return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

/// @brief Number following the first occurrence of @p phrase in @p line.
std::optional<std::size_t> numberAfter(std::string_view line, std::string_view phrase)
{
    const std::size_t at = line.find(phrase);
    if (at == std::string_view::npos)
        return std::nullopt;
    return digitsAt(line, at + phrase.size());
}

/// @brief Text between the first backquote and the following quote.
std::string quotedKey(std::string_view line)
{
    const std::size_t open = line.find('`');
    if (open == std::string_view::npos)
        return {};
    const std::size_t close = line.find('\'', open + 1);
    if (close == std::string_view::npos || close == open + 1)
        return {};
    return std::string(line.substr(open + 1, close - open - 1));
}

} // namespace

IssueKind classifyMessage(std::string_view message)
{
    for (const auto &rule : kErrorRules)
    {
        if (!contains(message, rule.needle))
            continue;
        if (!rule.alsoNeedle.empty() && !contains(message, rule.alsoNeedle))
            continue;
        return rule.kind;
    }
    return IssueKind::Other;
}

std::optional<std::size_t> findLineMarker(std::string_view line)
{
    std::size_t pos = 0;
    while ((pos = line.find("l.", pos)) != std::string_view::npos)
    {
        const bool wordStart =
            pos == 0 || !std::isalpha(static_cast<unsigned char>(line[pos - 1]));
        if (wordStart)
        {
            if (auto n = digitsAt(line, pos + 2))
                return n;
        }
        pos += 2;
    }
    return std::nullopt;
}

LogClassifier::LogClassifier(std::string_view log) : log_(log) {}

/// @brief Advance the error state machine by one line.
///
/// @details Open issues receive the line as context first; only then does a
///          "! " line open its own issue. Issues leave the queue in the order
///          they were opened because every window has the same length.
void LogClassifier::feedErrorScan(std::string_view line)
{
    if (state_ == State::Context)
    {
        for (auto &p : pending_)
        {
            p.issue.context.emplace_back(line);
            if (!p.issue.line)
                p.issue.line = findLineMarker(line);
            --p.remaining;
        }
        while (!pending_.empty() && pending_.front().remaining == 0)
        {
            errors_.push_back(std::move(pending_.front().issue));
            pending_.pop_front();
        }
    }

    if (line.starts_with("! "))
    {
        PendingError p;
        p.issue.message = std::string(line.substr(2));
        p.issue.kind = classifyMessage(p.issue.message);
        p.issue.severity = support::Severity::Error;
        pending_.push_back(std::move(p));
    }

    state_ = pending_.empty() ? State::Scanning : State::Context;
}

void LogClassifier::finishPending()
{
    for (auto &p : pending_)
        errors_.push_back(std::move(p.issue));
    pending_.clear();
    state_ = State::Scanning;
}

void LogClassifier::scanWarning(std::string_view line)
{
    Issue issue;
    if (contains(line, "Citation") && contains(line, "undefined"))
    {
        issue.kind = IssueKind::UndefinedCitation;
    }
    else if (contains(line, "Reference") && contains(line, "undefined"))
    {
        issue.kind = IssueKind::UndefinedReference;
    }
    else
    {
        bool badBox = false;
        for (auto marker : kBadBoxMarkers)
            badBox = badBox || contains(line, marker);
        if (!badBox)
            return;
        issue.kind = IssueKind::BadBox;
        issue.severity = support::Severity::Note;
        issue.message = std::string(trim(line));
        issue.line = numberAfter(line, "at lines ");
        if (!issue.line)
            issue.line = numberAfter(line, "at line ");
        warnings_.push_back(std::move(issue));
        return;
    }

    issue.severity = support::Severity::Warning;
    issue.message = std::string(trim(line));
    issue.key = quotedKey(line);
    issue.line = numberAfter(line, "on input line ");
    warnings_.push_back(std::move(issue));
}

std::vector<Issue> LogClassifier::run()
{
    errors_.clear();
    warnings_.clear();
    pending_.clear();
    state_ = State::Scanning;

    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= log_.size())
    {
        std::size_t eol = log_.find('\n', start);
        if (eol == std::string_view::npos)
            eol = log_.size();
        std::string_view line = log_.substr(start, eol - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        lines.push_back(line);
        start = eol + 1;
    }

    for (auto line : lines)
        feedErrorScan(line);
    finishPending();

    for (auto line : lines)
        scanWarning(line);

    std::vector<Issue> issues = std::move(errors_);
    issues.insert(issues.end(),
                  std::make_move_iterator(warnings_.begin()),
                  std::make_move_iterator(warnings_.end()));
    return issues;
}

std::vector<Issue> classifyLog(std::string_view log)
{
    return LogClassifier(log).run();
}

} // namespace texguard::latex
