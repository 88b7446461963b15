//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/LogClassifier.hpp
// Purpose: Turn a TeX compiler log into typed issues.
// Key invariants: Every line starting with "! " yields exactly one error
//                 issue, in log order, even when another error begins inside
//                 its context window. Classification never fails; unknown
//                 messages become IssueKind::Other.
// Ownership/Lifetime: The classifier borrows the log text for one run().
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "latex/Issue.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string_view>
#include <vector>

namespace texguard::latex
{

/// Number of log lines collected after an error line.
inline constexpr std::size_t kErrorContextLines = 5;

/// @brief Map an error message (text after "! ") to its kind.
/// @details Rules are tried in order and the first match wins.
IssueKind classifyMessage(std::string_view message);

/// @brief Source line from an `l.<digits>` marker in @p line, if any.
std::optional<std::size_t> findLineMarker(std::string_view line);

/// @brief Line-oriented state machine over a compiler log.
///
/// The error scan is in Scanning state until a "! " line opens an issue and
/// moves it to Context, where following lines are attached to every open
/// issue until each has collected kErrorContextLines lines. A separate
/// warning scan then picks up undefined citations and references plus box
/// warnings anywhere in the log.
class LogClassifier
{
  public:
    explicit LogClassifier(std::string_view log);

    /// @brief Classify the whole log: errors first, then warnings.
    std::vector<Issue> run();

  private:
    enum class State
    {
        Scanning,
        Context,
    };

    struct PendingError
    {
        Issue issue;
        std::size_t remaining = kErrorContextLines;
    };

    void feedErrorScan(std::string_view line);
    void scanWarning(std::string_view line);
    void finishPending();

    std::string_view log_;
    State state_ = State::Scanning;
    std::deque<PendingError> pending_;
    std::vector<Issue> errors_;
    std::vector<Issue> warnings_;
};

/// @brief Convenience wrapper around LogClassifier.
std::vector<Issue> classifyLog(std::string_view log);

} // namespace texguard::latex
