//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/SubmissionChecks.hpp
// Purpose: Pre-submission content checks: leftover TODO markers, required
//          and expected sections, anonymization, and content statistics.
// Key invariants: Comments never produce findings. Issue offsets index the
//                 text that was checked.
// Ownership/Lifetime: Pure functions; results are returned by value.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "latex/Issue.hpp"

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace texguard::latex
{

/// Marker words matched case-insensitively as whole words.
inline constexpr std::array<std::string_view, 5> kTodoMarkers{{"TODO", "TBD", "FIXME", "XXX", "HACK"}};

/// @brief A `\section{title}` or `\section*{title}` command.
struct SectionHeading
{
    std::string title;     ///< Brace contents, trimmed.
    std::size_t offset = 0; ///< Offset of the backslash.
};

/// @brief Counts printed by `texguard check --stats`.
struct ContentStats
{
    std::size_t words = 0; ///< Rough prose word count.
    std::size_t citations = 0;
    std::size_t figures = 0;
    std::size_t tables = 0;
    std::size_t equations = 0;
    std::vector<SectionHeading> sections;
};

/// @brief Review rules of a publication venue.
struct VenueRules
{
    std::string_view name;
    bool anonymous; ///< Submissions must be anonymized.
};

/// @brief Venues known to `texguard check --venue`.
std::span<const VenueRules> knownVenues();

/// @brief Rules for @p name (lower case), or nullptr.
const VenueRules *findVenue(std::string_view name);

/// @brief Copy of @p text with every comment replaced by spaces.
/// @details Offsets and line structure are preserved.
std::string withoutComments(std::string_view text);

/// @brief True when @p text holds `\begin{document}` outside comments.
bool isStandaloneDocument(std::string_view text);

/// @brief Section headings outside comments, in document order.
std::vector<SectionHeading> findSections(std::string_view text);

/// @brief One TodoMarker warning per marker word outside comments.
std::vector<Issue> findTodoMarkers(std::string_view text);

/// @brief Missing required sections as errors, missing expected ones as notes.
///
/// Abstract is satisfied by an abstract environment or a section named
/// "Abstract"; Introduction by any section title containing the word.
/// Related work, method, experiment, result and conclusion are expected:
/// a section title containing each phrase satisfies it.
std::vector<Issue> checkSections(std::string_view text);

/// @brief Anonymization warnings for double-blind review.
/// @details Reports a named author field, self-citation phrases, GitHub and
///          GitLab links, `\url` targets other than arXiv, DOI or Papers
///          with Code, and an acknowledgments section.
std::vector<Issue> checkAnonymization(std::string_view text);

/// @brief Word, citation, float and equation counts outside comments.
ContentStats collectStats(std::string_view text);

} // namespace texguard::latex
