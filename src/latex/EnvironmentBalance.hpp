//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/EnvironmentBalance.hpp
// Purpose: Tally \begin{x} / \end{x} delimiters and report imbalance.
// Key invariants: Delimiters inside comments and command definitions are
//                 ignored; every other environment counts, allow-listed or not.
//                 Only aggregate counts per name are compared, so a crossed
//                 pair with equal counts is not detected.
// Ownership/Lifetime: Delimiters own their names; results are per call.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "latex/Issue.hpp"
#include "latex/Span.hpp"
#include "latex/TextScan.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace texguard::latex
{

/// @brief One `\begin{name}` or `\end{name}` occurrence.
struct EnvironmentDelimiter
{
    std::string name;
    DelimiterRole role = DelimiterRole::Begin;
    std::size_t position = 0; ///< Offset of the backslash.
};

/// @brief Per-name delimiter counts.
struct BalanceCount
{
    std::size_t begins = 0;
    std::size_t ends = 0;
    std::size_t lastPosition = 0; ///< Offset of the last delimiter seen.

    [[nodiscard]] bool balanced() const
    {
        return begins == ends;
    }
};

/// @brief Delimiters of @p text in document order.
/// @param spans Segmentation of @p text used to skip comments and definitions.
std::vector<EnvironmentDelimiter> collectDelimiters(std::string_view text,
                                                    const SpanList &spans);

/// @brief Count delimiters per environment name.
std::map<std::string, BalanceCount> tallyDelimiters(
    const std::vector<EnvironmentDelimiter> &delimiters);

/// @brief One EnvironmentImbalance issue per unbalanced name, sorted by name.
std::vector<Issue> validateBalance(const std::vector<EnvironmentDelimiter> &delimiters);

/// @brief Segment, collect and validate @p text in one call.
std::vector<Issue> checkDocument(std::string_view text);

} // namespace texguard::latex
