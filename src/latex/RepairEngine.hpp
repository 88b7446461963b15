//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/RepairEngine.hpp
// Purpose: Ordered best-effort repair passes over a LaTeX document.
// Key invariants: Passes run in a fixed order, each on the text produced by
//                 the previous one and each with a fresh segmentation. Edits
//                 go through EditBuilder, so protected spans are never
//                 rewritten. With no applied fix the input is returned as is.
// Ownership/Lifetime: The engine owns its options; reports own their text.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "latex/Issue.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace texguard::latex
{

/// @brief Record of one repair action.
struct Fix
{
    std::string name;        ///< e.g. "html_bold", "add_end_figure".
    std::string description; ///< Human-readable summary.
    bool applied = true;     ///< False when identified but left undone.
};

/// @brief Tunables of the repair passes.
struct RepairOptions
{
    /// Extensions tried after the literal path of an \includegraphics.
    std::vector<std::string> imageExtensions{".png", ".pdf", ".jpg", ".jpeg", ".eps"};

    /// Prefix written in front of a line whose figure file is missing.
    std::string missingFigureMarker = "% FIXME: missing file - ";
};

/// @brief Outcome of one engine run.
struct RepairReport
{
    std::string text;            ///< Repaired text, or the input unchanged.
    std::vector<Fix> fixes;      ///< Every action in pass order.
    std::vector<Issue> residual; ///< Issues still open after the run.
    bool noFixesNeeded = false;  ///< True when no fix was applied.

    [[nodiscard]] std::size_t appliedCount() const;
};

/// @brief Append the fixes of a later run to @p into.
/// @details A fix left undone that is already listed with the same name and
///          description is not repeated. Applied fixes are always appended.
void mergeFixes(std::vector<Fix> &into, const std::vector<Fix> &from);

/// @brief Applies the HTML, environment, figure and math-mode passes.
class RepairEngine
{
  public:
    explicit RepairEngine(RepairOptions options = {});

    /// @brief Repair @p text once through every pass.
    /// @param baseDir Directory figure paths are resolved against.
    /// @param issues Findings to reconcile, typically from a compiler log.
    ///               When null, issues are derived from the balance validator.
    [[nodiscard]] RepairReport run(std::string_view text,
                                   const std::filesystem::path &baseDir,
                                   const std::vector<Issue> *issues = nullptr) const;

    [[nodiscard]] const RepairOptions &options() const
    {
        return options_;
    }

  private:
    std::string fixHtmlTags(const std::string &text, std::vector<Fix> &fixes) const;
    std::string fixEnvironmentMismatch(const std::string &text, std::vector<Fix> &fixes) const;
    std::string fixMissingFigures(const std::string &text,
                                  const std::filesystem::path &baseDir,
                                  std::vector<Fix> &fixes,
                                  std::vector<std::string> &commentedPaths) const;
    std::string fixMathModeEscapes(const std::string &text, std::vector<Fix> &fixes) const;

    bool figureExists(const std::filesystem::path &baseDir, std::string_view path) const;

    RepairOptions options_;
};

} // namespace texguard::latex
