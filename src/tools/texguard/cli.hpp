//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/texguard/cli.hpp
// Purpose: Declarations for texguard subcommand handlers and shared helpers.
// Key invariants: Handlers write documents to ToolContext::out and reports to
//                 ToolContext::err; they never touch std::cout directly.
// Ownership/Lifetime: ToolContext borrows everything it references.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tools/common/config.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace texguard::support
{
class SourceManager;
}

namespace texguard::tools
{

/// @brief Environment shared by every subcommand invocation.
struct ToolContext
{
    const config::Config &config; ///< Settings after --config was applied.
    std::ostream &out;            ///< Receives document text and listings.
    std::ostream &err;            ///< Receives diagnostics and progress.
    support::SourceManager &sm;   ///< Tracks paths for diagnostics.
};

/// @brief Run the texguard command line with injectable streams.
///
/// @param argc Argument count including the program name.
/// @param argv Argument vector as received by main().
/// @param out Standard output replacement.
/// @param err Standard error replacement.
/// @param sm Source manager used for every file the command touches.
/// @return Process exit status.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err, support::SourceManager &sm);

/// @brief Handle `texguard clean <in.tex> [-o out] [--dry-run] [--tables-only]`.
///
/// @param argc Number of arguments following `clean`.
/// @param argv Argument vector beginning with the input path.
/// @return `0` on success, `1` on argument or I/O errors.
int cmdClean(int argc, char **argv, const ToolContext &ctx);

/// @brief Handle `texguard check <in.tex> [--check-anon] [--venue NAME]
///        [--stats] [--no-inputs]`.
/// @return `0` when only notes were found, `1` for errors, warnings, argument
///         errors and I/O errors.
int cmdCheck(int argc, char **argv, const ToolContext &ctx);

/// @brief Handle `texguard diagnose <file.log> [--tex <in.tex>]`.
/// @return `0` when the log holds no errors, `1` otherwise.
int cmdDiagnose(int argc, char **argv, const ToolContext &ctx);

/// @brief Handle `texguard fix`.
///
/// Runs up to `--rounds` repair rounds over the document, optionally guided
/// by a compiler log, and writes the result. Output is written even when
/// issues remain.
///
/// @return `0` when no unresolved issue remains, `1` otherwise or on errors.
int cmdFix(int argc, char **argv, const ToolContext &ctx);

/// @brief Handle `texguard spans <in.tex>`: dump the segmentation.
int cmdSpans(int argc, char **argv, const ToolContext &ctx);

/// @brief Print usage text to @p os.
void usage(std::ostream &os);

/// @brief Print the version banner to @p os.
void printVersion(std::ostream &os);

/// @brief Write @p text to @p outFile, or to ctx.out when @p outFile is empty.
/// @return False after reporting a diagnostic when the file cannot be written.
bool writeOutput(std::string_view text, const std::string &outFile, const ToolContext &ctx);

/// @brief Print a per-line summary of the differences between two texts.
/// @details Shows the first 20 changed lines (each truncated to 100 bytes)
///          followed by the total number of changed lines.
void printLineChanges(std::string_view before, std::string_view after, std::ostream &os);

} // namespace texguard::tools
