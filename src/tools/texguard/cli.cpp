//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the top-level `texguard` driver. Global options are consumed
// here; everything after the subcommand name is handed to the matching
// cmd* function together with a ToolContext.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Command dispatch and helpers shared by the texguard subcommands.

#include "tools/texguard/cli.hpp"

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <algorithm>
#include <fstream>
#include <ostream>
#include <vector>

namespace texguard::tools
{
namespace
{

std::vector<std::string_view> splitLines(std::string_view text)
{
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size())
    {
        std::size_t eol = text.find('\n', start);
        if (eol == std::string_view::npos)
            eol = text.size();
        lines.push_back(text.substr(start, eol - start));
        start = eol + 1;
    }
    return lines;
}

} // namespace

bool writeOutput(std::string_view text, const std::string &outFile, const ToolContext &ctx)
{
    if (outFile.empty())
    {
        ctx.out << text;
        return true;
    }
    std::ofstream ofs(outFile, std::ios::binary);
    if (!ofs)
    {
        support::printDiag(support::makeError({}, "unable to write " + outFile), ctx.err);
        return false;
    }
    ofs << text;
    if (!ofs)
    {
        support::printDiag(support::makeError({}, "error writing " + outFile), ctx.err);
        return false;
    }
    return true;
}

void printLineChanges(std::string_view before, std::string_view after, std::ostream &os)
{
    constexpr std::size_t kShownChanges = 20;
    constexpr std::size_t kShownBytes = 100;

    const auto oldLines = splitLines(before);
    const auto newLines = splitLines(after);
    const std::size_t common = std::min(oldLines.size(), newLines.size());

    std::size_t changes = 0;
    for (std::size_t i = 0; i < common; ++i)
    {
        if (oldLines[i] == newLines[i])
            continue;
        if (++changes <= kShownChanges)
        {
            os << "Line " << (i + 1) << ":\n";
            os << "  - " << oldLines[i].substr(0, kShownBytes) << "\n";
            os << "  + " << newLines[i].substr(0, kShownBytes) << "\n";
        }
    }
    if (changes > kShownChanges)
        os << "... and " << (changes - kShownChanges) << " more changes\n";
    os << "\nTotal lines changed: " << changes << "\n";
}

/// @brief Parse global options and dispatch to a subcommand.
///
/// @details Step-by-step summary:
///          1. Consume any number of leading `--config <file>` options,
///             loading each file over the current configuration.
///          2. Handle `--version` and `--help`.
///          3. Dispatch the subcommand with the remaining arguments.
///          4. Fall back to usage when no subcommand matches.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err, support::SourceManager &sm)
{
    config::Config cfg;
    int i = 1;
    while (i < argc && std::string_view(argv[i]) == "--config")
    {
        if (i + 1 >= argc)
        {
            usage(err);
            return 1;
        }
        const std::string path = argv[i + 1];
        if (!config::loadFromFile(path, cfg))
        {
            support::printDiag(support::makeError({}, "unable to open config " + path), err);
            return 1;
        }
        i += 2;
    }

    if (i >= argc)
    {
        usage(err);
        return 1;
    }

    const std::string_view cmd = argv[i];
    if (cmd == "--version")
    {
        printVersion(out);
        return 0;
    }
    if (cmd == "--help" || cmd == "-h")
    {
        usage(err);
        return 0;
    }

    const ToolContext ctx{cfg, out, err, sm};
    const int subArgc = argc - i - 1;
    char **subArgv = argv + i + 1;
    if (cmd == "clean")
        return cmdClean(subArgc, subArgv, ctx);
    if (cmd == "check")
        return cmdCheck(subArgc, subArgv, ctx);
    if (cmd == "diagnose")
        return cmdDiagnose(subArgc, subArgv, ctx);
    if (cmd == "fix")
        return cmdFix(subArgc, subArgv, ctx);
    if (cmd == "spans")
        return cmdSpans(subArgc, subArgv, ctx);

    err << "unknown command: " << cmd << "\n";
    usage(err);
    return 1;
}

} // namespace texguard::tools
