//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `texguard fix` subcommand. The driver loads the document and
// an optional compiler log, runs a bounded number of repair rounds, and
// writes the repaired text together with a fix report.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Repair loop entry point for `texguard`.
/// @details Each round is an independent RepairEngine run over the text the
///          previous round produced; only the text and the open issues are
///          carried from one round to the next.

#include "tools/texguard/cli.hpp"

#include "latex/Document.hpp"
#include "latex/LogClassifier.hpp"
#include "latex/RepairEngine.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/source_loader.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace texguard::tools
{
namespace
{

constexpr std::size_t kListedLogIssues = 10;
constexpr std::size_t kListedMessageBytes = 80;

/// @brief `<stem>.log` beside @p texFile when it exists.
std::string autoDetectLog(const std::string &texFile)
{
    std::filesystem::path log(texFile);
    log.replace_extension(".log");
    std::error_code ec;
    if (std::filesystem::exists(log, ec))
        return log.string();
    return {};
}

void printFixList(const std::vector<latex::Fix> &fixes, std::ostream &os)
{
    for (const auto &fix : fixes)
    {
        os << "  - [" << fix.name << "] " << fix.description;
        if (!fix.applied)
            os << " (not applied)";
        os << "\n";
    }
}

bool blocksSuccess(const latex::Issue &issue)
{
    return issue.severity != support::Severity::Note;
}

} // namespace

/// @brief Repair a LaTeX document.
///
/// @details Execution steps:
///          1. Parse options. `--rounds` defaults to `[repair] max_rounds`.
///          2. Load the document and, when requested or auto-detected, the
///             compiler log, which is classified into issues.
///          3. Run repair rounds until one applies nothing or the bound is
///             reached.
///          4. Report fixes and residual issues, then write the text. In
///             `--dry-run` mode only the report is produced.
int cmdFix(int argc, char **argv, const ToolContext &ctx)
{
    if (argc < 1)
    {
        usage(ctx.err);
        return 1;
    }
    const std::string inFile = argv[0];
    std::string outFile;
    std::string logFile;
    bool autoDetect = false;
    bool dryRun = false;
    unsigned rounds = ctx.config.repair.max_rounds;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "-o" && i + 1 < argc)
        {
            outFile = argv[++i];
        }
        else if (arg == "--log" && i + 1 < argc)
        {
            logFile = argv[++i];
        }
        else if (arg == "--auto-detect")
        {
            autoDetect = true;
        }
        else if (arg == "--dry-run")
        {
            dryRun = true;
        }
        else if (arg == "--rounds" && i + 1 < argc)
        {
            if (!config::parse_rounds(argv[++i], rounds))
            {
                ctx.err << "invalid --rounds value: " << argv[i] << "\n";
                return 1;
            }
        }
        else
        {
            ctx.err << "unknown fix option: " << arg << "\n";
            usage(ctx.err);
            return 1;
        }
    }
    if (!logFile.empty() && autoDetect)
    {
        ctx.err << "--log and --auto-detect are mutually exclusive\n";
        return 1;
    }

    auto doc = common::loadDocument(inFile, ctx.sm);
    if (!doc)
    {
        support::printDiag(doc.error(), ctx.err, &ctx.sm);
        return 1;
    }
    const latex::SourceDocument &source = doc.value();

    if (autoDetect)
        logFile = autoDetectLog(inFile);

    std::optional<std::vector<latex::Issue>> issues;
    if (!logFile.empty())
    {
        auto log = common::loadSourceBuffer(logFile, ctx.sm, support::SourceRole::Log);
        if (!log)
        {
            support::printDiag(log.error(), ctx.err, &ctx.sm);
            return 1;
        }
        issues = latex::classifyLog(log.value().buffer);
        if (!issues->empty())
        {
            ctx.err << "Found " << issues->size() << " errors/warnings in log\n";
            const std::size_t listed = std::min(issues->size(), kListedLogIssues);
            for (std::size_t i = 0; i < listed; ++i)
            {
                const auto &issue = (*issues)[i];
                ctx.err << "  [" << latex::issueKindName(issue.kind) << "] "
                        << issue.message.substr(0, kListedMessageBytes) << "\n";
            }
        }
    }

    const latex::RepairEngine engine(config::repairOptions(ctx.config));
    std::string text(source.text());
    std::vector<latex::Fix> fixes;
    std::vector<latex::Issue> residual;
    for (unsigned round = 0; round < rounds; ++round)
    {
        auto report = engine.run(text, source.directory(), issues ? &*issues : nullptr);
        residual = report.residual;
        if (round == 0 || !report.noFixesNeeded)
            latex::mergeFixes(fixes, report.fixes);
        if (report.noFixesNeeded)
            break;
        text = std::move(report.text);
        issues = std::move(report.residual);
    }

    const auto applied = static_cast<std::size_t>(
        std::count_if(fixes.begin(), fixes.end(), [](const latex::Fix &f) { return f.applied; }));

    const latex::SourceDocument repaired(text, source.path(), source.fileId());
    latex::printIssues(residual, ctx.err, &ctx.sm, source.fileId(), &repaired);
    const bool clean = std::none_of(residual.begin(), residual.end(), blocksSuccess);

    if (dryRun)
    {
        ctx.out << "## Fixes that would be applied (" << applied << "):\n";
        printFixList(fixes, ctx.out);
        if (applied == 0)
            ctx.out << "  No fixes needed.\n";
        return clean ? 0 : 1;
    }

    if (applied == 0)
    {
        ctx.err << "No fixes needed.\n";
        printFixList(fixes, ctx.err);
    }
    else
    {
        ctx.err << "\nApplied " << applied << " fixes:\n";
        printFixList(fixes, ctx.err);
    }

    if (!writeOutput(text, outFile, ctx))
        return 1;
    if (!outFile.empty())
        ctx.err << "Fixed file written to " << outFile << "\n";
    return clean ? 0 : 1;
}

} // namespace texguard::tools
