//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `texguard diagnose` subcommand: classify a compiler log and
// print one diagnostic per issue.
//
//===----------------------------------------------------------------------===//

#include "tools/texguard/cli.hpp"

#include "latex/LogClassifier.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/source_loader.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace texguard::tools
{

/// @brief Classify a compiler log.
///
/// @details Line numbers in a log refer to the typeset source, so `--tex`
///          names the file diagnostics are attributed to; without it they
///          point into the log itself. A summary with error and warning
///          counts goes to standard output.
int cmdDiagnose(int argc, char **argv, const ToolContext &ctx)
{
    if (argc < 1)
    {
        usage(ctx.err);
        return 1;
    }
    const std::string logFile = argv[0];
    std::string texFile;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--tex" && i + 1 < argc)
        {
            texFile = argv[++i];
        }
        else
        {
            ctx.err << "unknown diagnose option: " << arg << "\n";
            usage(ctx.err);
            return 1;
        }
    }

    auto log = common::loadSourceBuffer(logFile, ctx.sm, support::SourceRole::Log);
    if (!log)
    {
        support::printDiag(log.error(), ctx.err, &ctx.sm);
        return 1;
    }

    uint32_t fileId = log.value().fileId;
    if (!texFile.empty())
    {
        auto texId = ctx.sm.addFile(texFile);
        if (!texId)
        {
            support::printDiag(texId.error(), ctx.err, &ctx.sm);
            return 1;
        }
        fileId = texId.value();
    }

    support::DiagnosticEngine de;
    for (const auto &issue : latex::classifyLog(log.value().buffer))
        de.report(latex::issueToDiagnostic(issue, fileId));
    de.printAll(ctx.err, &ctx.sm);

    ctx.out << de.errorCount() << " error(s), " << de.warningCount() << " warning(s)";
    if (de.noteCount() != 0)
        ctx.out << ", " << de.noteCount() << " note(s)";
    ctx.out << "\n";
    return de.hasErrors() ? 1 : 0;
}

} // namespace texguard::tools
