//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `texguard clean` subcommand: load a document, sanitize the
// prose and tabular cells, and write the result or a change summary.
//
//===----------------------------------------------------------------------===//

#include "tools/texguard/cli.hpp"

#include "latex/Sanitizer.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/source_loader.hpp"

#include <ostream>
#include <string>

namespace texguard::tools
{

/// @brief Sanitize a LaTeX document.
///
/// @details Execution steps:
///          1. Parse options; `--tables-only` overrides the configured mode.
///          2. Load the input with replacement decoding.
///          3. Run latex::sanitizeDocument with the built-in tables.
///          4. Either print the line-change summary (`--dry-run`) or write
///             the cleaned text to `-o` or standard output.
int cmdClean(int argc, char **argv, const ToolContext &ctx)
{
    if (argc < 1)
    {
        usage(ctx.err);
        return 1;
    }
    const std::string inFile = argv[0];
    std::string outFile;
    bool dryRun = false;
    bool tablesOnly = ctx.config.sanitize.tables_only;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "-o" && i + 1 < argc)
        {
            outFile = argv[++i];
        }
        else if (arg == "--dry-run")
        {
            dryRun = true;
        }
        else if (arg == "--tables-only")
        {
            tablesOnly = true;
        }
        else
        {
            ctx.err << "unknown clean option: " << arg << "\n";
            usage(ctx.err);
            return 1;
        }
    }

    auto doc = common::loadDocument(inFile, ctx.sm);
    if (!doc)
    {
        support::printDiag(doc.error(), ctx.err, &ctx.sm);
        return 1;
    }

    const auto mode = tablesOnly ? latex::SanitizeMode::TablesOnly : latex::SanitizeMode::Full;
    const std::string cleaned =
        latex::sanitizeDocument(doc.value().text(), latex::defaultSanitizerTables(), mode);

    if (dryRun)
    {
        printLineChanges(doc.value().text(), cleaned, ctx.out);
        return 0;
    }

    if (!writeOutput(cleaned, outFile, ctx))
        return 1;
    if (!outFile.empty())
        ctx.err << "Cleaned file written to " << outFile << "\n";
    return 0;
}

} // namespace texguard::tools
