//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `texguard check` subcommand. The document is expanded with
// the files its \input directives name, then checked for environment
// balance, leftover markers, missing sections and, on request, anything that
// breaks anonymous review.
//
//===----------------------------------------------------------------------===//

#include "tools/texguard/cli.hpp"

#include "latex/EnvironmentBalance.hpp"
#include "latex/InputExpansion.hpp"
#include "latex/SubmissionChecks.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/source_loader.hpp"

#include <algorithm>
#include <deque>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace texguard::tools
{
namespace
{

struct CheckOptions
{
    bool anonymization = false;
    bool stats = false;
    bool followInputs = true;
};

void printStats(const latex::ContentStats &stats, std::ostream &os)
{
    os << "Estimated word count: " << stats.words << "\n";
    os << "Sections: " << stats.sections.size() << "\n";
    for (const auto &section : stats.sections)
        os << "  - " << section.title << "\n";
    os << "Citations: " << stats.citations << "\n";
    os << "Figures: " << stats.figures << "\n";
    os << "Tables: " << stats.tables << "\n";
    os << "Equations: " << stats.equations << "\n";
}

bool blocksSuccess(const latex::Issue &issue)
{
    return issue.severity != support::Severity::Note;
}

} // namespace

int cmdCheck(int argc, char **argv, const ToolContext &ctx)
{
    if (argc < 1)
    {
        usage(ctx.err);
        return 1;
    }
    const std::string inFile = argv[0];
    CheckOptions opts;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--check-anon")
        {
            opts.anonymization = true;
        }
        else if (arg == "--venue" && i + 1 < argc)
        {
            const latex::VenueRules *venue = latex::findVenue(argv[++i]);
            if (!venue)
            {
                ctx.err << "unknown venue: " << argv[i] << "\n";
                return 1;
            }
            opts.anonymization = opts.anonymization || venue->anonymous;
        }
        else if (arg == "--stats")
        {
            opts.stats = true;
        }
        else if (arg == "--no-inputs")
        {
            opts.followInputs = false;
        }
        else
        {
            ctx.err << "unknown check option: " << arg << "\n";
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
    const latex::SourceDocument &source = doc.value();

    // Deque elements keep their address, which ExpandedDocument relies on.
    std::deque<latex::SourceDocument> included;
    std::vector<latex::Inclusion> inclusions;
    std::vector<latex::Issue> unresolved;
    if (opts.followInputs)
    {
        for (auto &directive : latex::findInputDirectives(source.text()))
        {
            const std::filesystem::path path =
                source.directory() / latex::inputFileName(directive.name);
            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
            {
                latex::Issue note;
                note.kind = latex::IssueKind::MissingFile;
                note.severity = support::Severity::Note;
                note.message = "input file " + path.generic_string() + " not found; not checked";
                note.offset = directive.start;
                unresolved.push_back(std::move(note));
                continue;
            }
            auto loaded = common::loadDocument(path.string(), ctx.sm, support::SourceRole::Input);
            if (!loaded)
            {
                support::printDiag(loaded.error(), ctx.err, &ctx.sm);
                return 1;
            }
            included.push_back(std::move(loaded.value()));
            inclusions.push_back(latex::Inclusion{std::move(directive), &included.back()});
        }
    }
    const latex::ExpandedDocument expanded(source, inclusions);
    const std::string_view text = expanded.text();

    std::vector<latex::Issue> issues = latex::checkDocument(text);
    for (auto &issue : latex::findTodoMarkers(text))
        issues.push_back(std::move(issue));
    if (latex::isStandaloneDocument(text))
    {
        for (auto &issue : latex::checkSections(text))
            issues.push_back(std::move(issue));
    }
    if (opts.anonymization)
    {
        for (auto &issue : latex::checkAnonymization(text))
            issues.push_back(std::move(issue));
    }

    latex::printIssues(unresolved, ctx.err, &ctx.sm, source.fileId(), &source);
    for (const auto &issue : issues)
    {
        const auto [local, origin] = expanded.localize(issue);
        support::printDiag(latex::issueToDiagnostic(local, origin->fileId(), origin), ctx.err, &ctx.sm);
    }

    if (opts.stats)
        printStats(latex::collectStats(text), ctx.out);

    if (std::any_of(issues.begin(), issues.end(), blocksSuccess))
        return 1;
    ctx.out << "OK\n";
    return 0;
}

} // namespace texguard::tools
