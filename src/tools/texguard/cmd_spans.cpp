//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `texguard spans` subcommand, a debugging aid that prints the
// region segmentation as `start:end kind [name]` lines.
//
//===----------------------------------------------------------------------===//

#include "tools/texguard/cli.hpp"

#include "latex/Segmenter.hpp"
#include "support/diag_expected.hpp"
#include "tools/common/source_loader.hpp"

#include <ostream>

namespace texguard::tools
{

int cmdSpans(int argc, char **argv, const ToolContext &ctx)
{
    if (argc != 1)
    {
        usage(ctx.err);
        return 1;
    }

    auto doc = common::loadDocument(argv[0], ctx.sm);
    if (!doc)
    {
        support::printDiag(doc.error(), ctx.err, &ctx.sm);
        return 1;
    }

    const std::string_view text = doc.value().text();
    const latex::SpanList spans = latex::segment(text);
    if (auto ok = latex::checkPartition(spans, text.size()); !ok)
    {
        support::printDiag(ok.error(), ctx.err, &ctx.sm);
        return 1;
    }

    for (const auto &span : spans)
    {
        ctx.out << span.start << ':' << span.end << ' ' << latex::spanKindName(span.kind);
        if (!span.name.empty())
            ctx.out << ' ' << span.name;
        ctx.out << '\n';
    }
    return 0;
}

} // namespace texguard::tools
