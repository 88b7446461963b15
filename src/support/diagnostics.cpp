//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.cpp
// Purpose: Severity names and the collecting diagnostic engine.
// Key invariants: counts_ is indexed by the Severity enumerator value.
// Ownership/Lifetime: See diagnostics.hpp.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"

namespace texguard::support
{

std::string_view severityName(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}

void DiagnosticEngine::report(Diagnostic d)
{
    ++counts_[static_cast<size_t>(d.severity)];
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

size_t DiagnosticEngine::count(Severity severity) const
{
    return counts_[static_cast<size_t>(severity)];
}

} // namespace texguard::support
