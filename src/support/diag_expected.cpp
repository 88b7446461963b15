//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.cpp
// Purpose: Out-of-line parts of Expected<void> and the diagnostic printer
//          every command writes its findings through.
// Key invariants: Each printed diagnostic is exactly one line.
// Ownership/Lifetime: Stateless.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

#include "support/source_manager.hpp"

namespace texguard::support
{
Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

const Diag &Expected<void>::error() const &
{
    return *error_;
}

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.isValid())
    {
        const std::string_view path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.hasLine())
            {
                os << ':' << diag.loc.line;
                if (diag.loc.hasColumn())
                    os << ':' << diag.loc.column;
            }
            os << ": ";
        }
    }
    os << severityName(diag.severity) << ": ";
    if (!diag.code.empty())
        os << '[' << diag.code << "] ";
    os << diag.message << '\n';
}
} // namespace texguard::support
