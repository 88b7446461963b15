//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Diagnostic records shared by every texguard component and the
//          engine the commands use to collect and print them.
// Key invariants: Per-severity counters always equal the number of stored
//                 diagnostics of that severity.
// Ownership/Lifetime: The engine owns the diagnostics reported to it.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace texguard::support
{

class SourceManager;

/// @brief How serious a finding is. Notes never fail a command.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Lowercase spelling used when printing, e.g. "warning".
std::string_view severityName(Severity severity);

/// @brief One message with an optional location and short code.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
    std::string code{};  ///< Optional short tag printed as "[code]"
};

/// @brief Collects diagnostics in report order and counts them by severity.
class DiagnosticEngine
{
  public:
    void report(Diagnostic d);

    /// @brief Print every stored diagnostic with printDiag().
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    size_t count(Severity severity) const;

    size_t errorCount() const
    {
        return count(Severity::Error);
    }

    size_t warningCount() const
    {
        return count(Severity::Warning);
    }

    size_t noteCount() const
    {
        return count(Severity::Note);
    }

    [[nodiscard]] bool hasErrors() const
    {
        return errorCount() != 0;
    }

  private:
    std::vector<Diagnostic> diags_;
    std::array<size_t, 3> counts_{};
};
} // namespace texguard::support
