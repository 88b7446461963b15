//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/Sanitizer.hpp
// Purpose: Character-level escaping of plain prose and tabular cell content.
// Key invariants: Bytes of protected spans are copied verbatim. Keys already
//                 preceded by an escaping backslash are left alone, so
//                 sanitizing twice equals sanitizing once.
// Ownership/Lifetime: Pure functions; results are freshly allocated strings.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "latex/Span.hpp"
#include "latex/SubstitutionTable.hpp"

#include <string>
#include <string_view>

namespace texguard::latex
{

/// @brief Where a plain span lives, which selects the escape table.
enum class SanitizeContext
{
    General,   ///< Running prose.
    TableCell, ///< Body of a tabular environment.
};

/// @brief Scope of a whole-document sanitization.
enum class SanitizeMode
{
    Full,       ///< Non-ASCII pass, prose escaping and tabular cells.
    TablesOnly, ///< Tabular cell bodies only.
};

/// @brief Replace every occurrence of a key of @p table regardless of context.
std::string normalizeNonAscii(std::string_view text, const SubstitutionTable &table);

/// @brief Escape unescaped special characters using the general table.
std::string escapePlain(std::string_view text, const SanitizerTables &tables);

/// @brief Escape unescaped characters using the reduced table-cell table.
std::string escapeTableCell(std::string_view text, const SanitizerTables &tables);

/// @brief Sanitize one span of @p text.
/// @return Escaped text for Plain spans, the original bytes otherwise.
std::string sanitizeSpan(std::string_view text,
                         const Span &span,
                         SanitizeContext context,
                         const SanitizerTables &tables);

/// @brief Sanitize a complete document.
///
/// In Full mode the non-ASCII table is applied to the whole text first; the
/// result is then segmented and each Plain span escaped. Tabular environments
/// keep their delimiters and column specification while the Plain parts of
/// their body receive the table-cell table.
std::string sanitizeDocument(std::string_view text,
                             const SanitizerTables &tables,
                             SanitizeMode mode = SanitizeMode::Full);

} // namespace texguard::latex
