//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/TextScan.hpp
// Purpose: Low-level scanning primitives shared by the segmenter, sanitizer,
//          balance validator and repair passes.
// Key invariants: Every helper is bounds-checked and returns std::nullopt
//                 instead of reading past the end of the text.
// Ownership/Lifetime: Stateless free functions over borrowed text.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace texguard::latex
{

/// @brief Role of an environment delimiter token.
enum class DelimiterRole
{
    Begin,
    End
};

/// @brief A parsed `\begin{name}` or `\end{name}` token.
struct EnvironmentToken
{
    DelimiterRole role;
    std::string_view name;
    std::size_t start; ///< Offset of the backslash.
    std::size_t end;   ///< One past the closing brace.
};

/// @brief True when the character at @p pos is preceded by an odd number of
///        backslashes and therefore taken literally by TeX.
bool isEscaped(std::string_view text, std::size_t pos);

/// @brief Letters of the control word starting at @p pos (which must hold a
///        backslash), e.g. "newcommand" for `\newcommand*`.
/// @return Empty view when @p pos does not start a control word.
std::string_view controlWordAt(std::string_view text, std::size_t pos);

/// @brief End of the `{...}` group at @p pos with at most @p maxNesting
///        levels of inner braces. Escaped braces are literal.
/// @return One past the closing brace, or nullopt when unterminated or nested
///         deeper than allowed.
std::optional<std::size_t> braceGroupEnd(std::string_view text,
                                         std::size_t pos,
                                         int maxNesting);

/// @brief End of a flat group: @p open at @p pos up to the first @p close.
/// @details Mirrors a `\{[^}]*\}` pattern: the body may contain anything but
///          @p close, newlines included.
std::optional<std::size_t> flatGroupEnd(std::string_view text,
                                        std::size_t pos,
                                        char open,
                                        char close);

/// @brief Parse an environment delimiter at @p pos.
/// @details Names consist of letters, digits, `_`, `@` and `*`. The
///          backslash must not itself be escaped.
std::optional<EnvironmentToken> environmentTokenAt(std::string_view text, std::size_t pos);

/// @brief Offset of the nearest unescaped `\end{name}` at or after @p from.
std::optional<EnvironmentToken> findEnvironmentEnd(std::string_view text,
                                                   std::string_view name,
                                                   std::size_t from);

/// @brief True for `tabular` and `tabular*`.
bool isTabularEnvironment(std::string_view name);

/// @brief True for `figure` and `figure*`.
bool isFigureEnvironment(std::string_view name);

/// @brief Case-insensitive ASCII prefix test of @p text at @p pos.
bool startsWithNoCase(std::string_view text, std::size_t pos, std::string_view prefix);

} // namespace texguard::latex
