//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/utf8.hpp
// Purpose: UTF-8 validation helpers used when loading documents and logs.
// Key invariants: repairUtf8() output is always well-formed UTF-8.
// Ownership/Lifetime: Stateless free functions.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace texguard::support
{

/// @brief UTF-8 encoding of U+FFFD REPLACEMENT CHARACTER.
inline constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

/// @brief Replace every maximal ill-formed subsequence of @p bytes with U+FFFD.
/// @param bytes Raw file contents.
/// @param replaced Optional out-parameter receiving the number of replacements.
/// @return Well-formed UTF-8 text; identical to @p bytes when already valid.
std::string repairUtf8(std::string_view bytes, std::size_t *replaced = nullptr);

/// @brief Count code points in well-formed UTF-8 @p text.
std::size_t countCodePoints(std::string_view text);

} // namespace texguard::support
