//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/InputExpansion.hpp
// Purpose: Locate \input directives and splice included files into a single
//          text whose offsets map back to the file they came from.
// Key invariants: Expansion is one level deep; directives inside included
//                 files stay verbatim. Pieces cover the expanded text in
//                 order without gaps.
// Ownership/Lifetime: ExpandedDocument borrows every SourceDocument it was
//                     built from; they must outlive it.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "latex/Document.hpp"
#include "latex/Issue.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace texguard::latex
{

/// @brief One `\input{name}` directive of a document.
struct InputDirective
{
    std::string name;      ///< Argument as written.
    std::size_t start = 0; ///< Offset of the backslash.
    std::size_t end = 0;   ///< One past the closing brace.
};

/// @brief Directives outside comments and command definitions, in order.
std::vector<InputDirective> findInputDirectives(std::string_view text);

/// @brief File name an `\input` argument refers to; `.tex` is appended when
///        the argument does not already end with it.
std::string inputFileName(std::string_view name);

/// @brief A directive paired with the document that replaces it.
struct Inclusion
{
    InputDirective directive;
    const SourceDocument *document = nullptr; ///< Null keeps the directive.
};

/// @brief Main document text with resolved `\input` directives spliced in.
class ExpandedDocument
{
  public:
    /// @brief Where an offset of the expanded text came from.
    struct Origin
    {
        const SourceDocument *document;
        std::size_t offset;
    };

    /// @param inclusions Directives of @p main in document order.
    ExpandedDocument(const SourceDocument &main, const std::vector<Inclusion> &inclusions);

    [[nodiscard]] std::string_view text() const
    {
        return text_;
    }

    /// @brief Number of files spliced in.
    [[nodiscard]] std::size_t includedCount() const
    {
        return included_;
    }

    /// @brief Document and local offset of expanded @p offset.
    /// @details Offsets past the end map to the end of the last piece.
    [[nodiscard]] Origin origin(std::size_t offset) const;

    /// @brief Copy of @p issue with its offset rebased onto its origin.
    /// @return The issue and the document its offset now refers to; issues
    ///         without an offset are attributed to the main document.
    [[nodiscard]] std::pair<Issue, const SourceDocument *> localize(const Issue &issue) const;

  private:
    struct Piece
    {
        std::size_t start;             ///< Offset in text_.
        const SourceDocument *document;
        std::size_t sourceStart;       ///< Offset in the document.
    };

    void append(const SourceDocument &doc, std::size_t from, std::size_t to);

    const SourceDocument &main_;
    std::string text_;
    std::vector<Piece> pieces_;
    std::size_t included_ = 0;
};

} // namespace texguard::latex
