//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/TextEdit.hpp
// Purpose: Span-checked text edits used by the repair passes.
// Key invariants: Accepted edits never overlap and never change a byte of a
//                 protected span. Offsets refer to the text the builder was
//                 created for; edits are applied back to front.
// Ownership/Lifetime: The builder borrows the text and its segmentation; both
//                     must outlive it.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "latex/Span.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace texguard::latex
{

/// @brief Replace @c length bytes at @c offset with @c replacement.
struct TextEdit
{
    std::size_t offset = 0;
    std::size_t length = 0; ///< Zero for a pure insertion.
    std::string replacement;
};

/// @brief Collects the edits of one repair pass.
class EditBuilder
{
  public:
    EditBuilder(std::string_view text, const SpanList &spans);

    /// @brief True when [offset, offset + length) lies inside one Plain span.
    /// @details A zero-length range is accepted inside a Plain span or at any
    ///          span boundary, since inserting there leaves every existing
    ///          span's bytes intact.
    [[nodiscard]] bool canReplace(std::size_t offset, std::size_t length) const;

    /// @brief True when the range is replaceable and overlaps no earlier edit.
    [[nodiscard]] bool accepts(std::size_t offset, std::size_t length) const;

    /// @brief Record a replacement.
    /// @return False when the edit was refused.
    bool replace(std::size_t offset, std::size_t length, std::string replacement);

    /// @brief Insert @p prefix at the line start @p lineStart.
    /// @details Besides Plain text, the line may start inside a figure
    ///          environment: only bytes are added, none are changed.
    /// @return False when @p lineStart is not a line start or the insertion
    ///         would land inside another protected span.
    bool insertLinePrefix(std::size_t lineStart, std::string prefix);

    [[nodiscard]] bool empty() const
    {
        return edits_.empty();
    }

    [[nodiscard]] const std::vector<TextEdit> &edits() const
    {
        return edits_;
    }

    /// @brief Text with every recorded edit applied.
    [[nodiscard]] std::string apply() const;

  private:
    bool overlaps(std::size_t offset, std::size_t length) const;

    std::string_view text_;
    const SpanList &spans_;
    std::vector<TextEdit> edits_;
};

} // namespace texguard::latex
