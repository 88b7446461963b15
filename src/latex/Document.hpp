//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/Document.hpp
// Purpose: Immutable LaTeX source text plus its origin and line index.
// Key invariants: Text is well-formed UTF-8 and never changes after
//                 construction; transformations produce new strings.
// Ownership/Lifetime: The document owns its text; views returned by text()
//                     live as long as the document.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace texguard::latex
{

/// @brief One input document (a .tex source or a compiler log).
class SourceDocument
{
  public:
    /// @brief Wrap @p text that originates from @p path.
    /// @param text UTF-8 text; callers repair malformed input before this.
    /// @param path Path the text was read from; empty for in-memory text.
    /// @param fileId SourceManager id of @p path, 0 when unregistered.
    explicit SourceDocument(std::string text, std::string path = {}, uint32_t fileId = 0);

    [[nodiscard]] std::string_view text() const
    {
        return text_;
    }

    /// @brief Length in bytes.
    [[nodiscard]] std::size_t size() const
    {
        return text_.size();
    }

    /// @brief Length in Unicode code points.
    [[nodiscard]] std::size_t codePointCount() const;

    [[nodiscard]] const std::string &path() const
    {
        return path_;
    }

    [[nodiscard]] uint32_t fileId() const
    {
        return fileId_;
    }

    /// @brief Directory containing the document; the working directory when
    ///        the document has no path.
    [[nodiscard]] std::filesystem::path directory() const;

    /// @brief Map byte @p offset to a 1-based line/column location.
    /// @details Columns count bytes. Offsets past the end map to the end.
    [[nodiscard]] support::SourceLoc locate(std::size_t offset) const;

    /// @brief Number of lines, counting a trailing partial line.
    [[nodiscard]] std::size_t lineCount() const
    {
        return lineStarts_.size();
    }

  private:
    std::string text_;
    std::string path_;
    uint32_t fileId_ = 0;
    std::vector<std::size_t> lineStarts_; ///< Byte offset of each line start.
};

} // namespace texguard::latex
