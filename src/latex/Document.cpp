//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/Document.cpp
// Purpose: Line indexing and location lookup for SourceDocument.
// Key invariants: lineStarts_ is sorted and starts with 0.
// Ownership/Lifetime: See Document.hpp.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/Document.hpp"

#include "support/utf8.hpp"

#include <algorithm>

namespace texguard::latex
{

SourceDocument::SourceDocument(std::string text, std::string path, uint32_t fileId)
    : text_(std::move(text)), path_(std::move(path)), fileId_(fileId)
{
    lineStarts_.push_back(0);
    for (std::size_t i = 0; i < text_.size(); ++i)
    {
        if (text_[i] == '\n' && i + 1 < text_.size())
            lineStarts_.push_back(i + 1);
    }
}

std::size_t SourceDocument::codePointCount() const
{
    return support::countCodePoints(text_);
}

std::filesystem::path SourceDocument::directory() const
{
    if (path_.empty())
        return std::filesystem::current_path();
    std::filesystem::path dir = std::filesystem::absolute(path_).parent_path();
    return dir;
}

support::SourceLoc SourceDocument::locate(std::size_t offset) const
{
    offset = std::min(offset, text_.size());
    auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
    const auto lineIndex = static_cast<std::size_t>(std::distance(lineStarts_.begin(), it)) - 1;
    support::SourceLoc loc;
    loc.file_id = fileId_;
    loc.line = static_cast<uint32_t>(lineIndex + 1);
    loc.column = static_cast<uint32_t>(offset - lineStarts_[lineIndex] + 1);
    return loc;
}

} // namespace texguard::latex
