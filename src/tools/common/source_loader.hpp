//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Shared helpers for loading LaTeX sources and compiler logs.
// Key invariants: Loaded text is well-formed UTF-8; malformed byte sequences
//                 are replaced with U+FFFD rather than rejected.
// Ownership/Lifetime: The caller owns the returned values.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "latex/Document.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace texguard::tools::common
{

/// @brief Result of loading a text file into memory.
struct LoadedSource
{
    std::string buffer;          ///< UTF-8 contents after replacement decoding.
    uint32_t fileId{0};          ///< Identifier assigned by SourceManager.
    std::size_t replacements{0}; ///< Number of U+FFFD substitutions made.
};

/// @brief Load @p path, repair its encoding and register it with @p sm.
/// @return Loaded buffer, or a diagnostic for I/O failures, oversized files
///         and SourceManager overflow.
support::Expected<LoadedSource> loadSourceBuffer(
    const std::string &path,
    support::SourceManager &sm,
    support::SourceRole role = support::SourceRole::Document);

/// @brief Load @p path as a SourceDocument.
support::Expected<latex::SourceDocument> loadDocument(
    const std::string &path,
    support::SourceManager &sm,
    support::SourceRole role = support::SourceRole::Document);

} // namespace texguard::tools::common
