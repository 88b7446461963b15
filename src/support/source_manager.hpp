//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Registry of the files a texguard run reads, with their roles.
// Key invariants: File id 0 is invalid; a normalized path has one id.
// Ownership/Lifetime: The manager owns its path strings.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace texguard::support
{

/// @brief What a registered file is to the run.
enum class SourceRole
{
    Document, ///< A .tex file named on the command line.
    Input,    ///< A file pulled in by `\input` from a document.
    Log,      ///< A compiler log.
};

/// @brief Lower-case role name, e.g. "log".
std::string_view sourceRoleName(SourceRole role);

/// @brief Path registry for diagnostics.
///
/// Issues carry a file id; the printer asks the manager for the path. Ids
/// start at 1 and are handed out in registration order.
class SourceManager
{
  public:
    /// @brief Register @p path under @p role.
    /// @details The path is normalized lexically. Registering a path again
    ///          returns its first id and keeps its first role.
    /// @return The id, or an error once the 32-bit id space is exhausted.
    Expected<uint32_t> addFile(std::string path, SourceRole role = SourceRole::Document);

    /// @brief Normalized path of @p file_id, empty for unknown ids.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Role of @p file_id, nullopt for unknown ids.
    std::optional<SourceRole> roleOf(uint32_t file_id) const;

    /// @brief Id of a registered path, 0 when the path is unknown.
    uint32_t findFile(std::string_view path) const;

    /// @brief Number of files registered under @p role.
    std::size_t countRole(SourceRole role) const;

    std::size_t fileCount() const
    {
        return files_.size();
    }

  private:
    struct Entry
    {
        std::string path;
        SourceRole role;
    };

    const Entry *entry(uint32_t file_id) const;

    /// Index i holds id i + 1; a deque keeps the keyed strings in place.
    std::deque<Entry> files_;
    std::unordered_map<std::string_view, uint32_t> ids_;
};

} // namespace texguard::support
