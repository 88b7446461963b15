//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Path normalization and id assignment for the files a run registers. The
// id map keys are views of the paths the deque stores.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <limits>

namespace texguard::support
{
namespace
{
std::string normalizePath(std::string_view path)
{
    return std::filesystem::path(path).lexically_normal().generic_string();
}
} // namespace

std::string_view sourceRoleName(SourceRole role)
{
    switch (role)
    {
        case SourceRole::Document:
            return "document";
        case SourceRole::Input:
            return "input";
        case SourceRole::Log:
            return "log";
    }
    return "document";
}

Expected<uint32_t> SourceManager::addFile(std::string path, SourceRole role)
{
    std::string normalized = normalizePath(path);
    if (auto it = ids_.find(normalized); it != ids_.end())
        return Expected<uint32_t>(it->second);

    if (files_.size() >= std::numeric_limits<uint32_t>::max())
    {
        return Expected<uint32_t>(
            makeError({}, "too many source files; cannot register " + normalized));
    }

    files_.push_back(Entry{std::move(normalized), role});
    const auto file_id = static_cast<uint32_t>(files_.size());
    ids_.emplace(files_.back().path, file_id);
    return Expected<uint32_t>(file_id);
}

const SourceManager::Entry *SourceManager::entry(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return nullptr;
    return &files_[file_id - 1];
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    const Entry *e = entry(file_id);
    return e ? std::string_view(e->path) : std::string_view{};
}

std::optional<SourceRole> SourceManager::roleOf(uint32_t file_id) const
{
    if (const Entry *e = entry(file_id))
        return e->role;
    return std::nullopt;
}

uint32_t SourceManager::findFile(std::string_view path) const
{
    const auto it = ids_.find(normalizePath(path));
    return it == ids_.end() ? 0 : it->second;
}

std::size_t SourceManager::countRole(SourceRole role) const
{
    return static_cast<std::size_t>(std::count_if(
        files_.begin(), files_.end(), [role](const Entry &e) { return e.role == role; }));
}

} // namespace texguard::support
