//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Standardise how texguard commands read documents and logs.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned LoadedSource owns its buffer.
// Links: src/tools/common/source_loader.hpp, docs/codemap.md#tools
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Provides file loading helpers for the texguard subcommands.
/// @details Every command reads its inputs through this unit so size limits,
///          encoding repair and SourceManager registration behave the same.

#include "tools/common/source_loader.hpp"

#include "support/utf8.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace texguard::tools::common
{

support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                 support::SourceManager &sm,
                                                 support::SourceRole role)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return support::Expected<LoadedSource>(
            support::Diagnostic{support::Severity::Error, "unable to open " + path, {}, {}});
    }
    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(256ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
    {
        return support::Expected<LoadedSource>(
            support::Diagnostic{support::Severity::Error,
                                "source file too large: " + path + " (limit: 256 MB)",
                                {},
                                {}});
    }

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return support::Expected<LoadedSource>(support::Diagnostic{
            support::Severity::Error, "out of memory reading " + path, {}, {}});
    }

    auto fileId = sm.addFile(path, role);
    if (!fileId)
        return support::Expected<LoadedSource>(fileId.error());

    LoadedSource source{};
    source.buffer = support::repairUtf8(contents, &source.replacements);
    source.fileId = fileId.value();
    return support::Expected<LoadedSource>(std::move(source));
}

support::Expected<latex::SourceDocument> loadDocument(const std::string &path,
                                                      support::SourceManager &sm,
                                                      support::SourceRole role)
{
    auto loaded = loadSourceBuffer(path, sm, role);
    if (!loaded)
        return support::Expected<latex::SourceDocument>(loaded.error());
    LoadedSource &source = loaded.value();
    return support::Expected<latex::SourceDocument>(
        latex::SourceDocument(std::move(source.buffer), path, source.fileId));
}

} // namespace texguard::tools::common
