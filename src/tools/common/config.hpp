//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/config.hpp
// Purpose: INI-like configuration for the texguard command-line tool.
// Key invariants: Recognizes sections [repair] and [sanitize]; unknown
//                 sections and keys are ignored and malformed values leave
//                 the defaults in place.
// Ownership/Lifetime: Config is a plain value type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "latex/RepairEngine.hpp"

#include <string>
#include <vector>

namespace texguard::tools::config
{

/// @brief Settings of the `fix` command and the repair engine.
struct RepairSettings
{
    unsigned max_rounds = 3;
    std::vector<std::string> image_extensions{".png", ".pdf", ".jpg", ".jpeg", ".eps"};
    std::string missing_figure_marker = "% FIXME: missing file - ";
};

/// @brief Settings of the `clean` command.
struct SanitizeSettings
{
    bool tables_only = false;
};

/// @brief Complete tool configuration.
struct Config
{
    RepairSettings repair;
    SanitizeSettings sanitize;
};

/// @brief Load configuration from @p path into @p out.
/// @return False when the file cannot be opened; @p out is left untouched.
bool loadFromFile(const std::string &path, Config &out);

/// @brief Parse a repair round count in the range 1 to 100.
/// @return False for anything else; @p out is left untouched.
bool parse_rounds(const std::string &s, unsigned &out);

/// @brief Repair engine options derived from @p cfg.
latex::RepairOptions repairOptions(const Config &cfg);

} // namespace texguard::tools::config
