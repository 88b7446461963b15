//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/config.cpp
// Purpose: INI-like configuration loader for the [repair] and [sanitize]
//          sections.
// Ownership/Lifetime: The loader does not own external resources beyond the
//                     file path it reads.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "tools/common/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace texguard::tools::config
{

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string to_lower(std::string s)
{
    std::transform(
        s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool parse_bool(const std::string &s, bool &out)
{
    const std::string lower = to_lower(s);
    if (lower == "1" || lower == "true" || lower == "yes")
    {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no")
    {
        out = false;
        return true;
    }
    return false;
}

std::vector<std::string> parse_list(const std::string &s)
{
    std::vector<std::string> items;
    std::stringstream ss(s);
    std::string token;
    while (std::getline(ss, token, ','))
    {
        token = trim(token);
        if (!token.empty())
        {
            items.push_back(token);
        }
    }
    return items;
}

} // namespace

bool parse_rounds(const std::string &s, unsigned &out)
{
    try
    {
        size_t parsed = 0;
        const unsigned long value = std::stoul(s, &parsed);
        if (parsed != s.size() || value == 0 || value > 100)
        {
            return false;
        }
        out = static_cast<unsigned>(value);
        return true;
    }
    catch (const std::invalid_argument &)
    {
        return false;
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
}

bool loadFromFile(const std::string &path, Config &out)
{
    std::ifstream in(path);
    if (!in)
    {
        return false;
    }
    Config cfg = out;
    std::string line;
    std::string section;
    while (std::getline(in, line))
    {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = to_lower(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        const std::string key = to_lower(trim(trimmed.substr(0, eq)));
        const std::string value = trim(trimmed.substr(eq + 1));

        if (section == "repair")
        {
            if (key == "max_rounds")
            {
                unsigned rounds = 0;
                if (parse_rounds(value, rounds))
                    cfg.repair.max_rounds = rounds;
            }
            else if (key == "image_extensions")
            {
                auto exts = parse_list(value);
                if (!exts.empty())
                    cfg.repair.image_extensions = std::move(exts);
            }
            else if (key == "missing_figure_marker")
            {
                // Trimming drops the separator; the marker is always followed
                // by one space.
                if (!value.empty())
                    cfg.repair.missing_figure_marker = value + " ";
            }
        }
        else if (section == "sanitize")
        {
            if (key == "tables_only")
            {
                bool flag = false;
                if (parse_bool(value, flag))
                    cfg.sanitize.tables_only = flag;
            }
        }
    }
    out = std::move(cfg);
    return true;
}

latex::RepairOptions repairOptions(const Config &cfg)
{
    latex::RepairOptions opts;
    opts.imageExtensions = cfg.repair.image_extensions;
    opts.missingFigureMarker = cfg.repair.missing_figure_marker;
    return opts;
}

} // namespace texguard::tools::config
