//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/SubstitutionTable.hpp
// Purpose: Immutable key -> replacement tables used by the sanitizer.
// Key invariants: Entries are ordered longest key first so a lookup at a
//                 position always picks the longest matching key. Keys are
//                 non-empty UTF-8 strings.
// Ownership/Lifetime: Tables own their strings. The default tables are built
//                     once and handed out by const reference.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace texguard::latex
{

/// @brief Ordered mapping from literal keys to replacement markup.
class SubstitutionTable
{
  public:
    struct Entry
    {
        std::string key;
        std::string replacement;
    };

    SubstitutionTable() = default;

    /// @brief Build a table from @p entries; empty keys are dropped.
    /// @details Later duplicates of a key are ignored.
    explicit SubstitutionTable(std::vector<Entry> entries);

    SubstitutionTable(std::initializer_list<std::pair<std::string_view, std::string_view>> entries);

    /// @brief Longest entry whose key occurs in @p text at @p pos.
    /// @return Pointer to the entry or nullptr when no key matches.
    [[nodiscard]] const Entry *matchAt(std::string_view text, std::size_t pos) const;

    /// @brief Replacement registered for @p key, or nullptr.
    [[nodiscard]] const std::string *lookup(std::string_view key) const;

    [[nodiscard]] const std::vector<Entry> &entries() const
    {
        return entries_;
    }

    [[nodiscard]] std::size_t size() const
    {
        return entries_.size();
    }

    [[nodiscard]] bool empty() const
    {
        return entries_.empty();
    }

  private:
    void normalize();

    std::vector<Entry> entries_;
};

/// @brief The three tables the sanitizer consults.
struct SanitizerTables
{
    SubstitutionTable nonAscii;  ///< Typographic and accented characters.
    SubstitutionTable special;   ///< Characters TeX treats specially in prose.
    SubstitutionTable tableCell; ///< Reduced set safe inside tabular cells.
};

/// @brief Built-in tables, constructed on first use.
const SanitizerTables &defaultSanitizerTables();

} // namespace texguard::latex
