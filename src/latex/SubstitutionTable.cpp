//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/SubstitutionTable.cpp
// Purpose: Table construction, longest-key lookup and the built-in tables.
// Key invariants: normalize() leaves entries sorted by descending key length
//                 with ties kept in insertion order.
// Ownership/Lifetime: defaultSanitizerTables() owns a function-local static.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/SubstitutionTable.hpp"

#include <algorithm>
#include <unordered_set>

namespace texguard::latex
{

SubstitutionTable::SubstitutionTable(std::vector<Entry> entries) : entries_(std::move(entries))
{
    normalize();
}

SubstitutionTable::SubstitutionTable(
    std::initializer_list<std::pair<std::string_view, std::string_view>> entries)
{
    entries_.reserve(entries.size());
    for (const auto &[key, replacement] : entries)
        entries_.push_back(Entry{std::string(key), std::string(replacement)});
    normalize();
}

void SubstitutionTable::normalize()
{
    std::unordered_set<std::string> seen;
    std::vector<Entry> unique;
    unique.reserve(entries_.size());
    for (auto &e : entries_)
    {
        if (e.key.empty() || !seen.insert(e.key).second)
            continue;
        unique.push_back(std::move(e));
    }
    std::stable_sort(unique.begin(),
                     unique.end(),
                     [](const Entry &a, const Entry &b) { return a.key.size() > b.key.size(); });
    entries_ = std::move(unique);
}

const SubstitutionTable::Entry *SubstitutionTable::matchAt(std::string_view text,
                                                           std::size_t pos) const
{
    if (pos >= text.size())
        return nullptr;
    for (const auto &e : entries_)
    {
        if (text.compare(pos, e.key.size(), e.key) == 0)
            return &e;
    }
    return nullptr;
}

const std::string *SubstitutionTable::lookup(std::string_view key) const
{
    for (const auto &e : entries_)
    {
        if (e.key == key)
            return &e.replacement;
    }
    return nullptr;
}

namespace
{

SanitizerTables buildDefaultTables()
{
    SanitizerTables tables;

    tables.nonAscii = SubstitutionTable{
        {"–", "--"},
        {"—", "---"},
        {"’", "'"},
        {"‘", "`"},
        {"“", "``"},
        {"”", "''"},
        {"²", "$^2$"},
        {"³", "$^3$"},
        {"¼", "$\\frac{1}{4}$"},
        {"½", "$\\frac{1}{2}$"},
        {"¾", "$\\frac{3}{4}$"},
        {"∆", "$\\Delta$"},
        {"∇", "$\\nabla$"},
        {"∂", "$\\partial$"},
        {"…", "\\ldots{}"},
        {"é", "\\'e"},
        {"è", "\\`e"},
        {"ü", "\\\"u"},
        {"ö", "\\\"o"},
        {"ä", "\\\"a"},
    };

    tables.special = SubstitutionTable{
        {"&", "\\&"},
        {"%", "\\%"},
        {"#", "\\#"},
        {"_", "\\_"},
        {"^", "\\textasciicircum{}"},
        {"<", "$<$"},
        {">", "$>$"},
        {"≤", "$\\leq$"},
        {"≥", "$\\geq$"},
        {"≠", "$\\neq$"},
        {"±", "$\\pm$"},
        {"×", "$\\times$"},
        {"÷", "$\\div$"},
        {"°", "$^{\\circ}$"},
        {"∞", "$\\infty$"},
        {"√", "$\\sqrt{}$"},
        {"∑", "$\\sum$"},
        {"∏", "$\\prod$"},
        {"|", "\\textbar{}"},
        {"∈", "$\\in$"},
        {"∉", "$\\notin$"},
        {"∀", "$\\forall$"},
        {"∃", "$\\exists$"},
        {"∅", "$\\emptyset$"},
        {"\xE2\x80\x8B", ""}, // zero-width space
        {"\xE2\x80\xAF", " "}, // narrow no-break space
    };

    tables.tableCell = SubstitutionTable{
        {">", "$>$"},
        {"<", "$<$"},
        {"=", "$=$"},
        {"|", "\\textbar{}"},
    };

    return tables;
}

} // namespace

const SanitizerTables &defaultSanitizerTables()
{
    static const SanitizerTables tables = buildDefaultTables();
    return tables;
}

} // namespace texguard::latex
