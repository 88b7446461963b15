//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/latex/TextScan.cpp
// Purpose: Implements the shared scanning primitives.
// Key invariants: See TextScan.hpp.
// Ownership/Lifetime: Stateless.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "latex/TextScan.hpp"

#include <cctype>

namespace texguard::latex
{
namespace
{
bool isAsciiLetter(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isEnvironmentNameChar(char c)
{
    return isAsciiLetter(c) || (c >= '0' && c <= '9') || c == '_' || c == '@' || c == '*';
}
} // namespace

bool isEscaped(std::string_view text, std::size_t pos)
{
    std::size_t count = 0;
    while (pos > 0 && text[pos - 1] == '\\')
    {
        ++count;
        --pos;
    }
    return (count % 2) == 1;
}

std::string_view controlWordAt(std::string_view text, std::size_t pos)
{
    if (pos >= text.size() || text[pos] != '\\')
        return {};
    std::size_t end = pos + 1;
    while (end < text.size() && isAsciiLetter(text[end]))
        ++end;
    return text.substr(pos + 1, end - pos - 1);
}

std::optional<std::size_t> braceGroupEnd(std::string_view text, std::size_t pos, int maxNesting)
{
    if (pos >= text.size() || text[pos] != '{')
        return std::nullopt;

    int depth = 0;
    for (std::size_t i = pos + 1; i < text.size(); ++i)
    {
        const char c = text[i];
        if (c == '\\')
        {
            ++i; // control symbol; `\{` and `\}` are literal
            continue;
        }
        if (c == '{')
        {
            if (++depth > maxNesting)
                return std::nullopt;
        }
        else if (c == '}')
        {
            if (depth == 0)
                return i + 1;
            --depth;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> flatGroupEnd(std::string_view text,
                                        std::size_t pos,
                                        char open,
                                        char close)
{
    if (pos >= text.size() || text[pos] != open)
        return std::nullopt;
    const std::size_t closer = text.find(close, pos + 1);
    if (closer == std::string_view::npos)
        return std::nullopt;
    return closer + 1;
}

std::optional<EnvironmentToken> environmentTokenAt(std::string_view text, std::size_t pos)
{
    const std::string_view word = controlWordAt(text, pos);
    DelimiterRole role;
    if (word == "begin")
        role = DelimiterRole::Begin;
    else if (word == "end")
        role = DelimiterRole::End;
    else
        return std::nullopt;
    if (isEscaped(text, pos))
        return std::nullopt;

    std::size_t p = pos + 1 + word.size();
    if (p >= text.size() || text[p] != '{')
        return std::nullopt;
    const std::size_t nameStart = ++p;
    while (p < text.size() && isEnvironmentNameChar(text[p]))
        ++p;
    if (p == nameStart || p >= text.size() || text[p] != '}')
        return std::nullopt;

    return EnvironmentToken{role, text.substr(nameStart, p - nameStart), pos, p + 1};
}

std::optional<EnvironmentToken> findEnvironmentEnd(std::string_view text,
                                                   std::string_view name,
                                                   std::size_t from)
{
    std::size_t pos = from;
    while ((pos = text.find("\\end{", pos)) != std::string_view::npos)
    {
        if (auto tok = environmentTokenAt(text, pos); tok && tok->name == name)
            return tok;
        ++pos;
    }
    return std::nullopt;
}

bool isTabularEnvironment(std::string_view name)
{
    return name == "tabular" || name == "tabular*";
}

bool isFigureEnvironment(std::string_view name)
{
    return name == "figure" || name == "figure*";
}

bool startsWithNoCase(std::string_view text, std::size_t pos, std::string_view prefix)
{
    if (pos > text.size() || text.size() - pos < prefix.size())
        return false;
    for (std::size_t i = 0; i < prefix.size(); ++i)
    {
        const auto a = static_cast<unsigned char>(text[pos + i]);
        const auto b = static_cast<unsigned char>(prefix[i]);
        if (std::tolower(a) != std::tolower(b))
            return false;
    }
    return true;
}

} // namespace texguard::latex
