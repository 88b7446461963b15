//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/utf8.cpp
// Purpose: Decode-with-replacement for documents read from disk.
// Key invariants: Follows the "maximal subpart" replacement practice so a
//                 truncated multi-byte sequence yields exactly one U+FFFD.
// Ownership/Lifetime: Returns freshly allocated strings.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "support/utf8.hpp"

namespace texguard::support
{
namespace
{
/// @brief Expected sequence length for lead byte @p b, 0 when @p b cannot lead.
std::size_t leadLength(unsigned char b)
{
    if (b < 0x80)
        return 1;
    if (b >= 0xC2 && b <= 0xDF)
        return 2;
    if (b >= 0xE0 && b <= 0xEF)
        return 3;
    if (b >= 0xF0 && b <= 0xF4)
        return 4;
    return 0;
}

/// @brief Valid range of the byte following lead byte @p lead.
void secondByteRange(unsigned char lead, unsigned char &lo, unsigned char &hi)
{
    lo = 0x80;
    hi = 0xBF;
    if (lead == 0xE0)
        lo = 0xA0;
    else if (lead == 0xED)
        hi = 0x9F;
    else if (lead == 0xF0)
        lo = 0x90;
    else if (lead == 0xF4)
        hi = 0x8F;
}

/// @brief Number of bytes of the sequence at @p pos that are well formed.
/// @details Returns the full length for a valid sequence; otherwise the length
///          of the valid prefix (at least 1) and sets @p valid to false.
std::size_t scanSequence(std::string_view text, std::size_t pos, bool &valid)
{
    const auto lead = static_cast<unsigned char>(text[pos]);
    const std::size_t need = leadLength(lead);
    valid = need != 0;
    if (need <= 1)
        return 1;

    for (std::size_t k = 1; k < need; ++k)
    {
        if (pos + k >= text.size())
        {
            valid = false;
            return k;
        }
        const auto c = static_cast<unsigned char>(text[pos + k]);
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (k == 1)
            secondByteRange(lead, lo, hi);
        if (c < lo || c > hi)
        {
            valid = false;
            return k;
        }
    }
    return need;
}
} // namespace

std::string repairUtf8(std::string_view bytes, std::size_t *replaced)
{
    std::string out;
    out.reserve(bytes.size());
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < bytes.size())
    {
        bool valid = true;
        const std::size_t len = scanSequence(bytes, pos, valid);
        if (valid)
        {
            out.append(bytes.substr(pos, len));
        }
        else
        {
            out.append(kReplacementChar);
            ++count;
        }
        pos += len;
    }
    if (replaced)
        *replaced = count;
    return out;
}

std::size_t countCodePoints(std::string_view text)
{
    std::size_t n = 0;
    for (char ch : text)
    {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80)
            ++n;
    }
    return n;
}

} // namespace texguard::support
