//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/Span.hpp
// Purpose: Span value type describing one region of a segmented document.
// Key invariants: A segmentation is sorted, contiguous, non-overlapping and
//                 covers [0, length) exactly; no span is empty.
// Ownership/Lifetime: Spans store offsets only and never own document text.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace texguard::latex
{

/// @brief Classification of a document region.
enum class SpanKind
{
    Plain,             ///< Prose eligible for character escaping.
    Comment,           ///< `%` to end of line.
    InlineMath,        ///< `$...$`.
    DisplayMath,       ///< `$$...$$`.
    DelimitedMath,     ///< `\(...\)` or `\[...\]`.
    Command,           ///< Skip command such as `\cite{...}` or `\url{...}`.
    NamedEnvironment,  ///< Allow-listed `\begin{name}...\end{name}`.
    CommandDefinition, ///< `\newcommand`, `\def` and friends.
};

/// @brief Half-open byte range [start, end) of a document with its kind.
struct Span
{
    std::size_t start = 0;
    std::size_t end = 0;
    SpanKind kind = SpanKind::Plain;
    std::string name{}; ///< Environment name for NamedEnvironment spans.

    [[nodiscard]] std::size_t length() const
    {
        return end - start;
    }

    /// @brief True for every kind whose bytes must survive sanitization.
    [[nodiscard]] bool isProtected() const
    {
        return kind != SpanKind::Plain;
    }

    [[nodiscard]] bool contains(std::size_t offset) const
    {
        return offset >= start && offset < end;
    }
};

using SpanList = std::vector<Span>;

/// @brief Stable lowercase name of @p kind, e.g. "inline-math".
std::string_view spanKindName(SpanKind kind);

/// @brief Text covered by @p span inside @p text.
std::string_view spanText(std::string_view text, const Span &span);

/// @brief Locate the span containing @p offset using binary search.
/// @return Pointer into @p spans, or nullptr when @p offset is past the end.
const Span *findSpanAt(const SpanList &spans, std::size_t offset);

/// @brief Verify that @p spans partition a document of @p length bytes.
/// @return Success, or a diagnostic naming the first violated condition.
support::Expected<void> checkPartition(const SpanList &spans, std::size_t length);

} // namespace texguard::latex
