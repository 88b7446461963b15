//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: latex/Segmenter.hpp
// Purpose: Partition LaTeX source into protected regions and plain prose.
//
// The segmenter is the first stage of every texguard pipeline:
//   Segmenter -> {Sanitizer, EnvironmentBalance} -> report
//   Segmenter -> RepairEngine passes -> re-validation
//
// At every offset not yet covered, an ordered table of matchers is tried and
// the first one that succeeds claims the region:
//   1. line comments
//   2. command definitions (\newcommand family, \def)
//   3. $$...$$, $...$, \(...\), \[...\]
//   4. allow-listed named environments (flat, not recursive)
//   5. skip commands (\cite, \ref, \label, \url, \href, ...)
// Bytes no matcher claims are merged into Plain spans. Unterminated
// constructs simply fail to match, so segmentation never fails.
//
// Key invariants: Output satisfies checkPartition() for the input length.
// Ownership/Lifetime: Borrows the text for the duration of run().
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "latex/Span.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace texguard::latex
{

/// @brief Names of the environments whose bodies are protected verbatim.
std::span<const std::string_view> protectedEnvironmentNames();

/// @brief True when @p name is in protectedEnvironmentNames().
bool isProtectedEnvironment(std::string_view name);

/// @brief Single-use scanner producing the span partition of one text.
class Segmenter
{
  public:
    /// @brief Create a segmenter over @p text. The text is not copied.
    explicit Segmenter(std::string_view text);

    /// @brief Scan the whole text and return the ordered span list.
    SpanList run();

  private:
    /// @brief A protected region recognised at some offset.
    struct Match
    {
        SpanKind kind;
        std::size_t end;
        std::string name;
    };

    /// @brief Try each matcher in priority order at @p pos.
    std::optional<Match> matchAt(std::size_t pos) const;

    /// @brief Flush pending plain bytes [plainStart_, upTo) into the output.
    void flushPlain(std::size_t upTo);

    std::string_view text_;
    SpanList spans_;
    std::size_t plainStart_ = 0;
};

/// @brief Convenience wrapper: Segmenter(text).run().
SpanList segment(std::string_view text);

} // namespace texguard::latex
