//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Value-or-diagnostic return type for fallible operations (file
//          loading, partition checks) plus the single diagnostic printer.
// Key invariants: An Expected holds either a value or exactly one diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace texguard::support
{
class SourceManager;

using Diag = Diagnostic;

/// @brief Either a T or the Diag explaining why none could be produced.
template <class T> class Expected
{
  public:
    /// @brief Success. Disabled for Diag so errors pick the overload below.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Failure carrying @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre hasValue()
    T &value()
    {
        return *value_;
    }

    /// @pre hasValue()
    const T &value() const
    {
        return *value_;
    }

    /// @pre !hasValue()
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Success-or-diagnostic for operations without a result value.
template <> class Expected<void>
{
  public:
    Expected() = default;

    Expected(Diag diag);

    [[nodiscard]] bool hasValue() const;

    explicit operator bool() const;

    /// @pre !hasValue()
    const Diag &error() const &;

  private:
    std::optional<Diag> error_;
};

/// @brief Error-severity diagnostic at @p loc.
Diag makeError(SourceLoc loc, std::string msg);

/// @brief Write @p diag as `path:line:col: severity: [code] message`.
/// @details The location prefix needs @p sm and a registered file id; line and
///          column are printed only when known.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);
} // namespace texguard::support
