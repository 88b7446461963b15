//===----------------------------------------------------------------------===//
//
// Part of the texguard project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line validity query for SourceLoc. A location is valid
// when it refers to a registered file identifier; line and column components
// are optional and surfaced through `hasLine()` and `hasColumn()`.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace texguard::support
{
/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager hands out identifiers starting at one, so a zero
///          identifier marks a location synthesized without a file (for
///          example an issue parsed from a log that names no input line).
///
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace texguard::support
