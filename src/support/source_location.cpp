//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line utilities for the SourceLoc value type.  A location
// is considered valid when it refers to a registered file identifier; line and
// column components are optional and surfaced through `hasLine()` and
// `hasColumn()` respectively.  The offset-to-location helper lives here too so
// every subsystem that only knows byte offsets (the JavaScript syntax tree, the
// edit buffer) reports positions the same way.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements validity queries and offset mapping for `SourceLoc`.

#include "support/source_location.hpp"

#include <algorithm>

namespace shake::support
{
/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager dispenses monotonically increasing identifiers for
///          every file registered with the bundler.  The default-constructed
///          location uses zero to mark "unknown".
///
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

/// @brief Map a byte offset to a 1-based line/column pair.
///
/// @details Lines are separated by `\n`; a `\r` preceding the newline counts as
///          an ordinary column.  Offsets beyond the end of @p text resolve to the
///          position just past the final character, matching how the parser
///          reports end-of-input errors.
///
/// @param fileId Identifier copied into the result.
/// @param text Source text the offset refers to.
/// @param offset Byte offset into @p text.
/// @return Location describing @p offset.
SourceLoc locateOffset(uint32_t fileId, std::string_view text, std::size_t offset)
{
    offset = std::min(offset, text.size());
    uint32_t line = 1;
    std::size_t lineStart = 0;
    for (std::size_t i = 0; i < offset; ++i)
    {
        if (text[i] == '\n')
        {
            ++line;
            lineStart = i + 1;
        }
    }
    return SourceLoc{fileId, line, static_cast<uint32_t>(offset - lineStart + 1)};
}
} // namespace shake::support
