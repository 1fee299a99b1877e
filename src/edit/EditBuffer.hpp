//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file EditBuffer.hpp
/// @brief Deferred text edits over an immutable source string.
///
/// @details An EditBuffer views a window `[start, end)` of an original text
/// that is shared between all buffers snipped or cloned from it.  Edits are
/// recorded in original coordinates and only applied when the buffer is
/// rendered with toString(), so node byte ranges from the parser remain valid
/// no matter how many edits were already made.
///
/// ## Edit Kinds
///
/// | Operation   | Effect in toString()                                   |
/// |-------------|--------------------------------------------------------|
/// | overwrite   | original `[start, end)` replaced by the new text       |
/// | remove      | original `[start, end)` dropped                        |
/// | insert      | text emitted before the original character at offset   |
/// | append      | text emitted after the window                          |
///
/// An overwrite may swallow earlier edits that it fully contains; partial
/// overlaps are rejected.
///
/// @invariant start() <= end() <= original().size().
/// @invariant Recorded replacements never overlap.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>

namespace shake::edit
{

class EditBuffer
{
  public:
    /// @brief Create a buffer whose window spans all of @p text.
    explicit EditBuffer(std::string text);

    /// @brief A fresh buffer over `[start, end)` of the same original text.
    /// @details Edits of this buffer are not carried over; the range is
    ///          clamped to the current window.
    EditBuffer snip(uint32_t start, uint32_t end) const;

    /// @brief An independent copy including all recorded edits.
    EditBuffer clone() const;

    /// @brief Replace original `[start, end)` with @p text.
    support::Expected<void> overwrite(uint32_t start, uint32_t end, std::string text);

    /// @brief Drop original `[start, end)` from the output.
    support::Expected<void> remove(uint32_t start, uint32_t end);

    /// @brief Emit @p text before the original character at @p offset.
    /// @return An error when @p offset is not inside the window or falls
    ///         within an overwritten range.
    support::Expected<void> insert(uint32_t offset, std::string_view text);

    /// @brief Emit @p text after the window.
    void append(std::string_view text);

    /// @brief Record @p offset as relevant for source mapping.
    void addSourcemapLocation(uint32_t offset);

    const std::set<uint32_t> &sourcemapLocations() const
    {
        return sourcemapLocations_;
    }

    /// @brief Render the window with every edit applied.
    std::string toString() const;

    uint32_t start() const
    {
        return start_;
    }

    uint32_t end() const
    {
        return end_;
    }

    /// @brief The full text every snip of this buffer shares.
    const std::string &original() const
    {
        return *original_;
    }

  private:
    EditBuffer(std::shared_ptr<const std::string> original, uint32_t start, uint32_t end);

    support::Expected<void> checkRange(uint32_t start, uint32_t end) const;

    struct Replacement
    {
        uint32_t end;
        std::string text;
    };

    std::shared_ptr<const std::string> original_;
    uint32_t start_ = 0;
    uint32_t end_ = 0;

    /// Keyed by start offset.
    std::map<uint32_t, Replacement> replacements_;
    std::map<uint32_t, std::string> insertions_;
    std::string appended_;
    std::set<uint32_t> sourcemapLocations_;
};

} // namespace shake::edit
