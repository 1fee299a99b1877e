//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares manager for source file identifiers and their text.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns file path strings and source text.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace shake::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path or module identifier.
    /// @return New file identifier (>0 on success, 0 on overflow).
    /// @details Registering the same normalized path twice returns the
    ///          identifier assigned the first time.
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return File path string view.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Attach the source text of @p file_id.
    void setText(uint32_t file_id, std::string text);

    /// @brief Retrieve the source text previously attached to @p file_id.
    /// @return Stored text, or an empty view when none was recorded.
    std::string_view getText(uint32_t file_id) const;

    /// @brief Resolve a byte offset within @p file_id into a line/column location.
    SourceLoc locate(uint32_t file_id, std::size_t offset) const;

  private:
    /// Stored file paths. Index corresponds to file identifier; index 0 is reserved.
    /// Implemented with std::deque to keep string references stable as new files are added.
    std::deque<std::string> files_;

    /// Source text per file, parallel to files_.
    std::deque<std::string> texts_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    /// Fast lookup from normalized path to previously assigned identifier.
    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace shake::support
