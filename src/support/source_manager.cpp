//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager, the registry that hands out file identifiers
// to every module the bundler loads.  Paths are normalized before insertion so
// that diagnostics print stable, platform independent names, and the text of
// each module is retained so offsets recorded in syntax trees can be mapped
// back to line/column pairs long after parsing finished.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Source file registry with path normalization and text retention.
/// @details Keeps identifier assignment in one place while letting this
///          implementation focus on normalization details.

#include "source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace shake::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
///
/// @details The path is normalized into a generic string so diagnostics print
///          platform independent output regardless of OS path conventions.
///          Identifiers start at one, leaving zero to represent an unknown
///          location.
///
/// @param path Filesystem path to normalize and store.
/// @return Identifier (>0) representing the stored path.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, std::string(kSourceManagerFileIdOverflowMessage));
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    texts_.emplace_back();
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

/// @brief Retrieve the canonical path associated with a file identifier.
///
/// @param file_id 1-based identifier previously returned by addFile().
/// @return Stored path, or empty string view if @p file_id is invalid.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

/// @brief Store the source text for a registered file.
///
/// @details Unknown identifiers are ignored so callers holding a zero id (for
///          example modules built directly in tests) need no special casing.
void SourceManager::setText(uint32_t file_id, std::string text)
{
    if (file_id == 0 || file_id > texts_.size())
        return;
    texts_[file_id - 1] = std::move(text);
}

std::string_view SourceManager::getText(uint32_t file_id) const
{
    if (file_id == 0 || file_id > texts_.size())
        return {};
    return texts_[file_id - 1];
}

/// @brief Resolve @p offset inside the stored text of @p file_id.
/// @return Location with line/column filled in; the file id is preserved even
///         when no text has been attached.
SourceLoc SourceManager::locate(uint32_t file_id, std::size_t offset) const
{
    return locateOffset(file_id, getText(file_id), offset);
}
} // namespace shake::support
