// File: src/bundle/ModuleLoader.cpp
// Purpose: Implements the file-system and in-memory module loaders.
// Key invariants: Resolved ids are lexically normalized generic paths.
// Ownership/Lifetime: MemoryLoader owns copies of registered sources.
// Links: docs/codemap.md

#include "bundle/ModuleLoader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace shake::bundle
{
namespace
{

bool isPathSpecifier(const std::string &spec)
{
    return spec.rfind("./", 0) == 0 || spec.rfind("../", 0) == 0 || spec.rfind('/', 0) == 0 ||
           spec == "." || spec == "..";
}

/// @brief Path named by @p importee relative to the directory of @p importer.
std::string resolvePath(const std::string &importee, const std::string &importer)
{
    std::filesystem::path path(importee);
    if (path.is_relative() && !importer.empty())
        path = std::filesystem::path(importer).parent_path() / path;
    if (!path.has_extension())
        path += ".js";
    return path.lexically_normal().generic_string();
}

} // namespace

std::optional<std::string> FileSystemLoader::resolveId(const std::string &importee,
                                                       const std::string &importer) const
{
    // The entry is always a file, even when spelled without `./`.
    if (importer.empty() || isPathSpecifier(importee))
        return resolvePath(importee, importer);
    return std::nullopt;
}

support::Expected<std::string> FileSystemLoader::load(const std::string &id)
{
    std::ifstream in(id, std::ios::binary);
    if (!in)
        return support::makeError({}, "Could not load " + id, "S4000");
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void MemoryLoader::add(std::string id, std::string text)
{
    files_[std::move(id)] = std::move(text);
}

std::optional<std::string> MemoryLoader::resolveId(const std::string &importee,
                                                   const std::string &importer) const
{
    if (files_.count(importee))
        return importee;
    if (importer.empty() || isPathSpecifier(importee))
        return resolvePath(importee, importer);
    return std::nullopt;
}

support::Expected<std::string> MemoryLoader::load(const std::string &id)
{
    auto it = files_.find(id);
    if (it == files_.end())
        return support::makeError({}, "Could not load " + id, "S4000");
    return it->second;
}

} // namespace shake::bundle
