// File: src/bundle/ModuleLoader.hpp
// Purpose: Declares how module specifiers become ids and ids become source text.
// Key invariants: resolveId is pure; the same (importee, importer) pair always
//                 yields the same id.
// Ownership/Lifetime: Loaders are owned by the caller and outlive the Bundle.
// Links: docs/codemap.md
#pragma once

#include "support/diag_expected.hpp"

#include <map>
#include <optional>
#include <string>

namespace shake::bundle
{

/// @brief Source of module text for a bundling session.
class ModuleLoader
{
  public:
    virtual ~ModuleLoader() = default;

    /// @brief Resolve @p importee as written in module @p importer.
    /// @param importer Id of the importing module; empty for the entry.
    /// @return The module id, or std::nullopt when the module is external.
    virtual std::optional<std::string> resolveId(const std::string &importee,
                                                 const std::string &importer) const = 0;

    /// @brief Read the source of module @p id.
    virtual support::Expected<std::string> load(const std::string &id) = 0;
};

/// @brief Loads modules from disk.
/// @details Relative (`./`, `../`) and absolute specifiers name files; a
///          missing extension defaults to `.js`.  Bare specifiers such as
///          `lodash` are external.
class FileSystemLoader : public ModuleLoader
{
  public:
    std::optional<std::string> resolveId(const std::string &importee,
                                         const std::string &importer) const override;
    support::Expected<std::string> load(const std::string &id) override;
};

/// @brief Serves modules from an in-memory table keyed by id.
/// @details Resolution follows FileSystemLoader, except that a bare specifier
///          naming a registered id is internal.
class MemoryLoader : public ModuleLoader
{
  public:
    /// @brief Register module @p id with source @p text, replacing any previous text.
    void add(std::string id, std::string text);

    std::optional<std::string> resolveId(const std::string &importee,
                                         const std::string &importer) const override;
    support::Expected<std::string> load(const std::string &id) override;

  private:
    std::map<std::string, std::string> files_;
};

} // namespace shake::bundle
