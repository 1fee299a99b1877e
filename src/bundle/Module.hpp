//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Module.hpp
/// @brief A parsed source module and its import/export bookkeeping.
///
/// @details A Module splits its program into top-level Statements, records
/// what it imports and exports, and answers `define(name)` requests: the
/// ordered list of statements, possibly from other modules, that establish
/// a top-level binding.  Other modules are reached through a ModuleProvider,
/// which the Bundle implements.
///
/// ## Name Resolution
///
/// | Local name is...            | define(name) yields                          |
/// |-----------------------------|----------------------------------------------|
/// | a named or default import   | the exporter's definition of that export     |
/// | a namespace import          | every statement of the imported module       |
/// | an import from an external  | nothing; referenced as `<external>.<name>`   |
/// | defined at top level        | the defining statement, expanded             |
/// | anything else               | nothing (treated as a global)                |
///
/// Each name is defined at most once per module: repeated requests return an
/// empty list, which also cuts cycles between mutually importing modules.
///
/// ## Canonical Names
///
/// After deconfliction every module-level binding has a canonical name in the
/// bundle.  Imports resolve to the exporter's canonical name; `default` and
/// namespace bindings take a name suggested by an importer, falling back to
/// the module's file stem.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "bundle/Statement.hpp"
#include "support/diag_expected.hpp"
#include "support/trace.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace shake::bundle
{

class Module;

/// @brief A binding introduced by an import specifier.
struct ImportBinding
{
    std::string source;       ///< Module specifier as written
    std::string originalName; ///< Exported name, `default`, or `*` for namespaces
    std::string localName;    ///< Name bound in the importing module
    Module *module = nullptr; ///< Resolved on first use

    bool isNamespace() const
    {
        return originalName == "*";
    }
};

/// @brief A name the module makes available to importers.
struct ExportBinding
{
    std::string localName;               ///< Local binding; empty for anonymous defaults
    Statement *statement = nullptr;      ///< Statement carrying the export
    std::string source;                  ///< Non-empty for `export { x } from "..."`
    std::string importedName;            ///< Name imported from @ref source
    Module *module = nullptr;            ///< Resolved re-export target

    bool isReexport() const
    {
        return !source.empty();
    }
};

/// @brief Supplies modules to one another during expansion.
class ModuleProvider
{
  public:
    virtual ~ModuleProvider() = default;

    /// @brief The module @p importee refers to when imported from @p importer.
    /// @return The (possibly external) module, or a load/parse error.
    virtual support::Expected<Module *> fetchModule(const std::string &importee,
                                                    const std::string &importer) = 0;

    /// @brief Trace sink shared by the bundling session, or nullptr.
    virtual support::TraceSink *trace()
    {
        return nullptr;
    }
};

class Module
{
  public:
    /// @brief Create a module for @p source identified by @p id.
    /// @param id Resolved module identifier (usually a path).
    /// @param source Full module text.
    /// @param fileId SourceManager identifier used in diagnostics.
    /// @param provider Resolver for imports; may be null for standalone use.
    Module(std::string id, std::string source, uint32_t fileId, ModuleProvider *provider = nullptr);

    /// @brief Create an external module: known by id, never parsed or bundled.
    static std::unique_ptr<Module> makeExternal(std::string id);

    Module(const Module &) = delete;
    Module &operator=(const Module &) = delete;

    /// @brief Parse the source into top-level statements.
    /// @return The first lexical or syntax error, if any.
    support::Expected<void> parse();

    /// @brief Record imports and exports, then analyse every statement.
    support::Expected<void> analyse();

    /// @brief Statements needed to establish the module-level binding @p name.
    support::Expected<StatementList> define(const std::string &name);

    /// @brief Statements needed to establish export @p exportedName.
    /// @param importer Id of the requesting module, used in diagnostics.
    support::Expected<StatementList> defineExport(const std::string &exportedName,
                                                  const std::string &importer);

    /// @brief Include every statement (imports excluded).
    /// @param isEntry True for the bundle entry, whose `export { ... }` lists
    ///        must define the names they export.
    support::Expected<StatementList> expandAllStatements(bool isEntry);

    //===------------------------------------------------------------------===//
    // Canonical names
    //===------------------------------------------------------------------===//

    /// @brief Force @p name (or `default` / `*`) to be emitted as @p replacement.
    void rename(const std::string &name, const std::string &replacement);

    /// @brief Offer @p suggestion as the bundle name for `default` or `*`.
    /// @details The first suggestion wins; later ones are ignored.
    void suggestName(const std::string &key, const std::string &suggestion);

    /// @brief Name under which local binding @p localName appears in the bundle.
    std::string getCanonicalName(const std::string &localName) const;

    /// @brief Bundle expression for the value this module exports as @p exportedName.
    std::string getExportCanonicalName(const std::string &exportedName) const;

    //===------------------------------------------------------------------===//
    // Accessors
    //===------------------------------------------------------------------===//

    const std::string &id() const
    {
        return id_;
    }

    const std::string &source() const
    {
        return source_;
    }

    uint32_t fileId() const
    {
        return fileId_;
    }

    bool isExternal() const
    {
        return isExternal_;
    }

    /// @brief True once some importer binds this module as a namespace object.
    bool needsNamespace() const
    {
        return needsNamespace_;
    }

    const std::vector<std::unique_ptr<Statement>> &statements() const
    {
        return statements_;
    }

    const std::map<std::string, ImportBinding> &imports() const
    {
        return imports_;
    }

    /// @brief Exports in declaration order.
    const std::vector<std::string> &exportOrder() const
    {
        return exportOrder_;
    }

    const std::map<std::string, ExportBinding> &exports() const
    {
        return exports_;
    }

    /// @brief Import binding for local @p name, or nullptr.
    const ImportBinding *findImport(const std::string &name) const;

    /// @brief Top-level statement defining @p name, or nullptr.
    Statement *definition(const std::string &name) const;

    /// @brief Statements modifying @p name in source order, or nullptr.
    const StatementList *modifications(const std::string &name) const;

    /// @brief Line/column location of byte @p offset in this module.
    support::SourceLoc locate(uint32_t offset) const;

    /// @brief Trace sink of the owning session, or nullptr.
    support::TraceSink *trace() const
    {
        return provider_ ? provider_->trace() : nullptr;
    }

  private:
    Module(std::string id, bool isExternal);

    /// @brief Resolve the module behind specifier @p source.
    support::Expected<Module *> fetch(const std::string &source);

    /// @brief Record import and export bindings of @p stmt.
    support::Expected<void> recordBindings(Statement &stmt);

    /// @brief Legal identifier derived from the id's file stem.
    std::string defaultName() const;

    std::string id_;
    std::string source_;
    uint32_t fileId_ = 0;
    ModuleProvider *provider_ = nullptr;
    bool isExternal_ = false;
    bool needsNamespace_ = false;

    std::vector<std::unique_ptr<Statement>> statements_;

    std::map<std::string, ImportBinding> imports_;
    std::map<std::string, ExportBinding> exports_;
    std::vector<std::string> exportOrder_;

    std::unordered_map<std::string, Statement *> definitions_;
    std::unordered_map<std::string, StatementList> modifications_;

    NameSet defineRequests_;
    std::unordered_map<std::string, std::string> suggestedNames_;
    std::unordered_map<std::string, std::string> canonicalNames_;
};

} // namespace shake::bundle
