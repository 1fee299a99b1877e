//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Bundle.hpp
/// @brief A bundling session: module graph, tree-shaking and code generation.
///
/// @details Typical use:
///
/// @code
///   MemoryLoader loader;
///   loader.add("main.js", "import { a } from './a.js';\nconsole.log(a);\n");
///   loader.add("a.js", "export var a = 1;\nexport var b = 2;\n");
///
///   support::SourceManager sm;
///   Bundle bundle(BundleOptions{"main.js"}, loader, sm);
///   if (auto built = bundle.build(); !built)
///       support::printDiag(built.error(), std::cerr, &sm);
///   auto code = bundle.generate();
/// @endcode
///
/// build() pulls in only the statements the entry needs, in dependency
/// order, and then assigns every module-level binding a bundle-wide unique
/// name.  generate() renders the included statements as a single CommonJS
/// script.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "bundle/BundleOptions.hpp"
#include "bundle/Module.hpp"
#include "bundle/ModuleLoader.hpp"
#include "support/source_manager.hpp"
#include "support/trace.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace shake::bundle
{

class Bundle : public ModuleProvider
{
  public:
    /// @param options Session settings; the entry specifier is required.
    /// @param loader Source of module text; must outlive the bundle.
    /// @param sm Registry receiving every loaded module for diagnostics.
    Bundle(BundleOptions options, ModuleLoader &loader, support::SourceManager &sm);

    /// @brief Load the entry, include what it needs and deconflict names.
    support::Expected<void> build();

    /// @brief Render the bundle built by build().
    support::Expected<std::string> generate() const;

    support::Expected<Module *> fetchModule(const std::string &importee,
                                            const std::string &importer) override;

    support::TraceSink *trace() override
    {
        return trace_.config().enabled() ? &trace_ : nullptr;
    }

    /// @brief Included statements in output order.
    const StatementList &statements() const
    {
        return statements_;
    }

    /// @brief Entry module; null before build().
    Module *entryModule() const
    {
        return entry_;
    }

    /// @brief Module registered under @p id, or nullptr.
    Module *findModule(const std::string &id) const;

    /// @brief Every fetched module in fetch order, externals included.
    const std::vector<Module *> &modules() const
    {
        return moduleOrder_;
    }

  private:
    /// @brief Give every included module-level binding a unique name.
    void deconflict();

    /// @brief Replacement text for each name the statements of @p module use.
    NameMap namesFor(const Module &module) const;

    /// @brief Export assignment targets of the entry's exported top-level variables.
    NameMap entryExportTargets() const;

    BundleOptions options_;
    ModuleLoader &loader_;
    support::SourceManager &sm_;
    support::TraceSink trace_;

    std::unordered_map<std::string, std::unique_ptr<Module>> modules_;
    std::vector<Module *> moduleOrder_;
    Module *entry_ = nullptr;
    StatementList statements_;
};

} // namespace shake::bundle
