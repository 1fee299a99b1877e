// File: src/tests/unit/BundleTestSupport.hpp
// Purpose: Shared helpers for bundle unit tests: build and analyse a module from text.
// Key invariants: Modules get file id 1 and no provider unless a test supplies one.
// Ownership/Lifetime: Returned modules are owned by the caller.
// Links: docs/codemap.md
#pragma once

#include <gtest/gtest.h>

#include "bundle/Module.hpp"
#include "bundle/NameSet.hpp"

#include <memory>
#include <string>
#include <vector>

namespace shake::bundle::testing
{

/// @brief Parse @p text into a module; parse failures are reported as test failures.
inline std::unique_ptr<Module> parseModule(const std::string &text, const std::string &id = "main.js")
{
    auto module = std::make_unique<Module>(id, text, 1);
    auto parsed = module->parse();
    EXPECT_TRUE(parsed.hasValue()) << (parsed ? std::string() : parsed.error().message);
    return module;
}

/// @brief Parse and analyse @p text; failures are reported as test failures.
inline std::unique_ptr<Module> analysedModule(const std::string &text, const std::string &id = "main.js")
{
    auto module = parseModule(text, id);
    auto analysed = module->analyse();
    EXPECT_TRUE(analysed.hasValue()) << (analysed ? std::string() : analysed.error().message);
    return module;
}

inline std::vector<std::string> names(const NameSet &set)
{
    return set.names();
}

/// @brief Render statement @p index of @p module with the given rename maps.
inline std::string render(const Module &module,
                          std::size_t index,
                          const NameMap &renames,
                          const NameMap &exportTargets = {})
{
    auto edited = module.statements().at(index)->replaceIdentifiers(renames, exportTargets);
    EXPECT_TRUE(edited.hasValue()) << (edited ? std::string() : edited.error().message);
    return edited ? edited.value().toString() : std::string();
}

} // namespace shake::bundle::testing
