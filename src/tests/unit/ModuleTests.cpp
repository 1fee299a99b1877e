// File: src/tests/unit/ModuleTests.cpp
// Purpose: Verify import/export bookkeeping, binding errors and canonical-name helpers of a module.
// Key invariants: Every import specifier binds a unique local name; exports keep declaration order.
// Ownership/Lifetime: Each test owns its module.
// Links: docs/codemap.md

#include "BundleTestSupport.hpp"

#include "bundle/Identifiers.hpp"

using namespace shake::bundle;
using namespace shake::bundle::testing;

TEST(ModuleTest, RecordsImportsAndExports)
{
    auto module = analysedModule("import def, { a as b } from './dep.js';\n"
                                 "import * as ns from './ns.js';\n"
                                 "export var x = 1, y = 2;\n"
                                 "export function f() {}\n"
                                 "export { b as c };\n"
                                 "export default 42;\n");

    ASSERT_EQ(module->imports().size(), 3u);
    const ImportBinding *def = module->findImport("def");
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->source, "./dep.js");
    EXPECT_EQ(def->originalName, "default");
    EXPECT_EQ(module->findImport("b")->originalName, "a");
    EXPECT_TRUE(module->findImport("ns")->isNamespace());
    EXPECT_EQ(module->findImport("a"), nullptr);

    EXPECT_EQ(module->exportOrder(), std::vector<std::string>({"x", "y", "f", "c", "default"}));
    EXPECT_EQ(module->exports().at("c").localName, "b");
    EXPECT_TRUE(module->exports().at("default").localName.empty());
    EXPECT_EQ(module->exports().at("x").statement, module->statements()[2].get());
    EXPECT_FALSE(module->exports().at("x").isReexport());
}

TEST(ModuleTest, NamedDefaultExportUsesDeclaredName)
{
    auto module = analysedModule("export default function main() {}\n");
    EXPECT_EQ(module->exports().at("default").localName, "main");
    EXPECT_EQ(module->definition("main"), module->statements()[0].get());
}

TEST(ModuleTest, ReexportsRecordTheirSource)
{
    auto module = analysedModule("export { a, b as c } from './other.js';\n");
    const ExportBinding &c = module->exports().at("c");
    EXPECT_TRUE(c.isReexport());
    EXPECT_EQ(c.source, "./other.js");
    EXPECT_EQ(c.importedName, "b");
}

TEST(ModuleTest, DuplicatedImportIsAnError)
{
    auto module = parseModule("import a from './a.js';\nimport { a } from './b.js';\n");
    auto result = module->analyse();

    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().message, "Duplicated import 'a'");
    EXPECT_EQ(result.error().code, "S3001");
    EXPECT_EQ(result.error().loc.line, 2u);
}

TEST(ModuleTest, DefinitionsAndModifications)
{
    auto module = analysedModule("var a = 1;\na++;\nfunction g() { a = 2; }\n");
    EXPECT_EQ(module->definition("a"), module->statements()[0].get());
    EXPECT_EQ(module->definition("g"), module->statements()[2].get());
    EXPECT_EQ(module->definition("missing"), nullptr);

    const StatementList *mods = module->modifications("a");
    ASSERT_NE(mods, nullptr);
    ASSERT_EQ(mods->size(), 2u);
    EXPECT_EQ((*mods)[0], module->statements()[1].get());
    EXPECT_EQ((*mods)[1], module->statements()[2].get());
}

TEST(ModuleTest, ImportWithoutProviderFailsToResolve)
{
    auto module = analysedModule("import { a } from './a.js';\nconsole.log(a);\n");
    auto result = module->define("a");
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, "S4000");
}

TEST(ModuleTest, CanonicalNamesFollowRenamesAndSuggestions)
{
    auto module = analysedModule("var value = 1;\nexport default value + 1;\n", "lib/my-utils.js");

    EXPECT_EQ(module->getCanonicalName("value"), "value");
    module->rename("value", "_value");
    EXPECT_EQ(module->getCanonicalName("value"), "_value");

    EXPECT_EQ(module->getCanonicalName("default"), "myUtils");
    module->suggestName("default", "utils");
    module->suggestName("default", "ignored");
    EXPECT_EQ(module->getCanonicalName("default"), "utils");
    EXPECT_EQ(module->getExportCanonicalName("default"), "utils");
}

TEST(ModuleTest, FallbackNameAvoidsModuleBindings)
{
    auto module = analysedModule("var main = 1;\nexport default main;\n", "main.js");
    EXPECT_EQ(module->getCanonicalName("default"), "_main");
}

TEST(ModuleTest, ExternalModuleNames)
{
    auto external = Module::makeExternal("node-fetch");
    EXPECT_TRUE(external->isExternal());
    EXPECT_TRUE(external->statements().empty());
    EXPECT_EQ(external->getCanonicalName("*"), "nodeFetch");

    external->suggestName("default", "fetch");
    EXPECT_EQ(external->getExportCanonicalName("default"), "fetch");
    EXPECT_EQ(external->getExportCanonicalName("Headers"), "fetch.Headers");

    auto defined = external->define("anything");
    ASSERT_TRUE(defined.hasValue());
    EXPECT_TRUE(defined.value().empty());
}

TEST(IdentifiersTest, MakeLegalIdentifier)
{
    EXPECT_EQ(makeLegalIdentifier("my-utils"), "myUtils");
    EXPECT_EQ(makeLegalIdentifier("1abc"), "_1abc");
    EXPECT_EQ(makeLegalIdentifier("class"), "_class");
    EXPECT_EQ(makeLegalIdentifier("a.b"), "a_b");
    EXPECT_EQ(makeLegalIdentifier(""), "_");
    EXPECT_EQ(makeLegalIdentifier("$ok_1"), "$ok_1");
}

TEST(IdentifiersTest, PropertyAccess)
{
    EXPECT_EQ(propertyAccess("exports", "foo"), "exports.foo");
    EXPECT_EQ(propertyAccess("exports", "default"), "exports['default']");
    EXPECT_EQ(propertyAccess("x", "a-b"), "x['a-b']");
}

TEST(IdentifiersTest, ReservedNames)
{
    EXPECT_TRUE(isReservedName("arguments"));
    EXPECT_TRUE(isReservedName("let"));
    EXPECT_FALSE(isReservedName("value"));
}
