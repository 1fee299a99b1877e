// File: src/tests/unit/StatementExpandTests.cpp
// Purpose: Verify statement inclusion order, idempotence, modifier pickup and cycle termination.
// Key invariants: Dependencies precede the statement; modifiers follow it; included statements
//                 expand to nothing.
// Ownership/Lifetime: Each test owns its module.
// Links: docs/codemap.md

#include "BundleTestSupport.hpp"

using namespace shake::bundle;
using namespace shake::bundle::testing;

namespace
{
/// @brief Indices of @p list within @p module's statements.
std::vector<std::size_t> indicesOf(const Module &module, const StatementList &list)
{
    std::vector<std::size_t> out;
    for (const Statement *stmt : list)
    {
        for (std::size_t i = 0; i < module.statements().size(); ++i)
        {
            if (module.statements()[i].get() == stmt)
                out.push_back(i);
        }
    }
    return out;
}

using Indices = std::vector<std::size_t>;

constexpr const char *kChain = "var a = 1;\n"
                               "var b = a + 1;\n"
                               "a = 5;\n"
                               "function unused() { return b; }\n"
                               "var c = b * 2;\n";
} // namespace

TEST(StatementExpandTest, DependenciesThenStatementThenModifiers)
{
    auto module = analysedModule(kChain);
    auto result = module->define("b");

    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(indicesOf(*module, result.value()), Indices({0, 2, 1}));
    EXPECT_FALSE(module->statements()[3]->isIncluded());
    EXPECT_FALSE(module->statements()[4]->isIncluded());
}

TEST(StatementExpandTest, ExpandIsIdempotent)
{
    auto module = analysedModule(kChain);
    Statement &stmt = *module->statements()[1];

    auto first = stmt.expand();
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(indicesOf(*module, first.value()), Indices({0, 2, 1}));
    EXPECT_TRUE(stmt.isIncluded());

    auto second = stmt.expand();
    ASSERT_TRUE(second.hasValue());
    EXPECT_TRUE(second.value().empty());

    auto again = module->define("b");
    ASSERT_TRUE(again.hasValue());
    EXPECT_TRUE(again.value().empty());
}

TEST(StatementExpandTest, ExpandAllKeepsSourceOrderWhereDependenciesAllow)
{
    auto module = analysedModule(kChain);
    auto result = module->expandAllStatements(true);

    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(indicesOf(*module, result.value()), Indices({0, 2, 1, 3, 4}));
}

TEST(StatementExpandTest, MutuallyRecursiveFunctionsTerminate)
{
    auto module = analysedModule("function isEven(n) { return n === 0 || isOdd(n - 1); }\n"
                                 "function isOdd(n) { return n !== 0 && isEven(n - 1); }\n");
    auto result = module->define("isEven");

    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(indicesOf(*module, result.value()), Indices({1, 0}));
}

TEST(StatementExpandTest, GlobalsExpandToNothing)
{
    auto module = analysedModule("console.log(1);");
    auto result = module->define("console");
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().empty());
    EXPECT_FALSE(module->statements()[0]->isIncluded());
}

TEST(StatementExpandTest, RedeclarationIsTreatedAsModifier)
{
    auto module = analysedModule("var x = 1;\nvar y = 2;\nvar x = 3;\nvar z = x;\n");
    EXPECT_EQ(module->definition("x"), module->statements()[0].get());
    ASSERT_NE(module->modifications("x"), nullptr);

    auto result = module->define("z");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(indicesOf(*module, result.value()), Indices({0, 2, 3}));
}

TEST(StatementExpandTest, ModifiersOfDependenciesAreIncluded)
{
    auto module = analysedModule("var list = [];\n"
                                 "list[0] = 1;\n"
                                 "register(list);\n"
                                 "var other = 2;\n"
                                 "export default list;\n");
    auto result = module->define("default");

    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(indicesOf(*module, result.value()), Indices({0, 1, 2, 4}));
    EXPECT_FALSE(module->statements()[3]->isIncluded());
}

TEST(StatementExpandTest, ExportListsOnlyExpandInEntry)
{
    auto entry = analysedModule("var a = 1;\nexport { a };\n");
    auto all = entry->expandAllStatements(true);
    ASSERT_TRUE(all.hasValue());
    EXPECT_EQ(indicesOf(*entry, all.value()), Indices({0, 1}));

    auto dependency = analysedModule("var a = 1;\nexport { a };\n", "dep.js");
    auto some = dependency->expandAllStatements(false);
    ASSERT_TRUE(some.hasValue());
    EXPECT_EQ(indicesOf(*dependency, some.value()), Indices({0}));
}

TEST(StatementExpandTest, LaterFunctionDeclarationIsIncludedFirst)
{
    auto module = analysedModule("export function a() { return b(); }\nfunction b() { return 1; }\n");
    Statement &exported = *module->statements()[0];

    EXPECT_EQ(names(exported.dependsOn()), std::vector<std::string>({"b"}));
    EXPECT_EQ(names(exported.defines()), std::vector<std::string>({"a"}));

    auto result = exported.expand();
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(indicesOf(*module, result.value()), Indices({1, 0}));
}
