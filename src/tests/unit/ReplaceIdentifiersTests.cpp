// File: src/tests/unit/ReplaceIdentifiersTests.cpp
// Purpose: Verify identifier renaming, shadow handling and export rewriting of single statements.
// Key invariants: Locally declared names are never renamed; replacements cannot be captured by
//                 local declarations; the original statement buffer is left untouched.
// Ownership/Lifetime: Each test owns its module.
// Links: docs/codemap.md

#include "BundleTestSupport.hpp"

using namespace shake::bundle;
using namespace shake::bundle::testing;

TEST(ReplaceIdentifiersTest, EmptyMapsLeaveTextUnchanged)
{
    auto module = analysedModule("var x = a + b;");
    EXPECT_EQ(render(*module, 0, {}), "var x = a + b;");
}

TEST(ReplaceIdentifiersTest, RenamesReferences)
{
    auto module = analysedModule("var x = a + b;");
    EXPECT_EQ(render(*module, 0, {{"a", "_a"}, {"x", "y"}}), "var y = _a + b;");
    EXPECT_EQ(module->statements()[0]->source().toString(), "var x = a + b;");
}

TEST(ReplaceIdentifiersTest, PropertyNamesAreNotRenamed)
{
    auto module = analysedModule("foo.a = { a: a };");
    EXPECT_EQ(render(*module, 0, {{"a", "z"}}), "foo.a = { a: z };");
}

TEST(ReplaceIdentifiersTest, ShorthandPropertyKeepsItsKey)
{
    auto module = analysedModule("var o = { a, b };");
    EXPECT_EQ(render(*module, 0, {{"a", "z"}}), "var o = { a: z, b };");
}

TEST(ReplaceIdentifiersTest, LocalDeclarationsShadowRenames)
{
    auto module = analysedModule("function f(a) { return a + b; }");
    EXPECT_EQ(render(*module, 0, {{"a", "x"}, {"b", "y"}}), "function f(a) { return a + y; }");
}

TEST(ReplaceIdentifiersTest, ScopesWithNothingToRenameAreSkipped)
{
    auto module = analysedModule("function f(a) { return a; }");
    EXPECT_EQ(render(*module, 0, {{"a", "x"}}), "function f(a) { return a; }");
}

TEST(ReplaceIdentifiersTest, BlockScopedShadowing)
{
    auto module = analysedModule("if (ok) { let count = 0; count++; } else { count++; }");
    EXPECT_EQ(render(*module, 0, {{"count", "_count"}}),
              "if (ok) { let count = 0; count++; } else { _count++; }");
}

TEST(ReplaceIdentifiersTest, LocalsCollidingWithReplacementRootAreDeshadowed)
{
    auto module = analysedModule("function f(util) { return helper(util); }");
    EXPECT_EQ(render(*module, 0, {{"helper", "util.helper"}}),
              "function f(util$$) { return util.helper(util$$); }");
}

TEST(ReplaceIdentifiersTest, NestedScopeKeepsLocalWhileRootIsDeshadowed)
{
    auto module = analysedModule(
        "function run(bundle) { function inner(foo) { return foo; } return foo + inner(bundle); }");
    EXPECT_EQ(render(*module, 0, {{"foo", "bundle.foo"}}),
              "function run(bundle$$) { function inner(foo) { return foo; } return bundle.foo + inner(bundle$$); }");
}

TEST(ReplaceIdentifiersTest, FunctionNameIsRenamedWhenParameterShadowsIt)
{
    auto module = analysedModule("function foo(foo) { return foo; }");
    EXPECT_EQ(render(*module, 0, {{"foo", "_foo"}}), "function _foo(foo) { return foo; }");
}

TEST(ReplaceIdentifiersTest, FunctionNameIsRenamedWhenLocalShadowsIt)
{
    auto module = analysedModule("function foo() { var foo = 1; return bar + foo; }");
    EXPECT_EQ(render(*module, 0, {{"foo", "_foo"}, {"bar", "_bar"}}),
              "function _foo() { var foo = 1; return _bar + foo; }");
}

TEST(ReplaceIdentifiersTest, SingleDeclaratorExportIsRewrittenInPlace)
{
    auto module = analysedModule("var x = 1;\nx += 1;");
    const NameMap names{{"x", "exports.x"}};
    const NameMap targets{{"x", "exports.x"}};

    EXPECT_EQ(render(*module, 0, names, targets), "exports.x = 1;");
    EXPECT_EQ(render(*module, 1, names, targets), "exports.x += 1;");
}

TEST(ReplaceIdentifiersTest, ExportedDeclarationIsRewrittenInsideExport)
{
    auto module = analysedModule("export const answer = 42;");
    EXPECT_EQ(render(*module, 0, {}, {{"answer", "exports.answer"}}), "export exports.answer = 42;");
}

TEST(ReplaceIdentifiersTest, MultipleDeclaratorsGetTrailingAssignments)
{
    auto module = analysedModule("var a = 1, b = 2;");
    EXPECT_EQ(render(*module, 0, {}, {{"a", "exports.a"}}), "var a = 1, b = 2;\nexports.a = a;");
    EXPECT_EQ(render(*module, 0, {{"a", "_a"}}, {{"a", "exports.a"}, {"b", "exports.b"}}),
              "var _a = 1, b = 2;\nexports.a = _a;\nexports.b = b;");
}

TEST(ReplaceIdentifiersTest, NestedDeclarationsAreNotExportTargets)
{
    auto module = analysedModule("function f() { var x = 1; return x; }");
    EXPECT_EQ(render(*module, 0, {}, {{"x", "exports.x"}}), "function f() { var x = 1; return x; }");
}
