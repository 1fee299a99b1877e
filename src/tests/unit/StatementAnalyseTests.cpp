// File: src/tests/unit/StatementAnalyseTests.cpp
// Purpose: Verify classification of identifiers into defines, modifies and dependsOn.
// Key invariants: Only top-level or unresolved reads become dependencies; property names are never reads;
//                 writes that replace an imported binding are rejected with S3000.
// Ownership/Lifetime: Each test owns its module and statements.
// Links: docs/codemap.md

#include "BundleTestSupport.hpp"

using namespace shake::bundle;
using namespace shake::bundle::testing;
using Names = std::vector<std::string>;

TEST(StatementAnalyseTest, FunctionDeclarationDependsOnFreeNames)
{
    auto module = analysedModule("function foo() { return bar + baz; }");
    const Statement &stmt = *module->statements()[0];

    EXPECT_EQ(names(stmt.defines()), Names({"foo"}));
    EXPECT_EQ(names(stmt.dependsOn()), Names({"bar", "baz"}));
    EXPECT_TRUE(stmt.modifies().empty());
}

TEST(StatementAnalyseTest, ParametersAndLocalsShadow)
{
    auto module = analysedModule("function f(a) { var b = a; return b + c; }");
    EXPECT_EQ(names(module->statements()[0]->dependsOn()), Names({"c"}));
}

TEST(StatementAnalyseTest, PropertyNamesAreNotReads)
{
    auto module = analysedModule("var x = obj.prop;\nvar o = { key: value, [computed]: 1 };");
    EXPECT_EQ(names(module->statements()[0]->dependsOn()), Names({"obj"}));
    EXPECT_EQ(names(module->statements()[1]->dependsOn()), Names({"value", "computed"}));
}

TEST(StatementAnalyseTest, BlockScopingAndHoisting)
{
    auto module = analysedModule("if (cond) { let y = 1; var z = y; }");
    const Statement &stmt = *module->statements()[0];

    EXPECT_EQ(names(stmt.defines()), Names({"z"}));
    EXPECT_EQ(names(stmt.dependsOn()), Names({"cond"}));
}

TEST(StatementAnalyseTest, HoistedInnerFunctionIsLocal)
{
    auto module = analysedModule("function outer() { inner(); function inner() {} }");
    EXPECT_TRUE(module->statements()[0]->dependsOn().empty());
}

TEST(StatementAnalyseTest, NamedFunctionExpressionBindsOnlyItself)
{
    auto module = analysedModule("var f = function g() { return g; };\nvar h = g;");
    EXPECT_EQ(names(module->statements()[0]->defines()), Names({"f"}));
    EXPECT_TRUE(module->statements()[0]->dependsOn().empty());
    EXPECT_EQ(names(module->statements()[1]->dependsOn()), Names({"g"}));
}

TEST(StatementAnalyseTest, ClassesDefineAndDependOnSuperclass)
{
    auto module = analysedModule("class A extends B { run() { return helper(this); } }\nvar C = class D {};");
    EXPECT_EQ(names(module->statements()[0]->defines()), Names({"A"}));
    EXPECT_EQ(names(module->statements()[0]->dependsOn()), Names({"B", "helper"}));
    EXPECT_EQ(names(module->statements()[1]->defines()), Names({"C"}));
    EXPECT_TRUE(module->statements()[1]->dependsOn().empty());
}

TEST(StatementAnalyseTest, CatchParameterIsLocal)
{
    auto module = analysedModule("try { risky(); } catch (e) { log(e); }");
    EXPECT_EQ(names(module->statements()[0]->dependsOn()), Names({"risky", "log"}));
}

TEST(StatementAnalyseTest, WritesRecordRootIdentifier)
{
    auto module = analysedModule("a.b.c = 1;\ncount++;\nfoo(bar, baz.qux);");

    EXPECT_EQ(names(module->statements()[0]->modifies()), Names({"a"}));
    EXPECT_EQ(names(module->statements()[0]->dependsOn()), Names({"a"}));
    EXPECT_EQ(names(module->statements()[1]->modifies()), Names({"count"}));
    EXPECT_EQ(names(module->statements()[2]->modifies()), Names({"bar", "baz"}));
    EXPECT_EQ(names(module->statements()[2]->dependsOn()), Names({"foo", "bar", "baz"}));
}

TEST(StatementAnalyseTest, DefinedNamesAreNotDependencies)
{
    auto module = analysedModule("var x = 1, y = x + z;");
    const Statement &stmt = *module->statements()[0];
    EXPECT_EQ(names(stmt.defines()), Names({"x", "y"}));
    EXPECT_EQ(names(stmt.dependsOn()), Names({"z"}));
}

TEST(StatementAnalyseTest, ExportedDeclarationsDefineTheirNames)
{
    auto module = analysedModule("export var a = b;\nexport function f() {}\nexport { a as c };");
    EXPECT_EQ(names(module->statements()[0]->defines()), Names({"a"}));
    EXPECT_EQ(names(module->statements()[0]->dependsOn()), Names({"b"}));
    EXPECT_EQ(names(module->statements()[1]->defines()), Names({"f"}));
    EXPECT_EQ(names(module->statements()[2]->dependsOn()), Names({"a"}));
    EXPECT_TRUE(module->statements()[2]->isExportDeclaration());
}

TEST(StatementAnalyseTest, ImportDeclarationsAreNotAnalysed)
{
    auto module = analysedModule("import { a } from './a.js';");
    const Statement &stmt = *module->statements()[0];
    EXPECT_TRUE(stmt.isImportDeclaration());
    EXPECT_TRUE(stmt.defines().empty());
    EXPECT_TRUE(stmt.dependsOn().empty());
}

TEST(StatementAnalyseTest, ReassigningImportIsAnError)
{
    auto module = parseModule("import x from './x.js';\nx = 1;");
    auto result = module->analyse();

    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().message, "Illegal reassignment to import 'x'");
    EXPECT_EQ(result.error().code, "S3000");
    EXPECT_EQ(result.error().severity, shake::support::Severity::Error);
    EXPECT_EQ(result.error().loc.file_id, 1u);
    EXPECT_EQ(result.error().loc.line, 2u);
    EXPECT_EQ(result.error().loc.column, 1u);
}

TEST(StatementAnalyseTest, UpdatingImportIsAnError)
{
    auto module = parseModule("import { n } from './n.js';\nfunction bump() { n++; }");
    auto result = module->analyse();
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().message, "Illegal reassignment to import 'n'");
}

TEST(StatementAnalyseTest, NamespaceMembersAreReadOnly)
{
    auto direct = parseModule("import * as ns from './ns.js';\nns.foo = 1;");
    EXPECT_FALSE(direct->analyse().hasValue());

    auto nested = parseModule("import * as ns from './ns.js';\nns.foo.bar = 1;");
    EXPECT_TRUE(nested->analyse().hasValue());
}

TEST(StatementAnalyseTest, MutatingImportedObjectIsAllowed)
{
    auto module = analysedModule("import { obj } from './o.js';\nobj.prop = 1;");
    EXPECT_EQ(names(module->statements()[1]->modifies()), Names({"obj"}));
}

TEST(StatementAnalyseTest, ShadowedImportMayBeAssigned)
{
    auto module = analysedModule("import x from './x.js';\nfunction f(x) { x = 2; return x; }");
    EXPECT_TRUE(module->statements()[1]->dependsOn().empty());
}

TEST(StatementAnalyseTest, PassingImportToCallIsAllowed)
{
    auto module = analysedModule("import x from './x.js';\nmutate(x);");
    EXPECT_EQ(names(module->statements()[1]->modifies()), Names({"x"}));
}

TEST(StatementAnalyseTest, ScopesAreRecordedPerNode)
{
    auto module = analysedModule("function f(a) { { let b; } }");
    const Statement &stmt = *module->statements()[0];

    const Scope *fnScope = stmt.scopeOf(stmt.node());
    ASSERT_NE(fnScope, nullptr);
    EXPECT_EQ(fnScope->depth(), 1);
    EXPECT_TRUE(fnScope->declaresLocally("a"));
    EXPECT_TRUE(stmt.scope().declaresLocally("f"));
    EXPECT_FALSE(stmt.scope().declaresLocally("b"));
    EXPECT_FALSE(fnScope->declaresLocally("b"));
}
