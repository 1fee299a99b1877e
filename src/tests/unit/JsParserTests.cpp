// File: src/tests/unit/JsParserTests.cpp
// Purpose: Verify parsing of module items, statements and expression precedence.
// Key invariants: Node ranges cover their source text; unsupported syntax yields S2000 diagnostics.
// Ownership/Lifetime: Test owns lexer, parser, diagnostics and the resulting tree.
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "frontends/js/AST.hpp"
#include "frontends/js/Lexer.hpp"
#include "frontends/js/Parser.hpp"
#include "support/diagnostics.hpp"

#include <memory>
#include <string>

using namespace shake::frontends::js;
using shake::support::DiagnosticEngine;

namespace
{
struct ParseResult
{
    std::unique_ptr<Program> program;
    bool hasError = false;
};

ParseResult parse(const std::string &text, DiagnosticEngine &diag)
{
    Lexer lexer(text, 1, diag);
    Parser parser(lexer, diag);
    ParseResult result;
    result.program = parser.parseProgram();
    result.hasError = parser.hasError();
    return result;
}
} // namespace

TEST(JsParserTest, ImportForms)
{
    DiagnosticEngine diag;
    auto result = parse("import d, { a as b, c } from './m.js';\nimport * as ns from 'lib';\nimport 'side';\n",
                        diag);
    ASSERT_FALSE(result.hasError);
    ASSERT_EQ(result.program->body.size(), 3u);

    const auto &first = as<ImportDeclaration>(*result.program->body[0]);
    EXPECT_EQ(first.source->value, "./m.js");
    ASSERT_EQ(first.specifiers.size(), 3u);
    EXPECT_TRUE(first.specifiers[0]->is(NodeKind::ImportDefaultSpecifier));
    EXPECT_EQ(first.specifiers[0]->local->name, "d");
    EXPECT_EQ(first.specifiers[1]->imported->name, "a");
    EXPECT_EQ(first.specifiers[1]->local->name, "b");
    EXPECT_EQ(first.specifiers[2]->local->name, "c");

    const auto &second = as<ImportDeclaration>(*result.program->body[1]);
    ASSERT_EQ(second.specifiers.size(), 1u);
    EXPECT_TRUE(second.specifiers[0]->is(NodeKind::ImportNamespaceSpecifier));
    EXPECT_EQ(second.specifiers[0]->local->name, "ns");

    EXPECT_TRUE(as<ImportDeclaration>(*result.program->body[2]).specifiers.empty());
}

TEST(JsParserTest, ExportForms)
{
    DiagnosticEngine diag;
    auto result = parse("export var a = 1, b;\n"
                        "export function f() {}\n"
                        "export { a as x, b };\n"
                        "export { y } from './y.js';\n"
                        "export default a + 1;\n",
                        diag);
    ASSERT_FALSE(result.hasError);
    ASSERT_EQ(result.program->body.size(), 5u);

    const auto &vars = as<ExportNamedDeclaration>(*result.program->body[0]);
    ASSERT_TRUE(vars.declaration);
    EXPECT_EQ(as<VariableDeclaration>(*vars.declaration).declarations.size(), 2u);

    const auto &fn = as<ExportNamedDeclaration>(*result.program->body[1]);
    EXPECT_TRUE(fn.declaration->is(NodeKind::FunctionDeclaration));

    const auto &list = as<ExportNamedDeclaration>(*result.program->body[2]);
    EXPECT_FALSE(list.declaration);
    ASSERT_EQ(list.specifiers.size(), 2u);
    EXPECT_EQ(list.specifiers[0]->local->name, "a");
    EXPECT_EQ(list.specifiers[0]->exported->name, "x");
    EXPECT_EQ(list.specifiers[1]->exported->name, "b");

    const auto &reexport = as<ExportNamedDeclaration>(*result.program->body[3]);
    ASSERT_TRUE(reexport.source);
    EXPECT_EQ(reexport.source->value, "./y.js");

    const auto &def = as<ExportDefaultDeclaration>(*result.program->body[4]);
    EXPECT_TRUE(def.declaration->is(NodeKind::BinaryExpression));
}

TEST(JsParserTest, NodeRangesCoverSource)
{
    DiagnosticEngine diag;
    const std::string text = "function f(a) { return a; }\nvar x = f(1);";
    auto result = parse(text, diag);
    ASSERT_FALSE(result.hasError);
    ASSERT_EQ(result.program->body.size(), 2u);

    const Node &fn = *result.program->body[0];
    EXPECT_EQ(fn.start, 0u);
    EXPECT_EQ(fn.end, 27u);
    const Node &var = *result.program->body[1];
    EXPECT_EQ(text.substr(var.start, var.end - var.start), "var x = f(1);");
}

TEST(JsParserTest, BinaryPrecedence)
{
    DiagnosticEngine diag;
    auto result = parse("x = a + b * c;", diag);
    ASSERT_FALSE(result.hasError);

    const auto &stmt = as<ExpressionStatement>(*result.program->body[0]);
    ASSERT_TRUE(stmt.expression->is(NodeKind::AssignmentExpression));
    const auto &assign = as<BinaryExpression>(*stmt.expression);
    ASSERT_TRUE(assign.right->is(NodeKind::BinaryExpression));
    const auto &sum = as<BinaryExpression>(*assign.right);
    EXPECT_EQ(sum.op, "+");
    ASSERT_TRUE(sum.right->is(NodeKind::BinaryExpression));
    EXPECT_EQ(as<BinaryExpression>(*sum.right).op, "*");
}

TEST(JsParserTest, AutomaticSemicolonInsertion)
{
    DiagnosticEngine diag;
    auto result = parse("var a = 1\nvar b = 2\nfunction f() { return }", diag);
    ASSERT_FALSE(result.hasError);
    ASSERT_EQ(result.program->body.size(), 3u);
    EXPECT_EQ(result.program->body[0]->end, 9u);
}

TEST(JsParserTest, ObjectLiteralShorthandAndMethods)
{
    DiagnosticEngine diag;
    auto result = parse("var o = { a, b: 1, get c() { return 2; }, d() {} };", diag);
    ASSERT_FALSE(result.hasError);

    const auto &decl = as<VariableDeclaration>(*result.program->body[0]);
    const auto &obj = as<ObjectExpression>(*decl.declarations[0]->init);
    ASSERT_EQ(obj.properties.size(), 4u);
    EXPECT_TRUE(obj.properties[0]->shorthand);
    EXPECT_FALSE(obj.properties[1]->shorthand);
    EXPECT_TRUE(obj.properties[3]->method);
}

TEST(JsParserTest, ArrowFunctionsAndClasses)
{
    DiagnosticEngine diag;
    auto result = parse("var f = (a, b) => a + b;\nvar g = x => { return x; };\n"
                        "class A extends B { constructor() { super(); } static make() { return new A(); } }",
                        diag);
    ASSERT_FALSE(result.hasError);
    ASSERT_EQ(result.program->body.size(), 3u);

    const auto &f = as<VariableDeclaration>(*result.program->body[0]);
    ASSERT_TRUE(f.declarations[0]->init->is(NodeKind::ArrowFunctionExpression));
    EXPECT_EQ(as<FunctionNode>(*f.declarations[0]->init).params.size(), 2u);

    const auto &cls = as<ClassNode>(*result.program->body[2]);
    ASSERT_TRUE(cls.superClass);
    EXPECT_EQ(cls.body->body.size(), 2u);
}

TEST(JsParserTest, DestructuringIsRejected)
{
    DiagnosticEngine diag;
    auto result = parse("var { a } = obj;", diag);
    EXPECT_TRUE(result.hasError);
    ASSERT_GE(diag.errorCount(), 1u);
    EXPECT_EQ(diag.diagnostics().front().code, "S2000");
    EXPECT_TRUE(result.program);
}

TEST(JsParserTest, ExportStarIsRejected)
{
    DiagnosticEngine diag;
    auto result = parse("export * from './a.js';", diag);
    EXPECT_TRUE(result.hasError);
}

TEST(JsParserTest, LexicalErrorsMarkParseFailed)
{
    DiagnosticEngine diag;
    auto result = parse("var s = `t`;", diag);
    EXPECT_TRUE(result.hasError);
    EXPECT_EQ(diag.diagnostics().front().code, "S1000");
}

TEST(JsParserTest, IsReferenceExcludesPropertyNames)
{
    DiagnosticEngine diag;
    auto result = parse("a.b; ({ c: d });", diag);
    ASSERT_FALSE(result.hasError);

    const auto &member = as<MemberExpression>(*as<ExpressionStatement>(*result.program->body[0]).expression);
    EXPECT_TRUE(isReference(*member.object, &member));
    EXPECT_FALSE(isReference(*member.property, &member));

    const auto &obj = as<ObjectExpression>(*as<ExpressionStatement>(*result.program->body[1]).expression);
    const Property &prop = *obj.properties[0];
    EXPECT_FALSE(isReference(*prop.key, &prop));
    EXPECT_TRUE(isReference(*prop.value, &prop));
}
