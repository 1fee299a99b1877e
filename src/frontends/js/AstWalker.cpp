// File: src/frontends/js/AstWalker.cpp
// Purpose: Implements child enumeration and the recursive walker for JavaScript ASTs.
// Key invariants: Child order matches source order, so position-sensitive passes
//                 (such as the identifier rewriter) see nodes left to right.
// Ownership/Lifetime: Borrows nodes only.
// Links: docs/codemap.md

#include "frontends/js/AstWalker.hpp"

namespace shake::frontends::js
{
namespace
{
template <typename Ptr> void visitOptional(const Ptr &child, const std::function<void(const Node &)> &fn)
{
    if (child)
        fn(*child);
}

template <typename Range> void visitRange(const Range &children, const std::function<void(const Node &)> &fn)
{
    for (const auto &child : children)
        visitOptional(child, fn);
}
} // namespace

void forEachChild(const Node &node, const std::function<void(const Node &)> &fn)
{
    switch (node.kind)
    {
        case NodeKind::Program:
            visitRange(as<Program>(node).body, fn);
            break;

        case NodeKind::ImportDeclaration:
        {
            const auto &decl = as<ImportDeclaration>(node);
            visitRange(decl.specifiers, fn);
            visitOptional(decl.source, fn);
            break;
        }
        case NodeKind::ImportSpecifier:
        case NodeKind::ImportDefaultSpecifier:
        case NodeKind::ImportNamespaceSpecifier:
        {
            const auto &spec = as<ImportSpecifier>(node);
            visitOptional(spec.imported, fn);
            visitOptional(spec.local, fn);
            break;
        }
        case NodeKind::ExportNamedDeclaration:
        {
            const auto &decl = as<ExportNamedDeclaration>(node);
            visitOptional(decl.declaration, fn);
            visitRange(decl.specifiers, fn);
            visitOptional(decl.source, fn);
            break;
        }
        case NodeKind::ExportDefaultDeclaration:
            visitOptional(as<ExportDefaultDeclaration>(node).declaration, fn);
            break;
        case NodeKind::ExportSpecifier:
        {
            const auto &spec = as<ExportSpecifier>(node);
            visitOptional(spec.local, fn);
            visitOptional(spec.exported, fn);
            break;
        }

        case NodeKind::VariableDeclaration:
            visitRange(as<VariableDeclaration>(node).declarations, fn);
            break;
        case NodeKind::VariableDeclarator:
        {
            const auto &decl = as<VariableDeclarator>(node);
            visitOptional(decl.id, fn);
            visitOptional(decl.init, fn);
            break;
        }
        case NodeKind::FunctionDeclaration:
        case NodeKind::FunctionExpression:
        case NodeKind::ArrowFunctionExpression:
        {
            const auto &fnNode = as<FunctionNode>(node);
            visitOptional(fnNode.id, fn);
            visitRange(fnNode.params, fn);
            visitOptional(fnNode.body, fn);
            break;
        }
        case NodeKind::ClassDeclaration:
        case NodeKind::ClassExpression:
        {
            const auto &cls = as<ClassNode>(node);
            visitOptional(cls.id, fn);
            visitOptional(cls.superClass, fn);
            visitOptional(cls.body, fn);
            break;
        }
        case NodeKind::ClassBody:
            visitRange(as<ClassBody>(node).body, fn);
            break;
        case NodeKind::MethodDefinition:
        {
            const auto &method = as<MethodDefinition>(node);
            visitOptional(method.key, fn);
            visitOptional(method.value, fn);
            break;
        }

        case NodeKind::BlockStatement:
            visitRange(as<BlockStatement>(node).body, fn);
            break;
        case NodeKind::ExpressionStatement:
            visitOptional(as<ExpressionStatement>(node).expression, fn);
            break;
        case NodeKind::EmptyStatement:
        case NodeKind::BreakStatement:
        case NodeKind::ContinueStatement:
            break;
        case NodeKind::IfStatement:
        {
            const auto &stmt = as<IfStatement>(node);
            visitOptional(stmt.test, fn);
            visitOptional(stmt.consequent, fn);
            visitOptional(stmt.alternate, fn);
            break;
        }
        case NodeKind::ForStatement:
        {
            const auto &stmt = as<ForStatement>(node);
            visitOptional(stmt.init, fn);
            visitOptional(stmt.test, fn);
            visitOptional(stmt.update, fn);
            visitOptional(stmt.body, fn);
            break;
        }
        case NodeKind::ForInStatement:
        case NodeKind::ForOfStatement:
        {
            const auto &stmt = as<ForEachStatement>(node);
            visitOptional(stmt.left, fn);
            visitOptional(stmt.right, fn);
            visitOptional(stmt.body, fn);
            break;
        }
        case NodeKind::WhileStatement:
        {
            const auto &stmt = as<LoopStatement>(node);
            visitOptional(stmt.test, fn);
            visitOptional(stmt.body, fn);
            break;
        }
        case NodeKind::DoWhileStatement:
        {
            const auto &stmt = as<LoopStatement>(node);
            visitOptional(stmt.body, fn);
            visitOptional(stmt.test, fn);
            break;
        }
        case NodeKind::ReturnStatement:
        case NodeKind::ThrowStatement:
            visitOptional(as<ArgumentStatement>(node).argument, fn);
            break;
        case NodeKind::TryStatement:
        {
            const auto &stmt = as<TryStatement>(node);
            visitOptional(stmt.block, fn);
            visitOptional(stmt.handler, fn);
            visitOptional(stmt.finalizer, fn);
            break;
        }
        case NodeKind::CatchClause:
        {
            const auto &clause = as<CatchClause>(node);
            visitOptional(clause.param, fn);
            visitOptional(clause.body, fn);
            break;
        }
        case NodeKind::SwitchStatement:
        {
            const auto &stmt = as<SwitchStatement>(node);
            visitOptional(stmt.discriminant, fn);
            visitRange(stmt.cases, fn);
            break;
        }
        case NodeKind::SwitchCase:
        {
            const auto &sc = as<SwitchCase>(node);
            visitOptional(sc.test, fn);
            visitRange(sc.consequent, fn);
            break;
        }

        case NodeKind::Identifier:
        case NodeKind::Literal:
        case NodeKind::ThisExpression:
        case NodeKind::Super:
            break;
        case NodeKind::ArrayExpression:
            visitRange(as<ArrayExpression>(node).elements, fn);
            break;
        case NodeKind::ObjectExpression:
            visitRange(as<ObjectExpression>(node).properties, fn);
            break;
        case NodeKind::Property:
        {
            const auto &prop = as<Property>(node);
            visitOptional(prop.key, fn);
            visitOptional(prop.value, fn);
            break;
        }
        case NodeKind::UnaryExpression:
        case NodeKind::UpdateExpression:
            visitOptional(as<UnaryExpression>(node).argument, fn);
            break;
        case NodeKind::BinaryExpression:
        case NodeKind::LogicalExpression:
        case NodeKind::AssignmentExpression:
        {
            const auto &expr = as<BinaryExpression>(node);
            visitOptional(expr.left, fn);
            visitOptional(expr.right, fn);
            break;
        }
        case NodeKind::ConditionalExpression:
        {
            const auto &expr = as<ConditionalExpression>(node);
            visitOptional(expr.test, fn);
            visitOptional(expr.consequent, fn);
            visitOptional(expr.alternate, fn);
            break;
        }
        case NodeKind::CallExpression:
        case NodeKind::NewExpression:
        {
            const auto &call = as<CallExpression>(node);
            visitOptional(call.callee, fn);
            visitRange(call.arguments, fn);
            break;
        }
        case NodeKind::MemberExpression:
        {
            const auto &member = as<MemberExpression>(node);
            visitOptional(member.object, fn);
            visitOptional(member.property, fn);
            break;
        }
        case NodeKind::SequenceExpression:
            visitRange(as<SequenceExpression>(node).expressions, fn);
            break;
    }
}

void walk(const Node &root, NodeVisitor &visitor, const Node *parent)
{
    if (visitor.enter(root, parent) == WalkAction::Continue)
    {
        forEachChild(root, [&](const Node &child) { walk(child, visitor, &root); });
    }
    visitor.leave(root, parent);
}

} // namespace shake::frontends::js
