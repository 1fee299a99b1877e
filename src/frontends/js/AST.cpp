//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.cpp
/// @brief Out-of-line helpers for the JavaScript syntax tree.
///
//===----------------------------------------------------------------------===//

#include "frontends/js/AST.hpp"

namespace shake::frontends::js
{

const char *nodeKindToString(NodeKind kind)
{
    switch (kind)
    {
        case NodeKind::Program:
            return "Program";
        case NodeKind::ImportDeclaration:
            return "ImportDeclaration";
        case NodeKind::ImportSpecifier:
            return "ImportSpecifier";
        case NodeKind::ImportDefaultSpecifier:
            return "ImportDefaultSpecifier";
        case NodeKind::ImportNamespaceSpecifier:
            return "ImportNamespaceSpecifier";
        case NodeKind::ExportNamedDeclaration:
            return "ExportNamedDeclaration";
        case NodeKind::ExportDefaultDeclaration:
            return "ExportDefaultDeclaration";
        case NodeKind::ExportSpecifier:
            return "ExportSpecifier";
        case NodeKind::VariableDeclaration:
            return "VariableDeclaration";
        case NodeKind::VariableDeclarator:
            return "VariableDeclarator";
        case NodeKind::FunctionDeclaration:
            return "FunctionDeclaration";
        case NodeKind::ClassDeclaration:
            return "ClassDeclaration";
        case NodeKind::ClassBody:
            return "ClassBody";
        case NodeKind::MethodDefinition:
            return "MethodDefinition";
        case NodeKind::BlockStatement:
            return "BlockStatement";
        case NodeKind::ExpressionStatement:
            return "ExpressionStatement";
        case NodeKind::EmptyStatement:
            return "EmptyStatement";
        case NodeKind::IfStatement:
            return "IfStatement";
        case NodeKind::ForStatement:
            return "ForStatement";
        case NodeKind::ForInStatement:
            return "ForInStatement";
        case NodeKind::ForOfStatement:
            return "ForOfStatement";
        case NodeKind::WhileStatement:
            return "WhileStatement";
        case NodeKind::DoWhileStatement:
            return "DoWhileStatement";
        case NodeKind::ReturnStatement:
            return "ReturnStatement";
        case NodeKind::ThrowStatement:
            return "ThrowStatement";
        case NodeKind::BreakStatement:
            return "BreakStatement";
        case NodeKind::ContinueStatement:
            return "ContinueStatement";
        case NodeKind::TryStatement:
            return "TryStatement";
        case NodeKind::CatchClause:
            return "CatchClause";
        case NodeKind::SwitchStatement:
            return "SwitchStatement";
        case NodeKind::SwitchCase:
            return "SwitchCase";
        case NodeKind::Identifier:
            return "Identifier";
        case NodeKind::Literal:
            return "Literal";
        case NodeKind::ThisExpression:
            return "ThisExpression";
        case NodeKind::Super:
            return "Super";
        case NodeKind::ArrayExpression:
            return "ArrayExpression";
        case NodeKind::ObjectExpression:
            return "ObjectExpression";
        case NodeKind::Property:
            return "Property";
        case NodeKind::FunctionExpression:
            return "FunctionExpression";
        case NodeKind::ArrowFunctionExpression:
            return "ArrowFunctionExpression";
        case NodeKind::ClassExpression:
            return "ClassExpression";
        case NodeKind::UnaryExpression:
            return "UnaryExpression";
        case NodeKind::UpdateExpression:
            return "UpdateExpression";
        case NodeKind::BinaryExpression:
            return "BinaryExpression";
        case NodeKind::LogicalExpression:
            return "LogicalExpression";
        case NodeKind::AssignmentExpression:
            return "AssignmentExpression";
        case NodeKind::ConditionalExpression:
            return "ConditionalExpression";
        case NodeKind::CallExpression:
            return "CallExpression";
        case NodeKind::NewExpression:
            return "NewExpression";
        case NodeKind::MemberExpression:
            return "MemberExpression";
        case NodeKind::SequenceExpression:
            return "SequenceExpression";
    }
    return "<unknown>";
}

bool isFunctionKind(NodeKind kind)
{
    return kind == NodeKind::FunctionDeclaration || kind == NodeKind::FunctionExpression ||
           kind == NodeKind::ArrowFunctionExpression;
}

bool isReference(const Node &node, const Node *parent)
{
    if (!node.is(NodeKind::Identifier))
        return false;
    if (!parent)
        return true;

    switch (parent->kind)
    {
        case NodeKind::MemberExpression:
        {
            // disregard the `bar` in `foo.bar`
            const auto &member = as<MemberExpression>(*parent);
            return member.computed || member.object.get() == &node;
        }
        case NodeKind::Property:
        {
            // disregard the `bar` in `{ bar: foo }`
            const auto &prop = as<Property>(*parent);
            return prop.computed || prop.value.get() == &node;
        }
        case NodeKind::MethodDefinition:
        {
            const auto &method = as<MethodDefinition>(*parent);
            return method.computed || method.key.get() != &node;
        }
        case NodeKind::ExportSpecifier:
            return as<ExportSpecifier>(*parent).local.get() == &node;
        case NodeKind::ImportSpecifier:
            return as<ImportSpecifier>(*parent).local.get() == &node;
        default:
            return true;
    }
}

} // namespace shake::frontends::js
