//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing for the JavaScript parser.
///
/// @details Expressions descend from the comma operator through assignment,
/// the conditional operator and binary precedence climbing down to unary,
/// postfix, call/member and primary expressions:
///
/// - parseExpression() -> parseAssignment() -> parseConditional()
/// - parseBinary(minPrec) loops over operators at or above minPrec
/// - parseUnary() -> parsePostfix() -> parseLeftHandSide() -> parsePrimary()
///
/// Parentheses are not represented in the tree; a parenthesised expression
/// yields its inner node with the inner range.
///
/// @see Parser.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontends/js/Parser.hpp"
#include <array>

namespace shake::frontends::js
{

namespace
{

constexpr std::array<std::string_view, 16> kAssignmentOps = {
    "=", "+=", "-=", "*=", "/=", "%=", "**=", "<<=", ">>=", ">>>=", "&=", "|=", "^=", "&&=", "||=", "?\?=",
};

bool isAssignmentOp(const Token &tok)
{
    if (tok.kind != TokenKind::Punctuator)
        return false;
    for (std::string_view op : kAssignmentOps)
    {
        if (tok.text == op)
            return true;
    }
    return false;
}

bool isSimpleTarget(const Node &node)
{
    return node.is(NodeKind::Identifier) || node.is(NodeKind::MemberExpression);
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Comma, Assignment, Conditional
//===----------------------------------------------------------------------===//

NodePtr Parser::parseExpression(bool noIn)
{
    NodePtr first = parseAssignment(noIn);
    if (!first || !checkPunct(","))
        return first;

    auto seq = std::make_unique<SequenceExpression>(first->start, 0);
    seq->expressions.push_back(std::move(first));
    while (matchPunct(","))
    {
        NodePtr next = parseAssignment(noIn);
        if (!next)
            return nullptr;
        seq->expressions.push_back(std::move(next));
    }
    seq->end = lastEnd_;
    return seq;
}

NodePtr Parser::parseAssignment(bool noIn)
{
    if (isArrowAhead())
        return parseArrowFunction();

    NodePtr left = parseConditional(noIn);
    if (!left || !isAssignmentOp(peek()))
        return left;

    if (!isSimpleTarget(*left))
    {
        if (left->is(NodeKind::ArrayExpression) || left->is(NodeKind::ObjectExpression))
            error("destructuring assignment is not supported");
        else
            error("invalid assignment target");
        return nullptr;
    }

    Token op = advance();
    auto assign = std::make_unique<BinaryExpression>(NodeKind::AssignmentExpression, left->start, 0);
    assign->op = op.text;
    assign->left = std::move(left);
    assign->right = parseAssignment(noIn);
    if (!assign->right)
        return nullptr;
    assign->end = lastEnd_;
    return assign;
}

NodePtr Parser::parseConditional(bool noIn)
{
    NodePtr test = parseBinary(1, noIn);
    if (!test || !matchPunct("?"))
        return test;

    auto cond = std::make_unique<ConditionalExpression>(test->start, 0);
    cond->test = std::move(test);
    cond->consequent = parseAssignment(false);
    if (!cond->consequent || !expectPunct(":"))
        return nullptr;
    cond->alternate = parseAssignment(noIn);
    if (!cond->alternate)
        return nullptr;
    cond->end = lastEnd_;
    return cond;
}

//===----------------------------------------------------------------------===//
// Binary Operators
//===----------------------------------------------------------------------===//

int Parser::binaryPrecedence(const Token &tok, bool noIn) const
{
    if (tok.kind == TokenKind::Keyword)
    {
        if (tok.text == "instanceof")
            return 7;
        if (tok.text == "in")
            return noIn ? 0 : 7;
        return 0;
    }
    if (tok.kind != TokenKind::Punctuator)
        return 0;

    const std::string &op = tok.text;
    if (op == "??" || op == "||")
        return 1;
    if (op == "&&")
        return 2;
    if (op == "|")
        return 3;
    if (op == "^")
        return 4;
    if (op == "&")
        return 5;
    if (op == "==" || op == "!=" || op == "===" || op == "!==")
        return 6;
    if (op == "<" || op == ">" || op == "<=" || op == ">=")
        return 7;
    if (op == "<<" || op == ">>" || op == ">>>")
        return 8;
    if (op == "+" || op == "-")
        return 9;
    if (op == "*" || op == "/" || op == "%")
        return 10;
    if (op == "**")
        return 11;
    return 0;
}

NodePtr Parser::parseBinary(int minPrec, bool noIn)
{
    NodePtr left = parseUnary();
    if (!left)
        return nullptr;

    for (;;)
    {
        const int prec = binaryPrecedence(peek(), noIn);
        if (prec == 0 || prec < minPrec)
            break;

        Token op = advance();
        // `**` is right associative; everything else associates left.
        NodePtr right = parseBinary(op.text == "**" ? prec : prec + 1, noIn);
        if (!right)
            return nullptr;

        const bool logical = op.text == "&&" || op.text == "||" || op.text == "??";
        auto bin = std::make_unique<BinaryExpression>(
            logical ? NodeKind::LogicalExpression : NodeKind::BinaryExpression, left->start, lastEnd_);
        bin->op = op.text;
        bin->left = std::move(left);
        bin->right = std::move(right);
        left = std::move(bin);
    }

    return left;
}

//===----------------------------------------------------------------------===//
// Unary and Postfix
//===----------------------------------------------------------------------===//

NodePtr Parser::parseUnary()
{
    const Token tok = peek();

    const bool unaryPunct = tok.isPunct("!") || tok.isPunct("~") || tok.isPunct("+") || tok.isPunct("-");
    const bool unaryKeyword = tok.isKeyword("typeof") || tok.isKeyword("void") || tok.isKeyword("delete");
    if (unaryPunct || unaryKeyword)
    {
        advance();
        auto unary = std::make_unique<UnaryExpression>(NodeKind::UnaryExpression, tok.start, 0);
        unary->op = tok.text;
        unary->argument = parseUnary();
        if (!unary->argument)
            return nullptr;
        unary->end = lastEnd_;
        return unary;
    }

    if (tok.isPunct("++") || tok.isPunct("--"))
    {
        advance();
        auto update = std::make_unique<UnaryExpression>(NodeKind::UpdateExpression, tok.start, 0);
        update->op = tok.text;
        update->argument = parseUnary();
        if (!update->argument)
            return nullptr;
        if (!isSimpleTarget(*update->argument))
        {
            errorAt(tok.loc, "invalid operand for '" + tok.text + "'");
            return nullptr;
        }
        update->end = lastEnd_;
        return update;
    }

    if (tok.isKeyword("await") || tok.isKeyword("yield"))
    {
        error("'" + tok.text + "' expressions are not supported");
        return nullptr;
    }

    return parsePostfix();
}

NodePtr Parser::parsePostfix()
{
    NodePtr expr = parseLeftHandSide();
    if (!expr)
        return nullptr;

    if ((checkPunct("++") || checkPunct("--")) && !peek().newlineBefore)
    {
        if (!isSimpleTarget(*expr))
        {
            error("invalid operand for '" + peek().text + "'");
            return nullptr;
        }
        Token op = advance();
        auto update = std::make_unique<UnaryExpression>(NodeKind::UpdateExpression, expr->start, lastEnd_);
        update->op = op.text;
        update->prefix = false;
        update->argument = std::move(expr);
        return update;
    }

    return expr;
}

//===----------------------------------------------------------------------===//
// Calls, Members, new
//===----------------------------------------------------------------------===//

NodePtr Parser::parseLeftHandSide()
{
    NodePtr expr = checkKeyword("new") ? parseNew() : parsePrimary();
    if (!expr)
        return nullptr;

    for (;;)
    {
        if (matchPunct("."))
        {
            auto member = std::make_unique<MemberExpression>(expr->start, 0);
            member->object = std::move(expr);
            member->property = parseIdentifierName();
            if (!member->property)
                return nullptr;
            member->end = lastEnd_;
            expr = std::move(member);
        }
        else if (matchPunct("["))
        {
            auto member = std::make_unique<MemberExpression>(expr->start, 0);
            member->object = std::move(expr);
            member->computed = true;
            member->property = parseExpression();
            if (!member->property || !expectPunct("]"))
                return nullptr;
            member->end = lastEnd_;
            expr = std::move(member);
        }
        else if (checkPunct("("))
        {
            auto call = std::make_unique<CallExpression>(NodeKind::CallExpression, expr->start, 0);
            call->callee = std::move(expr);
            if (!parseArguments(call->arguments))
                return nullptr;
            call->end = lastEnd_;
            expr = std::move(call);
        }
        else
        {
            break;
        }
    }

    return expr;
}

/// @brief Parse `new Callee[.member...][(args)]`.
/// @details Member accesses bind to the callee; the first argument list
///          belongs to the `new`.  Later calls are handled by the caller.
NodePtr Parser::parseNew()
{
    const uint32_t start = advance().start; // 'new'

    if (checkPunct("."))
    {
        error("'new.target' is not supported");
        return nullptr;
    }

    NodePtr callee = checkKeyword("new") ? parseNew() : parsePrimary();
    if (!callee)
        return nullptr;

    for (;;)
    {
        if (matchPunct("."))
        {
            auto member = std::make_unique<MemberExpression>(callee->start, 0);
            member->object = std::move(callee);
            member->property = parseIdentifierName();
            if (!member->property)
                return nullptr;
            member->end = lastEnd_;
            callee = std::move(member);
        }
        else if (matchPunct("["))
        {
            auto member = std::make_unique<MemberExpression>(callee->start, 0);
            member->object = std::move(callee);
            member->computed = true;
            member->property = parseExpression();
            if (!member->property || !expectPunct("]"))
                return nullptr;
            member->end = lastEnd_;
            callee = std::move(member);
        }
        else
        {
            break;
        }
    }

    auto expr = std::make_unique<CallExpression>(NodeKind::NewExpression, start, 0);
    expr->callee = std::move(callee);
    if (checkPunct("(") && !parseArguments(expr->arguments))
        return nullptr;
    expr->end = lastEnd_;
    return expr;
}

bool Parser::parseArguments(std::vector<NodePtr> &args)
{
    if (!expectPunct("("))
        return false;

    while (!checkPunct(")"))
    {
        if (checkPunct("..."))
        {
            error("spread arguments are not supported");
            return false;
        }
        NodePtr arg = parseAssignment();
        if (!arg)
            return false;
        args.push_back(std::move(arg));
        if (!matchPunct(","))
            break;
    }

    return expectPunct(")");
}

//===----------------------------------------------------------------------===//
// Primary Expressions
//===----------------------------------------------------------------------===//

NodePtr Parser::parsePrimary()
{
    const Token tok = peek();

    switch (tok.kind)
    {
        case TokenKind::Identifier:
            if (tok.text == "async" && checkKeyword("function", 1) && !peek(1).newlineBefore)
            {
                error("async functions are not supported");
                return nullptr;
            }
            return parseBindingIdentifier();

        case TokenKind::NumberLiteral:
            advance();
            return std::make_unique<Literal>(tok.start, tok.end, LiteralKind::Number, tok.text, tok.text);

        case TokenKind::StringLiteral:
            return parseStringLiteral();

        case TokenKind::Keyword:
            if (tok.text == "this")
            {
                advance();
                return std::make_unique<ThisExpression>(tok.start, tok.end);
            }
            if (tok.text == "super")
            {
                advance();
                return std::make_unique<Super>(tok.start, tok.end);
            }
            if (tok.text == "true" || tok.text == "false")
            {
                advance();
                return std::make_unique<Literal>(tok.start, tok.end, LiteralKind::Boolean, tok.text, tok.text);
            }
            if (tok.text == "null")
            {
                advance();
                return std::make_unique<Literal>(tok.start, tok.end, LiteralKind::Null, tok.text, tok.text);
            }
            if (tok.text == "function")
                return parseFunction(NodeKind::FunctionExpression, false);
            if (tok.text == "class")
                return parseClass(NodeKind::ClassExpression, false);
            if (tok.text == "new")
                return parseNew();
            break;

        case TokenKind::Punctuator:
            if (tok.text == "(")
            {
                advance();
                NodePtr inner = parseExpression();
                if (!inner || !expectPunct(")"))
                    return nullptr;
                return inner;
            }
            if (tok.text == "[")
                return parseArrayLiteral();
            if (tok.text == "{")
                return parseObjectLiteral();
            if (tok.text == "/" || tok.text == "/=")
            {
                error("regular expression literals are not supported");
                return nullptr;
            }
            break;

        case TokenKind::Eof:
        case TokenKind::Error:
            break;
    }

    unexpected("expression");
    return nullptr;
}

NodePtr Parser::parseArrayLiteral()
{
    auto array = std::make_unique<ArrayExpression>(advance().start, 0); // '['

    while (!checkPunct("]"))
    {
        if (matchPunct(","))
        {
            array->elements.push_back(nullptr);
            continue;
        }
        if (checkPunct("..."))
        {
            error("spread elements are not supported");
            return nullptr;
        }
        NodePtr element = parseAssignment();
        if (!element)
            return nullptr;
        array->elements.push_back(std::move(element));
        if (!matchPunct(","))
            break;
    }

    if (!expectPunct("]"))
        return nullptr;
    array->end = lastEnd_;
    return array;
}

NodePtr Parser::parseObjectLiteral()
{
    auto object = std::make_unique<ObjectExpression>(advance().start, 0); // '{'

    while (!checkPunct("}"))
    {
        auto prop = parseProperty();
        if (!prop)
            return nullptr;
        object->properties.push_back(std::move(prop));
        if (!matchPunct(","))
            break;
    }

    if (!expectPunct("}"))
        return nullptr;
    object->end = lastEnd_;
    return object;
}

/// @brief Parse one object literal member.
/// @details Handles `key: value`, shorthand `{ a }`, methods `m() {}` and
///          accessors `get x() {}` / `set x(v) {}`.
std::unique_ptr<Property> Parser::parseProperty()
{
    auto prop = std::make_unique<Property>(peek().start, 0);

    if (checkPunct("..."))
    {
        error("object spread is not supported");
        return nullptr;
    }

    auto endsKey = [this](size_t offset) {
        return checkPunct("(", offset) || checkPunct(",", offset) || checkPunct(":", offset) ||
               checkPunct("}", offset);
    };

    if ((peek().isIdentifier("get") || peek().isIdentifier("set")) && !endsKey(1))
    {
        prop->propertyKind = advance().text == "get" ? PropertyKind::Get : PropertyKind::Set;
    }
    else if (checkPunct("*") || (peek().isIdentifier("async") && !endsKey(1)))
    {
        error("generator and async methods are not supported");
        return nullptr;
    }

    const bool keyIsKeyword = peek().kind == TokenKind::Keyword;
    prop->key = parsePropertyKey(prop->computed);
    if (!prop->key)
        return nullptr;

    if (prop->propertyKind != PropertyKind::Init || checkPunct("("))
    {
        prop->method = prop->propertyKind == PropertyKind::Init;
        auto fn = std::make_unique<FunctionNode>(NodeKind::FunctionExpression, peek().start, 0);
        if (!parseParams(fn->params))
            return nullptr;
        fn->body = parseBlock();
        if (!fn->body)
            return nullptr;
        fn->end = lastEnd_;
        prop->value = std::move(fn);
    }
    else if (matchPunct(":"))
    {
        prop->value = parseAssignment();
        if (!prop->value)
            return nullptr;
    }
    else if (!prop->computed && !keyIsKeyword && prop->key->is(NodeKind::Identifier) &&
             (checkPunct(",") || checkPunct("}")))
    {
        const auto &key = as<Identifier>(*prop->key);
        prop->shorthand = true;
        prop->value = std::make_unique<Identifier>(key.start, key.end, key.name);
    }
    else
    {
        if (checkPunct("="))
            error("destructuring defaults are not supported");
        else
            unexpected("':'");
        return nullptr;
    }

    prop->end = lastEnd_;
    return prop;
}

NodePtr Parser::parsePropertyKey(bool &computed)
{
    const Token tok = peek();

    if (tok.isPunct("["))
    {
        advance();
        computed = true;
        NodePtr key = parseAssignment();
        if (!key || !expectPunct("]"))
            return nullptr;
        return key;
    }
    if (tok.kind == TokenKind::StringLiteral)
        return parseStringLiteral();
    if (tok.kind == TokenKind::NumberLiteral)
    {
        advance();
        return std::make_unique<Literal>(tok.start, tok.end, LiteralKind::Number, tok.text, tok.text);
    }
    if (checkIdentifierName())
        return parseIdentifierName();

    unexpected("property name");
    return nullptr;
}

//===----------------------------------------------------------------------===//
// Arrow Functions
//===----------------------------------------------------------------------===//

bool Parser::isArrowAhead()
{
    if (peek().kind == TokenKind::Identifier)
        return checkPunct("=>", 1) && !peek(1).newlineBefore;
    if (!checkPunct("("))
        return false;

    // Find the matching ')' and look at what follows it.
    int depth = 0;
    for (size_t i = 0;; ++i)
    {
        const Token &tok = peek(i);
        if (tok.kind == TokenKind::Eof)
            return false;
        if (tok.isPunct("(") || tok.isPunct("[") || tok.isPunct("{"))
            ++depth;
        else if (tok.isPunct(")") || tok.isPunct("]") || tok.isPunct("}"))
            --depth;
        if (depth == 0)
            return checkPunct("=>", i + 1) && !peek(i + 1).newlineBefore;
    }
}

NodePtr Parser::parseArrowFunction()
{
    auto fn = std::make_unique<FunctionNode>(NodeKind::ArrowFunctionExpression, peek().start, 0);

    if (peek().kind == TokenKind::Identifier)
    {
        fn->params.push_back(parseBindingIdentifier());
    }
    else if (!parseParams(fn->params))
    {
        return nullptr;
    }

    if (!expectPunct("=>"))
        return nullptr;

    if (checkPunct("{"))
        fn->body = parseBlock();
    else
        fn->body = parseAssignment();
    if (!fn->body)
        return nullptr;

    fn->end = lastEnd_;
    return fn;
}

//===----------------------------------------------------------------------===//
// Names and Literals
//===----------------------------------------------------------------------===//

IdentifierPtr Parser::parseBindingIdentifier()
{
    if (peek().kind == TokenKind::Identifier)
    {
        Token tok = advance();
        return std::make_unique<Identifier>(tok.start, tok.end, tok.text);
    }
    if (peek().kind == TokenKind::Keyword)
    {
        error("'" + peek().text + "' is a reserved word");
        return nullptr;
    }
    unexpected("identifier");
    return nullptr;
}

IdentifierPtr Parser::parseIdentifierName()
{
    if (checkIdentifierName())
    {
        Token tok = advance();
        return std::make_unique<Identifier>(tok.start, tok.end, tok.text);
    }
    unexpected("identifier");
    return nullptr;
}

std::unique_ptr<Literal> Parser::parseStringLiteral()
{
    if (peek().kind != TokenKind::StringLiteral)
    {
        unexpected("string literal");
        return nullptr;
    }
    Token tok = advance();
    return std::make_unique<Literal>(tok.start, tok.end, LiteralKind::String, tok.text, tok.value);
}

} // namespace shake::frontends::js
