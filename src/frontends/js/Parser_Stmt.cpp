//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Module item, statement and declaration parsing.
///
//===----------------------------------------------------------------------===//

#include "frontends/js/Parser.hpp"

namespace shake::frontends::js
{

//===----------------------------------------------------------------------===//
// Program and Module Items
//===----------------------------------------------------------------------===//

std::unique_ptr<Program> Parser::parseProgram()
{
    auto program = std::make_unique<Program>(0, static_cast<uint32_t>(lexer_.source().size()));

    while (peek().kind != TokenKind::Eof)
    {
        const size_t before = tokenPos_;
        if (NodePtr item = parseModuleItem())
        {
            program->body.push_back(std::move(item));
            continue;
        }
        resyncAfterError();
        if (tokenPos_ == before)
            advance();
    }

    return program;
}

NodePtr Parser::parseModuleItem()
{
    if (checkKeyword("import") && !checkPunct("(", 1) && !checkPunct(".", 1))
        return parseImportDeclaration();
    if (checkKeyword("export"))
        return parseExportDeclaration();
    return parseStatement();
}

/// @brief Parse `import ... from "source";` in all of its forms.
/// @details Supports the side-effect form `import "x"`, a default binding,
///          a namespace binding `* as ns`, and braced named bindings, in the
///          combinations the language permits.
NodePtr Parser::parseImportDeclaration()
{
    const uint32_t start = advance().start; // 'import'
    auto decl = std::make_unique<ImportDeclaration>(start, start);

    if (peek().kind != TokenKind::StringLiteral)
    {
        bool needNamed = true;

        if (peek().kind == TokenKind::Identifier)
        {
            const uint32_t specStart = peek().start;
            auto spec =
                std::make_unique<ImportSpecifier>(NodeKind::ImportDefaultSpecifier, specStart, specStart);
            spec->local = parseBindingIdentifier();
            if (!spec->local)
                return nullptr;
            spec->end = lastEnd_;
            decl->specifiers.push_back(std::move(spec));
            needNamed = matchPunct(",");
        }

        if (needNamed && checkPunct("*"))
        {
            const uint32_t specStart = advance().start;
            if (!peek().isIdentifier("as"))
            {
                unexpected("'as'");
                return nullptr;
            }
            advance();
            auto spec =
                std::make_unique<ImportSpecifier>(NodeKind::ImportNamespaceSpecifier, specStart, specStart);
            spec->local = parseBindingIdentifier();
            if (!spec->local)
                return nullptr;
            spec->end = lastEnd_;
            decl->specifiers.push_back(std::move(spec));
        }
        else if (needNamed && matchPunct("{"))
        {
            while (!checkPunct("}"))
            {
                const uint32_t specStart = peek().start;
                const bool importedIsKeyword = peek().kind == TokenKind::Keyword;
                auto spec =
                    std::make_unique<ImportSpecifier>(NodeKind::ImportSpecifier, specStart, specStart);
                spec->imported = parseIdentifierName();
                if (!spec->imported)
                    return nullptr;

                if (peek().isIdentifier("as"))
                {
                    advance();
                    spec->local = parseBindingIdentifier();
                    if (!spec->local)
                        return nullptr;
                }
                else if (importedIsKeyword)
                {
                    unexpected("'as'");
                    return nullptr;
                }
                else
                {
                    spec->local = std::make_unique<Identifier>(
                        spec->imported->start, spec->imported->end, spec->imported->name);
                }

                spec->end = lastEnd_;
                decl->specifiers.push_back(std::move(spec));
                if (!matchPunct(","))
                    break;
            }
            if (!expectPunct("}"))
                return nullptr;
        }
        else if (needNamed)
        {
            unexpected("import specifier");
            return nullptr;
        }

        if (!peek().isIdentifier("from"))
        {
            unexpected("'from'");
            return nullptr;
        }
        advance();
    }

    decl->source = parseStringLiteral();
    if (!decl->source || !consumeSemicolon())
        return nullptr;
    decl->end = lastEnd_;
    return decl;
}

NodePtr Parser::parseExportDeclaration()
{
    const uint32_t start = advance().start; // 'export'

    if (matchKeyword("default"))
    {
        auto decl = std::make_unique<ExportDefaultDeclaration>(start, start);
        if (checkKeyword("function"))
        {
            decl->declaration = parseFunction(NodeKind::FunctionDeclaration, false);
        }
        else if (checkKeyword("class"))
        {
            decl->declaration = parseClass(NodeKind::ClassDeclaration, false);
        }
        else
        {
            decl->declaration = parseAssignment();
            if (decl->declaration && !consumeSemicolon())
                return nullptr;
        }
        if (!decl->declaration)
            return nullptr;
        decl->end = lastEnd_;
        return decl;
    }

    if (checkPunct("*"))
    {
        error("'export *' is not supported");
        return nullptr;
    }

    auto decl = std::make_unique<ExportNamedDeclaration>(start, start);

    if (matchPunct("{"))
    {
        while (!checkPunct("}"))
        {
            const uint32_t specStart = peek().start;
            auto spec = std::make_unique<ExportSpecifier>(specStart, specStart);
            spec->local = parseIdentifierName();
            if (!spec->local)
                return nullptr;
            if (peek().isIdentifier("as"))
            {
                advance();
                spec->exported = parseIdentifierName();
                if (!spec->exported)
                    return nullptr;
            }
            else
            {
                spec->exported =
                    std::make_unique<Identifier>(spec->local->start, spec->local->end, spec->local->name);
            }
            spec->end = lastEnd_;
            decl->specifiers.push_back(std::move(spec));
            if (!matchPunct(","))
                break;
        }
        if (!expectPunct("}"))
            return nullptr;

        if (peek().isIdentifier("from"))
        {
            advance();
            decl->source = parseStringLiteral();
            if (!decl->source)
                return nullptr;
        }
        if (!consumeSemicolon())
            return nullptr;
        decl->end = lastEnd_;
        return decl;
    }

    if (checkKeyword("var") || checkKeyword("let") || checkKeyword("const"))
        decl->declaration = parseVariableStatement();
    else if (checkKeyword("function"))
        decl->declaration = parseFunction(NodeKind::FunctionDeclaration, true);
    else if (checkKeyword("class"))
        decl->declaration = parseClass(NodeKind::ClassDeclaration, true);
    else
        unexpected("declaration or '{' after 'export'");

    if (!decl->declaration)
        return nullptr;
    decl->end = lastEnd_;
    return decl;
}

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

/// @brief Parse a statement, dispatching on the leading token.
/// @return The parsed statement, or nullptr on error.
NodePtr Parser::parseStatement()
{
    const Token tok = peek();

    if (tok.isPunct("{"))
        return parseBlock();

    if (tok.isPunct(";"))
    {
        Token semi = advance();
        return std::make_unique<SimpleStatement>(NodeKind::EmptyStatement, semi.start, semi.end);
    }

    if (tok.kind == TokenKind::Keyword)
    {
        if (tok.text == "var" || tok.text == "let" || tok.text == "const")
            return parseVariableStatement();
        if (tok.text == "function")
            return parseFunction(NodeKind::FunctionDeclaration, true);
        if (tok.text == "class")
            return parseClass(NodeKind::ClassDeclaration, true);
        if (tok.text == "if")
            return parseIfStatement();
        if (tok.text == "for")
            return parseForStatement();
        if (tok.text == "while")
            return parseWhileStatement();
        if (tok.text == "do")
            return parseDoWhileStatement();
        if (tok.text == "return" || tok.text == "throw")
            return parseReturnOrThrow();
        if (tok.text == "break" || tok.text == "continue")
            return parseBreakOrContinue();
        if (tok.text == "try")
            return parseTryStatement();
        if (tok.text == "switch")
            return parseSwitchStatement();
        if (tok.text == "import" || tok.text == "export")
        {
            error("'" + tok.text + "' may only appear at the top level of a module");
            return nullptr;
        }
        if (tok.text == "with" || tok.text == "debugger")
        {
            error("'" + tok.text + "' statements are not supported");
            return nullptr;
        }
    }

    if (tok.kind == TokenKind::Identifier)
    {
        if (checkPunct(":", 1))
        {
            error("labeled statements are not supported");
            return nullptr;
        }
        if (tok.text == "async" && checkKeyword("function", 1) && !peek(1).newlineBefore)
        {
            error("async functions are not supported");
            return nullptr;
        }
    }

    return parseExpressionStatement();
}

std::unique_ptr<BlockStatement> Parser::parseBlock()
{
    auto block = std::make_unique<BlockStatement>(peek().start, peek().start);
    if (!expectPunct("{"))
        return nullptr;

    while (!checkPunct("}") && peek().kind != TokenKind::Eof)
    {
        const size_t before = tokenPos_;
        if (NodePtr stmt = parseStatement())
        {
            block->body.push_back(std::move(stmt));
            continue;
        }
        resyncAfterError();
        if (tokenPos_ == before)
            advance();
    }

    if (!expectPunct("}"))
        return nullptr;
    block->end = lastEnd_;
    return block;
}

std::unique_ptr<VariableDeclaration> Parser::parseVariableDeclaration(bool noIn)
{
    Token kw = advance();
    auto decl = std::make_unique<VariableDeclaration>(kw.start, kw.end);
    if (kw.text == "let")
        decl->varKind = VarKind::Let;
    else if (kw.text == "const")
        decl->varKind = VarKind::Const;

    do
    {
        if (checkPunct("[") || checkPunct("{"))
        {
            error("destructuring patterns are not supported");
            return nullptr;
        }

        auto declarator = std::make_unique<VariableDeclarator>(peek().start, peek().start);
        declarator->id = parseBindingIdentifier();
        if (!declarator->id)
            return nullptr;

        if (matchPunct("="))
        {
            declarator->init = parseAssignment(noIn);
            if (!declarator->init)
                return nullptr;
        }

        declarator->end = lastEnd_;
        decl->declarations.push_back(std::move(declarator));
    } while (matchPunct(","));

    decl->end = lastEnd_;
    return decl;
}

NodePtr Parser::parseVariableStatement()
{
    auto decl = parseVariableDeclaration(false);
    if (!decl || !consumeSemicolon())
        return nullptr;
    decl->end = lastEnd_;
    return decl;
}

NodePtr Parser::parseIfStatement()
{
    auto stmt = std::make_unique<IfStatement>(advance().start, 0); // 'if'

    if (!expectPunct("("))
        return nullptr;
    stmt->test = parseExpression();
    if (!stmt->test || !expectPunct(")"))
        return nullptr;

    stmt->consequent = parseStatement();
    if (!stmt->consequent)
        return nullptr;

    if (matchKeyword("else"))
    {
        stmt->alternate = parseStatement();
        if (!stmt->alternate)
            return nullptr;
    }

    stmt->end = lastEnd_;
    return stmt;
}

/// @brief Parse the three `for` forms: classic, `for-in` and `for-of`.
/// @details The head is parsed with `in` disabled as a binary operator so a
///          following `in` or `of` can be recognised as the loop form.
NodePtr Parser::parseForStatement()
{
    const uint32_t start = advance().start; // 'for'

    if (checkKeyword("await"))
    {
        error("'for await' is not supported");
        return nullptr;
    }
    if (!expectPunct("("))
        return nullptr;

    NodePtr init;
    if (!checkPunct(";"))
    {
        if (checkKeyword("var") || checkKeyword("let") || checkKeyword("const"))
            init = parseVariableDeclaration(true);
        else
            init = parseExpression(true);
        if (!init)
            return nullptr;
    }

    if (init && (checkKeyword("in") || peek().isIdentifier("of")))
    {
        const bool isIn = advance().text == "in";

        if (init->is(NodeKind::VariableDeclaration))
        {
            const auto &decl = as<VariableDeclaration>(*init);
            if (decl.declarations.size() != 1 || decl.declarations.front()->init)
            {
                errorAt(peek().loc, "invalid variable declaration in for-" +
                                        std::string(isIn ? "in" : "of") + " loop");
                return nullptr;
            }
        }
        else if (!init->is(NodeKind::Identifier) && !init->is(NodeKind::MemberExpression))
        {
            error("invalid left-hand side in for loop");
            return nullptr;
        }

        auto stmt = std::make_unique<ForEachStatement>(
            isIn ? NodeKind::ForInStatement : NodeKind::ForOfStatement, start, start);
        stmt->left = std::move(init);
        stmt->right = isIn ? parseExpression() : parseAssignment();
        if (!stmt->right || !expectPunct(")"))
            return nullptr;
        stmt->body = parseStatement();
        if (!stmt->body)
            return nullptr;
        stmt->end = lastEnd_;
        return stmt;
    }

    auto stmt = std::make_unique<ForStatement>(start, start);
    stmt->init = std::move(init);
    if (!expectPunct(";"))
        return nullptr;

    if (!checkPunct(";"))
    {
        stmt->test = parseExpression();
        if (!stmt->test)
            return nullptr;
    }
    if (!expectPunct(";"))
        return nullptr;

    if (!checkPunct(")"))
    {
        stmt->update = parseExpression();
        if (!stmt->update)
            return nullptr;
    }
    if (!expectPunct(")"))
        return nullptr;

    stmt->body = parseStatement();
    if (!stmt->body)
        return nullptr;
    stmt->end = lastEnd_;
    return stmt;
}

NodePtr Parser::parseWhileStatement()
{
    auto stmt = std::make_unique<LoopStatement>(NodeKind::WhileStatement, advance().start, 0);

    if (!expectPunct("("))
        return nullptr;
    stmt->test = parseExpression();
    if (!stmt->test || !expectPunct(")"))
        return nullptr;
    stmt->body = parseStatement();
    if (!stmt->body)
        return nullptr;

    stmt->end = lastEnd_;
    return stmt;
}

NodePtr Parser::parseDoWhileStatement()
{
    auto stmt = std::make_unique<LoopStatement>(NodeKind::DoWhileStatement, advance().start, 0);

    stmt->body = parseStatement();
    if (!stmt->body)
        return nullptr;
    if (!matchKeyword("while"))
    {
        unexpected("'while'");
        return nullptr;
    }
    if (!expectPunct("("))
        return nullptr;
    stmt->test = parseExpression();
    if (!stmt->test || !expectPunct(")"))
        return nullptr;

    // The terminator after do-while is always optional.
    matchPunct(";");
    stmt->end = lastEnd_;
    return stmt;
}

NodePtr Parser::parseReturnOrThrow()
{
    Token kw = advance();
    const bool isReturn = kw.text == "return";
    auto stmt = std::make_unique<ArgumentStatement>(
        isReturn ? NodeKind::ReturnStatement : NodeKind::ThrowStatement, kw.start, kw.end);

    const Token &next = peek();
    const bool terminated = next.isPunct(";") || next.isPunct("}") ||
                            next.kind == TokenKind::Eof || next.newlineBefore;
    if (!isReturn && terminated)
    {
        error("expected expression after 'throw'");
        return nullptr;
    }
    if (!terminated)
    {
        stmt->argument = parseExpression();
        if (!stmt->argument)
            return nullptr;
    }

    if (!consumeSemicolon())
        return nullptr;
    stmt->end = lastEnd_;
    return stmt;
}

NodePtr Parser::parseBreakOrContinue()
{
    Token kw = advance();
    auto stmt = std::make_unique<SimpleStatement>(
        kw.text == "break" ? NodeKind::BreakStatement : NodeKind::ContinueStatement, kw.start, kw.end);

    if (peek().kind == TokenKind::Identifier && !peek().newlineBefore)
    {
        error("labeled " + kw.text + " is not supported");
        return nullptr;
    }
    if (!consumeSemicolon())
        return nullptr;
    stmt->end = lastEnd_;
    return stmt;
}

NodePtr Parser::parseTryStatement()
{
    auto stmt = std::make_unique<TryStatement>(advance().start, 0); // 'try'

    stmt->block = parseBlock();
    if (!stmt->block)
        return nullptr;

    if (checkKeyword("catch"))
    {
        auto clause = std::make_unique<CatchClause>(advance().start, 0);
        if (matchPunct("("))
        {
            if (checkPunct("[") || checkPunct("{"))
            {
                error("destructuring patterns are not supported");
                return nullptr;
            }
            clause->param = parseBindingIdentifier();
            if (!clause->param || !expectPunct(")"))
                return nullptr;
        }
        clause->body = parseBlock();
        if (!clause->body)
            return nullptr;
        clause->end = lastEnd_;
        stmt->handler = std::move(clause);
    }

    if (matchKeyword("finally"))
    {
        stmt->finalizer = parseBlock();
        if (!stmt->finalizer)
            return nullptr;
    }

    if (!stmt->handler && !stmt->finalizer)
    {
        unexpected("'catch' or 'finally'");
        return nullptr;
    }

    stmt->end = lastEnd_;
    return stmt;
}

NodePtr Parser::parseSwitchStatement()
{
    auto stmt = std::make_unique<SwitchStatement>(advance().start, 0); // 'switch'

    if (!expectPunct("("))
        return nullptr;
    stmt->discriminant = parseExpression();
    if (!stmt->discriminant || !expectPunct(")") || !expectPunct("{"))
        return nullptr;

    while (!checkPunct("}"))
    {
        auto sc = std::make_unique<SwitchCase>(peek().start, 0);
        if (matchKeyword("case"))
        {
            sc->test = parseExpression();
            if (!sc->test)
                return nullptr;
        }
        else if (!matchKeyword("default"))
        {
            unexpected("'case' or 'default'");
            return nullptr;
        }
        if (!expectPunct(":"))
            return nullptr;

        while (!checkKeyword("case") && !checkKeyword("default") && !checkPunct("}") &&
               peek().kind != TokenKind::Eof)
        {
            NodePtr consequent = parseStatement();
            if (!consequent)
                return nullptr;
            sc->consequent.push_back(std::move(consequent));
        }

        sc->end = lastEnd_;
        stmt->cases.push_back(std::move(sc));
    }

    advance(); // '}'
    stmt->end = lastEnd_;
    return stmt;
}

NodePtr Parser::parseExpressionStatement()
{
    auto stmt = std::make_unique<ExpressionStatement>(peek().start, 0);
    stmt->expression = parseExpression();
    if (!stmt->expression || !consumeSemicolon())
        return nullptr;
    stmt->end = lastEnd_;
    return stmt;
}

//===----------------------------------------------------------------------===//
// Functions and Classes
//===----------------------------------------------------------------------===//

std::unique_ptr<FunctionNode> Parser::parseFunction(NodeKind kind, bool requireName)
{
    auto fn = std::make_unique<FunctionNode>(kind, advance().start, 0); // 'function'

    if (checkPunct("*"))
    {
        error("generator functions are not supported");
        return nullptr;
    }

    if (peek().kind == TokenKind::Identifier)
    {
        fn->id = parseBindingIdentifier();
    }
    else if (requireName)
    {
        unexpected("function name");
        return nullptr;
    }

    if (!parseParams(fn->params))
        return nullptr;
    fn->body = parseBlock();
    if (!fn->body)
        return nullptr;

    fn->end = lastEnd_;
    return fn;
}

bool Parser::parseParams(std::vector<IdentifierPtr> &params)
{
    if (!expectPunct("("))
        return false;

    while (!checkPunct(")"))
    {
        if (checkPunct("..."))
        {
            error("rest parameters are not supported");
            return false;
        }
        if (checkPunct("[") || checkPunct("{"))
        {
            error("destructuring patterns are not supported");
            return false;
        }

        IdentifierPtr param = parseBindingIdentifier();
        if (!param)
            return false;
        if (checkPunct("="))
        {
            error("default parameters are not supported");
            return false;
        }
        params.push_back(std::move(param));

        if (!matchPunct(","))
            break;
    }

    return expectPunct(")");
}

std::unique_ptr<ClassNode> Parser::parseClass(NodeKind kind, bool requireName)
{
    auto cls = std::make_unique<ClassNode>(kind, advance().start, 0); // 'class'

    if (peek().kind == TokenKind::Identifier)
    {
        cls->id = parseBindingIdentifier();
    }
    else if (requireName)
    {
        unexpected("class name");
        return nullptr;
    }

    if (matchKeyword("extends"))
    {
        cls->superClass = parseLeftHandSide();
        if (!cls->superClass)
            return nullptr;
    }

    cls->body = std::make_unique<ClassBody>(peek().start, 0);
    if (!expectPunct("{"))
        return nullptr;

    while (!checkPunct("}"))
    {
        if (matchPunct(";"))
            continue;
        auto method = parseMethodDefinition();
        if (!method)
            return nullptr;
        cls->body->body.push_back(std::move(method));
    }

    advance(); // '}'
    cls->body->end = lastEnd_;
    cls->end = lastEnd_;
    return cls;
}

std::unique_ptr<MethodDefinition> Parser::parseMethodDefinition()
{
    auto method = std::make_unique<MethodDefinition>(peek().start, 0);

    if (checkKeyword("static") && !checkPunct("(", 1))
    {
        advance();
        method->isStatic = true;
    }

    if ((peek().isIdentifier("get") || peek().isIdentifier("set")) && !checkPunct("(", 1))
    {
        method->methodKind = advance().text == "get" ? MethodKind::Get : MethodKind::Set;
    }
    else if (checkPunct("*") || (peek().isIdentifier("async") && !checkPunct("(", 1)))
    {
        error("generator and async methods are not supported");
        return nullptr;
    }

    method->key = parsePropertyKey(method->computed);
    if (!method->key)
        return nullptr;

    if (!method->computed && !method->isStatic && method->methodKind == MethodKind::Method &&
        method->key->is(NodeKind::Identifier) && as<Identifier>(*method->key).name == "constructor")
    {
        method->methodKind = MethodKind::Constructor;
    }

    if (!checkPunct("("))
    {
        error("class fields are not supported");
        return nullptr;
    }

    method->value = std::make_unique<FunctionNode>(NodeKind::FunctionExpression, peek().start, 0);
    if (!parseParams(method->value->params))
        return nullptr;
    method->value->body = parseBlock();
    if (!method->value->body)
        return nullptr;

    method->value->end = lastEnd_;
    method->end = lastEnd_;
    return method;
}

} // namespace shake::frontends::js
