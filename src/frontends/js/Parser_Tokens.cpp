//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token buffering and error handling for the JavaScript parser.
///
//===----------------------------------------------------------------------===//

#include "frontends/js/Parser.hpp"

namespace shake::frontends::js
{

Parser::Parser(Lexer &lexer, support::DiagnosticEngine &diag) : lexer_(lexer), diag_(diag)
{
    tokens_.push_back(lexer_.next());
    if (tokens_.back().kind == TokenKind::Error)
        hasError_ = true;
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &Parser::peek(size_t offset)
{
    while (tokens_.size() <= tokenPos_ + offset)
    {
        if (tokens_.back().kind == TokenKind::Eof)
            return tokens_.back();
        tokens_.push_back(lexer_.next());
        // The lexer already reported the problem.
        if (tokens_.back().kind == TokenKind::Error)
            hasError_ = true;
    }
    return tokens_[tokenPos_ + offset];
}

Token Parser::advance()
{
    Token cur = peek();
    if (cur.kind != TokenKind::Eof)
    {
        ++tokenPos_;
        lastEnd_ = cur.end;
    }
    return cur;
}

bool Parser::checkPunct(std::string_view p, size_t offset)
{
    return peek(offset).isPunct(p);
}

bool Parser::checkKeyword(std::string_view k, size_t offset)
{
    return peek(offset).isKeyword(k);
}

bool Parser::matchPunct(std::string_view p)
{
    if (!checkPunct(p))
        return false;
    advance();
    return true;
}

bool Parser::matchKeyword(std::string_view k)
{
    if (!checkKeyword(k))
        return false;
    advance();
    return true;
}

bool Parser::expectPunct(std::string_view p)
{
    if (matchPunct(p))
        return true;
    unexpected("'" + std::string(p) + "'");
    return false;
}

bool Parser::consumeSemicolon()
{
    if (matchPunct(";"))
        return true;
    const Token &tok = peek();
    if (tok.isPunct("}") || tok.kind == TokenKind::Eof || tok.newlineBefore)
        return true;
    unexpected("';'");
    return false;
}

bool Parser::checkIdentifierName(size_t offset)
{
    const TokenKind kind = peek(offset).kind;
    return kind == TokenKind::Identifier || kind == TokenKind::Keyword;
}

void Parser::resyncAfterError()
{
    if (peek().kind == TokenKind::Eof)
        return;
    Token skipped = advance();
    while (!skipped.isPunct(";") && peek().kind != TokenKind::Eof)
    {
        if (checkPunct("}") || peek().newlineBefore)
            return;
        skipped = advance();
    }
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

void Parser::error(const std::string &message)
{
    errorAt(peek().loc, message);
}

void Parser::errorAt(support::SourceLoc loc, const std::string &message)
{
    hasError_ = true;
    diag_.report(support::Diagnostic{support::Severity::Error, message, loc, "S2000"});
}

void Parser::unexpected(const std::string &what)
{
    const Token &tok = peek();
    if (tok.kind == TokenKind::Error)
        return;
    if (tok.kind == TokenKind::Eof)
        error("expected " + what + ", got end of input");
    else
        error("expected " + what + ", got '" + tok.text + "'");
}

} // namespace shake::frontends::js
