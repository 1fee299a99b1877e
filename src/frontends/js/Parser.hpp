//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for JavaScript modules.
///
/// @details The parser consumes tokens from the lexer and builds the syntax
/// tree declared in AST.hpp.  Statements are parsed by recursive descent;
/// binary operators by precedence climbing.
///
/// ## Operator Precedence
///
/// Binary operators, lowest binding first:
///
/// | Level | Operators                                 |
/// |-------|-------------------------------------------|
/// |   1   | `??` `||`                                 |
/// |   2   | `&&`                                      |
/// |   3   | `|`                                       |
/// |   4   | `^`                                       |
/// |   5   | `&`                                       |
/// |   6   | `==` `!=` `===` `!==`                     |
/// |   7   | `<` `>` `<=` `>=` `instanceof` `in`       |
/// |   8   | `<<` `>>` `>>>`                           |
/// |   9   | `+` `-`                                   |
/// |  10   | `*` `/` `%`                               |
/// |  11   | `**` (right associative)                  |
///
/// Conditional, assignment, arrow functions and the comma operator sit
/// above level 1; unary, postfix, call and member expressions below 11.
///
/// ## Automatic Semicolon Insertion
///
/// A statement terminator may be omitted before `}`, at end of input, or
/// when the next token starts on a new line.  `return`, `throw`, `break`,
/// `continue` and postfix `++`/`--` honour the no-line-terminator
/// restriction.
///
/// ## Unsupported Syntax
///
/// Destructuring, default and rest parameters, template literals,
/// regular expressions, generators, async functions and labels produce a
/// parse error (code S2000).
///
/// ## Usage Example
///
/// ```cpp
/// DiagnosticEngine diag;
/// Lexer lexer(source, fileId, diag);
/// Parser parser(lexer, diag);
///
/// auto program = parser.parseProgram();
/// if (parser.hasError()) {
///     // Handle parse errors
/// }
/// ```
///
/// @invariant peek() is always valid (may be an Eof token).
/// @invariant Every node's `end` is the end offset of its last token.
///
/// @see Lexer.hpp - Token source
/// @see AST.hpp - Syntax node types
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/js/AST.hpp"
#include "frontends/js/Lexer.hpp"
#include "support/diagnostics.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace shake::frontends::js
{

/// @brief Recursive descent parser for the JavaScript module subset.
///
/// @details The parser borrows the Lexer and DiagnosticEngine; both must
/// outlive it.  Produced nodes are owned by the caller.
class Parser
{
  public:
    /// @brief Create a parser reading from @p lexer.
    Parser(Lexer &lexer, support::DiagnosticEngine &diag);

    /// @brief Parse a complete module.
    /// @return The program; always non-null, possibly partial when errors occurred.
    std::unique_ptr<Program> parseProgram();

    /// @brief True once any lexical or syntax error was seen.
    bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    /// @name Token Handling
    /// @{
    //=========================================================================

    /// @brief Token at @p offset positions ahead of the cursor.
    const Token &peek(size_t offset = 0);

    /// @brief Consume and return the current token.
    Token advance();

    bool checkPunct(std::string_view p, size_t offset = 0);
    bool checkKeyword(std::string_view k, size_t offset = 0);
    bool matchPunct(std::string_view p);
    bool matchKeyword(std::string_view k);

    /// @brief Consume punctuator @p p or report "expected '<p>'".
    bool expectPunct(std::string_view p);

    /// @brief Consume a statement terminator, applying automatic insertion.
    bool consumeSemicolon();

    /// @brief True when the token at @p offset may serve as a property name.
    bool checkIdentifierName(size_t offset = 0);

    /// @brief Skip tokens up to the next plausible statement boundary.
    void resyncAfterError();

    /// @}
    //=========================================================================
    /// @name Error Handling
    /// @{
    //=========================================================================

    void error(const std::string &message);
    void errorAt(support::SourceLoc loc, const std::string &message);

    /// @brief Report that the current token is not what @p what required.
    void unexpected(const std::string &what);

    /// @}
    //=========================================================================
    /// @name Modules and Statements
    /// @{
    //=========================================================================

    NodePtr parseModuleItem();
    NodePtr parseImportDeclaration();
    NodePtr parseExportDeclaration();
    NodePtr parseStatement();
    std::unique_ptr<BlockStatement> parseBlock();

    /// @brief Parse `var|let|const` declarators without the terminator.
    std::unique_ptr<VariableDeclaration> parseVariableDeclaration(bool noIn);

    NodePtr parseVariableStatement();
    NodePtr parseIfStatement();
    NodePtr parseForStatement();
    NodePtr parseWhileStatement();
    NodePtr parseDoWhileStatement();
    NodePtr parseReturnOrThrow();
    NodePtr parseBreakOrContinue();
    NodePtr parseTryStatement();
    NodePtr parseSwitchStatement();
    NodePtr parseExpressionStatement();

    /// @brief Parse `function [name](params) { ... }`.
    std::unique_ptr<FunctionNode> parseFunction(NodeKind kind, bool requireName);

    /// @brief Parse `class [name] [extends expr] { ... }`.
    std::unique_ptr<ClassNode> parseClass(NodeKind kind, bool requireName);

    std::unique_ptr<MethodDefinition> parseMethodDefinition();

    /// @brief Parse a parenthesised simple parameter list into @p params.
    bool parseParams(std::vector<IdentifierPtr> &params);

    /// @}
    //=========================================================================
    /// @name Expressions
    /// @{
    //=========================================================================

    /// @brief Expression including the comma operator.
    NodePtr parseExpression(bool noIn = false);

    NodePtr parseAssignment(bool noIn = false);
    NodePtr parseConditional(bool noIn);
    NodePtr parseBinary(int minPrec, bool noIn);
    NodePtr parseUnary();
    NodePtr parsePostfix();
    NodePtr parseLeftHandSide();
    NodePtr parseNew();
    NodePtr parsePrimary();
    NodePtr parseArrayLiteral();
    NodePtr parseObjectLiteral();
    std::unique_ptr<Property> parseProperty();
    NodePtr parsePropertyKey(bool &computed);
    NodePtr parseArrowFunction();

    /// @brief True when the tokens at the cursor begin an arrow function.
    bool isArrowAhead();

    bool parseArguments(std::vector<NodePtr> &args);

    /// @brief Binding precedence of binary operator @p tok, or 0.
    int binaryPrecedence(const Token &tok, bool noIn) const;

    IdentifierPtr parseBindingIdentifier();
    IdentifierPtr parseIdentifierName();
    std::unique_ptr<Literal> parseStringLiteral();

    /// @}

    Lexer &lexer_;
    support::DiagnosticEngine &diag_;
    std::vector<Token> tokens_;
    size_t tokenPos_ = 0;
    uint32_t lastEnd_ = 0; ///< End offset of the most recently consumed token
    bool hasError_ = false;
};

} // namespace shake::frontends::js
