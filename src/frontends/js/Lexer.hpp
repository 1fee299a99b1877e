//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Lexical analyzer for the JavaScript module subset.
///
/// @details Converts module source text into tokens on demand.  Whitespace
/// and comments are skipped, but whether a line terminator was crossed is
/// recorded on the following token so the parser can apply automatic
/// semicolon insertion.
///
/// Unsupported lexical forms (template literals, regular expressions are
/// lexed as `/` punctuators) produce an Error token and a diagnostic.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/js/Token.hpp"
#include "support/diagnostics.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace shake::frontends::js
{

class Lexer
{
  public:
    /// @brief Create a lexer over @p source.
    /// @param source Full module text.
    /// @param fileId Identifier recorded in token locations.
    /// @param diag Engine receiving lexical errors.
    Lexer(std::string source, uint32_t fileId, support::DiagnosticEngine &diag);

    /// @brief Produce the next token; returns Eof repeatedly at end of input.
    Token next();

    /// @brief The text being tokenized.
    const std::string &source() const
    {
        return source_;
    }

    /// @brief True when @p name is a reserved word in strict module code.
    static bool isKeyword(const std::string &name);

  private:
    char peekChar(size_t offset = 0) const;
    char getChar();
    bool eof() const;
    support::SourceLoc currentLoc() const;
    void reportError(support::SourceLoc loc, const std::string &message);

    /// @brief Skip whitespace and comments; returns true if a newline was crossed.
    bool skipWhitespaceAndComments();

    Token lexIdentifierOrKeyword();
    Token lexNumber();
    Token lexString(char quote);
    Token lexPunctuator();

    std::string source_;
    uint32_t fileId_;
    support::DiagnosticEngine &diag_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
};

} // namespace shake::frontends::js
