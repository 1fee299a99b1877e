//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token definitions for the JavaScript lexer.
///
/// @details Punctuators and keywords are not given one enumerator each;
/// their spelling is carried in `text` and the parser matches on it.  The
/// byte offsets `start`/`end` feed directly into syntax node ranges.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace shake::frontends::js
{

enum class TokenKind
{
    Eof,
    Error,
    Identifier,
    Keyword,
    NumberLiteral,
    StringLiteral,
    Punctuator,
};

/// @brief Lowercase name of @p kind for diagnostics.
const char *tokenKindToString(TokenKind kind);

struct Token
{
    TokenKind kind = TokenKind::Eof;

    /// @brief Source spelling (identifier name, keyword, punctuator, literal raw text).
    std::string text;

    /// @brief Cooked value of string literals; empty otherwise.
    std::string value;

    uint32_t start = 0; ///< Byte offset of the first character
    uint32_t end = 0;   ///< Byte offset one past the last character

    /// @brief Line/column of the first character.
    support::SourceLoc loc;

    /// @brief True when a line terminator separates this token from the previous one.
    bool newlineBefore = false;

    /// @brief True for a punctuator spelled @p p.
    bool isPunct(std::string_view p) const
    {
        return kind == TokenKind::Punctuator && text == p;
    }

    /// @brief True for keyword @p k.
    bool isKeyword(std::string_view k) const
    {
        return kind == TokenKind::Keyword && text == k;
    }

    /// @brief True for identifier spelled @p name (contextual keywords like `from`).
    bool isIdentifier(std::string_view name) const
    {
        return kind == TokenKind::Identifier && text == name;
    }
};

} // namespace shake::frontends::js
