//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the JavaScript lexical analyzer.
///
/// @details Key implementation details:
///
/// ## Keyword Lookup
///
/// Reserved words are stored in a sorted array (kKeywordTable) for binary
/// search.  Module code is always strict, so `let`, `static`, `yield` and
/// friends are reserved as well.  Contextual words (`from`, `as`, `of`,
/// `get`, `set`) remain identifiers and are recognised by the parser.
///
/// ## Punctuators
///
/// Punctuators are matched longest-first against kPunctuators.
///
/// ## Line Terminators
///
/// Every token records whether a newline preceded it, which drives
/// automatic semicolon insertion and the restricted productions
/// (`return`, postfix `++`/`--`).
///
/// @see Lexer.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontends/js/Lexer.hpp"
#include <algorithm>
#include <array>
#include <string_view>

namespace shake::frontends::js
{

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::Error:
            return "error";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::Keyword:
            return "keyword";
        case TokenKind::NumberLiteral:
            return "number";
        case TokenKind::StringLiteral:
            return "string";
        case TokenKind::Punctuator:
            return "punctuator";
    }
    return "<unknown>";
}

namespace
{

/// @brief Reserved words of strict module code, sorted for binary search.
constexpr std::array<std::string_view, 46> kKeywordTable = {
    "await",     "break",      "case",    "catch",      "class",     "const",   "continue",
    "debugger",  "default",    "delete",  "do",         "else",      "enum",    "export",
    "extends",   "false",      "finally", "for",        "function",  "if",      "implements",
    "import",    "in",         "instanceof", "interface", "let",     "new",     "null",
    "package",   "private",    "protected", "public",   "return",    "static",  "super",
    "switch",    "this",       "throw",   "true",       "try",       "typeof",  "var",
    "void",      "while",      "with",    "yield",
};

/// @brief Punctuators ordered so that longer spellings are tried first.
constexpr std::array<std::string_view, 56> kPunctuators = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=", "?\?=",
    "=>",   "==",  "!=",  "<=",  ">=",  "&&",  "||",  "??",  "++",  "--",  "+=",
    "-=",   "*=",  "/=",  "%=",  "&=",  "|=",  "^=",  "<<",  ">>",  "**",  "{",
    "}",    "(",   ")",   "[",   "]",   ";",   ",",   "<",   ">",   "+",   "-",
    "*",    "/",   "%",   "&",   "|",   "^",   "!",   "~",   "?",   ":",   "=",
    ".",
};

inline bool isWhitespace(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f' || c == '\n';
}

inline bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

inline bool isHexDigit(char c)
{
    return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

inline bool isIdentifierStart(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' ||
           static_cast<unsigned char>(c) >= 0x80;
}

inline bool isIdentifierContinue(char c)
{
    return isIdentifierStart(c) || isDigit(c);
}

int hexDigitValue(char c)
{
    if (isDigit(c))
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return c - 'A' + 10;
}

/// @brief Append code point @p cp to @p out as UTF-8.
void appendUtf8(std::string &out, uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // anonymous namespace

bool Lexer::isKeyword(const std::string &name)
{
    return std::binary_search(kKeywordTable.begin(), kKeywordTable.end(), std::string_view(name));
}

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source, uint32_t fileId, support::DiagnosticEngine &diag)
    : source_(std::move(source)), fileId_(fileId), diag_(diag)
{
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
        return '\0';
    return source_[pos_ + offset];
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
        return '\0';
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

support::SourceLoc Lexer::currentLoc() const
{
    return support::SourceLoc{fileId_, line_, column_};
}

void Lexer::reportError(support::SourceLoc loc, const std::string &message)
{
    diag_.report(support::Diagnostic{support::Severity::Error, message, loc, "S1000"});
}

bool Lexer::skipWhitespaceAndComments()
{
    bool sawNewline = false;
    while (!eof())
    {
        char c = peekChar();

        if (isWhitespace(c))
        {
            if (c == '\n')
                sawNewline = true;
            getChar();
            continue;
        }

        // Line comment: //
        if (c == '/' && peekChar(1) == '/')
        {
            while (!eof() && peekChar() != '\n')
                getChar();
            continue;
        }

        // Block comment: /* ... */
        if (c == '/' && peekChar(1) == '*')
        {
            support::SourceLoc startLoc = currentLoc();
            getChar();
            getChar();
            bool closed = false;
            while (!eof())
            {
                char ch = getChar();
                if (ch == '\n')
                    sawNewline = true;
                if (ch == '*' && peekChar() == '/')
                {
                    getChar();
                    closed = true;
                    break;
                }
            }
            if (!closed)
                reportError(startLoc, "unterminated block comment");
            continue;
        }

        break;
    }
    return sawNewline;
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();
    tok.start = static_cast<uint32_t>(pos_);

    while (!eof() && isIdentifierContinue(peekChar()))
        tok.text.push_back(getChar());

    tok.end = static_cast<uint32_t>(pos_);
    tok.kind = isKeyword(tok.text) ? TokenKind::Keyword : TokenKind::Identifier;
    return tok;
}

Token Lexer::lexNumber()
{
    Token tok;
    tok.kind = TokenKind::NumberLiteral;
    tok.loc = currentLoc();
    tok.start = static_cast<uint32_t>(pos_);

    if (peekChar() == '0' && (peekChar(1) == 'x' || peekChar(1) == 'X'))
    {
        getChar();
        getChar();
        if (!isHexDigit(peekChar()))
        {
            reportError(tok.loc, "malformed hexadecimal literal");
            tok.kind = TokenKind::Error;
        }
        while (isHexDigit(peekChar()))
            getChar();
    }
    else
    {
        while (isDigit(peekChar()))
            getChar();
        if (peekChar() == '.')
        {
            getChar();
            while (isDigit(peekChar()))
                getChar();
        }
        if (peekChar() == 'e' || peekChar() == 'E')
        {
            getChar();
            if (peekChar() == '+' || peekChar() == '-')
                getChar();
            if (!isDigit(peekChar()))
            {
                reportError(tok.loc, "malformed exponent in number literal");
                tok.kind = TokenKind::Error;
            }
            while (isDigit(peekChar()))
                getChar();
        }
    }

    if (isIdentifierStart(peekChar()))
    {
        reportError(currentLoc(), "identifier starts immediately after numeric literal");
        tok.kind = TokenKind::Error;
    }

    tok.end = static_cast<uint32_t>(pos_);
    tok.text = source_.substr(tok.start, tok.end - tok.start);
    return tok;
}

Token Lexer::lexString(char quote)
{
    Token tok;
    tok.kind = TokenKind::StringLiteral;
    tok.loc = currentLoc();
    tok.start = static_cast<uint32_t>(pos_);

    getChar(); // opening quote
    bool closed = false;
    while (!eof())
    {
        char c = getChar();
        if (c == quote)
        {
            closed = true;
            break;
        }
        if (c == '\n')
            break;
        if (c != '\\')
        {
            tok.value.push_back(c);
            continue;
        }

        char esc = getChar();
        switch (esc)
        {
            case 'n':
                tok.value.push_back('\n');
                break;
            case 't':
                tok.value.push_back('\t');
                break;
            case 'r':
                tok.value.push_back('\r');
                break;
            case 'b':
                tok.value.push_back('\b');
                break;
            case 'f':
                tok.value.push_back('\f');
                break;
            case 'v':
                tok.value.push_back('\v');
                break;
            case '0':
                tok.value.push_back('\0');
                break;
            case 'x':
            {
                if (!isHexDigit(peekChar()) || !isHexDigit(peekChar(1)))
                {
                    reportError(currentLoc(), "invalid hexadecimal escape sequence");
                    tok.kind = TokenKind::Error;
                    break;
                }
                int hi = hexDigitValue(getChar());
                int lo = hexDigitValue(getChar());
                appendUtf8(tok.value, static_cast<uint32_t>(hi * 16 + lo));
                break;
            }
            case 'u':
            {
                uint32_t cp = 0;
                for (int i = 0; i < 4; ++i)
                {
                    if (!isHexDigit(peekChar()))
                    {
                        reportError(currentLoc(), "invalid unicode escape sequence");
                        tok.kind = TokenKind::Error;
                        break;
                    }
                    cp = cp * 16 + static_cast<uint32_t>(hexDigitValue(getChar()));
                }
                appendUtf8(tok.value, cp);
                break;
            }
            case '\n':
                // line continuation
                break;
            default:
                tok.value.push_back(esc);
                break;
        }
    }

    if (!closed)
    {
        reportError(tok.loc, "unterminated string literal");
        tok.kind = TokenKind::Error;
    }

    tok.end = static_cast<uint32_t>(pos_);
    tok.text = source_.substr(tok.start, tok.end - tok.start);
    return tok;
}

Token Lexer::lexPunctuator()
{
    Token tok;
    tok.kind = TokenKind::Punctuator;
    tok.loc = currentLoc();
    tok.start = static_cast<uint32_t>(pos_);

    const std::string_view rest = std::string_view(source_).substr(pos_);
    auto tryMatch = [&](std::string_view p) {
        if (rest.substr(0, p.size()) != p)
            return false;
        for (size_t i = 0; i < p.size(); ++i)
            getChar();
        tok.text = std::string(p);
        return true;
    };

    for (std::string_view p : kPunctuators)
    {
        if (tryMatch(p))
        {
            tok.end = static_cast<uint32_t>(pos_);
            return tok;
        }
    }

    char c = getChar();
    tok.kind = TokenKind::Error;
    tok.text = std::string(1, c);
    tok.end = static_cast<uint32_t>(pos_);
    if (c == '`')
        reportError(tok.loc, "template literals are not supported");
    else
        reportError(tok.loc, std::string("unexpected character '") + c + "'");
    return tok;
}

Token Lexer::next()
{
    const bool newline = skipWhitespaceAndComments();

    Token tok;
    if (eof())
    {
        tok.kind = TokenKind::Eof;
        tok.loc = currentLoc();
        tok.start = tok.end = static_cast<uint32_t>(source_.size());
    }
    else
    {
        char c = peekChar();
        if (isIdentifierStart(c))
            tok = lexIdentifierOrKeyword();
        else if (isDigit(c) || (c == '.' && isDigit(peekChar(1))))
            tok = lexNumber();
        else if (c == '"' || c == '\'')
            tok = lexString(c);
        else
            tok = lexPunctuator();
    }

    tok.newlineBefore = newline;
    return tok;
}

} // namespace shake::frontends::js
