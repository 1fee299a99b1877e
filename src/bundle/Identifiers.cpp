// File: src/bundle/Identifiers.cpp
// Purpose: Implements identifier legalisation for generated bundle code.
// Key invariants: Output of makeLegalIdentifier matches [A-Za-z_$][A-Za-z0-9_$]*.
// Ownership/Lifetime: Stateless.
// Links: docs/codemap.md

#include "bundle/Identifiers.hpp"

#include "frontends/js/Lexer.hpp"

#include <cctype>

namespace shake::bundle
{
namespace
{
bool isIdentifierChar(char c, bool first)
{
    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$')
        return true;
    return !first && std::isdigit(static_cast<unsigned char>(c));
}

bool isValidIdentifier(const std::string &name)
{
    if (name.empty())
        return false;
    for (std::size_t i = 0; i < name.size(); ++i)
    {
        if (!isIdentifierChar(name[i], i == 0))
            return false;
    }
    return true;
}
} // namespace

bool isReservedName(const std::string &name)
{
    return frontends::js::Lexer::isKeyword(name) || name == "arguments" || name == "eval" ||
           name == "undefined" || name == "NaN" || name == "Infinity";
}

std::string makeLegalIdentifier(const std::string &text)
{
    std::string out;
    out.reserve(text.size() + 1);

    bool upperNext = false;
    for (char c : text)
    {
        if (c == '-')
        {
            upperNext = true;
            continue;
        }
        if (!isIdentifierChar(c, false))
        {
            out.push_back('_');
            upperNext = false;
            continue;
        }
        if (upperNext && !out.empty())
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        upperNext = false;
        out.push_back(c);
    }

    if (out.empty() || std::isdigit(static_cast<unsigned char>(out.front())) || isReservedName(out))
        out.insert(out.begin(), '_');
    return out;
}

std::string propertyAccess(const std::string &object, const std::string &key)
{
    if (isValidIdentifier(key) && !frontends::js::Lexer::isKeyword(key))
        return object + "." + key;
    return object + "['" + key + "']";
}

} // namespace shake::bundle
