// File: src/bundle/Identifiers.hpp
// Purpose: Helpers for producing valid JavaScript names in generated output.
// Key invariants: makeLegalIdentifier never returns a reserved word or an empty string.
// Ownership/Lifetime: Stateless free functions.
// Links: docs/codemap.md
#pragma once

#include <string>

namespace shake::bundle
{

/// @brief True when @p name cannot be used as a binding name in strict code.
bool isReservedName(const std::string &name);

/// @brief Turn arbitrary text (e.g. a file stem like `my-utils`) into a usable identifier.
/// @details Invalid characters become `_`, a leading digit is prefixed with `_`,
///          dashes followed by a letter are camel-cased, and reserved words get a
///          leading `_`.
std::string makeLegalIdentifier(const std::string &text);

/// @brief Property access expression `object.key`, or `object['key']` when
///        @p key is not usable after a dot.
std::string propertyAccess(const std::string &object, const std::string &key);

} // namespace shake::bundle
