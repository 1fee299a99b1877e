//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Scope.hpp
/// @brief Lexical scopes built while analysing a top-level statement.
///
/// @details Every statement owns a root scope at depth 0 that stands for the
/// module's top level.  Functions open function scopes; blocks and catch
/// clauses open block scopes.  `var` and function declarations hoist past
/// block scopes to the nearest function (or root) scope, while `let`,
/// `const` and class declarations stay where they appear.
///
/// @invariant depth() is 0 for the root and parent()->depth() + 1 otherwise.
/// @invariant A name maps to at most one declaring node within one scope;
///            a re-declaration replaces the earlier node.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "bundle/NameSet.hpp"
#include "frontends/js/AST.hpp"
#include <string>
#include <unordered_map>

namespace shake::bundle
{

class Scope
{
  public:
    /// @brief Create a scope nested in @p parent (null for the root).
    /// @param parent Enclosing scope; must outlive this scope.
    /// @param isBlockScope True for block and catch scopes.
    explicit Scope(Scope *parent = nullptr, bool isBlockScope = false);

    /// @brief Register @p name as declared by @p node.
    /// @details Function-scoped declarations (@p isBlockDeclaration false)
    ///          made in a block scope are forwarded to the nearest enclosing
    ///          function or root scope.
    void addDeclaration(const std::string &name, const frontends::js::Node *node, bool isBlockDeclaration);

    /// @brief Nearest scope, starting here, that declares @p name.
    /// @return The defining scope, or nullptr when @p name is unresolved.
    const Scope *findDefiningScope(const std::string &name) const;

    /// @brief True when this scope or an ancestor declares @p name.
    bool contains(const std::string &name) const;

    /// @brief True when this scope itself declares @p name.
    bool declaresLocally(const std::string &name) const
    {
        return declarations_.count(name) != 0;
    }

    /// @brief Declaring node of @p name in this scope, or nullptr.
    const frontends::js::Node *declaration(const std::string &name) const;

    /// @brief Names declared directly in this scope, in declaration order.
    const NameSet &declaredNames() const
    {
        return names_;
    }

    Scope *parent() const
    {
        return parent_;
    }

    bool isBlockScope() const
    {
        return isBlockScope_;
    }

    int depth() const
    {
        return depth_;
    }

  private:
    Scope *parent_{nullptr};
    bool isBlockScope_{false};
    int depth_{0};
    std::unordered_map<std::string, const frontends::js::Node *> declarations_;
    NameSet names_;
};

} // namespace shake::bundle
