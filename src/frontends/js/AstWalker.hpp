// File: src/frontends/js/AstWalker.hpp
// Purpose: Provides a reusable recursive walker over JavaScript syntax trees.
// Key invariants: Children are visited in source order; leave() pairs with every enter().
// Ownership/Lifetime: Walker borrows AST nodes without owning them.
// Links: docs/codemap.md
#pragma once

#include "frontends/js/AST.hpp"
#include <functional>

namespace shake::frontends::js
{

/// @brief Result of NodeVisitor::enter controlling descent into children.
enum class WalkAction
{
    Continue,     ///< Visit the node's children
    SkipChildren, ///< Do not descend; leave() is still invoked
};

/// @brief Callback interface for @ref walk.
/// @details Both hooks receive the parent node explicitly (null for the walk
///          root) so visitors never need to stash traversal state on nodes.
class NodeVisitor
{
  public:
    virtual ~NodeVisitor() = default;

    /// @brief Called before the children of @p node are visited.
    virtual WalkAction enter(const Node &node, const Node *parent)
    {
        (void)node;
        (void)parent;
        return WalkAction::Continue;
    }

    /// @brief Called after the children of @p node were visited (or skipped).
    virtual void leave(const Node &node, const Node *parent)
    {
        (void)node;
        (void)parent;
    }
};

/// @brief Depth-first traversal of the subtree rooted at @p root.
/// @param root Node to start from.
/// @param visitor Hooks receiving enter/leave notifications.
/// @param parent Parent reported for @p root; null when walking from a root.
void walk(const Node &root, NodeVisitor &visitor, const Node *parent = nullptr);

/// @brief Invoke @p fn for each non-null direct child of @p node in source order.
void forEachChild(const Node &node, const std::function<void(const Node &)> &fn);

} // namespace shake::frontends::js
