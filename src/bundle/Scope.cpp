//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Scope.cpp
/// @brief Declaration registration and outward name lookup.
///
//===----------------------------------------------------------------------===//

#include "bundle/Scope.hpp"

namespace shake::bundle
{

Scope::Scope(Scope *parent, bool isBlockScope)
    : parent_(parent), isBlockScope_(isBlockScope), depth_(parent ? parent->depth() + 1 : 0)
{
}

void Scope::addDeclaration(const std::string &name,
                           const frontends::js::Node *node,
                           bool isBlockDeclaration)
{
    if (!isBlockDeclaration && isBlockScope_ && parent_)
    {
        parent_->addDeclaration(name, node, isBlockDeclaration);
        return;
    }

    declarations_[name] = node;
    names_.insert(name);
}

const Scope *Scope::findDefiningScope(const std::string &name) const
{
    for (const Scope *scope = this; scope; scope = scope->parent_)
    {
        if (scope->declaresLocally(name))
            return scope;
    }
    return nullptr;
}

bool Scope::contains(const std::string &name) const
{
    return findDefiningScope(name) != nullptr;
}

const frontends::js::Node *Scope::declaration(const std::string &name) const
{
    auto it = declarations_.find(name);
    return it == declarations_.end() ? nullptr : it->second;
}

} // namespace shake::bundle
