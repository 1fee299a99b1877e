//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Statement_Rewrite.cpp
/// @brief Identifier renaming and export rewriting for one statement.
///
/// @details The rewriter keeps a stack of name maps.  The bottom entry is the
/// caller's bundle-wide map.  Entering a node that opened a scope pushes a
/// narrowed map:
///
/// - names the scope declares itself are dropped, since inside it they
///   refer to the local binding;
/// - a replacement's root name (`bundle` for `bundle.foo`) that the scope
///   declares is remapped to `<root>$$`, so the local declaration cannot
///   capture the rewritten outer reference.
///
/// A function declaration's name is rewritten with the enclosing map before
/// the narrowed one is pushed.  When the narrowed map is empty the rest of
/// the subtree is not visited at all.
///
//===----------------------------------------------------------------------===//

#include "bundle/Statement.hpp"

#include "frontends/js/AstWalker.hpp"

#include <optional>
#include <unordered_set>

namespace shake::bundle
{

using frontends::js::as;
using frontends::js::Node;
using frontends::js::NodeKind;
using frontends::js::WalkAction;

namespace js = frontends::js;

namespace
{

class IdentifierRewriter : public js::NodeVisitor
{
  public:
    IdentifierRewriter(const Statement &stmt,
                       edit::EditBuffer &buffer,
                       const NameMap &names,
                       const NameMap &exportTargets,
                       const NameSet &deshadowRoots)
        : stmt_(stmt), buffer_(buffer), exportTargets_(exportTargets), deshadowRoots_(deshadowRoots)
    {
        names_.push_back(names);
    }

    WalkAction enter(const Node &node, const Node *parent) override
    {
        if (error_ || skipped_.count(&node))
            return WalkAction::SkipChildren;

        if (node.is(NodeKind::VariableDeclaration) && !exportTargets_.empty() && isTopLevel(node, parent))
            rewriteExports(as<js::VariableDeclaration>(node));

        if (const Scope *scope = stmt_.scopeOf(node))
        {
            // A declaration's own name binds in the enclosing scope, even when
            // a parameter or local of the same name shadows it inside.
            if (node.is(NodeKind::FunctionDeclaration))
            {
                const auto &fn = as<js::FunctionNode>(node);
                if (fn.id)
                {
                    rewriteIdentifier(*fn.id, node);
                    skipped_.insert(fn.id.get());
                }
            }

            NameMap narrowed;
            for (const auto &[name, replacement] : names_.back())
            {
                if (!scope->declaresLocally(name))
                    narrowed.emplace(name, replacement);
            }
            for (const std::string &root : deshadowRoots_)
            {
                if (scope->declaresLocally(root))
                    narrowed[root] = root + "$$";
            }

            if (narrowed.empty())
                return WalkAction::SkipChildren;
            names_.push_back(std::move(narrowed));
            owners_.push_back(&node);
        }

        if (node.is(NodeKind::Identifier) && parent && js::isReference(node, parent))
            rewriteIdentifier(as<js::Identifier>(node), *parent);

        return WalkAction::Continue;
    }

    void leave(const Node &node, const Node *parent) override
    {
        (void)parent;
        if (!owners_.empty() && owners_.back() == &node)
        {
            owners_.pop_back();
            names_.pop_back();
        }
    }

    const std::optional<support::Diag> &error() const
    {
        return error_;
    }

  private:
    /// @brief True for the statement's own declaration or the one it exports.
    bool isTopLevel(const Node &node, const Node *parent) const
    {
        if (&node == &stmt_.node())
            return true;
        return parent == &stmt_.node() && parent->is(NodeKind::ExportNamedDeclaration);
    }

    void rewriteExports(const js::VariableDeclaration &decl)
    {
        if (decl.declarations.size() == 1)
        {
            const js::Identifier &id = *decl.declarations.front()->id;
            auto target = exportTargets_.find(id.name);
            if (target == exportTargets_.end())
                return;
            // `var x = 1` becomes `exports.x = 1`.
            record(buffer_.overwrite(decl.start, id.end, target->second));
            skipped_.insert(&id);
            return;
        }

        std::string initialisers;
        for (const auto &declarator : decl.declarations)
        {
            const std::string &name = declarator->id->name;
            auto target = exportTargets_.find(name);
            if (target == exportTargets_.end())
                continue;
            auto renamed = names_.back().find(name);
            const std::string &local = renamed == names_.back().end() ? name : renamed->second;
            initialisers += "\n" + target->second + " = " + local + ";";
        }
        if (initialisers.empty())
            return;

        if (!buffer_.insert(decl.end, initialisers))
            buffer_.append(initialisers);
    }

    void rewriteIdentifier(const js::Identifier &id, const Node &parent)
    {
        auto it = names_.back().find(id.name);
        if (it == names_.back().end() || it->second == id.name)
            return;

        // `{ a }` must keep its property name: `{ a: replacement }`.
        if (parent.is(NodeKind::Property) && as<js::Property>(parent).shorthand)
            record(buffer_.overwrite(id.start, id.end, id.name + ": " + it->second));
        else
            record(buffer_.overwrite(id.start, id.end, it->second));
    }

    void record(support::Expected<void> result)
    {
        if (!result && !error_)
            error_ = result.error();
    }

    const Statement &stmt_;
    edit::EditBuffer &buffer_;
    const NameMap &exportTargets_;
    const NameSet &deshadowRoots_;

    std::vector<NameMap> names_;
    std::vector<const Node *> owners_;
    std::unordered_set<const Node *> skipped_;
    std::optional<support::Diag> error_;
};

} // namespace

support::Expected<edit::EditBuffer> Statement::replaceIdentifiers(const NameMap &names,
                                                                  const NameMap &exportTargets) const
{
    edit::EditBuffer buffer = source_.clone();
    if (names.empty() && exportTargets.empty())
        return buffer;

    NameSet deshadowRoots;
    for (const auto &[name, replacement] : names)
        deshadowRoots.insert(replacement.substr(0, replacement.find('.')));

    IdentifierRewriter rewriter(*this, buffer, names, exportTargets, deshadowRoots);
    js::walk(*node_, rewriter);
    if (rewriter.error())
        return *rewriter.error();
    return buffer;
}

} // namespace shake::bundle
