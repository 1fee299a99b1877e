//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Statement.cpp
/// @brief Statement analysis (scopes, reads, writes) and expansion.
///
/// @details analyse() runs two visitors over the statement's syntax tree:
///
/// - ScopeBuilder opens a Scope for every function, block and catch clause
///   and registers declarations, recording each opened scope in the
///   statement's side table.
/// - ReferenceClassifier re-walks the tree, restoring the scope recorded for
///   each node, and sorts identifiers into reads and writes.
///
/// The set of defined names is taken from the root scope between the two
/// walks, so a statement never depends on a name it defines itself.
///
//===----------------------------------------------------------------------===//

#include "bundle/Statement.hpp"

#include "bundle/Module.hpp"
#include "frontends/js/AstWalker.hpp"

#include <optional>

namespace shake::bundle
{

using frontends::js::as;
using frontends::js::Node;
using frontends::js::NodeKind;
using frontends::js::NodeVisitor;
using frontends::js::WalkAction;

namespace js = frontends::js;

//===----------------------------------------------------------------------===//
// Pass 1: scope construction
//===----------------------------------------------------------------------===//

class ScopeBuilder : public NodeVisitor
{
  public:
    explicit ScopeBuilder(Statement &stmt) : stmt_(stmt), current_(stmt.scope_.get()) {}

    WalkAction enter(const Node &node, const Node *parent) override
    {
        (void)parent;
        stmt_.source_.addSourcemapLocation(node.start);

        Scope *opened = nullptr;
        switch (node.kind)
        {
            case NodeKind::FunctionDeclaration:
            case NodeKind::FunctionExpression:
            case NodeKind::ArrowFunctionExpression:
            {
                const auto &fn = as<js::FunctionNode>(node);
                if (node.is(NodeKind::FunctionDeclaration) && fn.id)
                    current_->addDeclaration(fn.id->name, &node, false);

                opened = stmt_.openScope(node, current_, false);
                for (const auto &param : fn.params)
                    opened->addDeclaration(param->name, param.get(), true);

                // A function expression's own name is visible only inside it.
                if (node.is(NodeKind::FunctionExpression) && fn.id)
                    opened->addDeclaration(fn.id->name, &node, true);
                break;
            }

            case NodeKind::BlockStatement:
                opened = stmt_.openScope(node, current_, true);
                break;

            case NodeKind::CatchClause:
            {
                const auto &clause = as<js::CatchClause>(node);
                opened = stmt_.openScope(node, current_, true);
                if (clause.param)
                    opened->addDeclaration(clause.param->name, clause.param.get(), true);
                break;
            }

            case NodeKind::VariableDeclaration:
            {
                const auto &decl = as<js::VariableDeclaration>(node);
                for (const auto &declarator : decl.declarations)
                    current_->addDeclaration(declarator->id->name, &node, decl.isBlockScoped());
                break;
            }

            case NodeKind::ClassDeclaration:
            {
                const auto &cls = as<js::ClassNode>(node);
                if (cls.id)
                    current_->addDeclaration(cls.id->name, &node, true);
                break;
            }

            default:
                break;
        }

        if (opened)
            current_ = opened;
        return WalkAction::Continue;
    }

    void leave(const Node &node, const Node *parent) override
    {
        (void)parent;
        if (stmt_.scopeOf(node))
            current_ = current_->parent();
    }

  private:
    Statement &stmt_;
    Scope *current_;
};

//===----------------------------------------------------------------------===//
// Pass 2: read/write classification
//===----------------------------------------------------------------------===//

class ReferenceClassifier : public NodeVisitor
{
  public:
    explicit ReferenceClassifier(Statement &stmt) : stmt_(stmt), current_(stmt.scope_.get()) {}

    WalkAction enter(const Node &node, const Node *parent) override
    {
        if (const Scope *scope = stmt_.scopeOf(node))
            current_ = scope;
        if (error_)
            return WalkAction::SkipChildren;

        if (node.is(NodeKind::Identifier) && parent)
            checkForRead(as<js::Identifier>(node), *parent);

        auto written = checkForWrites(node);
        if (!written)
        {
            error_ = written.error();
            return WalkAction::SkipChildren;
        }
        return WalkAction::Continue;
    }

    void leave(const Node &node, const Node *parent) override
    {
        (void)parent;
        if (stmt_.scopeOf(node))
            current_ = current_->parent();
    }

    support::Expected<void> result() const
    {
        if (error_)
            return *error_;
        return {};
    }

  private:
    void checkForRead(const js::Identifier &id, const Node &parent)
    {
        if (!js::isReference(id, &parent))
            return;
        // `class B {}` in expression position binds B only inside the class.
        if (parent.is(NodeKind::ClassExpression) && as<js::ClassNode>(parent).id.get() == &id)
            return;

        const Scope *defining = current_->findDefiningScope(id.name);
        if ((!defining || defining->depth() == 0) && !stmt_.defines_.contains(id.name))
            stmt_.dependsOn_.insert(id.name);
    }

    support::Expected<void> checkForWrites(const Node &node)
    {
        switch (node.kind)
        {
            case NodeKind::AssignmentExpression:
                return addWrite(*as<js::BinaryExpression>(node).left, true);
            case NodeKind::UpdateExpression:
                return addWrite(*as<js::UnaryExpression>(node).argument, true);
            case NodeKind::CallExpression:
                // Arguments may be mutated by the callee.
                for (const auto &arg : as<js::CallExpression>(node).arguments)
                {
                    if (auto r = addWrite(*arg, false); !r)
                        return r;
                }
                return {};
            default:
                return {};
        }
    }

    /// @brief Record the root identifier of write target @p target.
    /// @param disallowImportReassignment Reject writes that replace an
    ///        imported binding or a direct member of an imported namespace.
    support::Expected<void> addWrite(const Node &target, bool disallowImportReassignment)
    {
        const Node *root = &target;
        int depth = 0;
        while (root->is(NodeKind::MemberExpression))
        {
            root = as<js::MemberExpression>(*root).object.get();
            ++depth;
        }

        if (!root->is(NodeKind::Identifier))
            return {};
        const std::string &name = as<js::Identifier>(*root).name;

        if (disallowImportReassignment)
        {
            const Module &module = stmt_.module();
            const ImportBinding *binding = module.findImport(name);
            if (binding && !current_->contains(name))
            {
                const int minDepth = binding->isNamespace() ? 2 : 1;
                if (depth < minDepth)
                {
                    return support::makeError(
                        module.locate(root->start), "Illegal reassignment to import '" + name + "'", "S3000");
                }
            }
        }

        stmt_.modifies_.insert(name);
        return {};
    }

    Statement &stmt_;
    const Scope *current_;
    std::optional<support::Diag> error_;
};

//===----------------------------------------------------------------------===//
// Statement
//===----------------------------------------------------------------------===//

Statement::Statement(js::NodePtr node, edit::EditBuffer source, Module &module)
    : node_(std::move(node)), source_(std::move(source)), module_(module),
      scope_(std::make_unique<Scope>())
{
    isImportDeclaration_ = node_->is(NodeKind::ImportDeclaration);
    isExportDeclaration_ = node_->is(NodeKind::ExportNamedDeclaration) ||
                           node_->is(NodeKind::ExportDefaultDeclaration);
}

Scope *Statement::openScope(const Node &owner, Scope *parent, bool isBlockScope)
{
    nestedScopes_.push_back(std::make_unique<Scope>(parent, isBlockScope));
    Scope *scope = nestedScopes_.back().get();
    scopeTable_[&owner] = scope;
    return scope;
}

const Scope *Statement::scopeOf(const Node &node) const
{
    auto it = scopeTable_.find(&node);
    return it == scopeTable_.end() ? nullptr : it->second;
}

support::Expected<void> Statement::analyse()
{
    if (isImportDeclaration_)
        return {};

    ScopeBuilder builder(*this);
    js::walk(*node_, builder);

    for (const std::string &name : scope_->declaredNames())
        defines_.insert(name);

    ReferenceClassifier classifier(*this);
    js::walk(*node_, classifier);
    return classifier.result();
}

/// @brief Include this statement after its dependencies and before its modifiers.
/// @details The state flips to Included before any recursion so that a
///          dependency cycle leading back here contributes nothing.
support::Expected<StatementList> Statement::expand()
{
    if (state_ == InclusionState::Included)
        return StatementList{};
    state_ = InclusionState::Included;

    StatementList result;

    for (const std::string &name : dependsOn_)
    {
        auto definition = module_.define(name);
        if (!definition)
            return definition.error();
        result.insert(result.end(), definition.value().begin(), definition.value().end());
    }

    if (support::TraceSink *trace = module_.trace())
        trace->onStatementIncluded(module_.id(), module_.fileId(), node_->start, node_->end);
    result.push_back(this);

    for (const std::string &name : defines_)
    {
        const StatementList *modifiers = module_.modifications(name);
        if (!modifiers)
            continue;
        for (Statement *modifier : *modifiers)
        {
            if (modifier->isIncluded())
                continue;
            auto expanded = modifier->expand();
            if (!expanded)
                return expanded.error();
            result.insert(result.end(), expanded.value().begin(), expanded.value().end());
        }
    }

    return result;
}

} // namespace shake::bundle
