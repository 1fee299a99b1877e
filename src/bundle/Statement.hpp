//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Statement.hpp
/// @brief One top-level statement of a module: the unit of tree-shaking.
///
/// @details A Statement owns the syntax node of a single top-level program
/// item and the scope tree built over it.  Its life has three phases:
///
/// 1. **analyse()** walks the node twice.  The first walk builds scopes and
///    registers declarations (so hoisted names are known up front); the
///    second classifies every identifier as a read (recorded in
///    `dependsOn` when it refers to the module top level or a global) or a
///    write (recorded in `modifies`).  Names declared in the statement's
///    root scope become `defines`.
///
/// 2. **expand()** includes the statement in the bundle: first everything
///    its reads depend on, then the statement itself, then every later
///    statement that mutates a name it defines.
///
/// 3. **replaceIdentifiers()** renders the statement with bundle-wide
///    renames applied and export assignments injected.
///
/// Scopes are recorded in a side table keyed by node address; the syntax
/// tree itself is never annotated.
///
/// @invariant Once included, expand() returns an empty list.
/// @invariant The inclusion state is set before dependencies are expanded,
///            which is what terminates cyclic expansion.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "bundle/NameSet.hpp"
#include "bundle/Scope.hpp"
#include "edit/EditBuffer.hpp"
#include "frontends/js/AST.hpp"
#include "support/diag_expected.hpp"

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace shake::bundle
{

class Module;
class Statement;

/// @brief Ordered list of statements selected for the bundle.
using StatementList = std::vector<Statement *>;

/// @brief Mapping from a local name to the text that replaces it.
using NameMap = std::map<std::string, std::string>;

/// @brief Whether a statement has been pulled into the bundle.
enum class InclusionState
{
    Pending,
    Included,
};

class Statement
{
  public:
    /// @brief Wrap @p node, whose text is the window of @p source.
    /// @param node Top-level syntax node; ownership moves to the statement.
    /// @param source Buffer snipped to the node's range.
    /// @param module Owning module; must outlive the statement.
    Statement(frontends::js::NodePtr node, edit::EditBuffer source, Module &module);

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    /// @brief Build scopes and compute defines, modifies and dependsOn.
    /// @return An error for an illegal reassignment of an imported binding.
    /// @note Import declarations are left unanalysed.
    support::Expected<void> analyse();

    /// @brief Include this statement and everything it needs.
    /// @return Statements in bundle order; empty when already included.
    support::Expected<StatementList> expand();

    /// @brief Render this statement with identifiers renamed.
    /// @param names Replacement for each module-level name needing one.
    /// @param exportTargets Export expression for each exported top-level
    ///        variable (e.g. `x` -> `exports.x`).
    /// @return A copy of the statement's buffer carrying the edits.
    support::Expected<edit::EditBuffer> replaceIdentifiers(const NameMap &names,
                                                           const NameMap &exportTargets) const;

    const frontends::js::Node &node() const
    {
        return *node_;
    }

    /// @brief The statement's root scope (module top level).
    const Scope &scope() const
    {
        return *scope_;
    }

    /// @brief Scope opened by @p node during analysis, or nullptr.
    const Scope *scopeOf(const frontends::js::Node &node) const;

    const NameSet &defines() const
    {
        return defines_;
    }

    const NameSet &modifies() const
    {
        return modifies_;
    }

    const NameSet &dependsOn() const
    {
        return dependsOn_;
    }

    bool isIncluded() const
    {
        return state_ == InclusionState::Included;
    }

    bool isImportDeclaration() const
    {
        return isImportDeclaration_;
    }

    bool isExportDeclaration() const
    {
        return isExportDeclaration_;
    }

    const edit::EditBuffer &source() const
    {
        return source_;
    }

    Module &module() const
    {
        return module_;
    }

  private:
    friend class ScopeBuilder;
    friend class ReferenceClassifier;

    /// @brief Create a scope nested in @p parent, opened by @p owner.
    Scope *openScope(const frontends::js::Node &owner, Scope *parent, bool isBlockScope);

    frontends::js::NodePtr node_;
    edit::EditBuffer source_;
    Module &module_;

    std::unique_ptr<Scope> scope_;
    std::vector<std::unique_ptr<Scope>> nestedScopes_;
    std::unordered_map<const frontends::js::Node *, Scope *> scopeTable_;

    NameSet defines_;
    NameSet modifies_;
    NameSet dependsOn_;

    InclusionState state_{InclusionState::Pending};
    bool isImportDeclaration_{false};
    bool isExportDeclaration_{false};
};

} // namespace shake::bundle
