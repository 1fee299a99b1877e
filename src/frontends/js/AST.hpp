//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Syntax tree for the JavaScript module subset understood by Shake.
///
/// @details Nodes follow the ESTree shapes closely so that statement analysis
/// can be described in familiar terms (Identifier, MemberExpression, Property,
/// ...).  Every node records the half-open byte range `[start, end)` it spans
/// in the module source; the identifier rewriter overwrites exactly those
/// ranges.
///
/// Several ESTree kinds share one C++ struct (for example FunctionDeclaration,
/// FunctionExpression and ArrowFunctionExpression are all `FunctionNode`); the
/// `kind` field distinguishes them.
///
/// @invariant Nodes form a tree.  Every child is owned by exactly one parent
///            through std::unique_ptr; the Program (or, after a module splits
///            its program, each Statement) owns the root.
/// @invariant Nodes carry no analysis state.  Scopes and traversal flags are
///            kept in side tables keyed by node address.
///
/// @see AstWalker.hpp - generic traversal over these nodes.
/// @see Parser.hpp - produces these nodes from source text.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace shake::frontends::js
{

/// @brief Discriminator for every syntax node shape.
enum class NodeKind
{
    Program,

    // Modules
    ImportDeclaration,
    ImportSpecifier,
    ImportDefaultSpecifier,
    ImportNamespaceSpecifier,
    ExportNamedDeclaration,
    ExportDefaultDeclaration,
    ExportSpecifier,

    // Declarations
    VariableDeclaration,
    VariableDeclarator,
    FunctionDeclaration,
    ClassDeclaration,
    ClassBody,
    MethodDefinition,

    // Statements
    BlockStatement,
    ExpressionStatement,
    EmptyStatement,
    IfStatement,
    ForStatement,
    ForInStatement,
    ForOfStatement,
    WhileStatement,
    DoWhileStatement,
    ReturnStatement,
    ThrowStatement,
    BreakStatement,
    ContinueStatement,
    TryStatement,
    CatchClause,
    SwitchStatement,
    SwitchCase,

    // Expressions
    Identifier,
    Literal,
    ThisExpression,
    Super,
    ArrayExpression,
    ObjectExpression,
    Property,
    FunctionExpression,
    ArrowFunctionExpression,
    ClassExpression,
    UnaryExpression,
    UpdateExpression,
    BinaryExpression,
    LogicalExpression,
    AssignmentExpression,
    ConditionalExpression,
    CallExpression,
    NewExpression,
    MemberExpression,
    SequenceExpression,
};

/// @brief Human readable ESTree name of @p kind (e.g. "MemberExpression").
const char *nodeKindToString(NodeKind kind);

struct Node;

/// @brief Owning pointer to a syntax node.
using NodePtr = std::unique_ptr<Node>;

/// @brief Base of every syntax node.
struct Node
{
    NodeKind kind;      ///< Concrete node shape
    uint32_t start = 0; ///< Byte offset of the first character
    uint32_t end = 0;   ///< Byte offset one past the last character

    Node(NodeKind k, uint32_t s, uint32_t e) : kind(k), start(s), end(e) {}

    virtual ~Node() = default;

    /// @brief True when this node is of kind @p k.
    bool is(NodeKind k) const
    {
        return kind == k;
    }
};

/// @brief Downcast @p node to its concrete struct; the caller checks `kind` first.
template <typename T> const T &as(const Node &node)
{
    return static_cast<const T &>(node);
}

//===----------------------------------------------------------------------===//
// Leaves
//===----------------------------------------------------------------------===//

struct Identifier : Node
{
    std::string name;

    Identifier(uint32_t s, uint32_t e, std::string n)
        : Node(NodeKind::Identifier, s, e), name(std::move(n))
    {
    }
};

using IdentifierPtr = std::unique_ptr<Identifier>;

/// @brief Kinds of literal values.
enum class LiteralKind
{
    Number,
    String,
    Boolean,
    Null,
};

struct Literal : Node
{
    LiteralKind literalKind;
    std::string raw;   ///< Source spelling including quotes
    std::string value; ///< Cooked string value (strings) or raw text (others)

    Literal(uint32_t s, uint32_t e, LiteralKind k, std::string r, std::string v)
        : Node(NodeKind::Literal, s, e), literalKind(k), raw(std::move(r)), value(std::move(v))
    {
    }
};

struct ThisExpression : Node
{
    ThisExpression(uint32_t s, uint32_t e) : Node(NodeKind::ThisExpression, s, e) {}
};

/// @brief The `super` keyword as a callee or member object.
struct Super : Node
{
    Super(uint32_t s, uint32_t e) : Node(NodeKind::Super, s, e) {}
};

//===----------------------------------------------------------------------===//
// Program and modules
//===----------------------------------------------------------------------===//

struct Program : Node
{
    std::vector<NodePtr> body;

    Program(uint32_t s, uint32_t e) : Node(NodeKind::Program, s, e) {}
};

/// @brief Import specifier of any of the three ESTree kinds.
/// @details `imported` is null for ImportDefaultSpecifier and
///          ImportNamespaceSpecifier.
struct ImportSpecifier : Node
{
    IdentifierPtr imported;
    IdentifierPtr local;

    ImportSpecifier(NodeKind k, uint32_t s, uint32_t e) : Node(k, s, e) {}
};

struct ImportDeclaration : Node
{
    std::vector<std::unique_ptr<ImportSpecifier>> specifiers;
    std::unique_ptr<Literal> source;

    ImportDeclaration(uint32_t s, uint32_t e) : Node(NodeKind::ImportDeclaration, s, e) {}
};

struct ExportSpecifier : Node
{
    IdentifierPtr local;
    IdentifierPtr exported;

    ExportSpecifier(uint32_t s, uint32_t e) : Node(NodeKind::ExportSpecifier, s, e) {}
};

/// @brief `export <declaration>` or `export { a, b as c } [from "x"]`.
struct ExportNamedDeclaration : Node
{
    NodePtr declaration; ///< Null for specifier lists
    std::vector<std::unique_ptr<ExportSpecifier>> specifiers;
    std::unique_ptr<Literal> source; ///< Non-null for re-exports

    ExportNamedDeclaration(uint32_t s, uint32_t e)
        : Node(NodeKind::ExportNamedDeclaration, s, e)
    {
    }
};

/// @brief `export default <declaration-or-expression>`.
struct ExportDefaultDeclaration : Node
{
    NodePtr declaration;

    ExportDefaultDeclaration(uint32_t s, uint32_t e)
        : Node(NodeKind::ExportDefaultDeclaration, s, e)
    {
    }
};

//===----------------------------------------------------------------------===//
// Declarations
//===----------------------------------------------------------------------===//

enum class VarKind
{
    Var,
    Let,
    Const,
};

struct VariableDeclarator : Node
{
    IdentifierPtr id;
    NodePtr init;

    VariableDeclarator(uint32_t s, uint32_t e) : Node(NodeKind::VariableDeclarator, s, e) {}
};

struct VariableDeclaration : Node
{
    VarKind varKind = VarKind::Var;
    std::vector<std::unique_ptr<VariableDeclarator>> declarations;

    VariableDeclaration(uint32_t s, uint32_t e) : Node(NodeKind::VariableDeclaration, s, e) {}

    /// @brief True for `let` and `const`, whose bindings are block scoped.
    bool isBlockScoped() const
    {
        return varKind != VarKind::Var;
    }
};

/// @brief FunctionDeclaration, FunctionExpression or ArrowFunctionExpression.
struct FunctionNode : Node
{
    IdentifierPtr id; ///< Null for anonymous functions and arrows
    std::vector<IdentifierPtr> params;
    NodePtr body; ///< BlockStatement, or an expression for concise arrows

    FunctionNode(NodeKind k, uint32_t s, uint32_t e) : Node(k, s, e) {}

    /// @brief True for `(x) => x + 1` style arrows without a block body.
    bool hasExpressionBody() const
    {
        return body && !body->is(NodeKind::BlockStatement);
    }
};

enum class MethodKind
{
    Method,
    Constructor,
    Get,
    Set,
};

struct MethodDefinition : Node
{
    NodePtr key;
    std::unique_ptr<FunctionNode> value;
    MethodKind methodKind = MethodKind::Method;
    bool computed = false;
    bool isStatic = false;

    MethodDefinition(uint32_t s, uint32_t e) : Node(NodeKind::MethodDefinition, s, e) {}
};

struct ClassBody : Node
{
    std::vector<std::unique_ptr<MethodDefinition>> body;

    ClassBody(uint32_t s, uint32_t e) : Node(NodeKind::ClassBody, s, e) {}
};

/// @brief ClassDeclaration or ClassExpression.
struct ClassNode : Node
{
    IdentifierPtr id;
    NodePtr superClass;
    std::unique_ptr<ClassBody> body;

    ClassNode(NodeKind k, uint32_t s, uint32_t e) : Node(k, s, e) {}
};

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

struct BlockStatement : Node
{
    std::vector<NodePtr> body;

    BlockStatement(uint32_t s, uint32_t e) : Node(NodeKind::BlockStatement, s, e) {}
};

struct ExpressionStatement : Node
{
    NodePtr expression;

    ExpressionStatement(uint32_t s, uint32_t e) : Node(NodeKind::ExpressionStatement, s, e) {}
};

/// @brief EmptyStatement, BreakStatement or ContinueStatement.
struct SimpleStatement : Node
{
    SimpleStatement(NodeKind k, uint32_t s, uint32_t e) : Node(k, s, e) {}
};

struct IfStatement : Node
{
    NodePtr test;
    NodePtr consequent;
    NodePtr alternate;

    IfStatement(uint32_t s, uint32_t e) : Node(NodeKind::IfStatement, s, e) {}
};

struct ForStatement : Node
{
    NodePtr init;
    NodePtr test;
    NodePtr update;
    NodePtr body;

    ForStatement(uint32_t s, uint32_t e) : Node(NodeKind::ForStatement, s, e) {}
};

/// @brief ForInStatement or ForOfStatement.
struct ForEachStatement : Node
{
    NodePtr left;
    NodePtr right;
    NodePtr body;

    ForEachStatement(NodeKind k, uint32_t s, uint32_t e) : Node(k, s, e) {}
};

/// @brief WhileStatement or DoWhileStatement.
struct LoopStatement : Node
{
    NodePtr test;
    NodePtr body;

    LoopStatement(NodeKind k, uint32_t s, uint32_t e) : Node(k, s, e) {}
};

/// @brief ReturnStatement or ThrowStatement.
struct ArgumentStatement : Node
{
    NodePtr argument;

    ArgumentStatement(NodeKind k, uint32_t s, uint32_t e) : Node(k, s, e) {}
};

struct CatchClause : Node
{
    IdentifierPtr param;
    std::unique_ptr<BlockStatement> body;

    CatchClause(uint32_t s, uint32_t e) : Node(NodeKind::CatchClause, s, e) {}
};

struct TryStatement : Node
{
    std::unique_ptr<BlockStatement> block;
    std::unique_ptr<CatchClause> handler;
    std::unique_ptr<BlockStatement> finalizer;

    TryStatement(uint32_t s, uint32_t e) : Node(NodeKind::TryStatement, s, e) {}
};

struct SwitchCase : Node
{
    NodePtr test; ///< Null for `default:`
    std::vector<NodePtr> consequent;

    SwitchCase(uint32_t s, uint32_t e) : Node(NodeKind::SwitchCase, s, e) {}
};

struct SwitchStatement : Node
{
    NodePtr discriminant;
    std::vector<std::unique_ptr<SwitchCase>> cases;

    SwitchStatement(uint32_t s, uint32_t e) : Node(NodeKind::SwitchStatement, s, e) {}
};

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

struct ArrayExpression : Node
{
    std::vector<NodePtr> elements; ///< Null entries represent holes

    ArrayExpression(uint32_t s, uint32_t e) : Node(NodeKind::ArrayExpression, s, e) {}
};

enum class PropertyKind
{
    Init,
    Get,
    Set,
};

struct Property : Node
{
    NodePtr key;
    NodePtr value;
    PropertyKind propertyKind = PropertyKind::Init;
    bool computed = false;
    bool shorthand = false; ///< `{ a }`; key and value are distinct nodes over the same range
    bool method = false;

    Property(uint32_t s, uint32_t e) : Node(NodeKind::Property, s, e) {}
};

struct ObjectExpression : Node
{
    std::vector<std::unique_ptr<Property>> properties;

    ObjectExpression(uint32_t s, uint32_t e) : Node(NodeKind::ObjectExpression, s, e) {}
};

/// @brief UnaryExpression or UpdateExpression.
struct UnaryExpression : Node
{
    std::string op;
    bool prefix = true;
    NodePtr argument;

    UnaryExpression(NodeKind k, uint32_t s, uint32_t e) : Node(k, s, e) {}
};

/// @brief BinaryExpression, LogicalExpression or AssignmentExpression.
struct BinaryExpression : Node
{
    std::string op;
    NodePtr left;
    NodePtr right;

    BinaryExpression(NodeKind k, uint32_t s, uint32_t e) : Node(k, s, e) {}
};

struct ConditionalExpression : Node
{
    NodePtr test;
    NodePtr consequent;
    NodePtr alternate;

    ConditionalExpression(uint32_t s, uint32_t e) : Node(NodeKind::ConditionalExpression, s, e)
    {
    }
};

/// @brief CallExpression or NewExpression.
struct CallExpression : Node
{
    NodePtr callee;
    std::vector<NodePtr> arguments;

    CallExpression(NodeKind k, uint32_t s, uint32_t e) : Node(k, s, e) {}
};

struct MemberExpression : Node
{
    NodePtr object;
    NodePtr property;
    bool computed = false; ///< `a[b]` rather than `a.b`

    MemberExpression(uint32_t s, uint32_t e) : Node(NodeKind::MemberExpression, s, e) {}
};

struct SequenceExpression : Node
{
    std::vector<NodePtr> expressions;

    SequenceExpression(uint32_t s, uint32_t e) : Node(NodeKind::SequenceExpression, s, e) {}
};

//===----------------------------------------------------------------------===//
// Queries shared by analysis passes
//===----------------------------------------------------------------------===//

/// @brief True for the three function forms, all of which open a scope.
bool isFunctionKind(NodeKind kind);

/// @brief True when identifier @p node, appearing under @p parent, is a
///        reference rather than a property name.
/// @details Excludes the non-computed property of a MemberExpression, the key
///          of a non-computed object Property or MethodDefinition, and the
///          exported alias of an ExportSpecifier.  The shorthand `{ a }` case
///          counts its value (not its key) as a reference.
bool isReference(const Node &node, const Node *parent);

} // namespace shake::frontends::js
