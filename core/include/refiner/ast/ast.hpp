// refiner/ast/ast.hpp - AST node class definitions for the JavaScript subset
//
// This header contains all AST node class definitions following the
// LLVM/Clang style with classof() for RTTI support.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string_view>

#include "refiner/ast/ast_enums.hpp"
#include "refiner/basic/casting.hpp"
#include "refiner/basic/source_manager.hpp"

namespace refiner
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Invalid for synthesized nodes.

  // Non-copyable, non-movable (managed by AstContext)
  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  /// Get the node kind
  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  /// Get the source range (byte offsets only)
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/**
 * Base class for expressions.
 */
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for statements.
 */
class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class BlockStmt;

// ============================================================================
// Literal Expressions
// ============================================================================

/// String literal. `value` holds the decoded (cooked) text.
class StringLiteral : public NodeBase<StringLiteral, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteral(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Numeric literal. Always non-negative; `-1` is a UnaryExpr.
class NumberLiteral : public NodeBase<NumberLiteral, Expr, NodeKind::NumberLiteral>
{
public:
  double value;

  explicit NumberLiteral(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// BigInt literal. `digits` is the canonical decimal text without the `n` suffix.
class BigIntLiteral : public NodeBase<BigIntLiteral, Expr, NodeKind::BigIntLiteral>
{
public:
  std::string_view digits;

  explicit BigIntLiteral(std::string_view d, SourceRange r = {}) : NodeBase(r), digits(d) {}
};

class BoolLiteral : public NodeBase<BoolLiteral, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteral(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NullLiteral : public NodeBase<NullLiteral, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteral(SourceRange r = {}) : NodeBase(r) {}
};

/// Regular expression literal: /pattern/flags
class RegExpLiteral : public NodeBase<RegExpLiteral, Expr, NodeKind::RegExpLiteral>
{
public:
  std::string_view pattern;
  std::string_view flags;

  RegExpLiteral(std::string_view p, std::string_view f, SourceRange r = {})
  : NodeBase(r), pattern(p), flags(f)
  {
  }
};

/// One static chunk of a template literal.
struct TemplateQuasi
{
  std::string_view raw;                    ///< Source text between delimiters
  std::optional<std::string_view> cooked;  ///< Empty when an escape is malformed
};

/**
 * Template literal: `a${x}b`.
 *
 * Invariant: quasis.size() == expressions.size() + 1.
 */
class TemplateLiteral : public NodeBase<TemplateLiteral, Expr, NodeKind::TemplateLiteral>
{
public:
  gsl::span<TemplateQuasi> quasis;
  gsl::span<Expr *> expressions;

  TemplateLiteral(gsl::span<TemplateQuasi> q, gsl::span<Expr *> e, SourceRange r = {})
  : NodeBase(r), quasis(q), expressions(e)
  {
  }
};

// ============================================================================
// Primary Expressions
// ============================================================================

class Identifier : public NodeBase<Identifier, Expr, NodeKind::Identifier>
{
public:
  std::string_view name;

  explicit Identifier(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class ThisExpr : public NodeBase<ThisExpr, Expr, NodeKind::ThisExpr>
{
public:
  explicit ThisExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// Missing expression (parser recovery placeholder).
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Container Expressions
// ============================================================================

/// Inline-expansion marker: `...argument`
class SpreadElement : public NodeBase<SpreadElement, Expr, NodeKind::SpreadElement>
{
public:
  Expr * argument;

  explicit SpreadElement(Expr * a, SourceRange r = {}) : NodeBase(r), argument(a) {}
};

/**
 * Keyed slot inside an ObjectExpr.
 *
 * Non-computed keys are Identifier, StringLiteral or NumberLiteral.
 * Computed keys (`[expr]: v`) may be any expression.
 */
class Property : public NodeBase<Property, AstNode, NodeKind::Property>
{
public:
  Expr * key;
  Expr * value;
  bool computed = false;
  bool shorthand = false;  ///< `{ a }`: key and value are the same identifier

  Property(Expr * k, Expr * v, bool is_computed, bool is_shorthand, SourceRange r = {})
  : NodeBase(r), key(k), value(v), computed(is_computed), shorthand(is_shorthand)
  {
  }
};

/**
 * Keyed container: `{ a: 1, ...rest }`.
 *
 * Each entry is either a Property or a SpreadElement.
 */
class ObjectExpr : public NodeBase<ObjectExpr, Expr, NodeKind::ObjectExpr>
{
public:
  gsl::span<AstNode *> properties;

  explicit ObjectExpr(gsl::span<AstNode *> props, SourceRange r = {})
  : NodeBase(r), properties(props)
  {
  }

  /// Remove the entry at `index`, shifting later entries down.
  void erase_property(size_t index)
  {
    if (index >= properties.size()) return;
    for (size_t i = index + 1; i < properties.size(); ++i) {
      properties[i - 1] = properties[i];
    }
    properties = properties.first(properties.size() - 1);
  }
};

/**
 * Ordered container: `[a, , ...b]`.
 *
 * A nullptr element is a hole. Elements may be SpreadElement.
 */
class ArrayExpr : public NodeBase<ArrayExpr, Expr, NodeKind::ArrayExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayExpr(gsl::span<Expr *> elems, SourceRange r = {}) : NodeBase(r), elements(elems)
  {
  }
};

// ============================================================================
// Compound Expressions
// ============================================================================

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;
  bool optional = false;  ///< `f?.()`

  CallExpr(Expr * c, gsl::span<Expr *> a, bool is_optional = false, SourceRange r = {})
  : NodeBase(r), callee(c), args(a), optional(is_optional)
  {
  }
};

class NewExpr : public NodeBase<NewExpr, Expr, NodeKind::NewExpr>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  NewExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

/// Member access: `object.property`, `object[property]`, `object?.property`
class MemberExpr : public NodeBase<MemberExpr, Expr, NodeKind::MemberExpr>
{
public:
  Expr * object;
  Expr * property;  ///< Identifier when !computed
  bool computed = false;
  bool optional = false;

  MemberExpr(Expr * o, Expr * p, bool is_computed, bool is_optional, SourceRange r = {})
  : NodeBase(r), object(o), property(p), computed(is_computed), optional(is_optional)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// Binary, logical and nullish expressions.
class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class ConditionalExpr : public NodeBase<ConditionalExpr, Expr, NodeKind::ConditionalExpr>
{
public:
  Expr * test;
  Expr * consequent;
  Expr * alternate;

  ConditionalExpr(Expr * t, Expr * c, Expr * a, SourceRange r = {})
  : NodeBase(r), test(t), consequent(c), alternate(a)
  {
  }
};

/// Assignment, also used for default values in parameters and patterns.
class AssignExpr : public NodeBase<AssignExpr, Expr, NodeKind::AssignExpr>
{
public:
  Expr * target;
  AssignOp op;
  Expr * value;

  AssignExpr(Expr * t, AssignOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), op(o), value(v)
  {
  }
};

/**
 * Arrow function. Exactly one of `expr_body` and `block_body` is set.
 */
class ArrowFunctionExpr : public NodeBase<ArrowFunctionExpr, Expr, NodeKind::ArrowFunctionExpr>
{
public:
  gsl::span<Expr *> params;
  Expr * expr_body = nullptr;
  BlockStmt * block_body = nullptr;
  bool is_async = false;

  ArrowFunctionExpr(gsl::span<Expr *> p, Expr * body, bool async, SourceRange r = {})
  : NodeBase(r), params(p), expr_body(body), is_async(async)
  {
  }

  ArrowFunctionExpr(gsl::span<Expr *> p, BlockStmt * body, bool async, SourceRange r = {})
  : NodeBase(r), params(p), block_body(body), is_async(async)
  {
  }
};

// ============================================================================
// Statements
// ============================================================================

/**
 * Statement kept verbatim from source (import declarations, export lists).
 */
class RawStmt : public NodeBase<RawStmt, Stmt, NodeKind::RawStmt>
{
public:
  std::string_view text;

  explicit RawStmt(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

/// `target = init` inside a VarDecl. `init` may be nullptr.
class VarDeclarator : public NodeBase<VarDeclarator, AstNode, NodeKind::VarDeclarator>
{
public:
  Expr * target;
  Expr * init;

  VarDeclarator(Expr * t, Expr * i, SourceRange r = {}) : NodeBase(r), target(t), init(i) {}
};

class VarDecl : public NodeBase<VarDecl, Stmt, NodeKind::VarDecl>
{
public:
  VarKind var_kind;
  gsl::span<VarDeclarator *> declarators;
  bool exported = false;

  VarDecl(VarKind k, gsl::span<VarDeclarator *> d, bool is_exported, SourceRange r = {})
  : NodeBase(r), var_kind(k), declarators(d), exported(is_exported)
  {
  }
};

class FunctionDecl : public NodeBase<FunctionDecl, Stmt, NodeKind::FunctionDecl>
{
public:
  std::string_view name;  ///< Empty for `export default function () {}`
  gsl::span<Expr *> params;
  BlockStmt * body;
  bool exported = false;
  bool is_default = false;
  bool is_async = false;

  FunctionDecl(
    std::string_view n, gsl::span<Expr *> p, BlockStmt * b, SourceRange r = {})
  : NodeBase(r), name(n), params(p), body(b)
  {
  }
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * argument;  ///< nullptr for a bare `return;`

  explicit ReturnStmt(Expr * a, SourceRange r = {}) : NodeBase(r), argument(a) {}
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * test;
  Stmt * consequent;
  Stmt * alternate;  ///< nullptr when there is no else branch

  IfStmt(Expr * t, Stmt * c, Stmt * a, SourceRange r = {})
  : NodeBase(r), test(t), consequent(c), alternate(a)
  {
  }
};

class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> body;

  explicit BlockStmt(gsl::span<Stmt *> b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

class ThrowStmt : public NodeBase<ThrowStmt, Stmt, NodeKind::ThrowStmt>
{
public:
  Expr * argument;

  explicit ThrowStmt(Expr * a, SourceRange r = {}) : NodeBase(r), argument(a) {}
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// `export default <expr>;`
class ExportDefaultStmt : public NodeBase<ExportDefaultStmt, Stmt, NodeKind::ExportDefaultStmt>
{
public:
  Expr * expr;

  explicit ExportDefaultStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> body;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Get the SourceRange from any AST node.
 */
[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace refiner
