// refiner/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
#pragma once

#include <type_traits>

#include "refiner/ast/ast.hpp"
#include "refiner/ast/ast_enums.hpp"
#include "refiner/basic/casting.hpp"

namespace refiner
{

// ============================================================================
// Type Traits for Const-Aware Node Pointer
// ============================================================================

namespace detail
{

/// Helper to propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class implements `visit_<snake_name>` for the node types it
 * cares about; everything else falls through to the category methods
 * (`visit_expr`, `visit_stmt`) and finally `visit_node`.
 *
 * @code
 *   class CallCounter : public ConstRecursiveAstVisitor<CallCounter> {
 *   public:
 *     int count = 0;
 *     bool visit_call_expr(const CallExpr* node) {
 *       ++count;
 *       return RecursiveAstVisitor::visit_call_expr(node);
 *     }
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  // ===========================================================================
  // Main dispatch method
  // ===========================================================================

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "refiner/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated from X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "refiner/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for const AST traversal
template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that automatically traverses child nodes in source order.
 *
 * Override a visit method to customize behavior. Call the base
 * implementation to continue into children, or return without it to prune
 * the subtree. Returning false stops the whole traversal.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Leaves and absent children (holes, missing else branches) continue traversal.
  bool visit_node(NodePtrT /*node*/) { return true; }

  /// Visit an optional child; nullptr counts as success.
  bool visit_child(NodePtrT node) { return node == nullptr || get_derived().visit(node); }

  template <typename Span>
  bool visit_all(const Span & children)
  {
    for (auto * child : children) {
      if (!visit_child(child)) return false;
    }
    return true;
  }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  bool visit_template_literal(NodePtr<TemplateLiteral> node)
  {
    return visit_all(node->expressions);
  }

  bool visit_object_expr(NodePtr<ObjectExpr> node) { return visit_all(node->properties); }

  bool visit_array_expr(NodePtr<ArrayExpr> node) { return visit_all(node->elements); }

  bool visit_spread_element(NodePtr<SpreadElement> node) { return visit_child(node->argument); }

  bool visit_property(NodePtr<Property> node)
  {
    if (node->computed && !visit_child(node->key)) return false;
    return visit_child(node->value);
  }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    if (!visit_child(node->callee)) return false;
    return visit_all(node->args);
  }

  bool visit_new_expr(NodePtr<NewExpr> node)
  {
    if (!visit_child(node->callee)) return false;
    return visit_all(node->args);
  }

  bool visit_member_expr(NodePtr<MemberExpr> node)
  {
    if (!visit_child(node->object)) return false;
    return !node->computed || visit_child(node->property);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return visit_child(node->operand); }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    if (!visit_child(node->lhs)) return false;
    return visit_child(node->rhs);
  }

  bool visit_conditional_expr(NodePtr<ConditionalExpr> node)
  {
    if (!visit_child(node->test)) return false;
    if (!visit_child(node->consequent)) return false;
    return visit_child(node->alternate);
  }

  bool visit_assign_expr(NodePtr<AssignExpr> node)
  {
    if (!visit_child(node->target)) return false;
    return visit_child(node->value);
  }

  bool visit_arrow_function_expr(NodePtr<ArrowFunctionExpr> node)
  {
    if (!visit_all(node->params)) return false;
    if (node->expr_body) return visit_child(node->expr_body);
    return visit_child(node->block_body);
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  bool visit_var_declarator(NodePtr<VarDeclarator> node)
  {
    if (!visit_child(node->target)) return false;
    return visit_child(node->init);
  }

  bool visit_var_decl(NodePtr<VarDecl> node) { return visit_all(node->declarators); }

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    if (!visit_all(node->params)) return false;
    return visit_child(node->body);
  }

  bool visit_return_stmt(NodePtr<ReturnStmt> node) { return visit_child(node->argument); }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    if (!visit_child(node->test)) return false;
    if (!visit_child(node->consequent)) return false;
    return visit_child(node->alternate);
  }

  bool visit_block_stmt(NodePtr<BlockStmt> node) { return visit_all(node->body); }

  bool visit_throw_stmt(NodePtr<ThrowStmt> node) { return visit_child(node->argument); }

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return visit_child(node->expr); }

  bool visit_export_default_stmt(NodePtr<ExportDefaultStmt> node)
  {
    return visit_child(node->expr);
  }

  bool visit_program(NodePtr<Program> node) { return visit_all(node->body); }
};

/// Alias for const recursive AST traversal
template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace refiner
