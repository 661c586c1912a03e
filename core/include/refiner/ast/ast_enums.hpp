// refiner/ast/ast_enums.hpp - AST enumerations (node kinds, operators)
#pragma once

#include <cstdint>
#include <string_view>

namespace refiner
{

// ============================================================================
// NodeKind
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI, generated from ast_nodes.def.
 * Categories are contiguous so classof() can use range checks.
 */
enum class NodeKind : uint8_t {
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "refiner/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

enum class UnaryOp : uint8_t {
  Not,     ///< !
  Neg,     ///< -
  Plus,    ///< +
  BitNot,  ///< ~
  Typeof,  ///< typeof
  Void,    ///< void
};

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,
  Sub,
  Mul,
  Div,
  Mod,
  Exp,
  // Comparison
  Eq,
  Ne,
  StrictEq,
  StrictNe,
  Lt,
  Le,
  Gt,
  Ge,
  In,
  Instanceof,
  // Logical
  And,
  Or,
  Nullish,
  // Bitwise
  BitAnd,
  BitXor,
  BitOr,
  Shl,
  Shr,
  UShr,
};

enum class AssignOp : uint8_t {
  Assign,
  AddAssign,
  SubAssign,
  MulAssign,
  DivAssign,
  ModAssign,
  AndAssign,
  OrAssign,
  NullishAssign,
};

enum class VarKind : uint8_t { Const, Let, Var };

// ============================================================================
// to_string()
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Plus:
      return "+";
    case UnaryOp::BitNot:
      return "~";
    case UnaryOp::Typeof:
      return "typeof";
    case UnaryOp::Void:
      return "void";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Exp:
      return "**";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::StrictEq:
      return "===";
    case BinaryOp::StrictNe:
      return "!==";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::In:
      return "in";
    case BinaryOp::Instanceof:
      return "instanceof";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::Nullish:
      return "??";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::Shl:
      return "<<";
    case BinaryOp::Shr:
      return ">>";
    case BinaryOp::UShr:
      return ">>>";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::AddAssign:
      return "+=";
    case AssignOp::SubAssign:
      return "-=";
    case AssignOp::MulAssign:
      return "*=";
    case AssignOp::DivAssign:
      return "/=";
    case AssignOp::ModAssign:
      return "%=";
    case AssignOp::AndAssign:
      return "&&=";
    case AssignOp::OrAssign:
      return "||=";
    case AssignOp::NullishAssign:
      return "??=";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(VarKind kind) noexcept
{
  switch (kind) {
    case VarKind::Const:
      return "const";
    case VarKind::Let:
      return "let";
    case VarKind::Var:
      return "var";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::StringLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::MissingExpr;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::RawStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::ExportDefaultStmt;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

}  // namespace refiner
