// refiner/ast/expr_printer.cpp - JavaScript code generation
//
#include "refiner/ast/expr_printer.hpp"

#include <string>
#include <string_view>

#include "refiner/ast/ast.hpp"
#include "refiner/ast/ast_enums.hpp"
#include "refiner/basic/casting.hpp"
#include "refiner/basic/js_format.hpp"

namespace refiner
{
namespace
{

// ============================================================================
// Precedence
// ============================================================================

// Larger binds tighter.
enum Prec : int {
  k_prec_assign = 2,
  k_prec_conditional = 3,
  k_prec_nullish = 4,
  k_prec_or = 5,
  k_prec_and = 6,
  k_prec_bit_or = 7,
  k_prec_bit_xor = 8,
  k_prec_bit_and = 9,
  k_prec_equality = 10,
  k_prec_relational = 11,
  k_prec_shift = 12,
  k_prec_additive = 13,
  k_prec_multiplicative = 14,
  k_prec_exponent = 15,
  k_prec_unary = 16,
  k_prec_postfix = 18,
  k_prec_primary = 20,
};

int binary_prec(BinaryOp op)
{
  switch (op) {
    case BinaryOp::Nullish:
      return k_prec_nullish;
    case BinaryOp::Or:
      return k_prec_or;
    case BinaryOp::And:
      return k_prec_and;
    case BinaryOp::BitOr:
      return k_prec_bit_or;
    case BinaryOp::BitXor:
      return k_prec_bit_xor;
    case BinaryOp::BitAnd:
      return k_prec_bit_and;
    case BinaryOp::Eq:
    case BinaryOp::Ne:
    case BinaryOp::StrictEq:
    case BinaryOp::StrictNe:
      return k_prec_equality;
    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
    case BinaryOp::In:
    case BinaryOp::Instanceof:
      return k_prec_relational;
    case BinaryOp::Shl:
    case BinaryOp::Shr:
    case BinaryOp::UShr:
      return k_prec_shift;
    case BinaryOp::Add:
    case BinaryOp::Sub:
      return k_prec_additive;
    case BinaryOp::Mul:
    case BinaryOp::Div:
    case BinaryOp::Mod:
      return k_prec_multiplicative;
    case BinaryOp::Exp:
      return k_prec_exponent;
  }
  return k_prec_primary;
}

int expr_prec(const Expr * e)
{
  switch (e->get_kind()) {
    case NodeKind::AssignExpr:
    case NodeKind::ArrowFunctionExpr:
    case NodeKind::SpreadElement:
      return k_prec_assign;
    case NodeKind::ConditionalExpr:
      return k_prec_conditional;
    case NodeKind::BinaryExpr:
      return binary_prec(cast<BinaryExpr>(e)->op);
    case NodeKind::UnaryExpr:
      return k_prec_unary;
    case NodeKind::CallExpr:
    case NodeKind::NewExpr:
    case NodeKind::MemberExpr:
      return k_prec_postfix;
    default:
      return k_prec_primary;
  }
}

bool is_logical(const Expr * e)
{
  const auto * b = dyn_cast<BinaryExpr>(e);
  return b && (b->op == BinaryOp::And || b->op == BinaryOp::Or);
}

/// Leftmost sub-expression, used to detect statements that would start with `{`.
const Expr * leftmost(const Expr * e)
{
  while (e) {
    if (const auto * b = dyn_cast<BinaryExpr>(e)) {
      e = b->lhs;
    } else if (const auto * m = dyn_cast<MemberExpr>(e)) {
      e = m->object;
    } else if (const auto * c = dyn_cast<CallExpr>(e)) {
      e = c->callee;
    } else if (const auto * c = dyn_cast<ConditionalExpr>(e)) {
      e = c->test;
    } else if (const auto * a = dyn_cast<AssignExpr>(e)) {
      e = a->target;
    } else {
      return e;
    }
  }
  return e;
}

// ============================================================================
// Printer
// ============================================================================

class Printer
{
public:
  std::string out;

  void expr(const Expr * e, int min_prec = k_prec_assign)
  {
    if (!e) return;
    const bool wrap = expr_prec(e) < min_prec;
    if (wrap) out += '(';
    expr_inner(e);
    if (wrap) out += ')';
  }

  void stmt(const Stmt * s, int indent);

private:
  void indent_to(int indent) { out.append(static_cast<size_t>(indent) * 2, ' '); }

  template <typename Span>
  void expr_list(const Span & exprs)
  {
    bool first = true;
    for (const auto * e : exprs) {
      if (!first) out += ", ";
      first = false;
      expr(e);
    }
  }

  void params(const gsl::span<Expr *> & ps)
  {
    out += '(';
    expr_list(ps);
    out += ')';
  }

  void property_key(const Property * p)
  {
    if (p->computed) {
      out += '[';
      expr(p->key);
      out += ']';
      return;
    }
    if (const auto * id = dyn_cast<Identifier>(p->key)) {
      out += id->name;
    } else {
      expr(p->key, k_prec_primary);
    }
  }

  void block(const BlockStmt * b, int indent)
  {
    if (!b) {
      out += "{}";
      return;
    }
    if (b->body.empty()) {
      out += "{}";
      return;
    }
    out += "{\n";
    for (const auto * s : b->body) {
      indent_to(indent + 1);
      stmt(s, indent + 1);
      out += '\n';
    }
    block_indent_ = indent;
    indent_to(indent);
    out += '}';
  }

  void expr_inner(const Expr * e);

  int block_indent_ = 0;
};

void Printer::expr_inner(const Expr * e)
{
  switch (e->get_kind()) {
    case NodeKind::StringLiteral:
      out += quote_js_string(cast<StringLiteral>(e)->value);
      return;
    case NodeKind::NumberLiteral:
      out += format_js_number(cast<NumberLiteral>(e)->value);
      return;
    case NodeKind::BigIntLiteral:
      out += cast<BigIntLiteral>(e)->digits;
      out += 'n';
      return;
    case NodeKind::BoolLiteral:
      out += cast<BoolLiteral>(e)->value ? "true" : "false";
      return;
    case NodeKind::NullLiteral:
      out += "null";
      return;
    case NodeKind::RegExpLiteral: {
      const auto * re = cast<RegExpLiteral>(e);
      out += '/';
      out += re->pattern;
      out += '/';
      out += re->flags;
      return;
    }
    case NodeKind::TemplateLiteral: {
      const auto * tl = cast<TemplateLiteral>(e);
      out += '`';
      for (size_t i = 0; i < tl->quasis.size(); ++i) {
        out += tl->quasis[i].raw;
        if (i < tl->expressions.size()) {
          out += "${";
          expr(tl->expressions[i]);
          out += '}';
        }
      }
      out += '`';
      return;
    }
    case NodeKind::Identifier:
      out += cast<Identifier>(e)->name;
      return;
    case NodeKind::ThisExpr:
      out += "this";
      return;
    case NodeKind::ObjectExpr: {
      const auto * obj = cast<ObjectExpr>(e);
      if (obj->properties.empty()) {
        out += "{}";
        return;
      }
      out += '{';
      bool first = true;
      for (const auto * entry : obj->properties) {
        out += first ? "" : ", ";
        first = false;
        if (const auto * p = dyn_cast<Property>(entry)) {
          if (p->shorthand) {
            // `{a}` or a pattern default `{a = 1}`
            expr(p->value);
            continue;
          }
          property_key(p);
          out += ": ";
          expr(p->value);
        } else {
          expr(cast<Expr>(entry));
        }
      }
      out += '}';
      return;
    }
    case NodeKind::ArrayExpr: {
      const auto * arr = cast<ArrayExpr>(e);
      out += '[';
      for (size_t i = 0; i < arr->elements.size(); ++i) {
        if (i > 0) out += ", ";
        expr(arr->elements[i]);
      }
      // A trailing hole needs an explicit comma to keep the length
      if (!arr->elements.empty() && arr->elements.back() == nullptr) out += ',';
      out += ']';
      return;
    }
    case NodeKind::SpreadElement:
      out += "...";
      expr(cast<SpreadElement>(e)->argument);
      return;
    case NodeKind::CallExpr: {
      const auto * call = cast<CallExpr>(e);
      expr(call->callee, k_prec_postfix);
      if (call->optional) out += "?.";
      out += '(';
      expr_list(call->args);
      out += ')';
      return;
    }
    case NodeKind::NewExpr: {
      const auto * ne = cast<NewExpr>(e);
      out += "new ";
      // `new (f())()` keeps the call inside the callee
      if (isa<CallExpr>(ne->callee)) {
        out += '(';
        expr(ne->callee);
        out += ')';
      } else {
        expr(ne->callee, k_prec_postfix);
      }
      out += '(';
      expr_list(ne->args);
      out += ')';
      return;
    }
    case NodeKind::MemberExpr: {
      const auto * m = cast<MemberExpr>(e);
      if (isa<NumberLiteral>(m->object)) {
        out += '(';
        expr(m->object);
        out += ')';
      } else {
        expr(m->object, k_prec_postfix);
      }
      if (m->computed) {
        out += m->optional ? "?.[" : "[";
        expr(m->property);
        out += ']';
      } else {
        out += m->optional ? "?." : ".";
        expr(m->property, k_prec_primary);
      }
      return;
    }
    case NodeKind::UnaryExpr: {
      const auto * u = cast<UnaryExpr>(e);
      out += to_string(u->op);
      if (u->op == UnaryOp::Typeof || u->op == UnaryOp::Void) out += ' ';
      // `- -x` and `+ +x` must not fuse into `--x`
      if (isa<UnaryExpr>(u->operand)) {
        out += '(';
        expr(u->operand);
        out += ')';
      } else {
        expr(u->operand, k_prec_unary);
      }
      return;
    }
    case NodeKind::BinaryExpr: {
      const auto * b = cast<BinaryExpr>(e);
      const int prec = binary_prec(b->op);
      const bool right_assoc = b->op == BinaryOp::Exp;
      const bool nullish = b->op == BinaryOp::Nullish;

      // `??` cannot mix with `&&`/`||` without parentheses
      auto operand = [&](const Expr * side, bool is_left) {
        int min = prec + ((is_left == right_assoc) ? 1 : 0);
        if (right_assoc && is_left && isa<UnaryExpr>(side)) min = k_prec_postfix;
        const bool force = nullish ? is_logical(side)
                                   : (isa<BinaryExpr>(side) &&
                                      cast<BinaryExpr>(side)->op == BinaryOp::Nullish &&
                                      (b->op == BinaryOp::And || b->op == BinaryOp::Or));
        if (force) {
          out += '(';
          expr(side);
          out += ')';
        } else {
          expr(side, min);
        }
      };

      operand(b->lhs, true);
      out += ' ';
      out += to_string(b->op);
      out += ' ';
      operand(b->rhs, false);
      return;
    }
    case NodeKind::ConditionalExpr: {
      const auto * c = cast<ConditionalExpr>(e);
      expr(c->test, k_prec_nullish);
      out += " ? ";
      expr(c->consequent);
      out += " : ";
      expr(c->alternate);
      return;
    }
    case NodeKind::AssignExpr: {
      const auto * a = cast<AssignExpr>(e);
      expr(a->target, k_prec_postfix);
      out += ' ';
      out += to_string(a->op);
      out += ' ';
      expr(a->value);
      return;
    }
    case NodeKind::ArrowFunctionExpr: {
      const auto * fn = cast<ArrowFunctionExpr>(e);
      if (fn->is_async) out += "async ";
      params(fn->params);
      out += " => ";
      if (fn->expr_body) {
        if (isa<ObjectExpr>(leftmost(fn->expr_body))) {
          out += '(';
          expr(fn->expr_body);
          out += ')';
        } else {
          expr(fn->expr_body);
        }
      } else {
        block(fn->block_body, block_indent_);
      }
      return;
    }
    case NodeKind::MissingExpr:
      out += "undefined";
      return;
    default:
      return;
  }
}

void Printer::stmt(const Stmt * s, int indent)
{
  if (!s) return;
  block_indent_ = indent;

  switch (s->get_kind()) {
    case NodeKind::RawStmt:
      out += cast<RawStmt>(s)->text;
      return;
    case NodeKind::VarDecl: {
      const auto * vd = cast<VarDecl>(s);
      if (vd->exported) out += "export ";
      out += to_string(vd->var_kind);
      out += ' ';
      bool first = true;
      for (const auto * d : vd->declarators) {
        if (!first) out += ", ";
        first = false;
        expr(d->target);
        if (d->init) {
          out += " = ";
          expr(d->init);
        }
      }
      out += ';';
      return;
    }
    case NodeKind::FunctionDecl: {
      const auto * fn = cast<FunctionDecl>(s);
      if (fn->exported) out += "export ";
      if (fn->is_default) out += "default ";
      if (fn->is_async) out += "async ";
      out += "function";
      if (!fn->name.empty()) {
        out += ' ';
        out += fn->name;
      }
      params(fn->params);
      out += ' ';
      block(fn->body, indent);
      return;
    }
    case NodeKind::ReturnStmt: {
      const auto * r = cast<ReturnStmt>(s);
      out += "return";
      if (r->argument) {
        out += ' ';
        expr(r->argument);
      }
      out += ';';
      return;
    }
    case NodeKind::IfStmt: {
      const auto * is = cast<IfStmt>(s);
      out += "if (";
      expr(is->test);
      out += ") ";
      stmt(is->consequent, indent);
      if (is->alternate) {
        out += " else ";
        stmt(is->alternate, indent);
      }
      return;
    }
    case NodeKind::BlockStmt:
      block(cast<BlockStmt>(s), indent);
      return;
    case NodeKind::ThrowStmt:
      out += "throw ";
      expr(cast<ThrowStmt>(s)->argument);
      out += ';';
      return;
    case NodeKind::ExprStmt: {
      const Expr * e = cast<ExprStmt>(s)->expr;
      const Expr * first = leftmost(e);
      if (isa<ObjectExpr>(first)) {
        out += '(';
        expr(e);
        out += ')';
      } else {
        expr(e);
      }
      out += ';';
      return;
    }
    case NodeKind::ExportDefaultStmt:
      out += "export default ";
      expr(cast<ExportDefaultStmt>(s)->expr);
      out += ';';
      return;
    default:
      return;
  }
}

}  // namespace

std::string print_program(const Program * program)
{
  Printer p;
  if (!program) return p.out;
  for (const auto * s : program->body) {
    p.stmt(s, 0);
    p.out += '\n';
  }
  return p.out;
}

std::string print_expr(const Expr * expr)
{
  Printer p;
  p.expr(expr);
  return p.out;
}

}  // namespace refiner
