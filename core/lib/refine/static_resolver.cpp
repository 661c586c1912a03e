// refiner/refine/static_resolver.cpp - Leaf resolution of constant expressions
#include "refiner/refine/static_resolver.hpp"

#include <limits>
#include <string>
#include <utility>

namespace refiner
{

namespace
{

std::optional<Value> try_resolve_literal(const Expr * expr)
{
  switch (expr->get_kind()) {
    case NodeKind::StringLiteral:
      return Value::make_string(std::string(cast<StringLiteral>(expr)->value));
    case NodeKind::NumberLiteral:
      return Value::make_number(cast<NumberLiteral>(expr)->value);
    case NodeKind::BigIntLiteral:
      return Value::make_bigint(std::string(cast<BigIntLiteral>(expr)->digits));
    case NodeKind::BoolLiteral:
      return Value::make_bool(cast<BoolLiteral>(expr)->value);
    case NodeKind::NullLiteral:
      return Value::make_null();
    case NodeKind::RegExpLiteral: {
      const auto * re = cast<RegExpLiteral>(expr);
      return Value::make_regexp(std::string(re->pattern), std::string(re->flags));
    }
    default:
      return std::nullopt;
  }
}

std::optional<Value> try_resolve_identifier(const Expr * expr)
{
  const auto * ident = dyn_cast<Identifier>(expr);
  if (!ident) return std::nullopt;

  if (ident->name == "undefined") return Value::make_undefined();
  if (ident->name == "NaN") return Value::make_number(std::numeric_limits<double>::quiet_NaN());
  if (ident->name == "Infinity") {
    return Value::make_number(std::numeric_limits<double>::infinity());
  }
  return std::nullopt;
}

std::optional<Value> try_resolve_template(const Expr * expr)
{
  const auto * tpl = dyn_cast<TemplateLiteral>(expr);
  if (!tpl) return std::nullopt;

  std::string text;
  for (size_t i = 0; i < tpl->quasis.size(); ++i) {
    const auto & cooked = tpl->quasis[i].cooked;
    if (!cooked) return std::nullopt;
    text += *cooked;

    if (i < tpl->expressions.size()) {
      const Expr * part = tpl->expressions[i];
      if (!part) return std::nullopt;

      auto resolved = try_resolve_static_value(part);
      if (!resolved) return std::nullopt;
      text += to_js_string(*resolved);
    }
  }
  return Value::make_string(std::move(text));
}

}  // namespace

std::optional<Value> try_resolve_static_value(const Expr * expr)
{
  if (!expr) return std::nullopt;

  if (auto v = try_resolve_literal(expr)) return v;
  if (auto v = try_resolve_identifier(expr)) return v;
  if (auto v = try_resolve_template(expr)) return v;
  return std::nullopt;
}

}  // namespace refiner
