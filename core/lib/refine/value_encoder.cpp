// refiner/refine/value_encoder.cpp - Re-encode plain data as expression trees
#include "refiner/refine/value_encoder.hpp"

#include <cmath>
#include <fmt/format.h>
#include <string>
#include <unordered_set>
#include <vector>

#include "refiner/refine/error.hpp"

namespace refiner
{

namespace
{

class ValueEncoder
{
public:
  ValueEncoder(AstContext & ast, const ExpressionRefResolver & resolver)
  : ast_(ast), resolver_(resolver)
  {
  }

  Expr * encode(const Value & value)
  {
    switch (value.kind()) {
      case ValueKind::Undefined:
        return ident("undefined");
      case ValueKind::Null:
        return ast_.create<NullLiteral>();
      case ValueKind::Bool:
        return ast_.create<BoolLiteral>(value.as_bool());
      case ValueKind::Number:
        return number(value.as_number());
      case ValueKind::BigInt:
        return bigint(value.as_string());
      case ValueKind::String:
        return ast_.create<StringLiteral>(ast_.intern(value.as_string()));
      case ValueKind::RegExp:
        return ast_.create<RegExpLiteral>(
          ast_.intern(value.regexp_source()), ast_.intern(value.regexp_flags()));
      case ValueKind::Date:
        return construct("Date", number(value.date_time()));
      case ValueKind::Boxed:
        return boxed(value.boxed_value());
      case ValueKind::Object:
        return object(value);
      case ValueKind::Array:
        return array(value);
      case ValueKind::ExpressionRef:
        return expression_ref(value);
      case ValueKind::Opaque:
        break;
    }
    throw EncodingError(
      fmt::format("Cannot encode {} value '{}' as an expression.", to_string(value.kind()),
                  value.as_string()));
  }

private:
  AstContext & ast_;
  const ExpressionRefResolver & resolver_;
  std::unordered_set<const void *> active_;  ///< Containers being encoded

  Expr * ident(std::string_view name) { return ast_.create<Identifier>(ast_.intern(name)); }

  Expr * negate(Expr * operand) { return ast_.create<UnaryExpr>(UnaryOp::Neg, operand); }

  Expr * number(double v)
  {
    if (std::isnan(v)) return ident("NaN");
    if (std::isinf(v)) return v > 0 ? ident("Infinity") : negate(ident("Infinity"));
    if (std::signbit(v)) return negate(ast_.create<NumberLiteral>(-v));
    return ast_.create<NumberLiteral>(v);
  }

  Expr * bigint(const std::string & digits)
  {
    if (!digits.empty() && digits[0] == '-') {
      return negate(ast_.create<BigIntLiteral>(ast_.intern(digits.substr(1))));
    }
    return ast_.create<BigIntLiteral>(ast_.intern(digits));
  }

  Expr * construct(std::string_view ctor, Expr * arg)
  {
    return ast_.create<NewExpr>(ident(ctor), ast_.copy_to_arena(std::vector<Expr *>{arg}));
  }

  Expr * boxed(const Value & primitive)
  {
    switch (primitive.kind()) {
      case ValueKind::Number:
        return construct("Number", encode(primitive));
      case ValueKind::String:
        return construct("String", encode(primitive));
      case ValueKind::Bool:
        return construct("Boolean", encode(primitive));
      default:
        // BigInt has no constructor form.
        return ast_.create<CallExpr>(
          ident("Object"), ast_.copy_to_arena(std::vector<Expr *>{encode(primitive)}));
    }
  }

  Expr * expression_ref(const Value & ref)
  {
    Expr * resolved = resolver_ ? resolver_(ref) : nullptr;
    if (!resolved) {
      throw EncodingError(fmt::format(
        "Cannot inline ExpressionRef at path \"{}\".",
        join_property_path(ref.expression_ref_path())));
    }
    return resolved;
  }

  void enter(const Value & container)
  {
    if (!active_.insert(container.identity()).second) {
      throw EncodingError("Cannot encode a circular structure as an expression.");
    }
  }

  Expr * object(const Value & value)
  {
    enter(value);
    std::vector<AstNode *> props;
    props.reserve(value.object()->size());
    for (const auto & [key, child] : *value.object()) {
      Expr * key_expr = ast_.create<StringLiteral>(ast_.intern(key));
      props.push_back(ast_.create<Property>(key_expr, encode(child), false, false));
    }
    active_.erase(value.identity());
    return ast_.create<ObjectExpr>(ast_.copy_to_arena(props));
  }

  Expr * array(const Value & value)
  {
    enter(value);
    std::vector<Expr *> elements;
    elements.reserve(value.array()->size());
    for (const auto & element : value.array()->elements) {
      elements.push_back(element ? encode(*element) : nullptr);
    }
    active_.erase(value.identity());
    return ast_.create<ArrayExpr>(ast_.copy_to_arena(elements));
  }
};

}  // namespace

Expr * encode_value(AstContext & ast, const Value & value, const ExpressionRefResolver & resolver)
{
  ValueEncoder encoder(ast, resolver);
  return encoder.encode(value);
}

}  // namespace refiner
