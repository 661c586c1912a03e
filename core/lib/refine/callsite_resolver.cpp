// refiner/refine/callsite_resolver.cpp - Recognize JSX runtime call sites
#include "refiner/refine/callsite_resolver.hpp"

#include "refiner/refine/rule_validator.hpp"

namespace refiner
{

bool is_jsx_factory_name(std::string_view name)
{
  if (!name.empty() && name.front() == '_') name.remove_prefix(1);
  return name == "jsx" || name == "jsxs" || name == "jsxDEV";
}

namespace
{

std::optional<std::string> component_name(const Expr * expr)
{
  if (const auto * id = dyn_cast<Identifier>(expr)) return std::string(id->name);
  if (const auto * str = dyn_cast<StringLiteral>(expr)) return std::string(str->value);
  if (const auto * member = dyn_cast<MemberExpr>(expr)) {
    if (!member->computed) {
      if (const auto * prop = dyn_cast<Identifier>(member->property)) {
        return std::string(prop->name);
      }
    } else if (const auto * str = dyn_cast<StringLiteral>(member->property)) {
      return std::string(str->value);
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<ComponentMatch> resolve_component_match(
  CallExpr * call, const RuleRegistry & registry)
{
  if (!call) return std::nullopt;

  const auto * callee = dyn_cast<Identifier>(call->callee);
  if (!callee || !is_jsx_factory_name(callee->name)) return std::nullopt;

  if (call->args.size() < 2) return std::nullopt;
  Expr * component_arg = call->args[0];
  Expr * props_arg = call->args[1];
  if (!props_arg || isa<SpreadElement>(props_arg)) return std::nullopt;

  auto name = component_name(component_arg);
  if (!name) return std::nullopt;

  const ComponentRule * rule = registry.find(*name);
  if (!rule) return std::nullopt;

  validate_rule(rule, *name);
  return ComponentMatch{std::move(*name), rule, props_arg, call};
}

}  // namespace refiner
