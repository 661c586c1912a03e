// refiner/refine/callsite_resolver.hpp - Recognize JSX runtime call sites
#pragma once

#include <optional>
#include <string>

#include "refiner/ast/ast.hpp"
#include "refiner/refine/rule.hpp"

namespace refiner
{

/// A call site that targets a registered component.
struct ComponentMatch
{
  std::string component;
  const ComponentRule * rule = nullptr;  ///< Owned by the registry
  Expr * props = nullptr;                ///< Second call argument
  CallExpr * call = nullptr;
};

/// True for `jsx`, `jsxs` and `jsxDEV`, with one leading underscore allowed.
[[nodiscard]] bool is_jsx_factory_name(std::string_view name);

/**
 * Match `jsx(Component, props, ...)`.
 *
 * The callee must be a plain identifier naming a JSX factory. The component
 * argument may be an identifier, a member expression (`_components.Card`,
 * named by its last property) or a string literal. The props argument
 * must be an expression, not a spread.
 *
 * @return nullopt for calls that are not component call sites or whose
 *         component has no rule
 * @throws ConfigurationError when the registered rule is unusable
 */
[[nodiscard]] std::optional<ComponentMatch> resolve_component_match(
  CallExpr * call, const RuleRegistry & registry);

}  // namespace refiner
