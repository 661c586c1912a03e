// refiner/refine/static_resolver.hpp - Leaf resolution of constant expressions
#pragma once

#include <optional>

#include "refiner/ast/ast.hpp"
#include "refiner/model/value.hpp"

namespace refiner
{

/**
 * Resolve a leaf expression to a value without evaluating anything.
 *
 * Accepts string, number, bigint, boolean, null and regexp literals, the
 * identifiers `undefined`, `NaN` and `Infinity`, and template literals whose
 * every chunk cooks and every interpolation resolves through this function.
 * Containers are not leaves; see extract_static_value().
 *
 * @return nullopt when the expression is not a static leaf
 */
[[nodiscard]] std::optional<Value> try_resolve_static_value(const Expr * expr);

}  // namespace refiner
