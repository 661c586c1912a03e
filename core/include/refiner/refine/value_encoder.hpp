// refiner/refine/value_encoder.hpp - Re-encode plain data as expression trees
#pragma once

#include <functional>

#include "refiner/ast/ast.hpp"
#include "refiner/ast/ast_context.hpp"
#include "refiner/model/value.hpp"

namespace refiner
{

/// Maps a placeholder back to its captured expression; nullptr when unknown.
using ExpressionRefResolver = std::function<Expr *(const Value & ref)>;

/**
 * Build an expression that evaluates to `value`.
 *
 * Placeholders are replaced by the expression the resolver returns, so a
 * rebuilt container carries captured runtime subtrees unchanged. Arrays
 * keep holes as holes; object keys become string literals. Negative
 * numbers, NaN, Infinity and undefined use their identifier/unary forms;
 * dates and boxed primitives use constructor calls.
 *
 * All nodes are allocated in `ast` and carry invalid source ranges.
 *
 * @throws EncodingError for an unresolvable placeholder, an opaque value
 *         or a circular structure
 */
[[nodiscard]] Expr * encode_value(
  AstContext & ast, const Value & value, const ExpressionRefResolver & resolver);

}  // namespace refiner
