// refiner/ast/expr_printer.hpp - Print the AST back to JavaScript source
//
#pragma once

#include <string>

#include "refiner/ast/ast.hpp"

namespace refiner
{

/**
 * Print a whole module, one top-level statement per line.
 *
 * Statements kept verbatim (RawStmt) are emitted unchanged. Everything
 * else is regenerated with minimal parentheses.
 */
[[nodiscard]] std::string print_program(const Program * program);

/// Print a single expression. Holes and nullptr print as an empty string.
[[nodiscard]] std::string print_expr(const Expr * expr);

}  // namespace refiner
