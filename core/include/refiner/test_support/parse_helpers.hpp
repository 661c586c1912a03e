// refiner/test_support/parse_helpers.hpp - helpers for unit tests
//
// Single-module parsing for tests, plus shortcuts to reach the expression
// or call site a test is about.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "refiner/ast/ast.hpp"
#include "refiner/ast/visitor.hpp"
#include "refiner/syntax/frontend.hpp"

namespace refiner::test_support
{

[[nodiscard]] inline std::unique_ptr<ParsedUnit> parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.js")
{
  return parse_source(std::move(src), virtual_path);
}

/// Parsed unit plus the expression of `(src);`.
struct ParsedExpr
{
  std::unique_ptr<ParsedUnit> unit;
  Expr * expr = nullptr;

  [[nodiscard]] AstContext & ast() { return unit->ast; }
};

[[nodiscard]] inline ParsedExpr parse_expr(const std::string & src)
{
  ParsedExpr out;
  out.unit = parse("(" + src + ");");
  if (out.unit->program && out.unit->program->body.size() == 1) {
    if (auto * stmt = dyn_cast<ExprStmt>(out.unit->program->body[0])) {
      out.expr = stmt->expr;
    }
  }
  return out;
}

/// Every call expression in traversal order (outer calls first).
[[nodiscard]] inline std::vector<CallExpr *> collect_calls(Program * program)
{
  struct Collector : RecursiveAstVisitor<Collector>
  {
    std::vector<CallExpr *> calls;

    bool visit_call_expr(CallExpr * node)
    {
      calls.push_back(node);
      return RecursiveAstVisitor::visit_call_expr(node);
    }
  };

  Collector collector;
  collector.visit(program);
  return collector.calls;
}

}  // namespace refiner::test_support
