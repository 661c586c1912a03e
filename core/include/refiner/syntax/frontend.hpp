// refiner/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "refiner/ast/ast.hpp"
#include "refiner/ast/ast_context.hpp"
#include "refiner/basic/diagnostic.hpp"
#include "refiner/basic/source_manager.hpp"

namespace refiner
{

/**
 * Everything produced by parsing one module.
 *
 * The unit owns the source text, the arena and the diagnostics, so the
 * Program pointer stays valid for the unit's lifetime. Heap-allocated
 * because AstContext is not movable.
 */
struct ParsedUnit
{
  SourceManager source;
  AstContext ast;
  DiagnosticBag diags;
  Program * program = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  std::string source_text, std::filesystem::path path = {});

}  // namespace refiner
