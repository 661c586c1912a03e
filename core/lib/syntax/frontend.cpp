// refiner/syntax/frontend.cpp - High-level parse pipeline
#include "refiner/syntax/frontend.hpp"

#include <utility>

#include "refiner/syntax/lexer.hpp"
#include "refiner/syntax/parser.hpp"

namespace refiner
{

std::unique_ptr<ParsedUnit> parse_source(std::string source_text, std::filesystem::path path)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceManager(std::move(path), std::move(source_text));

  syntax::Lexer lexer(unit->source.get_source());
  auto tokens = lexer.lex_all();

  for (const auto & t : tokens) {
    if (t.kind == syntax::TokenKind::Unknown) {
      unit->diags.report_error(t.range, "invalid or unterminated token", "not recognized");
    }
  }

  syntax::Parser parser(unit->ast, unit->source, unit->diags, std::move(tokens));
  unit->program = parser.parse_program();
  return unit;
}

}  // namespace refiner
