// refiner/syntax/parser.hpp - Recursive-descent parser for a JavaScript module subset
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "refiner/ast/ast.hpp"
#include "refiner/ast/ast_context.hpp"
#include "refiner/basic/diagnostic.hpp"
#include "refiner/basic/source_manager.hpp"
#include "refiner/syntax/token.hpp"

namespace refiner::syntax
{

/**
 * Builds a Program from a token stream.
 *
 * Covers the subset emitted by JSX/MDX compilers: imports and export lists
 * (kept verbatim), variable and function declarations, `if`/`return`/
 * `throw`, and the full expression grammar minus classes, generators,
 * sequences and update operators. Errors go to the DiagnosticBag and the
 * parser recovers with MissingExpr placeholders.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, const SourceManager & source, DiagnosticBag & diags,
    std::vector<Token> tokens)
  : ast_(ast), source_(source), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);

  void error_at(const Token & t, std::string_view msg);
  void consume_semicolon();
  void synchronize_to_stmt();
  void skip_balanced(TokenKind open, TokenKind close);

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] bool is_arrow_ahead(size_t open_paren_offset) const;

  // Module items
  [[nodiscard]] Stmt * parse_module_item();
  [[nodiscard]] Stmt * parse_import();
  [[nodiscard]] Stmt * parse_export();
  void skip_module_specifier_tail();
  [[nodiscard]] RawStmt * make_raw_stmt(const Token & first);

  // Statements
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] VarDecl * parse_var_decl(bool exported, const Token & first);
  [[nodiscard]] FunctionDecl * parse_function_decl(
    bool exported, bool is_default, const Token & first);
  [[nodiscard]] BlockStmt * parse_block();
  [[nodiscard]] Stmt * parse_if();
  [[nodiscard]] Stmt * parse_return();
  [[nodiscard]] Stmt * parse_throw();
  [[nodiscard]] Stmt * skip_unsupported_stmt();
  [[nodiscard]] gsl::span<Expr *> parse_params();

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_assign();
  [[nodiscard]] Expr * parse_arrow(bool is_async, const Token & first);
  [[nodiscard]] Expr * parse_conditional();
  [[nodiscard]] Expr * parse_coalesce_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_bitor();
  [[nodiscard]] Expr * parse_bitxor();
  [[nodiscard]] Expr * parse_bitand();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_relational();
  [[nodiscard]] Expr * parse_shift();
  [[nodiscard]] Expr * parse_add();
  [[nodiscard]] Expr * parse_mul();
  [[nodiscard]] Expr * parse_exponent();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_new();
  [[nodiscard]] Expr * parse_primary();

  [[nodiscard]] Expr * parse_object();
  [[nodiscard]] AstNode * parse_object_entry();
  [[nodiscard]] Expr * parse_array();
  [[nodiscard]] Expr * parse_template();
  [[nodiscard]] gsl::span<Expr *> parse_arguments();
  [[nodiscard]] Identifier * parse_property_name();

  [[nodiscard]] Expr * make_missing_expr_at(const Token & t);

  /**
   * Decode escape sequences of a string or template chunk.
   *
   * @param tok_for_diag Token to report malformed escapes on; nullptr
   *        makes malformed escapes silent (template cooked values).
   * @return Decoded text, or nullopt on a malformed escape
   */
  [[nodiscard]] std::optional<std::string> unescape_string(
    std::string_view raw, const Token * tok_for_diag);

  AstContext & ast_;
  const SourceManager & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

/// Numeric value of a NumberLiteral token (separators, base prefixes, exponents).
[[nodiscard]] double parse_number_text(std::string_view text);

/// Canonical decimal digits of a BigIntLiteral token (without the `n`).
[[nodiscard]] std::string parse_bigint_text(std::string_view text);

}  // namespace refiner::syntax
