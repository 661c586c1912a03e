// refiner/syntax/parser.cpp - Recursive-descent parser for a JavaScript module subset
#include "refiner/syntax/parser.hpp"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace refiner::syntax
{

namespace
{

SourceRange join_ranges(SourceRange a, SourceRange b)
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

void append_utf8(std::string & out, uint32_t cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return;
  }
  if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return;
  }
  out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
  out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

int hex_value(char h)
{
  if (h >= '0' && h <= '9') return h - '0';
  if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
  if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
  return -1;
}

/// Read exactly `count` hex digits starting at raw[i].
std::optional<uint32_t> read_hex(std::string_view raw, size_t i, size_t count)
{
  if (i + count > raw.size()) return std::nullopt;
  uint32_t v = 0;
  for (size_t k = 0; k < count; ++k) {
    const int h = hex_value(raw[i + k]);
    if (h < 0) return std::nullopt;
    v = (v << 4) | static_cast<uint32_t>(h);
  }
  return v;
}

std::string strip_separators(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (c != '_') out.push_back(c);
  }
  return out;
}

int radix_of(std::string_view text)
{
  if (text.size() < 2 || text[0] != '0') return 10;
  switch (text[1]) {
    case 'x':
    case 'X':
      return 16;
    case 'o':
    case 'O':
      return 8;
    case 'b':
    case 'B':
      return 2;
    default:
      return 10;
  }
}

// Keywords that can never be an identifier reference.
constexpr std::array<std::string_view, 22> k_reserved_words = {
  "break",  "case",   "catch", "class",  "continue", "debugger", "default", "do",
  "else",   "export", "extends", "finally", "for",   "if",      "import",  "return",
  "switch", "throw",  "try",   "while",  "with",   "delete",
};

bool is_reserved_word(std::string_view text)
{
  for (const auto kw : k_reserved_words) {
    if (kw == text) return true;
  }
  return false;
}

std::optional<AssignOp> assign_op_of(TokenKind k)
{
  switch (k) {
    case TokenKind::Eq:
      return AssignOp::Assign;
    case TokenKind::PlusEq:
      return AssignOp::AddAssign;
    case TokenKind::MinusEq:
      return AssignOp::SubAssign;
    case TokenKind::StarEq:
      return AssignOp::MulAssign;
    case TokenKind::SlashEq:
      return AssignOp::DivAssign;
    case TokenKind::PercentEq:
      return AssignOp::ModAssign;
    case TokenKind::AndAndEq:
      return AssignOp::AndAssign;
    case TokenKind::OrOrEq:
      return AssignOp::OrAssign;
    case TokenKind::QuestionQuestionEq:
      return AssignOp::NullishAssign;
    default:
      return std::nullopt;
  }
}

bool is_assign_target(const Expr * e)
{
  return isa<Identifier>(e) || isa<MemberExpr>(e) || isa<ObjectExpr>(e) || isa<ArrayExpr>(e);
}

}  // namespace

// ============================================================================
// Numeric literal decoding
// ============================================================================

double parse_number_text(std::string_view text)
{
  const std::string clean = strip_separators(text);
  const int radix = radix_of(clean);
  if (radix != 10) {
    double v = 0.0;
    for (size_t i = 2; i < clean.size(); ++i) {
      v = v * radix + hex_value(clean[i]);
    }
    return v;
  }
  return std::strtod(clean.c_str(), nullptr);
}

std::string parse_bigint_text(std::string_view text)
{
  std::string clean = strip_separators(text);
  if (!clean.empty() && clean.back() == 'n') clean.pop_back();

  const int radix = radix_of(clean);
  std::string digits;
  if (radix == 10) {
    digits = clean;
  } else {
    // Little-endian decimal accumulator: digits = digits * radix + d
    std::vector<int> acc{0};
    for (size_t i = 2; i < clean.size(); ++i) {
      int carry = hex_value(clean[i]);
      for (int & d : acc) {
        const int v = d * radix + carry;
        d = v % 10;
        carry = v / 10;
      }
      while (carry > 0) {
        acc.push_back(carry % 10);
        carry /= 10;
      }
    }
    for (auto it = acc.rbegin(); it != acc.rend(); ++it) {
      digits.push_back(static_cast<char>('0' + *it));
    }
  }

  const size_t nz = digits.find_first_not_of('0');
  return nz == std::string::npos ? std::string("0") : digits.substr(nz);
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), std::string("expected ") + std::string(what));
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  diags_.report_error(t.range, std::string(msg));
}

void Parser::consume_semicolon()
{
  if (match(TokenKind::Semicolon)) return;
  // Automatic semicolon insertion
  if (at(TokenKind::RBrace) || at_eof() || cur().newline_before) return;

  diags_.report_error(cur().range, "expected ';'", "expected `;`");
  synchronize_to_stmt();
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) return;
    if (at(TokenKind::RBrace)) return;
    advance();
    if (cur().newline_before) return;
  }
}

void Parser::skip_balanced(TokenKind open, TokenKind close)
{
  if (!match(open)) return;
  int depth = 1;
  while (!at_eof() && depth > 0) {
    if (at(open)) ++depth;
    if (at(close)) --depth;
    advance();
  }
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::is_arrow_ahead(size_t open_paren_offset) const
{
  if (cur(open_paren_offset).kind != TokenKind::LParen) return false;

  int depth = 0;
  for (size_t i = idx_ + open_paren_offset; i < tokens_.size(); ++i) {
    switch (tokens_[i].kind) {
      case TokenKind::LParen:
      case TokenKind::LBracket:
      case TokenKind::LBrace:
        ++depth;
        break;
      case TokenKind::RParen:
      case TokenKind::RBracket:
      case TokenKind::RBrace:
        --depth;
        if (depth == 0) {
          return i + 1 < tokens_.size() && tokens_[i + 1].kind == TokenKind::Arrow &&
                 !tokens_[i + 1].newline_before;
        }
        break;
      case TokenKind::Eof:
        return false;
      default:
        break;
    }
  }
  return false;
}

Expr * Parser::make_missing_expr_at(const Token & t) { return ast_.create<MissingExpr>(t.range); }

// ============================================================================
// Program / module items
// ============================================================================

Program * Parser::parse_program()
{
  auto * prog = ast_.create<Program>(SourceRange(0, static_cast<uint32_t>(source_.size())));

  std::vector<Stmt *> body;
  while (!at_eof()) {
    const size_t before = idx_;
    if (Stmt * s = parse_module_item()) {
      body.push_back(s);
    }
    // Guarantee forward progress on malformed input
    if (idx_ == before) {
      error_at(cur(), "unexpected token");
      advance();
    }
  }

  prog->body = ast_.copy_to_arena(body);
  return prog;
}

Stmt * Parser::parse_module_item()
{
  if (is_kw("import", cur()) && cur(1).kind != TokenKind::LParen &&
      cur(1).kind != TokenKind::Dot) {
    return parse_import();
  }
  if (is_kw("export", cur())) {
    return parse_export();
  }
  return parse_stmt();
}

RawStmt * Parser::make_raw_stmt(const Token & first)
{
  const SourceRange range = join_ranges(first.range, prev().range);
  return ast_.create<RawStmt>(ast_.intern(source_.get_slice(range)), range);
}

void Parser::skip_module_specifier_tail()
{
  // `with { type: "json" }` import attributes
  if ((is_kw("with", cur()) || is_kw("assert", cur())) && cur(1).kind == TokenKind::LBrace) {
    advance();
    skip_balanced(TokenKind::LBrace, TokenKind::RBrace);
  }
  consume_semicolon();
}

Stmt * Parser::parse_import()
{
  const Token first = advance();

  // import "side-effect";
  if (match(TokenKind::StringLiteral)) {
    skip_module_specifier_tail();
    return make_raw_stmt(first);
  }

  while (!at_eof()) {
    if (at(TokenKind::LBrace)) {
      skip_balanced(TokenKind::LBrace, TokenKind::RBrace);
      continue;
    }
    if (is_kw("from", cur())) {
      advance();
      expect(TokenKind::StringLiteral, "module specifier string");
      skip_module_specifier_tail();
      return make_raw_stmt(first);
    }
    if (at(TokenKind::Semicolon)) break;
    advance();
  }

  error_at(cur(), "expected 'from' in import declaration");
  match(TokenKind::Semicolon);
  return make_raw_stmt(first);
}

Stmt * Parser::parse_export()
{
  const Token first = advance();

  if (is_kw("default", cur())) {
    advance();
    if (is_kw("function", cur()) || (is_kw("async", cur()) && is_kw("function", cur(1)))) {
      return parse_function_decl(true, true, first);
    }
    Expr * e = parse_assign();
    consume_semicolon();
    return ast_.create<ExportDefaultStmt>(e, join_ranges(first.range, prev().range));
  }

  if (is_kw("const", cur()) || is_kw("let", cur()) || is_kw("var", cur())) {
    return parse_var_decl(true, first);
  }

  if (is_kw("function", cur()) || (is_kw("async", cur()) && is_kw("function", cur(1)))) {
    return parse_function_decl(true, false, first);
  }

  // export { a, b as c } [from "x"];   export * [as ns] from "x";
  if (at(TokenKind::LBrace) || at(TokenKind::Star)) {
    if (at(TokenKind::LBrace)) {
      skip_balanced(TokenKind::LBrace, TokenKind::RBrace);
    } else {
      advance();
      if (is_kw("as", cur())) {
        advance();
        advance();
      }
    }
    if (is_kw("from", cur())) {
      advance();
      expect(TokenKind::StringLiteral, "module specifier string");
      skip_module_specifier_tail();
    } else {
      consume_semicolon();
    }
    return make_raw_stmt(first);
  }

  error_at(cur(), "unsupported export form");
  synchronize_to_stmt();
  return nullptr;
}

// ============================================================================
// Statements
// ============================================================================

Stmt * Parser::parse_stmt()
{
  const Token & t = cur();

  if (at(TokenKind::LBrace)) {
    return parse_block();
  }
  if (match(TokenKind::Semicolon)) {
    return nullptr;  // empty statement
  }
  if (is_kw("const", t) || is_kw("let", t) || is_kw("var", t)) {
    return parse_var_decl(false, t);
  }
  if (is_kw("function", t) || (is_kw("async", t) && is_kw("function", cur(1)))) {
    return parse_function_decl(false, false, t);
  }
  if (is_kw("return", t)) {
    return parse_return();
  }
  if (is_kw("if", t)) {
    return parse_if();
  }
  if (is_kw("throw", t)) {
    return parse_throw();
  }
  if (
    is_kw("for", t) || is_kw("while", t) || is_kw("do", t) || is_kw("switch", t) ||
    is_kw("try", t) || is_kw("class", t) || is_kw("break", t) || is_kw("continue", t)) {
    return skip_unsupported_stmt();
  }

  Expr * e = parse_expr();
  consume_semicolon();
  return ast_.create<ExprStmt>(e, join_ranges(e->get_range(), prev().range));
}

Stmt * Parser::skip_unsupported_stmt()
{
  const Token kw = advance();
  diags_.report_error(kw.range, "unsupported statement '" + std::string(kw.text) + "'")
    .with_help("only declarations, if, return, throw and expression statements are supported");

  skip_balanced(TokenKind::LParen, TokenKind::RParen);
  if (at(TokenKind::LBrace)) {
    skip_balanced(TokenKind::LBrace, TokenKind::RBrace);
  } else {
    synchronize_to_stmt();
  }
  return nullptr;
}

VarDecl * Parser::parse_var_decl(bool exported, const Token & first)
{
  const Token kw = advance();
  VarKind kind = VarKind::Const;
  if (kw.text == "let") {
    kind = VarKind::Let;
  } else if (kw.text == "var") {
    kind = VarKind::Var;
  }

  std::vector<VarDeclarator *> decls;
  do {
    const Token & target_tok = cur();
    Expr * target = nullptr;
    if (at(TokenKind::LBrace)) {
      target = parse_object();
    } else if (at(TokenKind::LBracket)) {
      target = parse_array();
    } else if (at(TokenKind::Identifier) && !is_reserved_word(target_tok.text)) {
      advance();
      target = ast_.create<Identifier>(ast_.intern(target_tok.text), target_tok.range);
    } else {
      error_at(target_tok, "expected binding name");
      target = make_missing_expr_at(target_tok);
      break;
    }

    Expr * init = nullptr;
    if (match(TokenKind::Eq)) {
      init = parse_assign();
    } else if (kind == VarKind::Const) {
      error_at(cur(), "missing initializer in const declaration");
    }
    decls.push_back(ast_.create<VarDeclarator>(
      target, init, join_ranges(target->get_range(), init ? init->get_range() : SourceRange{})));
  } while (match(TokenKind::Comma));

  consume_semicolon();
  return ast_.create<VarDecl>(
    kind, ast_.copy_to_arena(decls), exported, join_ranges(first.range, prev().range));
}

gsl::span<Expr *> Parser::parse_params()
{
  std::vector<Expr *> params;
  if (!expect(TokenKind::LParen, "'(' before parameters")) {
    return {};
  }
  while (!at(TokenKind::RParen) && !at_eof()) {
    if (match(TokenKind::Ellipsis)) {
      const Token spread_tok = prev();
      Expr * arg = parse_assign();
      params.push_back(
        ast_.create<SpreadElement>(arg, join_ranges(spread_tok.range, arg->get_range())));
    } else {
      params.push_back(parse_assign());
    }
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::RParen, "')' after parameters");
  return ast_.copy_to_arena(params);
}

FunctionDecl * Parser::parse_function_decl(bool exported, bool is_default, const Token & first)
{
  const bool is_async = is_kw("async", cur());
  if (is_async) advance();
  advance();  // function

  if (at(TokenKind::Star)) {
    error_at(cur(), "generator functions are not supported");
    advance();
  }

  std::string_view name;
  if (at(TokenKind::Identifier)) {
    name = ast_.intern(advance().text);
  } else if (!is_default) {
    error_at(cur(), "expected function name");
  }

  const auto params = parse_params();
  BlockStmt * body = parse_block();

  auto * fn = ast_.create<FunctionDecl>(name, params, body, join_ranges(first.range, prev().range));
  fn->exported = exported;
  fn->is_default = is_default;
  fn->is_async = is_async;
  return fn;
}

BlockStmt * Parser::parse_block()
{
  const Token open = cur();
  std::vector<Stmt *> stmts;
  if (!expect(TokenKind::LBrace, "'{'")) {
    return ast_.create<BlockStmt>(gsl::span<Stmt *>{}, open.range);
  }

  while (!at(TokenKind::RBrace) && !at_eof()) {
    const size_t before = idx_;
    if (Stmt * s = parse_stmt()) {
      stmts.push_back(s);
    }
    if (idx_ == before) {
      error_at(cur(), "unexpected token");
      advance();
    }
  }
  expect(TokenKind::RBrace, "'}' to close block");

  return ast_.create<BlockStmt>(ast_.copy_to_arena(stmts), join_ranges(open.range, prev().range));
}

Stmt * Parser::parse_if()
{
  const Token kw = advance();
  expect(TokenKind::LParen, "'(' after 'if'");
  Expr * test = parse_expr();
  expect(TokenKind::RParen, "')' after condition");

  auto branch = [this]() -> Stmt * {
    const Token & t = cur();
    Stmt * s = parse_stmt();
    // `if (x);` keeps an explicit empty block so the printer stays valid
    return s ? s : ast_.create<BlockStmt>(gsl::span<Stmt *>{}, t.range);
  };

  Stmt * consequent = branch();
  Stmt * alternate = nullptr;
  if (is_kw("else", cur())) {
    advance();
    alternate = branch();
  }
  return ast_.create<IfStmt>(test, consequent, alternate, join_ranges(kw.range, prev().range));
}

Stmt * Parser::parse_return()
{
  const Token kw = advance();
  Expr * arg = nullptr;
  if (!at(TokenKind::Semicolon) && !at(TokenKind::RBrace) && !at_eof() && !cur().newline_before) {
    arg = parse_expr();
  }
  consume_semicolon();
  return ast_.create<ReturnStmt>(arg, join_ranges(kw.range, prev().range));
}

Stmt * Parser::parse_throw()
{
  const Token kw = advance();
  if (cur().newline_before) {
    error_at(cur(), "illegal newline after throw");
  }
  Expr * arg = parse_expr();
  consume_semicolon();
  return ast_.create<ThrowStmt>(arg, join_ranges(kw.range, prev().range));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr() { return parse_assign(); }

Expr * Parser::parse_assign()
{
  const Token & t = cur();

  // Arrow functions
  if (is_kw("async", t) && !cur(1).newline_before) {
    if (cur(1).kind == TokenKind::Identifier && cur(2).kind == TokenKind::Arrow) {
      const Token first = advance();
      return parse_arrow(true, first);
    }
    if (is_arrow_ahead(1)) {
      const Token first = advance();
      return parse_arrow(true, first);
    }
  }
  if (t.kind == TokenKind::Identifier && cur(1).kind == TokenKind::Arrow) {
    return parse_arrow(false, t);
  }
  if (t.kind == TokenKind::LParen && is_arrow_ahead(0)) {
    return parse_arrow(false, t);
  }

  Expr * lhs = parse_conditional();

  if (const auto op = assign_op_of(cur().kind)) {
    const Token op_tok = advance();
    if (!is_assign_target(lhs)) {
      error_at(op_tok, "invalid assignment target");
    }
    Expr * rhs = parse_assign();
    return ast_.create<AssignExpr>(lhs, *op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_arrow(bool is_async, const Token & first)
{
  gsl::span<Expr *> params;
  if (at(TokenKind::Identifier)) {
    const Token & p = advance();
    std::vector<Expr *> single{ast_.create<Identifier>(ast_.intern(p.text), p.range)};
    params = ast_.copy_to_arena(single);
  } else {
    params = parse_params();
  }

  expect(TokenKind::Arrow, "'=>'");

  if (at(TokenKind::LBrace)) {
    BlockStmt * body = parse_block();
    return ast_.create<ArrowFunctionExpr>(
      params, body, is_async, join_ranges(first.range, body->get_range()));
  }
  Expr * body = parse_assign();
  return ast_.create<ArrowFunctionExpr>(
    params, body, is_async, join_ranges(first.range, body->get_range()));
}

Expr * Parser::parse_conditional()
{
  Expr * test = parse_coalesce_or();
  if (!match(TokenKind::Question)) {
    return test;
  }
  Expr * consequent = parse_assign();
  expect(TokenKind::Colon, "':' in conditional expression");
  Expr * alternate = parse_assign();
  return ast_.create<ConditionalExpr>(
    test, consequent, alternate, join_ranges(test->get_range(), alternate->get_range()));
}

Expr * Parser::parse_coalesce_or()
{
  Expr * lhs = parse_and();
  while (at(TokenKind::OrOr) || at(TokenKind::QuestionQuestion)) {
    const BinaryOp op = advance().kind == TokenKind::OrOr ? BinaryOp::Or : BinaryOp::Nullish;
    Expr * rhs = parse_and();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_bitor();
  while (match(TokenKind::AndAnd)) {
    Expr * rhs = parse_bitor();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitor()
{
  Expr * lhs = parse_bitxor();
  while (match(TokenKind::Pipe)) {
    Expr * rhs = parse_bitxor();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitOr, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitxor()
{
  Expr * lhs = parse_bitand();
  while (match(TokenKind::Caret)) {
    Expr * rhs = parse_bitand();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitXor, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitand()
{
  Expr * lhs = parse_equality();
  while (match(TokenKind::Amp)) {
    Expr * rhs = parse_equality();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitAnd, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_equality()
{
  Expr * lhs = parse_relational();
  while (true) {
    BinaryOp op{};
    if (at(TokenKind::EqEq)) {
      op = BinaryOp::Eq;
    } else if (at(TokenKind::Ne)) {
      op = BinaryOp::Ne;
    } else if (at(TokenKind::EqEqEq)) {
      op = BinaryOp::StrictEq;
    } else if (at(TokenKind::NeEq)) {
      op = BinaryOp::StrictNe;
    } else {
      break;
    }
    advance();
    Expr * rhs = parse_relational();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_relational()
{
  Expr * lhs = parse_shift();
  while (true) {
    BinaryOp op{};
    if (at(TokenKind::Lt)) {
      op = BinaryOp::Lt;
    } else if (at(TokenKind::Le)) {
      op = BinaryOp::Le;
    } else if (at(TokenKind::Gt)) {
      op = BinaryOp::Gt;
    } else if (at(TokenKind::Ge)) {
      op = BinaryOp::Ge;
    } else if (is_kw("in", cur())) {
      op = BinaryOp::In;
    } else if (is_kw("instanceof", cur())) {
      op = BinaryOp::Instanceof;
    } else {
      break;
    }
    advance();
    Expr * rhs = parse_shift();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_shift()
{
  Expr * lhs = parse_add();
  while (true) {
    BinaryOp op{};
    if (at(TokenKind::Shl)) {
      op = BinaryOp::Shl;
    } else if (at(TokenKind::Shr)) {
      op = BinaryOp::Shr;
    } else if (at(TokenKind::UShr)) {
      op = BinaryOp::UShr;
    } else {
      break;
    }
    advance();
    Expr * rhs = parse_add();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_add()
{
  Expr * lhs = parse_mul();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = advance().kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
    Expr * rhs = parse_mul();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  Expr * lhs = parse_exponent();
  while (true) {
    BinaryOp op{};
    if (at(TokenKind::Star)) {
      op = BinaryOp::Mul;
    } else if (at(TokenKind::Slash)) {
      op = BinaryOp::Div;
    } else if (at(TokenKind::Percent)) {
      op = BinaryOp::Mod;
    } else {
      break;
    }
    advance();
    Expr * rhs = parse_exponent();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_exponent()
{
  Expr * lhs = parse_unary();
  if (match(TokenKind::StarStar)) {
    if (isa<UnaryExpr>(lhs)) {
      error_at(prev(), "unary operand of '**' must be parenthesized");
    }
    Expr * rhs = parse_exponent();  // right-associative
    return ast_.create<BinaryExpr>(
      lhs, BinaryOp::Exp, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  const Token & t = cur();
  std::optional<UnaryOp> op;
  switch (t.kind) {
    case TokenKind::Bang:
      op = UnaryOp::Not;
      break;
    case TokenKind::Minus:
      op = UnaryOp::Neg;
      break;
    case TokenKind::Plus:
      op = UnaryOp::Plus;
      break;
    case TokenKind::Tilde:
      op = UnaryOp::BitNot;
      break;
    case TokenKind::Identifier:
      if (t.text == "typeof") {
        op = UnaryOp::Typeof;
      } else if (t.text == "void") {
        op = UnaryOp::Void;
      }
      break;
    case TokenKind::PlusPlus:
    case TokenKind::MinusMinus:
      error_at(t, "update expressions are not supported");
      break;
    default:
      break;
  }

  if (!op) {
    return parse_postfix();
  }
  const Token op_tok = advance();
  Expr * e = parse_unary();
  return ast_.create<UnaryExpr>(*op, e, join_ranges(op_tok.range, e->get_range()));
}

Identifier * Parser::parse_property_name()
{
  const Token & t = cur();
  if (t.kind != TokenKind::Identifier) {
    error_at(t, "expected property name");
    return ast_.create<Identifier>(ast_.intern(""), t.range);
  }
  advance();
  return ast_.create<Identifier>(ast_.intern(t.text), t.range);
}

gsl::span<Expr *> Parser::parse_arguments()
{
  std::vector<Expr *> args;
  expect(TokenKind::LParen, "'('");
  while (!at(TokenKind::RParen) && !at_eof()) {
    if (match(TokenKind::Ellipsis)) {
      const Token spread_tok = prev();
      Expr * arg = parse_assign();
      args.push_back(
        ast_.create<SpreadElement>(arg, join_ranges(spread_tok.range, arg->get_range())));
    } else {
      args.push_back(parse_assign());
    }
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::RParen, "')' after arguments");
  return ast_.copy_to_arena(args);
}

Expr * Parser::parse_postfix()
{
  Expr * e = is_kw("new", cur()) ? parse_new() : parse_primary();

  while (true) {
    if (match(TokenKind::Dot)) {
      Identifier * name = parse_property_name();
      e = ast_.create<MemberExpr>(e, name, false, false, join_ranges(e->get_range(), name->get_range()));
      continue;
    }
    if (match(TokenKind::QuestionDot)) {
      if (at(TokenKind::LParen)) {
        auto args = parse_arguments();
        e = ast_.create<CallExpr>(e, args, true, join_ranges(e->get_range(), prev().range));
      } else if (match(TokenKind::LBracket)) {
        Expr * index = parse_expr();
        expect(TokenKind::RBracket, "']' after computed member");
        e = ast_.create<MemberExpr>(e, index, true, true, join_ranges(e->get_range(), prev().range));
      } else {
        Identifier * name = parse_property_name();
        e = ast_.create<MemberExpr>(
          e, name, false, true, join_ranges(e->get_range(), name->get_range()));
      }
      continue;
    }
    if (match(TokenKind::LBracket)) {
      Expr * index = parse_expr();
      expect(TokenKind::RBracket, "']' after computed member");
      e = ast_.create<MemberExpr>(e, index, true, false, join_ranges(e->get_range(), prev().range));
      continue;
    }
    if (at(TokenKind::LParen)) {
      auto args = parse_arguments();
      e = ast_.create<CallExpr>(e, args, false, join_ranges(e->get_range(), prev().range));
      continue;
    }
    if ((at(TokenKind::PlusPlus) || at(TokenKind::MinusMinus)) && !cur().newline_before) {
      error_at(cur(), "update expressions are not supported");
      advance();
      continue;
    }
    if (
      (at(TokenKind::NoSubstitutionTemplate) || at(TokenKind::TemplateHead)) &&
      !cur().newline_before) {
      error_at(cur(), "tagged templates are not supported");
      Expr * ignored = parse_template();
      (void)ignored;
      continue;
    }
    break;
  }
  return e;
}

Expr * Parser::parse_new()
{
  const Token kw = advance();
  Expr * callee = is_kw("new", cur()) ? parse_new() : parse_primary();

  // Member accesses bind to the callee; the first call is the constructor's argument list
  while (true) {
    if (match(TokenKind::Dot)) {
      Identifier * name = parse_property_name();
      callee = ast_.create<MemberExpr>(
        callee, name, false, false, join_ranges(callee->get_range(), name->get_range()));
    } else if (match(TokenKind::LBracket)) {
      Expr * index = parse_expr();
      expect(TokenKind::RBracket, "']' after computed member");
      callee = ast_.create<MemberExpr>(
        callee, index, true, false, join_ranges(callee->get_range(), prev().range));
    } else {
      break;
    }
  }

  gsl::span<Expr *> args;
  if (at(TokenKind::LParen)) {
    args = parse_arguments();
  }
  return ast_.create<NewExpr>(callee, args, join_ranges(kw.range, prev().range));
}

Expr * Parser::parse_primary()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::NumberLiteral:
      advance();
      return ast_.create<NumberLiteral>(parse_number_text(t.text), t.range);
    case TokenKind::BigIntLiteral:
      advance();
      return ast_.create<BigIntLiteral>(ast_.intern(parse_bigint_text(t.text)), t.range);
    case TokenKind::StringLiteral: {
      advance();
      const auto s = unescape_string(t.text, &t);
      return ast_.create<StringLiteral>(ast_.intern(s ? *s : std::string(t.text)), t.range);
    }
    case TokenKind::RegExpLiteral: {
      advance();
      const size_t slash = t.text.rfind('/');
      return ast_.create<RegExpLiteral>(
        ast_.intern(t.text.substr(1, slash - 1)), ast_.intern(t.text.substr(slash + 1)), t.range);
    }
    case TokenKind::NoSubstitutionTemplate:
    case TokenKind::TemplateHead:
      return parse_template();
    case TokenKind::LParen: {
      advance();
      Expr * e = parse_expr();
      if (at(TokenKind::Comma)) {
        error_at(cur(), "sequence expressions are not supported");
      }
      expect(TokenKind::RParen, "')' after expression");
      return e;
    }
    case TokenKind::LBracket:
      return parse_array();
    case TokenKind::LBrace:
      return parse_object();
    case TokenKind::Identifier:
      if (t.text == "true" || t.text == "false") {
        advance();
        return ast_.create<BoolLiteral>(t.text == "true", t.range);
      }
      if (t.text == "null") {
        advance();
        return ast_.create<NullLiteral>(t.range);
      }
      if (t.text == "this") {
        advance();
        return ast_.create<ThisExpr>(t.range);
      }
      if (t.text == "function") {
        break;
      }
      // `import(...)` and `import.meta` are the only expression uses of `import`
      if (
        is_reserved_word(t.text) &&
        !(t.text == "import" &&
          (cur(1).kind == TokenKind::LParen || cur(1).kind == TokenKind::Dot))) {
        break;
      }
      advance();
      return ast_.create<Identifier>(ast_.intern(t.text), t.range);
    default:
      break;
  }

  if (is_kw("function", t)) {
    error_at(t, "function expressions are not supported; use an arrow function");
  } else {
    error_at(t, "expected expression");
  }

  // Do not consume likely synchronization tokens
  if (
    t.kind != TokenKind::Semicolon && t.kind != TokenKind::RBrace &&
    t.kind != TokenKind::RParen && t.kind != TokenKind::RBracket && !at_eof()) {
    advance();
  }
  return make_missing_expr_at(t);
}

Expr * Parser::parse_array()
{
  const Token open = advance();
  std::vector<Expr *> elems;

  while (!at(TokenKind::RBracket) && !at_eof()) {
    if (match(TokenKind::Comma)) {
      elems.push_back(nullptr);  // hole
      continue;
    }
    if (match(TokenKind::Ellipsis)) {
      const Token spread_tok = prev();
      Expr * arg = parse_assign();
      elems.push_back(
        ast_.create<SpreadElement>(arg, join_ranges(spread_tok.range, arg->get_range())));
    } else {
      elems.push_back(parse_assign());
    }
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::RBracket, "']' after array literal");

  return ast_.create<ArrayExpr>(ast_.copy_to_arena(elems), join_ranges(open.range, prev().range));
}

AstNode * Parser::parse_object_entry()
{
  const Token & t = cur();

  if (match(TokenKind::Ellipsis)) {
    Expr * arg = parse_assign();
    return ast_.create<SpreadElement>(arg, join_ranges(t.range, arg->get_range()));
  }

  Expr * key = nullptr;
  bool computed = false;

  if (match(TokenKind::LBracket)) {
    computed = true;
    key = parse_assign();
    expect(TokenKind::RBracket, "']' after computed key");
  } else if (t.kind == TokenKind::Identifier) {
    const TokenKind next = cur(1).kind;
    // `get x() {}`, `async x() {}`, `x() {}`
    const bool method_prefix = (t.text == "get" || t.text == "set" || t.text == "async") &&
                               next != TokenKind::Colon && next != TokenKind::Comma &&
                               next != TokenKind::RBrace && next != TokenKind::Eq &&
                               next != TokenKind::LParen;
    if (next == TokenKind::LParen || method_prefix) {
      error_at(t, "object methods are not supported; use a property with an arrow function");
      while (!at_eof() && !at(TokenKind::LBrace)) advance();
      skip_balanced(TokenKind::LBrace, TokenKind::RBrace);
      return nullptr;
    }

    advance();
    auto * id = ast_.create<Identifier>(ast_.intern(t.text), t.range);
    if (next == TokenKind::Comma || next == TokenKind::RBrace) {
      return ast_.create<Property>(id, id, false, true, t.range);
    }
    if (next == TokenKind::Eq) {
      // Pattern default: `{ a = 1 } = obj`
      advance();
      Expr * def = parse_assign();
      auto * value = ast_.create<AssignExpr>(
        id, AssignOp::Assign, def, join_ranges(t.range, def->get_range()));
      return ast_.create<Property>(id, value, false, true, value->get_range());
    }
    key = id;
  } else if (t.kind == TokenKind::StringLiteral || t.kind == TokenKind::NumberLiteral ||
             t.kind == TokenKind::BigIntLiteral) {
    key = parse_primary();
  } else {
    error_at(t, "expected property");
    if (!at(TokenKind::RBrace)) advance();
    return nullptr;
  }

  expect(TokenKind::Colon, "':' after property key");
  Expr * value = parse_assign();
  return ast_.create<Property>(key, value, computed, false, join_ranges(t.range, value->get_range()));
}

Expr * Parser::parse_object()
{
  const Token open = advance();
  std::vector<AstNode *> props;

  while (!at(TokenKind::RBrace) && !at_eof()) {
    const size_t before = idx_;
    if (AstNode * entry = parse_object_entry()) {
      props.push_back(entry);
    }
    if (match(TokenKind::Comma)) continue;
    if (!at(TokenKind::RBrace)) {
      error_at(cur(), "expected ',' or '}' in object literal");
      if (idx_ == before) advance();
    }
    break;
  }
  expect(TokenKind::RBrace, "'}' after object literal");

  return ast_.create<ObjectExpr>(ast_.copy_to_arena(props), join_ranges(open.range, prev().range));
}

Expr * Parser::parse_template()
{
  const Token first = advance();
  std::vector<TemplateQuasi> quasis;
  std::vector<Expr *> exprs;

  auto add_quasi = [&](const Token & tok) {
    TemplateQuasi q;
    q.raw = ast_.intern(tok.text);
    if (auto cooked = unescape_string(tok.text, nullptr)) {
      q.cooked = ast_.intern(*cooked);
    }
    quasis.push_back(q);
  };

  add_quasi(first);
  if (first.kind == TokenKind::TemplateHead) {
    while (true) {
      exprs.push_back(parse_expr());
      if (at(TokenKind::TemplateMiddle)) {
        add_quasi(advance());
        continue;
      }
      if (at(TokenKind::TemplateTail)) {
        add_quasi(advance());
        break;
      }
      error_at(cur(), "expected '}' to close template substitution");
      // Keep quasis.size() == exprs.size() + 1
      quasis.push_back(TemplateQuasi{std::string_view{}, std::string_view{}});
      break;
    }
  }

  return ast_.create<TemplateLiteral>(
    ast_.copy_to_arena(quasis), ast_.copy_to_arena(exprs), join_ranges(first.range, prev().range));
}

// ============================================================================
// Escapes
// ============================================================================

std::optional<std::string> Parser::unescape_string(
  std::string_view raw, const Token * tok_for_diag)
{
  auto fail = [&](std::string_view msg) -> std::optional<std::string> {
    if (tok_for_diag) error_at(*tok_for_diag, msg);
    return std::nullopt;
  };

  std::string out;
  out.reserve(raw.size());

  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c == '\r') {
      // CRLF and CR normalize to LF (template literals)
      out.push_back('\n');
      if (i + 1 < raw.size() && raw[i + 1] == '\n') ++i;
      continue;
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }

    if (i + 1 >= raw.size()) {
      return fail("unterminated escape sequence");
    }

    const char esc = raw[++i];
    switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'v':
        out.push_back('\v');
        break;
      case '0':
        if (i + 1 < raw.size() && raw[i + 1] >= '0' && raw[i + 1] <= '9') {
          return fail("octal escape sequences are not allowed");
        }
        out.push_back('\0');
        break;
      case '1':
      case '2':
      case '3':
      case '4':
      case '5':
      case '6':
      case '7':
      case '8':
      case '9':
        return fail("octal escape sequences are not allowed");
      case '\r':
        // Line continuation
        if (i + 1 < raw.size() && raw[i + 1] == '\n') ++i;
        break;
      case '\n':
        break;
      case 'x': {
        const auto v = read_hex(raw, i + 1, 2);
        if (!v) return fail("invalid \\x escape");
        append_utf8(out, *v);
        i += 2;
        break;
      }
      case 'u': {
        uint32_t cp = 0;
        if (i + 1 < raw.size() && raw[i + 1] == '{') {
          const size_t close = raw.find('}', i + 2);
          if (close == std::string_view::npos || close == i + 2 || close - (i + 2) > 6) {
            return fail("invalid \\u{...} escape");
          }
          const auto v = read_hex(raw, i + 2, close - (i + 2));
          if (!v || *v > 0x10FFFF) return fail("invalid \\u{...} escape");
          cp = *v;
          i = close;
        } else {
          const auto v = read_hex(raw, i + 1, 4);
          if (!v) return fail("invalid \\u escape");
          cp = *v;
          i += 4;
          // Combine a surrogate pair written as two escapes
          if (
            cp >= 0xD800 && cp <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
            raw[i + 2] == 'u') {
            const auto lo = read_hex(raw, i + 3, 4);
            if (lo && *lo >= 0xDC00 && *lo <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (*lo - 0xDC00);
              i += 6;
            }
          }
        }
        append_utf8(out, cp);
        break;
      }
      default:
        // Identity escape, including quotes and backslash
        out.push_back(esc);
        // U+2028/U+2029 after a backslash is a line continuation
        if (
          static_cast<unsigned char>(esc) == 0xE2 && i + 2 < raw.size() &&
          static_cast<unsigned char>(raw[i + 1]) == 0x80 &&
          (static_cast<unsigned char>(raw[i + 2]) == 0xA8 ||
           static_cast<unsigned char>(raw[i + 2]) == 0xA9)) {
          out.pop_back();
          i += 2;
        }
        break;
    }
  }

  return out;
}

}  // namespace refiner::syntax
