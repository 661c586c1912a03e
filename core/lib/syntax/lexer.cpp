// refiner/syntax/lexer.cpp - Hand-written JavaScript tokenizer
#include "refiner/syntax/lexer.hpp"

#include <array>
#include <cctype>

namespace refiner::syntax
{
namespace
{

bool is_ident_start(unsigned char c)
{
  return (std::isalpha(c) != 0) || c == '_' || c == '$' || c >= 0x80;
}
bool is_ident_continue(unsigned char c) { return is_ident_start(c) || (std::isdigit(c) != 0); }

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_hex_digit(unsigned char c)
{
  return (std::isdigit(c) != 0) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Keywords after which a `/` begins a regular expression.
constexpr std::array<std::string_view, 14> k_regex_prefix_keywords = {
  "return", "typeof", "instanceof", "in",   "of",   "new",   "delete",
  "void",   "throw",  "case",       "do",   "else", "yield", "await",
};

struct Punct
{
  std::string_view text;
  TokenKind kind;
};

// Longest first so that prefix matching picks the maximal munch.
constexpr std::array<Punct, 50> k_punctuators = {{
  {">>>", TokenKind::UShr},
  {"...", TokenKind::Ellipsis},
  {"===", TokenKind::EqEqEq},
  {"!==", TokenKind::NeEq},
  {"&&=", TokenKind::AndAndEq},
  {"||=", TokenKind::OrOrEq},
  {"?\?=", TokenKind::QuestionQuestionEq},
  {"=>", TokenKind::Arrow},
  {"==", TokenKind::EqEq},
  {"!=", TokenKind::Ne},
  {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},
  {"<<", TokenKind::Shl},
  {">>", TokenKind::Shr},
  {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},
  {"??", TokenKind::QuestionQuestion},
  {"**", TokenKind::StarStar},
  {"++", TokenKind::PlusPlus},
  {"--", TokenKind::MinusMinus},
  {"+=", TokenKind::PlusEq},
  {"-=", TokenKind::MinusEq},
  {"*=", TokenKind::StarEq},
  {"/=", TokenKind::SlashEq},
  {"%=", TokenKind::PercentEq},
  {"(", TokenKind::LParen},
  {")", TokenKind::RParen},
  {"{", TokenKind::LBrace},
  {"}", TokenKind::RBrace},
  {"[", TokenKind::LBracket},
  {"]", TokenKind::RBracket},
  {",", TokenKind::Comma},
  {":", TokenKind::Colon},
  {";", TokenKind::Semicolon},
  {".", TokenKind::Dot},
  {"?", TokenKind::Question},
  {"+", TokenKind::Plus},
  {"-", TokenKind::Minus},
  {"*", TokenKind::Star},
  {"/", TokenKind::Slash},
  {"%", TokenKind::Percent},
  {"&", TokenKind::Amp},
  {"|", TokenKind::Pipe},
  {"^", TokenKind::Caret},
  {"~", TokenKind::Tilde},
  {"!", TokenKind::Bang},
  {"=", TokenKind::Eq},
  {"<", TokenKind::Lt},
  {">", TokenKind::Gt},
  {"#", TokenKind::Unknown},
}};

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const noexcept
{
  const auto end = static_cast<uint32_t>(pos_);
  Token t;
  t.kind = kind;
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);
  return t;
}

bool Lexer::skip_trivia()
{
  bool newline = false;

  // Hashbang line
  if (pos_ == 0 && starts_with("#!")) {
    while (!eof() && peek() != '\n') advance(1);
  }

  while (!eof()) {
    const char c = peek();
    if (c == '\n' || c == '\r') {
      newline = true;
      advance(1);
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\v' || c == '\f') {
      advance(1);
      continue;
    }
    // U+00A0, U+FEFF
    if (starts_with("\xC2\xA0")) {
      advance(2);
      continue;
    }
    if (starts_with("\xEF\xBB\xBF")) {
      advance(3);
      continue;
    }
    // U+2028 / U+2029 line terminators
    if (starts_with("\xE2\x80\xA8") || starts_with("\xE2\x80\xA9")) {
      newline = true;
      advance(3);
      continue;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n' && peek() != '\r') advance(1);
      continue;
    }
    if (starts_with("/*")) {
      advance(2);
      while (!eof() && !starts_with("*/")) {
        if (peek() == '\n' || peek() == '\r') newline = true;
        advance(1);
      }
      // Unterminated block comment runs to EOF
      if (!eof()) advance(2);
      continue;
    }
    break;
  }
  return newline;
}

bool Lexer::regex_allowed() const noexcept
{
  switch (prev_kind_) {
    case TokenKind::Identifier:
      for (const auto kw : k_regex_prefix_keywords) {
        if (prev_text_ == kw) return true;
      }
      return false;
    case TokenKind::NumberLiteral:
    case TokenKind::BigIntLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::RegExpLiteral:
    case TokenKind::NoSubstitutionTemplate:
    case TokenKind::TemplateTail:
    case TokenKind::RParen:
    case TokenKind::RBracket:
    case TokenKind::RBrace:
    case TokenKind::PlusPlus:
    case TokenKind::MinusMinus:
      return false;
    default:
      return true;
  }
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  // Base-prefixed integers: 0x.. 0b.. 0o..
  if (peek() == '0') {
    const char p1 = peek(1);
    if (p1 == 'x' || p1 == 'X' || p1 == 'b' || p1 == 'B' || p1 == 'o' || p1 == 'O') {
      const int base = (p1 == 'x' || p1 == 'X') ? 16 : ((p1 == 'b' || p1 == 'B') ? 2 : 8);
      advance(2);

      bool any = false;
      bool invalid = false;
      while (!eof()) {
        const auto c = static_cast<unsigned char>(peek());
        bool ok = false;
        if (base == 16) {
          ok = is_hex_digit(c);
        } else if (base == 8) {
          ok = (c >= '0' && c <= '7');
        } else {
          ok = (c == '0' || c == '1');
        }

        if (ok) {
          any = true;
          advance(1);
          continue;
        }
        if (c == '_' && any && is_hex_digit(static_cast<unsigned char>(peek(1)))) {
          advance(1);
          continue;
        }
        if (c == 'n') {
          advance(1);
          return make_token(
            (!any || invalid) ? TokenKind::Unknown : TokenKind::BigIntLiteral, start);
        }
        // Still looks like part of the literal: consume it but mark invalid.
        if (std::isalnum(c) != 0) {
          invalid = true;
          advance(1);
          continue;
        }
        break;
      }
      return make_token((!any || invalid) ? TokenKind::Unknown : TokenKind::NumberLiteral, start);
    }
  }

  auto digits = [this]() {
    while (!eof() && (is_digit(peek()) || (peek() == '_' && is_digit(peek(1))))) {
      advance(1);
    }
  };

  bool is_integer = true;
  digits();

  if (peek() == '.') {
    is_integer = false;
    advance(1);
    digits();
  }

  if (peek() == 'e' || peek() == 'E') {
    const char sign = peek(1);
    if (is_digit(sign) || ((sign == '+' || sign == '-') && is_digit(peek(2)))) {
      is_integer = false;
      advance(2);
      digits();
    }
  }

  if (is_integer && peek() == 'n') {
    advance(1);
    return make_token(TokenKind::BigIntLiteral, start);
  }

  // `3in` or `1abc` is not a valid numeric literal
  if (!eof() && is_ident_start(static_cast<unsigned char>(peek()))) {
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) advance(1);
    return make_token(TokenKind::Unknown, start);
  }

  return make_token(TokenKind::NumberLiteral, start);
}

Token Lexer::lex_string(char quote)
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof()) {
    const char c = peek();
    if (c == quote) {
      const auto payload_end = static_cast<uint32_t>(pos_);
      advance(1);
      Token t = make_token(TokenKind::StringLiteral, start);
      t.text = src_.substr(payload_start, payload_end - payload_start);
      return t;
    }
    // Raw line terminators are not allowed inside string literals.
    if (c == '\n' || c == '\r') {
      break;
    }
    if (c == '\\') {
      advance(1);
      // Line continuation: \ CR LF
      if (peek() == '\r' && peek(1) == '\n') {
        advance(2);
        continue;
      }
    }
    if (!eof()) advance(1);
  }

  return make_token(TokenKind::Unknown, start);
}

Token Lexer::lex_template_part(uint32_t start, bool is_head_position)
{
  // pos_ is just past the opening '`' or '}'
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof()) {
    const char c = peek();
    if (c == '`') {
      const auto payload_end = static_cast<uint32_t>(pos_);
      advance(1);
      Token t = make_token(
        is_head_position ? TokenKind::NoSubstitutionTemplate : TokenKind::TemplateTail, start);
      t.text = src_.substr(payload_start, payload_end - payload_start);
      return t;
    }
    if (c == '$' && peek(1) == '{') {
      const auto payload_end = static_cast<uint32_t>(pos_);
      advance(2);
      brace_stack_.push_back(true);
      Token t = make_token(
        is_head_position ? TokenKind::TemplateHead : TokenKind::TemplateMiddle, start);
      t.text = src_.substr(payload_start, payload_end - payload_start);
      return t;
    }
    if (c == '\\') {
      advance(1);
    }
    if (!eof()) advance(1);
  }

  return make_token(TokenKind::Unknown, start);
}

Token Lexer::lex_regexp()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);

  bool in_class = false;
  while (!eof()) {
    const char c = peek();
    if (c == '\n' || c == '\r') {
      return make_token(TokenKind::Unknown, start);
    }
    if (c == '\\') {
      advance(2);
      continue;
    }
    if (c == '[') {
      in_class = true;
    } else if (c == ']') {
      in_class = false;
    } else if (c == '/' && !in_class) {
      advance(1);
      while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
        advance(1);
      }
      return make_token(TokenKind::RegExpLiteral, start);
    }
    advance(1);
  }
  return make_token(TokenKind::Unknown, start);
}

Token Lexer::lex_punctuator()
{
  const auto start = static_cast<uint32_t>(pos_);

  // `?.` followed by a digit is a conditional with a decimal: a?.5:b
  if (starts_with("?.") && !is_digit(peek(2))) {
    advance(2);
    return make_token(TokenKind::QuestionDot, start);
  }

  for (const auto & p : k_punctuators) {
    if (starts_with(p.text)) {
      advance(p.text.size());
      return make_token(p.kind, start);
    }
  }

  // Unknown byte
  advance(1);
  return make_token(TokenKind::Unknown, start);
}

Token Lexer::next_token()
{
  const bool newline = skip_trivia();

  Token t;
  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    t.kind = TokenKind::Eof;
    t.range = make_range(at, at);
  } else {
    const auto c = static_cast<unsigned char>(peek());
    const auto start = static_cast<uint32_t>(pos_);

    if (is_ident_start(c)) {
      t = lex_identifier();
    } else if (is_digit(peek()) || (peek() == '.' && is_digit(peek(1)))) {
      t = lex_number();
    } else if (peek() == '"' || peek() == '\'') {
      t = lex_string(peek());
    } else if (peek() == '`') {
      advance(1);
      t = lex_template_part(start, true);
    } else if (peek() == '/' && regex_allowed()) {
      t = lex_regexp();
    } else if (peek() == '{') {
      advance(1);
      brace_stack_.push_back(false);
      t = make_token(TokenKind::LBrace, start);
    } else if (peek() == '}') {
      advance(1);
      const bool closes_template = !brace_stack_.empty() && brace_stack_.back();
      if (!brace_stack_.empty()) brace_stack_.pop_back();
      t = closes_template ? lex_template_part(start, false) : make_token(TokenKind::RBrace, start);
    } else {
      t = lex_punctuator();
    }
  }

  t.newline_before = newline;
  prev_kind_ = t.kind;
  prev_text_ = t.text;
  return t;
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace refiner::syntax
