// refiner/syntax/lexer.hpp - Hand-written JavaScript tokenizer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "refiner/syntax/token.hpp"

namespace refiner::syntax
{

/**
 * Tokenizes a JavaScript module.
 *
 * Comments and whitespace are skipped; a token records whether a line
 * terminator preceded it. Template literals are split into head, middle
 * and tail pieces by tracking which open braces belong to `${`. A `/`
 * starts a regular expression when the previous significant token cannot
 * end an expression.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skips whitespace and comments. Returns true if a line terminator was crossed.
  bool skip_trivia();

  [[nodiscard]] bool regex_allowed() const noexcept;

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string(char quote);
  [[nodiscard]] Token lex_template_part(uint32_t start, bool is_head_position);
  [[nodiscard]] Token lex_regexp();
  [[nodiscard]] Token lex_punctuator();

  [[nodiscard]] static SourceRange make_range(uint32_t start, uint32_t end) noexcept
  {
    return {start, end};
  }

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;

  /// One entry per open brace: true when it was opened by `${`.
  std::vector<bool> brace_stack_;

  TokenKind prev_kind_ = TokenKind::Eof;
  std::string_view prev_text_;
};

}  // namespace refiner::syntax
