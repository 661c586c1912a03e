// refiner/syntax/token.hpp - Token kinds for the JavaScript lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "refiner/basic/source_manager.hpp"

namespace refiner::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,  // Includes keywords; the parser checks text
  NumberLiteral,
  BigIntLiteral,
  StringLiteral,  // token.text is the raw contents (without quotes)
  RegExpLiteral,  // token.text is the whole literal, /pattern/flags

  // Template pieces; token.text is the raw text between delimiters
  NoSubstitutionTemplate,  // `abc`
  TemplateHead,            // `abc${
  TemplateMiddle,          // }abc${
  TemplateTail,            // }abc`

  // Punctuation
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  Semicolon,
  Dot,
  Ellipsis,
  Question,
  QuestionDot,
  Arrow,

  // Operators
  Plus,
  Minus,
  Star,
  StarStar,
  Slash,
  Percent,
  PlusPlus,
  MinusMinus,

  Amp,
  Pipe,
  Caret,
  Tilde,
  Bang,
  Shl,
  Shr,
  UShr,

  AndAnd,
  OrOr,
  QuestionQuestion,

  Eq,
  EqEq,
  EqEqEq,
  Ne,
  NeEq,
  Lt,
  Le,
  Gt,
  Ge,

  PlusEq,
  MinusEq,
  StarEq,
  SlashEq,
  PercentEq,
  AndAndEq,
  OrOrEq,
  QuestionQuestionEq,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;
  std::string_view text;
  bool newline_before = false;  ///< A line terminator precedes this token (for ASI)
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "Eof";
    case TokenKind::Unknown:
      return "Unknown";
    case TokenKind::Identifier:
      return "Identifier";
    case TokenKind::NumberLiteral:
      return "NumberLiteral";
    case TokenKind::BigIntLiteral:
      return "BigIntLiteral";
    case TokenKind::StringLiteral:
      return "StringLiteral";
    case TokenKind::RegExpLiteral:
      return "RegExpLiteral";
    case TokenKind::NoSubstitutionTemplate:
      return "NoSubstitutionTemplate";
    case TokenKind::TemplateHead:
      return "TemplateHead";
    case TokenKind::TemplateMiddle:
      return "TemplateMiddle";
    case TokenKind::TemplateTail:
      return "TemplateTail";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::Ellipsis:
      return "...";
    case TokenKind::Question:
      return "?";
    case TokenKind::QuestionDot:
      return "?.";
    case TokenKind::Arrow:
      return "=>";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::StarStar:
      return "**";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::PlusPlus:
      return "++";
    case TokenKind::MinusMinus:
      return "--";
    case TokenKind::Amp:
      return "&";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Caret:
      return "^";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Shl:
      return "<<";
    case TokenKind::Shr:
      return ">>";
    case TokenKind::UShr:
      return ">>>";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::QuestionQuestion:
      return "??";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::EqEqEq:
      return "===";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::NeEq:
      return "!==";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::PlusEq:
      return "+=";
    case TokenKind::MinusEq:
      return "-=";
    case TokenKind::StarEq:
      return "*=";
    case TokenKind::SlashEq:
      return "/=";
    case TokenKind::PercentEq:
      return "%=";
    case TokenKind::AndAndEq:
      return "&&=";
    case TokenKind::OrOrEq:
      return "||=";
    case TokenKind::QuestionQuestionEq:
      return "?\?=";
  }
  return "Unknown";
}

}  // namespace refiner::syntax
