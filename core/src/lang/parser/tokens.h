#pragma once

#include <cstddef>
#include <string>

namespace xlformula {

/// Enumerates lexical tokens produced by the formula lexer.
/// MUST remain consistent with parser expectations.
enum class TokenType {
  Identifier,
  String,
  Number,
  Comma,
  Colon,
  LParen,
  RParen,
  Plus,
  Minus,
  Star,
  Slash,
  Caret,
  Percent,
  Equal,
  NotEqual,
  Greater,
  GreaterEqual,
  Less,
  LessEqual,
  KeywordTrue,
  KeywordFalse,
  End,
  Invalid
};

/// Represents a single token with source text and byte position.
struct Token {
  TokenType type;
  std::string text;
  size_t pos = 0;
};

}  // namespace xlformula
