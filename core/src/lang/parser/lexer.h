#pragma once

#include <string>

#include "tokens.h"

namespace xlformula {

/// Tokenizes formula text for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST advance the cursor and MUST return End at input exhaustion.
  /// Lexical errors are reported as Invalid tokens carrying the message.
  Token next();

 private:
  /// Lexes a double-quoted string; a doubled quote is an escaped quote.
  Token lex_string();
  Token lex_identifier_or_keyword();
  /// Lexes a decimal number with optional fraction and exponent.
  /// MUST stop at the first character that cannot continue the literal.
  Token lex_number();
  void skip_ws();
  char advance_char();
  Token make_token(TokenType type, const std::string& text, size_t start_pos) const;
  static bool is_ident_start(char c);
  static bool is_ident_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
};

}  // namespace xlformula
