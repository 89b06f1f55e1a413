#include "lexer.h"

#include <cctype>

#include "../../util/string_util.h"

namespace xlformula {

Lexer::Lexer(const std::string& input) : input_(input) {}

Token Lexer::next() {
  skip_ws();
  if (pos_ >= input_.size()) {
    return make_token(TokenType::End, "", pos_);
  }

  size_t start = pos_;
  char c = input_[pos_];
  switch (c) {
    case ',':
      advance_char();
      return make_token(TokenType::Comma, ",", start);
    case ':':
      advance_char();
      return make_token(TokenType::Colon, ":", start);
    case '(':
      advance_char();
      return make_token(TokenType::LParen, "(", start);
    case ')':
      advance_char();
      return make_token(TokenType::RParen, ")", start);
    case '+':
      advance_char();
      return make_token(TokenType::Plus, "+", start);
    case '-':
      advance_char();
      return make_token(TokenType::Minus, "-", start);
    case '*':
      advance_char();
      return make_token(TokenType::Star, "*", start);
    case '/':
      advance_char();
      return make_token(TokenType::Slash, "/", start);
    case '^':
      advance_char();
      return make_token(TokenType::Caret, "^", start);
    case '%':
      advance_char();
      return make_token(TokenType::Percent, "%", start);
    case '=':
      advance_char();
      return make_token(TokenType::Equal, "=", start);
    default:
      break;
  }
  if (c == '>') {
    advance_char();
    if (pos_ < input_.size() && input_[pos_] == '=') {
      advance_char();
      return make_token(TokenType::GreaterEqual, ">=", start);
    }
    return make_token(TokenType::Greater, ">", start);
  }
  if (c == '<') {
    advance_char();
    if (pos_ < input_.size() && input_[pos_] == '>') {
      advance_char();
      return make_token(TokenType::NotEqual, "<>", start);
    }
    if (pos_ < input_.size() && input_[pos_] == '=') {
      advance_char();
      return make_token(TokenType::LessEqual, "<=", start);
    }
    return make_token(TokenType::Less, "<", start);
  }
  if (c == '"') {
    return lex_string();
  }
  if (std::isdigit(static_cast<unsigned char>(c)) ||
      (c == '.' && pos_ + 1 < input_.size() &&
       std::isdigit(static_cast<unsigned char>(input_[pos_ + 1])))) {
    return lex_number();
  }
  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }

  advance_char();
  return make_token(TokenType::Invalid, std::string("Unexpected character '") + c + "'", start);
}

Token Lexer::lex_string() {
  size_t start = pos_;
  advance_char();
  std::string out;
  while (pos_ < input_.size()) {
    char c = advance_char();
    if (c == '"') {
      if (pos_ < input_.size() && input_[pos_] == '"') {
        out.push_back(advance_char());
        continue;
      }
      return make_token(TokenType::String, out, start);
    }
    out.push_back(c);
  }
  return make_token(TokenType::Invalid, "Unterminated string literal", start);
}

Token Lexer::lex_identifier_or_keyword() {
  size_t start = pos_;
  std::string out;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) {
    out.push_back(advance_char());
  }
  std::string upper = util::to_upper(out);
  if (upper == "TRUE") return make_token(TokenType::KeywordTrue, out, start);
  if (upper == "FALSE") return make_token(TokenType::KeywordFalse, out, start);
  return make_token(TokenType::Identifier, out, start);
}

Token Lexer::lex_number() {
  size_t start = pos_;
  std::string out;
  auto take_digits = [&]() {
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
      out.push_back(advance_char());
    }
  };
  take_digits();
  if (pos_ < input_.size() && input_[pos_] == '.') {
    out.push_back(advance_char());
    take_digits();
  }
  if (pos_ < input_.size() && (input_[pos_] == 'e' || input_[pos_] == 'E')) {
    size_t exp_pos = pos_ + 1;
    if (exp_pos < input_.size() && (input_[exp_pos] == '+' || input_[exp_pos] == '-')) {
      ++exp_pos;
    }
    if (exp_pos < input_.size() && std::isdigit(static_cast<unsigned char>(input_[exp_pos]))) {
      while (pos_ < exp_pos) {
        out.push_back(advance_char());
      }
      take_digits();
    }
  }
  return make_token(TokenType::Number, out, start);
}

void Lexer::skip_ws() {
  while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
    advance_char();
  }
}

char Lexer::advance_char() { return input_[pos_++]; }

Token Lexer::make_token(TokenType type, const std::string& text, size_t start_pos) const {
  return Token{type, text, start_pos};
}

bool Lexer::is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool Lexer::is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

}  // namespace xlformula
