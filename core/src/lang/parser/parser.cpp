#include "parser_internal.h"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

#include "../../formula_parser.h"
#include "../../util/string_util.h"

namespace xlformula {

namespace {

bool is_comparison_token(TokenType type) {
  return type == TokenType::Equal || type == TokenType::NotEqual ||
         type == TokenType::Greater || type == TokenType::GreaterEqual ||
         type == TokenType::Less || type == TokenType::LessEqual;
}

bool is_additive_token(TokenType type) {
  return type == TokenType::Plus || type == TokenType::Minus;
}

bool is_multiplicative_token(TokenType type) {
  return type == TokenType::Star || type == TokenType::Slash || type == TokenType::Percent;
}

std::string depth_message() {
  return "Formula nesting exceeds maximum depth of " + std::to_string(kMaxFormulaDepth);
}

/// Counts active parse_unary frames; every nested group, call or prefix
/// operator passes through one.
class DepthGuard {
 public:
  explicit DepthGuard(size_t& depth) : depth_(depth) { ++depth_; }
  ~DepthGuard() { --depth_; }

 private:
  size_t& depth_;
};

}  // namespace

OperatorType classify_operator(const std::string& op) {
  if (op == "+" || op == "-" || op == "*" || op == "/" || op == "^" || op == "%") {
    return OperatorType::Math;
  }
  if (op == "=" || op == "<>" || op == ">" || op == "<" || op == ">=" || op == "<=") {
    return OperatorType::Comparison;
  }
  return OperatorType::Unsupported;
}

Parser::Parser(const std::string& input) : input_(input), lexer_(input) { advance(); }

bool Parser::parse(std::unique_ptr<FormulaNode>& out) {
  if (has_error_) return false;
  if (current_.type == TokenType::Equal) {
    advance();
  }
  if (current_.type == TokenType::End) {
    return set_error("Empty formula");
  }
  if (!parse_comparison(out)) return false;
  if (current_.type != TokenType::End) {
    if (current_.type == TokenType::RParen) {
      return set_error("Unbalanced )");
    }
    return set_error("Unexpected token '" + current_.text + "'");
  }
  return true;
}

/// Parses comparison operators, the loosest binding level.
/// MUST build nodes in left-associative order.
bool Parser::parse_comparison(std::unique_ptr<FormulaNode>& out) {
  std::unique_ptr<FormulaNode> left;
  if (!parse_additive(left)) return false;
  while (is_comparison_token(current_.type)) {
    Token op = current_;
    advance();
    std::unique_ptr<FormulaNode> right;
    if (!parse_additive(right)) return false;
    left = make_operator_node(op, std::move(left), std::move(right));
    if (!check_height(*left)) return false;
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_additive(std::unique_ptr<FormulaNode>& out) {
  std::unique_ptr<FormulaNode> left;
  if (!parse_multiplicative(left)) return false;
  while (is_additive_token(current_.type)) {
    Token op = current_;
    advance();
    std::unique_ptr<FormulaNode> right;
    if (!parse_multiplicative(right)) return false;
    left = make_operator_node(op, std::move(left), std::move(right));
    if (!check_height(*left)) return false;
  }
  out = std::move(left);
  return true;
}

bool Parser::parse_multiplicative(std::unique_ptr<FormulaNode>& out) {
  std::unique_ptr<FormulaNode> left;
  if (!parse_power(left)) return false;
  while (is_multiplicative_token(current_.type)) {
    Token op = current_;
    advance();
    std::unique_ptr<FormulaNode> right;
    if (!parse_power(right)) return false;
    left = make_operator_node(op, std::move(left), std::move(right));
    if (!check_height(*left)) return false;
  }
  out = std::move(left);
  return true;
}

/// Parses exponentiation.
/// MUST stay left-associative (2^3^2 is 64) to match spreadsheet hosts.
bool Parser::parse_power(std::unique_ptr<FormulaNode>& out) {
  std::unique_ptr<FormulaNode> left;
  if (!parse_unary(left)) return false;
  while (current_.type == TokenType::Caret) {
    Token op = current_;
    advance();
    std::unique_ptr<FormulaNode> right;
    if (!parse_unary(right)) return false;
    left = make_operator_node(op, std::move(left), std::move(right));
    if (!check_height(*left)) return false;
  }
  out = std::move(left);
  return true;
}

/// Parses prefix + and -.
/// Binds tighter than ^, so -2^2 evaluates as (-2)^2.
bool Parser::parse_unary(std::unique_ptr<FormulaNode>& out) {
  DepthGuard guard(depth_);
  if (depth_ > kMaxFormulaDepth) {
    return set_error(depth_message());
  }
  if (is_additive_token(current_.type)) {
    Token op = current_;
    advance();
    std::unique_ptr<FormulaNode> operand;
    if (!parse_unary(operand)) return false;
    auto node = std::make_unique<FormulaNode>();
    node->kind = FormulaNode::Kind::Unary;
    node->op = op.text;
    node->span = Span{op.pos, operand->span.end};
    node->height = operand->height + 1;
    node->children.push_back(std::move(operand));
    if (!check_height(*node)) return false;
    out = std::move(node);
    return true;
  }
  return parse_primary(out);
}

bool Parser::parse_primary(std::unique_ptr<FormulaNode>& out) {
  Token token = current_;
  switch (token.type) {
    case TokenType::Number: {
      advance();
      auto node = std::make_unique<FormulaNode>();
      node->kind = FormulaNode::Kind::Literal;
      node->literal = std::strtod(token.text.c_str(), nullptr);
      node->span = Span{token.pos, token.pos + token.text.size()};
      out = std::move(node);
      return true;
    }
    case TokenType::String: {
      advance();
      auto node = std::make_unique<FormulaNode>();
      node->kind = FormulaNode::Kind::Literal;
      node->literal = token.text;
      node->span = Span{token.pos, current_.pos};
      out = std::move(node);
      return true;
    }
    case TokenType::KeywordTrue:
    case TokenType::KeywordFalse: {
      advance();
      auto node = std::make_unique<FormulaNode>();
      node->kind = FormulaNode::Kind::Literal;
      node->literal = token.type == TokenType::KeywordTrue;
      node->span = Span{token.pos, token.pos + token.text.size()};
      out = std::move(node);
      return true;
    }
    case TokenType::LParen: {
      advance();
      std::unique_ptr<FormulaNode> inner;
      if (!parse_comparison(inner)) return false;
      if (!consume(TokenType::RParen, "Expected ) to close expression")) return false;
      out = std::move(inner);
      return true;
    }
    case TokenType::Identifier: {
      advance();
      if (current_.type == TokenType::LParen) {
        return parse_function_call(token, out);
      }
      return parse_reference(token, out);
    }
    case TokenType::End:
      return set_error("Unexpected end of formula", token.pos);
    default:
      return set_error("Unexpected token '" + token.text + "'", token.pos);
  }
}

bool Parser::parse_function_call(const Token& name, std::unique_ptr<FormulaNode>& out) {
  auto node = std::make_unique<FormulaNode>();
  node->kind = FormulaNode::Kind::FunctionCall;
  node->function_name = util::to_upper(name.text);
  advance();
  if (current_.type != TokenType::RParen) {
    while (true) {
      std::unique_ptr<FormulaNode> arg;
      if (!parse_comparison(arg)) return false;
      node->height = std::max(node->height, arg->height + 1);
      node->children.push_back(std::move(arg));
      if (current_.type != TokenType::Comma) break;
      advance();
    }
  }
  size_t end = current_.pos + 1;
  if (!consume(TokenType::RParen, "Expected ) after function arguments")) return false;
  node->span = Span{name.pos, end};
  if (!check_height(*node)) return false;
  out = std::move(node);
  return true;
}

/// Parses a cell reference or an inclusive range ref:ref.
/// Reference text is validated at evaluation time, not here.
bool Parser::parse_reference(const Token& ref, std::unique_ptr<FormulaNode>& out) {
  auto node = std::make_unique<FormulaNode>();
  node->ref = ref.text;
  if (current_.type == TokenType::Colon) {
    advance();
    if (current_.type != TokenType::Identifier) {
      return set_error("Expected cell reference after :");
    }
    node->kind = FormulaNode::Kind::RangeRef;
    node->range_end_ref = current_.text;
    node->span = Span{ref.pos, current_.pos + current_.text.size()};
    advance();
  } else {
    node->kind = FormulaNode::Kind::CellRef;
    node->span = Span{ref.pos, ref.pos + ref.text.size()};
  }
  out = std::move(node);
  return true;
}

std::unique_ptr<FormulaNode> Parser::make_operator_node(const Token& op,
                                                        std::unique_ptr<FormulaNode> left,
                                                        std::unique_ptr<FormulaNode> right) const {
  auto node = std::make_unique<FormulaNode>();
  node->kind = classify_operator(op.text) == OperatorType::Comparison
                   ? FormulaNode::Kind::Comparison
                   : FormulaNode::Kind::Binary;
  node->op = op.text;
  node->span = Span{left->span.start, right->span.end};
  node->height = std::max(left->height, right->height) + 1;
  node->children.push_back(std::move(left));
  node->children.push_back(std::move(right));
  return node;
}

bool Parser::check_height(const FormulaNode& node) {
  if (node.height > kMaxFormulaDepth) {
    return set_error(depth_message(), node.span.start);
  }
  return true;
}

void Parser::advance() {
  current_ = lexer_.next();
  if (current_.type == TokenType::Invalid) {
    set_error(current_.text, current_.pos);
  }
}

bool Parser::consume(TokenType type, const std::string& message) {
  if (has_error_) return false;
  if (current_.type != type) {
    return set_error(message);
  }
  advance();
  return !has_error_;
}

bool Parser::set_error(const std::string& message) {
  return set_error(message, current_.pos);
}

bool Parser::set_error(const std::string& message, size_t position) {
  if (!has_error_) {
    has_error_ = true;
    error_message_ = message;
    error_position_ = position;
  }
  return false;
}

ParseResult parse_formula(const std::string& input) {
  ParseResult result;
  Parser parser(input);
  std::unique_ptr<FormulaNode> root;
  if (!parser.parse(root)) {
    result.error = ParseError{parser.error_message(), parser.error_position()};
    return result;
  }
  FormulaTree tree;
  tree.root = std::move(root);
  tree.source = input;
  result.tree = std::move(tree);
  return result;
}

}  // namespace xlformula
