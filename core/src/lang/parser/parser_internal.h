#pragma once

#include <memory>
#include <string>

#include "../ast.h"
#include "lexer.h"

namespace xlformula {

/// Deepest tree or parser nesting a formula may reach. Evaluation and tree
/// teardown recurse once per level, so this bounds their stack use too.
constexpr size_t kMaxFormulaDepth = 256;

/// Recursive-descent parser over the formula token stream.
/// Records only the first error; every parse_* returns false once it is set.
class Parser {
 public:
  explicit Parser(const std::string& input);

  /// Parses a full formula and requires the input to be exhausted.
  bool parse(std::unique_ptr<FormulaNode>& out);

  const std::string& error_message() const { return error_message_; }
  size_t error_position() const { return error_position_; }

 private:
  bool parse_comparison(std::unique_ptr<FormulaNode>& out);
  bool parse_additive(std::unique_ptr<FormulaNode>& out);
  bool parse_multiplicative(std::unique_ptr<FormulaNode>& out);
  bool parse_power(std::unique_ptr<FormulaNode>& out);
  bool parse_unary(std::unique_ptr<FormulaNode>& out);
  bool parse_primary(std::unique_ptr<FormulaNode>& out);
  bool parse_function_call(const Token& name, std::unique_ptr<FormulaNode>& out);
  bool parse_reference(const Token& ref, std::unique_ptr<FormulaNode>& out);

  /// Wraps two operands into a Binary or Comparison node per classify_operator.
  std::unique_ptr<FormulaNode> make_operator_node(const Token& op,
                                                  std::unique_ptr<FormulaNode> left,
                                                  std::unique_ptr<FormulaNode> right) const;

  /// Records a nesting error when a freshly built node is too tall.
  bool check_height(const FormulaNode& node);

  void advance();
  bool consume(TokenType type, const std::string& message);
  bool set_error(const std::string& message);
  bool set_error(const std::string& message, size_t position);

  const std::string& input_;
  Lexer lexer_;
  Token current_;
  std::string error_message_;
  size_t error_position_ = 0;
  bool has_error_ = false;
  size_t depth_ = 0;
};

}  // namespace xlformula
