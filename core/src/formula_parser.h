#pragma once

#include <optional>
#include <string>

#include "lang/ast.h"

namespace xlformula {

struct ParseError {
  std::string message;
  size_t position = 0;
};

struct ParseResult {
  std::optional<FormulaTree> tree;
  std::optional<ParseError> error;
};

/// Parses formula text (an optional leading '=' is accepted) into a syntax tree.
/// MUST NOT throw on malformed input; errors carry the byte position.
ParseResult parse_formula(const std::string& input);

}  // namespace xlformula
