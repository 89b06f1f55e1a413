#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "xlformula/value.h"

namespace xlformula {

struct Span {
  size_t start = 0;
  size_t end = 0;
};

/// Classifies an operator symbol so binary nodes route to arithmetic or comparison.
/// MUST classify "/" as Math even though it is listed twice in the legacy table.
enum class OperatorType { Unsupported, Math, Comparison };

OperatorType classify_operator(const std::string& op);

/// One node of a parsed formula.
/// Node identity (its address) keys the per-evaluation ResultCache, so a
/// tree MUST NOT be copied or moved while an evaluation over it is running.
struct FormulaNode {
  enum class Kind {
    Literal,
    Binary,
    Comparison,
    Unary,
    FunctionCall,
    CellRef,
    RangeRef
  } kind = Kind::Literal;
  CellValue literal = 0.0;
  std::string op;
  std::string function_name;
  std::string ref;
  std::string range_end_ref;
  std::vector<std::unique_ptr<FormulaNode>> children;
  Span span;
  /// Longest path to a leaf, counting this node; leaves are 1.
  size_t height = 1;
};

/// An immutable parsed formula; shared across rows and threads once built.
struct FormulaTree {
  std::unique_ptr<FormulaNode> root;
  std::string source;
};

}  // namespace xlformula
