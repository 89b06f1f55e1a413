#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../lang/ast.h"
#include "result_cache.h"
#include "xlformula/value.h"

namespace xlformula {

/// Outcome of resolving a cell reference to a 0-based column index.
struct ColumnIndexResult {
  size_t index = 0;
  std::optional<FormulaError> error;

  bool ok() const { return !error.has_value(); }
};

/// Evaluates one node kind at a time over operands the driver already evaluated.
/// Holds a read-only row and the caller-owned ResultCache of the current pass.
/// MUST NOT outlive either; one instance per evaluation.
class FormulaEvaluator {
 public:
  FormulaEvaluator(const Row& columns, ResultCache& cache);

  /// Matches "c<digits>" (either case) at the start of ref and returns index - 1.
  /// Indices outside [0, column count) are ColumnIndexOutOfRange.
  ColumnIndexResult resolve_column_index(const std::string& ref) const;
  EvaluationResult resolve_column_value(const std::string& ref) const;
  /// Returns the inclusive slice start..end as a list; empty when end < start.
  EvaluationResult resolve_range(const std::string& start_ref, const std::string& end_ref) const;

  /// Applies + - * / ^ % to numeric operands.
  /// Left errors win over right errors; infinite or NaN results are errors
  /// whose message is the quoted offending value.
  EvaluationResult eval_binary(const std::string& op,
                               const EvaluationResult& left,
                               const EvaluationResult& right) const;
  /// Applies = <> > < >= <= to numeric operands and yields a boolean.
  EvaluationResult eval_comparison(const std::string& op,
                                   const EvaluationResult& left,
                                   const EvaluationResult& right) const;
  /// Applies prefix + or - to a numeric operand.
  EvaluationResult eval_unary(const std::string& op, const EvaluationResult& operand) const;
  /// Applies a named function to argument nodes whose results are cached.
  /// Any std::exception raised inside becomes an InternalFailure result.
  EvaluationResult eval_function(const std::string& name,
                                 const std::vector<const FormulaNode*>& args) const;

  const ResultCache& cache() const { return cache_; }
  ResultCache& cache() { return cache_; }
  size_t column_count() const { return columns_.size(); }

 private:
  /// Collects argument values from the cache.
  /// MUST return an empty list as soon as one argument holds an error.
  std::vector<Value> gather_args(const std::vector<const FormulaNode*>& args) const;
  EvaluationResult apply_function(const std::string& name,
                                  const std::vector<const FormulaNode*>& arg_nodes) const;

  const Row& columns_;
  ResultCache& cache_;
};

}  // namespace xlformula
