#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace xlformula::cli {

/// One formula with its 1-based position in the source it came from.
struct FormulaStatement {
  std::string text;
  size_t line = 1;
  size_t column = 1;
};

struct ScriptRunOptions {
  bool continue_on_error = false;
};

using FormulaCollector = std::function<void(const FormulaStatement&)>;

/// Splits a formula file into one statement per non-empty line.
/// MUST skip blank lines and lines whose first non-space character is '#'.
std::vector<FormulaStatement> split_formula_script(const std::string& script);
std::vector<FormulaStatement> statements_from_formulas(const std::vector<std::string>& formulas);
/// Parses each statement and hands valid ones to the collector in order.
/// MUST stop on first error unless continue_on_error is enabled.
int run_formula_script(const std::vector<FormulaStatement>& statements,
                       const ScriptRunOptions& options,
                       const FormulaCollector& collect,
                       std::ostream& err);

}  // namespace xlformula::cli
