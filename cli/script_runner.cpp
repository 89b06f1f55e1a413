#include "script_runner.h"

#include <stdexcept>

#include "xlformula/diagnostics.h"
#include "formula_parser.h"

namespace xlformula::cli {

namespace {

bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

std::vector<FormulaStatement> split_formula_script(const std::string& script) {
  std::vector<FormulaStatement> out;
  size_t line_start = 0;
  size_t line_number = 1;
  while (line_start <= script.size()) {
    size_t line_end = script.find('\n', line_start);
    if (line_end == std::string::npos) line_end = script.size();
    size_t first = line_start;
    while (first < line_end && is_blank(script[first])) ++first;
    size_t last = line_end;
    while (last > first && is_blank(script[last - 1])) --last;
    if (first < last && script[first] != '#') {
      out.push_back(FormulaStatement{script.substr(first, last - first), line_number,
                                     first - line_start + 1});
    }
    if (line_end == script.size()) break;
    line_start = line_end + 1;
    ++line_number;
  }
  return out;
}

std::vector<FormulaStatement> statements_from_formulas(const std::vector<std::string>& formulas) {
  std::vector<FormulaStatement> out;
  out.reserve(formulas.size());
  for (const auto& formula : formulas) {
    out.push_back(FormulaStatement{formula, 1, 1});
  }
  return out;
}

int run_formula_script(const std::vector<FormulaStatement>& statements,
                       const ScriptRunOptions& options,
                       const FormulaCollector& collect,
                       std::ostream& err) {
  bool had_error = false;
  const size_t total = statements.size();
  for (size_t i = 0; i < total; ++i) {
    const FormulaStatement& statement = statements[i];
    const size_t statement_index = i + 1;

    ParseResult parsed = parse_formula(statement.text);
    if (!parsed.tree.has_value()) {
      const size_t parse_pos = parsed.error.has_value() ? parsed.error->position : 0;
      err << "Error: formula " << statement_index << "/" << total
          << " at line " << statement.line << ", column " << statement.column + parse_pos << "\n";
      const std::string parse_message =
          parsed.error.has_value() ? parsed.error->message : "Formula parse error";
      std::vector<Diagnostic> diagnostics;
      diagnostics.push_back(make_syntax_diagnostic(statement.text, parse_message, parse_pos));
      err << render_diagnostics_text(diagnostics) << "\n";
      had_error = true;
      if (!options.continue_on_error) return 1;
      continue;
    }

    try {
      collect(statement);
    } catch (const std::exception& ex) {
      err << "Error: formula " << statement_index << "/" << total
          << " at line " << statement.line << ", column " << statement.column << "\n";
      std::vector<Diagnostic> diagnostics = diagnose_formula_failure(statement.text, ex.what());
      if (!diagnostics.empty()) {
        err << render_diagnostics_text(diagnostics) << "\n";
      } else {
        err << ex.what() << "\n";
      }
      had_error = true;
      if (!options.continue_on_error) return 1;
    }
  }
  return had_error ? 1 : 0;
}

}  // namespace xlformula::cli
