#include "xlformula/diagnostics.h"

#include <algorithm>
#include <sstream>
#include <string_view>

#include "../formula_parser.h"
#include "../util/string_util.h"

namespace xlformula {

namespace {

constexpr const char* kGrammarDoc = "docs/formula-grammar.md";
constexpr const char* kFunctionsDoc = "docs/function-reference.md";

DiagnosticSpan span_from_bytes(const std::string& formula, size_t byte_start, size_t byte_end) {
  DiagnosticSpan span;
  const size_t size = formula.size();
  if (size == 0) {
    return span;
  }
  span.byte_start = std::min(byte_start, size - 1);
  span.byte_end = std::min(std::max(byte_end, span.byte_start + 1), size);

  size_t line = 1;
  size_t col = 1;
  for (size_t i = 0; i < span.byte_start; ++i) {
    if (formula[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  span.start_line = line;
  span.start_col = col;

  for (size_t i = span.byte_start; i < span.byte_end; ++i) {
    if (formula[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  span.end_line = line;
  span.end_col = col;
  return span;
}

std::string severity_name(DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::Error:
      return "ERROR";
    case DiagnosticSeverity::Warning:
      return "WARNING";
    case DiagnosticSeverity::Note:
      return "NOTE";
  }
  return "ERROR";
}

std::string json_escape(std::string_view s) {
  std::ostringstream out;
  for (char c : s) {
    switch (c) {
      case '\\':
        out << "\\\\";
        break;
      case '"':
        out << "\\\"";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\r':
        out << "\\r";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        out << c;
        break;
    }
  }
  return out.str();
}

std::string json_span(const DiagnosticSpan& span) {
  std::ostringstream out;
  out << "{"
      << "\"start_line\":" << span.start_line << ","
      << "\"start_col\":" << span.start_col << ","
      << "\"end_line\":" << span.end_line << ","
      << "\"end_col\":" << span.end_col << ","
      << "\"byte_start\":" << span.byte_start << ","
      << "\"byte_end\":" << span.byte_end
      << "}";
  return out.str();
}

/// Renders a single-line code frame with a caret under the span.
/// MUST return an empty string when the span falls outside the line.
std::string render_code_frame(const std::string& formula, const DiagnosticSpan& span) {
  if (formula.empty()) return "";
  size_t line_start = 0;
  size_t current_line = 1;
  while (current_line < span.start_line && line_start < formula.size()) {
    size_t nl = formula.find('\n', line_start);
    if (nl == std::string::npos) break;
    line_start = nl + 1;
    ++current_line;
  }
  size_t line_end = formula.find('\n', line_start);
  if (line_end == std::string::npos) line_end = formula.size();
  std::string line_text = formula.substr(line_start, line_end - line_start);
  if (!line_text.empty() && line_text.back() == '\r') line_text.pop_back();

  const size_t caret_start = span.start_col > 0 ? span.start_col - 1 : 0;
  size_t caret_width = 1;
  if (span.start_line == span.end_line && span.end_col > span.start_col) {
    caret_width = span.end_col - span.start_col;
  }
  if (caret_start > line_text.size()) {
    return "";
  }
  const size_t line_digits = std::to_string(span.start_line).size();

  std::ostringstream out;
  out << " --> line " << span.start_line << ", col " << span.start_col << "\n";
  out << std::string(line_digits, ' ') << " |\n";
  out << span.start_line << " | " << line_text << "\n";
  out << std::string(line_digits, ' ') << " | " << std::string(caret_start, ' ')
      << std::string(caret_width, '^');
  return out.str();
}

void set_syntax_code_help(Diagnostic& d) {
  const std::string upper = util::to_upper(d.message);
  d.code = "XLF-SYN-0001";
  d.help = "Formulas combine numbers, \"strings\", TRUE/FALSE, cell references (c1), "
           "ranges (c1:c3) and function calls with + - * / ^ % and comparisons.";
  d.doc_ref = kGrammarDoc;
  if (upper.find("UNTERMINATED STRING") != std::string::npos) {
    d.code = "XLF-SYN-0002";
    d.help = "Close the string literal with a double quote; write \"\" for a literal quote.";
    return;
  }
  if (upper.find("EXPECTED )") != std::string::npos ||
      upper.find("UNBALANCED )") != std::string::npos) {
    d.code = "XLF-SYN-0003";
    d.help = "Balance the parentheses of the expression or function call.";
    return;
  }
  if (upper.find("UNEXPECTED CHARACTER") != std::string::npos) {
    d.code = "XLF-SYN-0004";
    d.help = "Remove the character; string concatenation and array syntax are not supported.";
    return;
  }
  if (upper.find("EMPTY FORMULA") != std::string::npos) {
    d.code = "XLF-SYN-0005";
    d.help = "Provide an expression after the optional leading '='.";
    return;
  }
  if (upper.find("EXPECTED CELL REFERENCE") != std::string::npos) {
    d.code = "XLF-SYN-0006";
    d.help = "Write ranges as two cell references, for example c1:c4.";
    return;
  }
  if (upper.find("MAXIMUM DEPTH") != std::string::npos) {
    d.code = "XLF-SYN-0007";
    d.help = "Split the formula or use SUM over a range instead of long operator chains.";
    return;
  }
}

void set_evaluation_code_help(Diagnostic& d, FormulaError::Kind kind) {
  d.doc_ref = kFunctionsDoc;
  switch (kind) {
    case FormulaError::Kind::InvalidReference:
      d.code = "XLF-EVAL-0001";
      d.help = "Reference columns as c<number>, for example c1 for the first column.";
      return;
    case FormulaError::Kind::ColumnIndexOutOfRange:
      d.code = "XLF-EVAL-0002";
      d.help = "The referenced column does not exist in the row; check the column count.";
      return;
    case FormulaError::Kind::ArithmeticInvalid:
      d.code = "XLF-EVAL-0003";
      d.help = "The operation produced a non-finite number; check for division by zero.";
      return;
    case FormulaError::Kind::ArityError:
      d.code = "XLF-EVAL-0004";
      d.help = "Check the number and type of the function's arguments.";
      return;
    case FormulaError::Kind::Unimplemented:
      d.code = "XLF-EVAL-0005";
      d.help = "Only numeric operators and SUM, AVG, MOD, ABS, MIN, MAX, COUNT, OR, AND, "
               "IF and IFERROR are supported.";
      return;
    case FormulaError::Kind::InternalFailure:
      d.code = "XLF-EVAL-0006";
      d.help = "An unexpected failure occurred while evaluating a function.";
      return;
  }
}

}  // namespace

Diagnostic make_syntax_diagnostic(const std::string& formula,
                                  const std::string& parser_message,
                                  size_t error_byte) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = parser_message;
  d.span = span_from_bytes(formula, error_byte, error_byte + 1);
  set_syntax_code_help(d);
  d.snippet = render_code_frame(formula, d.span);

  if (d.code == "XLF-SYN-0003") {
    const size_t open = formula.rfind('(', d.span.byte_start);
    if (open != std::string::npos && formula[d.span.byte_start] != ')') {
      DiagnosticRelated related;
      related.message = "parenthesis opened here";
      related.span = span_from_bytes(formula, open, open + 1);
      d.related.push_back(std::move(related));
    }
  }
  return d;
}

Diagnostic make_evaluation_diagnostic(const std::string& formula, const FormulaError& error) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Warning;
  d.message = error.message;
  d.span = span_from_bytes(formula, 0, formula.size());
  set_evaluation_code_help(d, error.kind);
  d.snippet = render_code_frame(formula, d.span);
  return d;
}

std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    out << severity_name(d.severity) << "[" << d.code << "]: " << d.message << "\n";
    if (!d.snippet.empty()) out << d.snippet << "\n";
    for (const auto& related : d.related) {
      out << "note: " << related.message
          << " (line " << related.span.start_line << ", col " << related.span.start_col << ")\n";
    }
    out << "help: " << d.help;
    if (i + 1 < diagnostics.size()) out << "\n\n";
  }
  return out.str();
}

std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  out << "[";
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    if (i != 0) out << ",";
    out << "{";
    out << "\"severity\":\"" << json_escape(severity_name(d.severity)) << "\",";
    out << "\"code\":\"" << json_escape(d.code) << "\",";
    out << "\"message\":\"" << json_escape(d.message) << "\",";
    out << "\"help\":\"" << json_escape(d.help) << "\",";
    out << "\"doc_ref\":\"" << json_escape(d.doc_ref) << "\",";
    out << "\"span\":" << json_span(d.span) << ",";
    out << "\"snippet\":\"" << json_escape(d.snippet) << "\",";
    out << "\"related\":[";
    for (size_t j = 0; j < d.related.size(); ++j) {
      if (j != 0) out << ",";
      const auto& related = d.related[j];
      out << "{";
      out << "\"message\":\"" << json_escape(related.message) << "\",";
      out << "\"span\":" << json_span(related.span);
      out << "}";
    }
    out << "]";
    out << "}";
  }
  out << "]";
  return out.str();
}

bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics) {
  for (const auto& d : diagnostics) {
    if (d.severity == DiagnosticSeverity::Error) return true;
  }
  return false;
}

std::vector<Diagnostic> lint_formula(const std::string& formula) {
  std::vector<Diagnostic> out;
  ParseResult parsed = parse_formula(formula);
  if (!parsed.tree.has_value()) {
    const std::string message = parsed.error.has_value() ? parsed.error->message : "Invalid formula";
    const size_t pos = parsed.error.has_value() ? parsed.error->position : 0;
    out.push_back(make_syntax_diagnostic(formula, message, pos));
  }
  return out;
}

std::vector<Diagnostic> diagnose_formula_failure(const std::string& formula,
                                                 const std::string& error_message) {
  std::vector<Diagnostic> out = lint_formula(formula);
  if (!out.empty() || error_message.empty()) return out;
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = error_message;
  d.span = span_from_bytes(formula, 0, formula.size());
  d.code = "XLF-RUN-0001";
  d.help = "Check the input rows and the formula before retrying.";
  d.doc_ref = kGrammarDoc;
  d.snippet = render_code_frame(formula, d.span);
  out.push_back(std::move(d));
  return out;
}

}  // namespace xlformula
