#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "xlformula/value.h"

namespace xlformula {

/// Classifies diagnostic urgency for linting and evaluation reporting.
/// MUST remain stable for text/JSON outputs and tests.
enum class DiagnosticSeverity {
  Error,
  Warning,
  Note,
};

/// Describes a source span in both byte offsets and line/column coordinates.
/// MUST use 1-based line/column values; byte offsets are 0-based.
struct DiagnosticSpan {
  size_t start_line = 1;
  size_t start_col = 1;
  size_t end_line = 1;
  size_t end_col = 1;
  size_t byte_start = 0;
  size_t byte_end = 0;
};

struct DiagnosticRelated {
  std::string message;
  DiagnosticSpan span;
};

/// Structured formula diagnostic.
/// MUST include a stable code, actionable help, and a docs pointer.
struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Error;
  std::string code;
  std::string message;
  std::string help;
  std::string doc_ref;
  DiagnosticSpan span;
  std::string snippet;
  std::vector<DiagnosticRelated> related;
};

/// Builds a syntax diagnostic anchored at a byte position.
/// MUST return deterministic code/help/doc mappings for known parser errors.
Diagnostic make_syntax_diagnostic(const std::string& formula,
                                  const std::string& parser_message,
                                  size_t error_byte);
/// Builds a warning for a formula that parsed but evaluated to an error.
/// The code is derived from the error kind.
Diagnostic make_evaluation_diagnostic(const std::string& formula, const FormulaError& error);

/// Renders diagnostics in a human-readable multi-block text format.
/// MUST be deterministic for stable golden tests.
std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics);
/// Renders diagnostics as a stable JSON array for machine consumption.
/// MUST keep key ordering stable across runs.
std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics);
bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics);

/// Parses only (no evaluation) and returns diagnostics.
/// MUST return an empty list for valid formulas.
std::vector<Diagnostic> lint_formula(const std::string& formula);
/// Maps a caught facade error back to structured diagnostics.
/// MUST avoid throwing and return at least one diagnostic for non-empty messages.
std::vector<Diagnostic> diagnose_formula_failure(const std::string& formula,
                                                 const std::string& error_message);

}  // namespace xlformula
