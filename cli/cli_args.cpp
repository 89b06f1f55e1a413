#include "cli_args.h"

#include <string>
#include <utility>

namespace xlformula::cli {

/// Prints the startup help so users see baseline usage without flags.
/// MUST keep examples aligned with current CLI and MUST not throw on stream errors.
void print_startup_help(std::ostream& os) {
  os << "xlformula - spreadsheet formula evaluator\n\n";
  os << "Usage:\n";
  os << "  xlformula --formula <formula> [--formula <formula> ...] [--input <path>]\n";
  os << "  xlformula --formula-file <file> [--input <path>]\n";
  os << "            [--continue-on-error] [--quiet]\n";
  os << "  xlformula --lint \"<formula>\" [--format text|json]\n";
  os << "  xlformula --header\n";
  os << "  xlformula --version\n";
  os << "  xlformula --color=disabled\n\n";
  os << "Notes:\n";
  os << "  - If --input is omitted, CSV rows are read from stdin.\n";
  os << "  - Output is tab-separated: input columns, then one column f1, f2, ... per formula.\n";
  os << "  - Columns are referenced as c1, c2, ... and ranges as c1:c3.\n";
  os << "  - Exit codes: 0=success, 1=parse/runtime error, 2=CLI/IO usage error.\n\n";
  os << "Examples:\n";
  os << "  xlformula --formula \"=SUM(c1:c3)\" --input ./data/sales.csv\n";
  os << "  xlformula --formula \"IF(c2>10, c2*2, 0)\" --formula \"ABS(c1)\" --input ./data/sales.csv\n";
  os << "  xlformula --lint \"SUM(c1,\"\n";
}

/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags.
void print_help(std::ostream& os) {
  os << "Usage: xlformula --formula <formula> [--formula <formula> ...] [--input <path>]\n";
  os << "       xlformula --formula-file <file> [--input <path>]\n";
  os << "                 [--continue-on-error] [--quiet]\n";
  os << "       xlformula --lint \"<formula>\" [--format text|json]\n";
  os << "       xlformula --header\n";
  os << "       xlformula --version\n";
  os << "       xlformula --color=disabled\n";
  os << "If --input is omitted, CSV rows are read from stdin.\n";
  os << "--header treats the first CSV record as column names.\n";
  os << "Output is tab-separated text; formula columns are named f1, f2, ...\n";
  os << "Formula files hold one formula per line; blank lines and # comments are skipped.\n";
  os << "Supported functions: SUM AVG MOD ABS MIN MAX COUNT OR AND IF IFERROR.\n";
  os << "--lint validates syntax without evaluating the formula.\n";
  os << "--format json emits lint diagnostics as a JSON array.\n";
  os << "--quiet suppresses per-cell evaluation warnings.\n";
  os << "Exit codes: 0=success, 1=parse/runtime error, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--formula") {
      if (i + 1 >= argc) {
        error = "Missing value for --formula";
        return false;
      }
      parsed.formulas.push_back(argv[++i]);
    } else if (arg == "--formula-file") {
      if (i + 1 >= argc) {
        error = "Missing value for --formula-file";
        return false;
      }
      parsed.formula_file = argv[++i];
    } else if (arg == "--input") {
      if (i + 1 >= argc) {
        error = "Missing value for --input";
        return false;
      }
      parsed.input = argv[++i];
    } else if (arg == "--header") {
      parsed.header = true;
    } else if (arg == "--lint") {
      parsed.lint = true;
      if (i + 1 < argc) {
        std::string maybe_formula = argv[i + 1];
        // A leading '-' is a flag unless it is a negative number formula.
        if (!maybe_formula.empty() &&
            (maybe_formula[0] != '-' || maybe_formula.size() == 1 ||
             maybe_formula[1] != '-')) {
          parsed.formulas.push_back(maybe_formula);
          ++i;
        }
      }
    } else if (arg == "--format") {
      if (i + 1 >= argc) {
        error = "Missing value for --format";
        return false;
      }
      parsed.lint_format = argv[++i];
    } else if (arg == "--color=disabled") {
      parsed.color = false;
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else if (arg == "--continue-on-error") {
      parsed.continue_on_error = true;
    } else if (arg == "--quiet") {
      parsed.quiet = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (!parsed.formulas.empty() && !parsed.formula_file.empty()) {
    error = "Error: --formula and --formula-file are mutually exclusive";
    return false;
  }
  if (!parsed.lint && parsed.lint_format != "text") {
    error = "--format is only supported with --lint";
    return false;
  }
  if (parsed.lint_format != "text" && parsed.lint_format != "json") {
    error = "Invalid --format value (use text|json)";
    return false;
  }
  options = std::move(parsed);
  return true;
}

}  // namespace xlformula::cli
