#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "xlformula/diagnostics.h"
#include "xlformula/row_source.h"
#include "xlformula/version.h"
#include "xlformula/xlformula.h"
#include "cli_args.h"
#include "cli_utils.h"
#include "result_table.h"
#include "script_runner.h"
#include "ui/color.h"

using namespace xlformula::cli;

namespace {

xlformula::RowSet load_input(const CliOptions& options) {
  xlformula::CsvOptions csv;
  csv.has_header = options.header;
  if (options.input.empty()) {
    return xlformula::parse_csv_rows(read_stdin(), csv);
  }
  return xlformula::load_rows_from_file(options.input, csv);
}

}  // namespace

/// Entry point that parses CLI options and dispatches to lint or batch evaluation.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  CliOptions options;
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "xlformula " << xlformula::version_string() << std::endl;
    return 0;
  }

  const bool color = options.color && stderr_is_tty();

  std::vector<FormulaStatement> statements;
  if (!options.formula_file.empty()) {
    std::string script;
    try {
      script = read_file(options.formula_file);
    } catch (const std::exception& ex) {
      std::cerr << "Error: " << ex.what() << std::endl;
      return 2;
    }
    if (!is_valid_utf8(script)) {
      std::cerr << "Error: formula file is not valid UTF-8: " << options.formula_file << std::endl;
      return 2;
    }
    statements = split_formula_script(script);
  } else {
    statements = statements_from_formulas(options.formulas);
  }

  try {
    if (options.lint) {
      if (statements.empty()) {
        std::cerr << "Missing formula for --lint (use --lint \"...\" or --formula/--formula-file)\n";
        return 2;
      }
      std::vector<xlformula::Diagnostic> diagnostics;
      const size_t total = statements.size();
      for (size_t i = 0; i < total; ++i) {
        std::vector<xlformula::Diagnostic> formula_diags =
            xlformula::lint_formula(statements[i].text);
        if (total > 1) {
          for (auto& diag : formula_diags) {
            diag.message = "formula " + std::to_string(i + 1) + "/" + std::to_string(total) +
                           ": " + diag.message;
          }
        }
        diagnostics.insert(diagnostics.end(), formula_diags.begin(), formula_diags.end());
      }
      if (options.lint_format == "json") {
        std::cout << xlformula::render_diagnostics_json(diagnostics) << std::endl;
      } else if (diagnostics.empty()) {
        std::cout << "No diagnostics." << std::endl;
      } else {
        std::cout << xlformula::render_diagnostics_text(diagnostics) << std::endl;
      }
      return xlformula::has_error_diagnostics(diagnostics) ? 1 : 0;
    }

    if (statements.empty()) {
      std::cerr << "Missing --formula or --formula-file\n";
      return 2;
    }

    std::vector<FormulaColumn> formulas;
    ScriptRunOptions script_options;
    script_options.continue_on_error = options.continue_on_error;
    const int script_status = run_formula_script(
        statements, script_options,
        [&](const FormulaStatement& statement) {
          const size_t index = static_cast<size_t>(&statement - statements.data()) + 1;
          formulas.push_back(FormulaColumn{"f" + std::to_string(index), statement.text,
                                           xlformula::prepare_formula(statement.text)});
        },
        std::cerr);
    if (formulas.empty() || (script_status != 0 && !options.continue_on_error)) {
      return script_status;
    }

    xlformula::RowSet input;
    try {
      input = load_input(options);
    } catch (const std::exception& ex) {
      if (color) std::cerr << kColor.red;
      std::cerr << "Error: " << ex.what() << std::endl;
      if (color) std::cerr << kColor.reset;
      return 2;
    }

    std::vector<CellWarning> warnings;
    ResultTable table = evaluate_table(input, formulas, warnings);
    if (!options.quiet) {
      for (const auto& warning : warnings) {
        if (color) std::cerr << kColor.yellow;
        std::cerr << "Warning: " << render_cell_warning(warning) << std::endl;
        if (color) std::cerr << kColor.reset;
      }
    }

    std::cout << render_plain_table(table) << std::endl;
    return script_status;
  } catch (const std::exception& ex) {
    if (color) std::cerr << kColor.red;
    std::cerr << "Error: " << ex.what() << std::endl;
    if (color) std::cerr << kColor.reset;
    return 1;
  }
}
