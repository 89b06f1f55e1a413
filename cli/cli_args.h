#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace xlformula::cli {

struct CliOptions {
  std::vector<std::string> formulas;
  std::string formula_file;
  std::string input;
  bool header = false;
  bool lint = false;
  std::string lint_format = "text";
  bool color = true;
  bool show_help = false;
  bool show_version = false;
  bool continue_on_error = false;
  bool quiet = false;
};

void print_startup_help(std::ostream& os);
void print_help(std::ostream& os);
/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags and leave a one-line message in error.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace xlformula::cli
