#include "test_harness.h"
#include "test_utils.h"

#include <cmath>
#include <vector>

#include "result_table.h"

using xlformula::cli::CellWarning;
using xlformula::cli::FormulaColumn;
using xlformula::cli::ResultCell;
using xlformula::cli::ResultTable;

namespace {

FormulaColumn column(const std::string& name, const std::string& text) {
  return FormulaColumn{name, text, xlformula::prepare_formula(text)};
}

void test_cell_from_result_kinds() {
  ResultCell number = xlformula::cli::cell_from_result(run_formula("100/4"));
  expect_true(number.kind == ResultCell::Kind::Number && number.number == 25, "number cell");
  expect_eq(number.text, "25", "integral numbers print without a fraction");

  ResultCell flag = xlformula::cli::cell_from_result(run_formula("1<2"));
  expect_true(flag.kind == ResultCell::Kind::Boolean, "boolean cell");
  expect_eq(flag.text, "TRUE", "boolean text");

  ResultCell error = xlformula::cli::cell_from_result(run_formula("1/0"));
  expect_true(error.kind == ResultCell::Kind::Error, "error cell");
  expect_eq(error.text, "#ERROR: 'Infinity'", "error text");

  ResultCell list = xlformula::cli::cell_from_result(run_formula("c1:c2", {1.0, std::string("a")}));
  expect_true(list.kind == ResultCell::Kind::String, "lists render as text");
  expect_eq(list.text, "{1,a}", "list text");

  ResultCell nan = xlformula::cli::cell_from_result(run_formula("MOD(1, 0)"));
  expect_true(nan.kind == ResultCell::Kind::Number && std::isnan(nan.number), "NaN stays a number");
  expect_eq(nan.text, "NaN", "NaN text");
}

void test_evaluate_table_appends_formula_columns() {
  xlformula::RowSet input;
  input.header = {"price", "qty"};
  input.rows = {{2.0, 3.0}, {5.0, 0.0}};
  std::vector<CellWarning> warnings;
  ResultTable table = xlformula::cli::evaluate_table(
      input, {column("f1", "c1*c2"), column("f2", "c1/c2")}, warnings);
  expect_eq(table.columns.size(), 4, "input columns plus formulas");
  expect_eq(table.columns[0], "price", "header name used");
  expect_eq(table.columns[3], "f2", "formula column name");
  expect_eq(table.rows.size(), 2, "one output row per input row");
  expect_eq(table.rows[0][2].text, "6", "first product");
  expect_eq(table.rows[0][3].text, "0.6666666666666666", "shortest round-trip division");
  expect_eq(table.rows[1][3].text, "#ERROR: 'Infinity'", "division by zero cell");
  expect_eq(warnings.size(), 1, "one failing cell");
  expect_eq(warnings[0].row, 2, "warning row is 1-based");
  expect_eq(warnings[0].column, "f2", "warning column");
  expect_true(warnings[0].error.kind == xlformula::FormulaError::Kind::ArithmeticInvalid,
              "warning kind");
  expect_eq(warnings[0].formula, "c1/c2", "warning keeps the formula text");
}

void test_evaluate_table_pads_ragged_rows() {
  xlformula::RowSet input;
  input.rows = {{1.0}, {1.0, 2.0, 3.0}};
  std::vector<CellWarning> warnings;
  ResultTable table = xlformula::cli::evaluate_table(input, {column("f1", "c3")}, warnings);
  expect_eq(table.columns.size(), 4, "widest row decides the input columns");
  expect_eq(table.columns[2], "c3", "generated column name");
  expect_true(table.rows[0][1].kind == ResultCell::Kind::Null, "short row padded with null");
  expect_eq(table.rows[0][3].text, "#ERROR: column index out of range",
            "missing column is an error cell");
  expect_eq(table.rows[1][3].text, "3", "present column evaluates");
  expect_eq(warnings.size(), 1, "one warning");
}

void test_cell_warning_renders_evaluation_diagnostic() {
  CellWarning warning{2, "f2", "c1/c2",
                      xlformula::FormulaError{xlformula::FormulaError::Kind::ArithmeticInvalid,
                                              "'Infinity'"}};
  std::string expected =
      "row 2, f2: WARNING[XLF-EVAL-0003]: 'Infinity'\n"
      " --> line 1, col 1\n"
      "  |\n"
      "1 | c1/c2\n"
      "  | ^^^^^\n"
      "help: The operation produced a non-finite number; check for division by zero.";
  expect_eq(xlformula::cli::render_cell_warning(warning), expected, "warning text");

  xlformula::RowSet input;
  input.rows = {{1.0}};
  std::vector<CellWarning> warnings;
  xlformula::cli::evaluate_table(input, {column("f1", "c9")}, warnings);
  expect_eq(warnings.size(), 1, "missing column warns");
  std::string rendered = xlformula::cli::render_cell_warning(warnings[0]);
  expect_true(rendered.rfind("row 1, f1: WARNING[XLF-EVAL-0002]: column index out of range\n", 0) == 0,
              "table warnings carry their diagnostic code: " + rendered);
  expect_true(rendered.find("1 | c9") != std::string::npos, "formula shown in the frame");
}

void test_render_plain_table_is_tab_separated() {
  ResultTable table;
  table.columns = {"c1", "c2", "f1"};
  ResultCell number;
  number.kind = ResultCell::Kind::Number;
  number.text = "4";
  ResultCell error;
  error.kind = ResultCell::Kind::Error;
  error.text = "#ERROR: 'NaN'";
  table.rows = {{number, ResultCell{}, error}, {number}};
  expect_eq(xlformula::cli::render_plain_table(table),
            "c1\tc2\tf1\n4\t\t#ERROR: 'NaN'\n4\t\t", "null and missing cells are empty");
}

}  // namespace

void register_result_table_tests(std::vector<TestCase>& tests) {
  tests.push_back({"cell_from_result_kinds", test_cell_from_result_kinds});
  tests.push_back({"evaluate_table_appends_formula_columns",
                   test_evaluate_table_appends_formula_columns});
  tests.push_back({"evaluate_table_pads_ragged_rows", test_evaluate_table_pads_ragged_rows});
  tests.push_back({"cell_warning_renders_evaluation_diagnostic",
                   test_cell_warning_renders_evaluation_diagnostic});
  tests.push_back({"render_plain_table_is_tab_separated",
                   test_render_plain_table_is_tab_separated});
}
