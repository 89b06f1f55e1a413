#include "test_harness.h"
#include "test_utils.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "formula_parser.h"
#include "runtime/formula_evaluator.h"
#include "runtime/result_cache.h"
#include "runtime/traversal.h"

using xlformula::CellValue;
using xlformula::EvaluationResult;
using xlformula::FormulaError;
using xlformula::FormulaEvaluator;
using xlformula::ResultCache;
using xlformula::Row;

namespace {

const Row kFiveColumns = {1.0, 2.0, std::string("three"), true, 5.0};

void test_binary_arithmetic_operators() {
  Row row;
  ResultCache cache;
  FormulaEvaluator evaluator(row, cache);
  expect_true(is_number(evaluator.eval_binary("+", ok_number(7), ok_number(3)), 10), "7 + 3");
  expect_true(is_number(evaluator.eval_binary("-", ok_number(7), ok_number(3)), 4), "7 - 3");
  expect_true(is_number(evaluator.eval_binary("*", ok_number(7), ok_number(3)), 21), "7 * 3");
  expect_true(is_number(evaluator.eval_binary("/", ok_number(7), ok_number(2)), 3.5), "7 / 2");
  expect_true(is_number(evaluator.eval_binary("^", ok_number(2), ok_number(10)), 1024), "2 ^ 10");
  expect_true(is_number(evaluator.eval_binary("%", ok_number(7), ok_number(3)), 1), "7 % 3");
  expect_true(is_number(evaluator.eval_binary("%", ok_number(-7), ok_number(3)), -1),
              "remainder keeps the dividend sign");
}

void test_binary_non_finite_results() {
  Row row;
  ResultCache cache;
  FormulaEvaluator evaluator(row, cache);
  EvaluationResult div_zero = evaluator.eval_binary("/", ok_number(4), ok_number(0));
  expect_true(is_error(div_zero, FormulaError::Kind::ArithmeticInvalid, "'Infinity'"),
              "4/0 is an error embedding Infinity: " + describe(div_zero));
  expect_true(is_error(evaluator.eval_binary("/", ok_number(-4), ok_number(0)),
                       FormulaError::Kind::ArithmeticInvalid, "'-Infinity'"),
              "-4/0 is an error embedding -Infinity");
  expect_true(is_error(evaluator.eval_binary("/", ok_number(0), ok_number(0)),
                       FormulaError::Kind::ArithmeticInvalid, "'NaN'"),
              "0/0 is an error embedding NaN");
  expect_true(is_error(evaluator.eval_binary("%", ok_number(5), ok_number(0)),
                       FormulaError::Kind::ArithmeticInvalid, "'NaN'"),
              "5%0 is an error embedding NaN");
  expect_true(is_error(evaluator.eval_binary("^", ok_number(10), ok_number(400)),
                       FormulaError::Kind::ArithmeticInvalid, "'Infinity'"),
              "overflowing power is an error");
}

void test_binary_unknown_operator() {
  Row row;
  ResultCache cache;
  FormulaEvaluator evaluator(row, cache);
  expect_true(is_error(evaluator.eval_binary("&", ok_number(1), ok_number(2)),
                       FormulaError::Kind::ArithmeticInvalid, "'undefined'"),
              "operator without a result is ArithmeticInvalid");
}

void test_non_numeric_operands_unimplemented() {
  Row row;
  ResultCache cache;
  FormulaEvaluator evaluator(row, cache);
  const EvaluationResult text = xlformula::make_ok(xlformula::make_string("a"));
  const EvaluationResult flag = xlformula::make_ok(xlformula::make_boolean(true));
  const EvaluationResult list = xlformula::make_ok(xlformula::make_list({1.0, 2.0}));
  const std::vector<std::pair<EvaluationResult, EvaluationResult>> pairs = {
      {text, text}, {text, ok_number(1)}, {ok_number(1), flag}, {flag, flag}, {list, ok_number(1)}};
  for (const auto& operands : pairs) {
    expect_true(is_error(evaluator.eval_binary("+", operands.first, operands.second),
                         FormulaError::Kind::Unimplemented, "not implemented"),
                "binary over non-numeric operands is Unimplemented");
    expect_true(is_error(evaluator.eval_comparison("=", operands.first, operands.second),
                         FormulaError::Kind::Unimplemented, "not implemented"),
                "comparison over non-numeric operands is Unimplemented");
  }
}

void test_binary_error_propagation() {
  Row row;
  ResultCache cache;
  FormulaEvaluator evaluator(row, cache);
  const EvaluationResult left_error =
      xlformula::make_error(FormulaError::Kind::InvalidReference, "x");
  const EvaluationResult right_error =
      xlformula::make_error(FormulaError::Kind::ColumnIndexOutOfRange, "y");
  for (const std::string op : {"+", "-", "*", "/", "^", "%", "&"}) {
    expect_true(is_error(evaluator.eval_binary(op, left_error, ok_number(5)),
                         FormulaError::Kind::InvalidReference, "x"),
                "left error returned unchanged for " + op);
  }
  expect_true(is_error(evaluator.eval_binary("+", left_error, right_error),
                       FormulaError::Kind::InvalidReference, "x"),
              "left error wins over right error");
  expect_true(is_error(evaluator.eval_binary("+", ok_number(1), right_error),
                       FormulaError::Kind::ColumnIndexOutOfRange, "y"),
              "right error returned when left is ok");
  expect_true(is_error(evaluator.eval_comparison(">", left_error, right_error),
                       FormulaError::Kind::InvalidReference, "x"),
              "comparison propagates left error first");
}

void test_comparison_operators() {
  Row row;
  ResultCache cache;
  FormulaEvaluator evaluator(row, cache);
  expect_true(is_boolean(evaluator.eval_comparison("=", ok_number(2), ok_number(2)), true), "2 = 2");
  expect_true(is_boolean(evaluator.eval_comparison("<>", ok_number(2), ok_number(2)), false),
              "2 <> 2");
  expect_true(is_boolean(evaluator.eval_comparison(">", ok_number(3), ok_number(2)), true), "3 > 2");
  expect_true(is_boolean(evaluator.eval_comparison("<", ok_number(3), ok_number(2)), false),
              "3 < 2");
  expect_true(is_boolean(evaluator.eval_comparison(">=", ok_number(2), ok_number(2)), true),
              "2 >= 2");
  expect_true(is_boolean(evaluator.eval_comparison("<=", ok_number(3), ok_number(2)), false),
              "3 <= 2");
  expect_true(is_error(evaluator.eval_comparison("==", ok_number(1), ok_number(1)),
                       FormulaError::Kind::Unimplemented, "not implemented"),
              "unknown comparison operator is Unimplemented");
}

void test_unary_operators() {
  Row row;
  ResultCache cache;
  FormulaEvaluator evaluator(row, cache);
  expect_true(is_number(evaluator.eval_unary("-", ok_number(5)), -5), "negation");
  expect_true(is_number(evaluator.eval_unary("+", ok_number(5)), 5), "unary plus");
  expect_true(is_error(evaluator.eval_unary("-", xlformula::make_ok(xlformula::make_string("x"))),
                       FormulaError::Kind::Unimplemented, "not implemented"),
              "negating a string is Unimplemented");
  expect_true(is_error(evaluator.eval_unary("!", ok_number(1)),
                       FormulaError::Kind::Unimplemented, "not implemented"),
              "unknown unary operator is Unimplemented");
  expect_true(is_error(evaluator.eval_unary("-", xlformula::make_error(
                                                     FormulaError::Kind::ArityError, "z")),
                       FormulaError::Kind::ArityError, "z"),
              "unary propagates operand error");
}

void test_resolve_column_index() {
  ResultCache cache;
  FormulaEvaluator evaluator(kFiveColumns, cache);
  auto c3 = evaluator.resolve_column_index("c3");
  expect_true(c3.ok(), "c3 resolves");
  expect_eq(c3.index, 2, "c3 is index 2");
  expect_eq(evaluator.resolve_column_index("C3").index, 2, "upper-case C is accepted");
  expect_eq(evaluator.resolve_column_index("c5").index, 4, "last column resolves");
  expect_eq(evaluator.resolve_column_index("c0003").index, 2, "leading zeros are ignored");
  expect_eq(evaluator.resolve_column_index("c2x").index, 1, "only the leading match counts");

  auto z9 = evaluator.resolve_column_index("z9");
  expect_true(!z9.ok() && z9.error->kind == FormulaError::Kind::InvalidReference &&
                  z9.error->message == "invalid reference",
              "z9 is an invalid reference");
  for (const std::string ref : {"", "c", "1c", "xc1", "$c1"}) {
    auto bad = evaluator.resolve_column_index(ref);
    expect_true(!bad.ok() && bad.error->kind == FormulaError::Kind::InvalidReference,
                "malformed reference rejected: '" + ref + "'");
  }
  for (const std::string ref : {"c99", "c6", "c0", "c99999999999999999999"}) {
    auto out = evaluator.resolve_column_index(ref);
    expect_true(!out.ok() && out.error->kind == FormulaError::Kind::ColumnIndexOutOfRange &&
                    out.error->message == "column index out of range",
                "out of range reference rejected: " + ref);
  }
}

void test_resolve_column_value() {
  ResultCache cache;
  FormulaEvaluator evaluator(kFiveColumns, cache);
  EvaluationResult text = evaluator.resolve_column_value("c3");
  expect_true(text.ok() && text.value().kind == xlformula::Value::Kind::String &&
                  text.value().string_value == "three",
              "c3 yields the string column");
  expect_true(is_boolean(evaluator.resolve_column_value("c4"), true), "c4 yields the boolean");
  expect_true(is_error(evaluator.resolve_column_value("c7"),
                       FormulaError::Kind::ColumnIndexOutOfRange, "column index out of range"),
              "value lookup propagates index error");
}

void test_resolve_range() {
  ResultCache cache;
  FormulaEvaluator evaluator(kFiveColumns, cache);
  EvaluationResult range = evaluator.resolve_range("c2", "c4");
  expect_true(range.ok() && range.value().kind == xlformula::Value::Kind::List, "range is a list");
  expect_eq(range.value().list_value.size(), 3, "range is inclusive");
  expect_true(range.value().list_value[0] == CellValue(2.0), "range starts at c2");
  expect_true(range.value().list_value[2] == CellValue(true), "range ends at c4");

  EvaluationResult reversed = evaluator.resolve_range("c3", "c1");
  expect_true(reversed.ok(), "reversed range is not an error");
  expect_eq(reversed.value().list_value.size(), 0, "reversed range is empty");

  expect_true(is_error(evaluator.resolve_range("c1", "c9"),
                       FormulaError::Kind::ColumnIndexOutOfRange, "column index out of range"),
              "range end out of range");
  expect_true(is_error(evaluator.resolve_range("z1", "c9"),
                       FormulaError::Kind::InvalidReference, "invalid reference"),
              "range start error reported first");
}

void test_traversal_caches_every_node() {
  auto parsed = xlformula::parse_formula("1+2*3");
  expect_true(parsed.tree.has_value(), "formula parses");
  Row row;
  ResultCache cache;
  FormulaEvaluator evaluator(row, cache);
  EvaluationResult result = xlformula::evaluate_tree(*parsed.tree->root, evaluator);
  expect_true(is_number(result, 7), "root result is 7: " + describe(result));
  expect_eq(cache.size(), 5, "every node has a cached result");
  expect_true(cache.contains(parsed.tree->root.get()), "root is cached");
  std::vector<EvaluationResult> ordered = cache.values();
  expect_true(is_number(ordered.front(), 1), "first cached result is the leftmost leaf");
  expect_true(is_number(ordered.back(), 7), "root is cached last");
}

void test_traversal_evaluates_both_if_branches() {
  auto parsed = xlformula::parse_formula("IF(TRUE, 1, 1/0)");
  Row row;
  ResultCache cache;
  FormulaEvaluator evaluator(row, cache);
  EvaluationResult result = xlformula::evaluate_tree(*parsed.tree->root, evaluator);
  expect_true(is_number(result, 1), "taken branch wins: " + describe(result));
  const auto* untaken = parsed.tree->root->children[2].get();
  expect_true(cache.contains(untaken), "untaken branch was still evaluated");
  expect_true(!cache.get(untaken).ok(), "untaken branch error stays in the cache");
}

void test_evaluation_is_idempotent() {
  auto parsed = xlformula::parse_formula("IF(c1>1, SUM(c1:c3), c9)");
  expect_true(parsed.tree.has_value(), "formula parses");
  const std::vector<Row> rows = {{2.0, 3.0, 4.0}, {0.0, 3.0, 4.0}};
  for (const Row& row : rows) {
    ResultCache first_cache;
    FormulaEvaluator first(row, first_cache);
    EvaluationResult a = xlformula::evaluate_tree(*parsed.tree->root, first);
    ResultCache second_cache;
    FormulaEvaluator second(row, second_cache);
    EvaluationResult b = xlformula::evaluate_tree(*parsed.tree->root, second);
    expect_true(same_result(a, b), "same tree and row give the same result: " + describe(a));
  }
}

void test_evaluate_rows_uses_fresh_cache_per_row() {
  const std::vector<Row> rows = {{1.0, 2.0}, {10.0, 20.0}, {std::string("x")}};
  auto results = xlformula::evaluate_rows(rows, "c1+c2");
  expect_eq(results.size(), 3, "one result per row");
  expect_true(is_number(results[0], 3), "first row");
  expect_true(is_number(results[1], 30), "second row");
  expect_true(is_error(results[2], FormulaError::Kind::ColumnIndexOutOfRange,
                       "column index out of range"),
              "short row reports the missing column");
}

void test_facade_rejects_unparseable_formula() {
  expect_throws<std::runtime_error>([] { run_formula("SUM(1,"); },
                                    "parse failure throws from the facade");
  expect_throws<std::invalid_argument>(
      [] { xlformula::evaluate_prepared(nullptr, {}); },
      "null prepared handle is rejected");
}

void test_result_holds_value_or_error() {
  EvaluationResult value = xlformula::make_ok(xlformula::make_number(2));
  expect_true(value.ok(), "make_ok is ok");
  expect_true(value.value().number_value == 2, "value readable");
  expect_throws<std::bad_variant_access>([&]() { (void)value.error(); },
                                         "no error behind a value");

  EvaluationResult error =
      xlformula::make_error(FormulaError::Kind::ArityError, "requires 2 arguments");
  expect_true(!error.ok(), "make_error is not ok");
  expect_eq(error.error().message, "requires 2 arguments", "error readable");
  expect_throws<std::bad_variant_access>([&]() { (void)error.value(); },
                                         "no value behind an error");

  EvaluationResult copied = error;
  copied = value;
  expect_true(copied.ok() && copied.value().number_value == 2,
              "assignment replaces the whole outcome");
  expect_throws<std::bad_variant_access>([&]() { (void)copied.error(); },
                                         "assigned value drops the old error");
}

}  // namespace

void register_evaluator_tests(std::vector<TestCase>& tests) {
  tests.push_back({"binary_arithmetic_operators", test_binary_arithmetic_operators});
  tests.push_back({"binary_non_finite_results", test_binary_non_finite_results});
  tests.push_back({"binary_unknown_operator", test_binary_unknown_operator});
  tests.push_back({"non_numeric_operands_unimplemented", test_non_numeric_operands_unimplemented});
  tests.push_back({"binary_error_propagation", test_binary_error_propagation});
  tests.push_back({"comparison_operators", test_comparison_operators});
  tests.push_back({"unary_operators", test_unary_operators});
  tests.push_back({"resolve_column_index", test_resolve_column_index});
  tests.push_back({"resolve_column_value", test_resolve_column_value});
  tests.push_back({"resolve_range", test_resolve_range});
  tests.push_back({"traversal_caches_every_node", test_traversal_caches_every_node});
  tests.push_back({"traversal_evaluates_both_if_branches",
                   test_traversal_evaluates_both_if_branches});
  tests.push_back({"evaluation_is_idempotent", test_evaluation_is_idempotent});
  tests.push_back({"evaluate_rows_uses_fresh_cache_per_row",
                   test_evaluate_rows_uses_fresh_cache_per_row});
  tests.push_back({"facade_rejects_unparseable_formula", test_facade_rejects_unparseable_formula});
  tests.push_back({"result_holds_value_or_error", test_result_holds_value_or_error});
}
