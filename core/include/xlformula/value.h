#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace xlformula {

/// A single column value as it arrives from the host row.
/// MUST stay limited to number, string and boolean.
using CellValue = std::variant<double, std::string, bool>;

/// An ordered row of column values; index 0 is referenced as c1.
using Row = std::vector<CellValue>;

/// Value produced by evaluating one node.
/// Lists only come from range references and are flattened by functions.
struct Value {
  enum class Kind { Number, String, Boolean, List } kind = Kind::Number;
  double number_value = 0.0;
  std::string string_value;
  bool bool_value = false;
  std::vector<CellValue> list_value;
};

/// Classified evaluation failure carried as data through the tree.
/// MUST keep messages stable because hosts surface them verbatim.
struct FormulaError {
  enum class Kind {
    InvalidReference,
    ColumnIndexOutOfRange,
    ArithmeticInvalid,
    ArityError,
    Unimplemented,
    InternalFailure
  } kind = Kind::Unimplemented;
  std::string message;
};

/// Outcome of evaluating one node: a value or an error, never both.
/// Only make_ok/make_error construct one, so exactly one side is always set.
/// value() and error() MUST only be read on the matching side; the other
/// throws std::bad_variant_access.
class EvaluationResult {
 public:
  bool ok() const { return std::holds_alternative<Value>(state_); }
  const Value& value() const { return std::get<Value>(state_); }
  const FormulaError& error() const { return std::get<FormulaError>(state_); }

 private:
  explicit EvaluationResult(Value value) : state_(std::move(value)) {}
  explicit EvaluationResult(FormulaError error) : state_(std::move(error)) {}

  friend EvaluationResult make_ok(Value value);
  friend EvaluationResult make_error(FormulaError error);

  std::variant<Value, FormulaError> state_;
};

Value make_number(double value);
Value make_string(std::string value);
Value make_boolean(bool value);
Value make_list(std::vector<CellValue> values);
Value from_cell(const CellValue& cell);

EvaluationResult make_ok(Value value);
EvaluationResult make_error(FormulaError error);
EvaluationResult make_error(FormulaError::Kind kind, std::string message);

/// Spreadsheet truthiness: non-zero numbers, non-empty strings, true, any list.
bool is_truthy(const Value& value);
bool is_truthy(const CellValue& value);

/// Formats a number the way spreadsheet hosts display it.
/// MUST print integral values without a fraction and non-finite values as
/// Infinity, -Infinity or NaN.
std::string format_number(double value);
/// Formats any value for display; lists render as {a,b,c}.
std::string format_value(const Value& value);
std::string format_cell(const CellValue& value);
/// Stable name of an error kind for diagnostics and JSON output.
std::string error_kind_name(FormulaError::Kind kind);

bool operator==(const Value& lhs, const Value& rhs);
bool operator!=(const Value& lhs, const Value& rhs);

}  // namespace xlformula
