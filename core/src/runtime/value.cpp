#include "xlformula/value.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace xlformula {

Value make_number(double value) {
  Value out;
  out.kind = Value::Kind::Number;
  out.number_value = value;
  return out;
}

Value make_string(std::string value) {
  Value out;
  out.kind = Value::Kind::String;
  out.string_value = std::move(value);
  return out;
}

Value make_boolean(bool value) {
  Value out;
  out.kind = Value::Kind::Boolean;
  out.bool_value = value;
  return out;
}

Value make_list(std::vector<CellValue> values) {
  Value out;
  out.kind = Value::Kind::List;
  out.list_value = std::move(values);
  return out;
}

Value from_cell(const CellValue& cell) {
  if (const auto* number = std::get_if<double>(&cell)) return make_number(*number);
  if (const auto* text = std::get_if<std::string>(&cell)) return make_string(*text);
  return make_boolean(std::get<bool>(cell));
}

EvaluationResult make_ok(Value value) { return EvaluationResult(std::move(value)); }

EvaluationResult make_error(FormulaError error) { return EvaluationResult(std::move(error)); }

EvaluationResult make_error(FormulaError::Kind kind, std::string message) {
  return make_error(FormulaError{kind, std::move(message)});
}

bool is_truthy(const CellValue& value) {
  if (const auto* number = std::get_if<double>(&value)) {
    return *number != 0.0 && !std::isnan(*number);
  }
  if (const auto* text = std::get_if<std::string>(&value)) return !text->empty();
  return std::get<bool>(value);
}

bool is_truthy(const Value& value) {
  switch (value.kind) {
    case Value::Kind::Number:
      return value.number_value != 0.0 && !std::isnan(value.number_value);
    case Value::Kind::String:
      return !value.string_value.empty();
    case Value::Kind::Boolean:
      return value.bool_value;
    case Value::Kind::List:
      return true;
  }
  return false;
}

std::string format_number(double value) {
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
  if (value == 0.0) return "0";
  char buffer[32];
  if (std::fabs(value) < 1e15 && std::floor(value) == value) {
    std::snprintf(buffer, sizeof(buffer), "%.0f", value);
    return buffer;
  }
  // Shortest precision that survives a round trip.
  for (int precision = 1; precision <= 17; ++precision) {
    std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
    if (std::strtod(buffer, nullptr) == value) break;
  }
  return buffer;
}

std::string format_cell(const CellValue& value) {
  if (const auto* number = std::get_if<double>(&value)) return format_number(*number);
  if (const auto* text = std::get_if<std::string>(&value)) return *text;
  return std::get<bool>(value) ? "TRUE" : "FALSE";
}

std::string format_value(const Value& value) {
  switch (value.kind) {
    case Value::Kind::Number:
      return format_number(value.number_value);
    case Value::Kind::String:
      return value.string_value;
    case Value::Kind::Boolean:
      return value.bool_value ? "TRUE" : "FALSE";
    case Value::Kind::List: {
      std::string out = "{";
      for (size_t i = 0; i < value.list_value.size(); ++i) {
        if (i > 0) out += ",";
        out += format_cell(value.list_value[i]);
      }
      out += "}";
      return out;
    }
  }
  return "";
}

std::string error_kind_name(FormulaError::Kind kind) {
  switch (kind) {
    case FormulaError::Kind::InvalidReference:
      return "InvalidReference";
    case FormulaError::Kind::ColumnIndexOutOfRange:
      return "ColumnIndexOutOfRange";
    case FormulaError::Kind::ArithmeticInvalid:
      return "ArithmeticInvalid";
    case FormulaError::Kind::ArityError:
      return "ArityError";
    case FormulaError::Kind::Unimplemented:
      return "Unimplemented";
    case FormulaError::Kind::InternalFailure:
      return "InternalFailure";
  }
  return "InternalFailure";
}

bool operator==(const Value& lhs, const Value& rhs) {
  if (lhs.kind != rhs.kind) return false;
  switch (lhs.kind) {
    case Value::Kind::Number:
      return lhs.number_value == rhs.number_value;
    case Value::Kind::String:
      return lhs.string_value == rhs.string_value;
    case Value::Kind::Boolean:
      return lhs.bool_value == rhs.bool_value;
    case Value::Kind::List:
      return lhs.list_value == rhs.list_value;
  }
  return false;
}

bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

}  // namespace xlformula
