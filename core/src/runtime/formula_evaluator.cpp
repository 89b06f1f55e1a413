#include "formula_evaluator.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <utility>

#include "../util/string_util.h"

namespace xlformula {

namespace {

constexpr const char* kInvalidReference = "invalid reference";
constexpr const char* kColumnOutOfRange = "column index out of range";
constexpr const char* kNotImplemented = "not implemented";
constexpr const char* kRequiresOneArgument = "requires at least 1 argument";
constexpr const char* kModArity = "too many arguments or not numbers";
constexpr const char* kAbsArity = "too many arguments or not a number";
constexpr const char* kRequiresThreeArguments = "requires 3 arguments";
constexpr const char* kRequiresTwoArguments = "requires 2 arguments";

// Digit runs longer than this cannot name a real column.
constexpr size_t kMaxReferenceDigits = 15;

const std::regex& cell_key_expression() {
  static const std::regex expression("^[cC][0-9]+");
  return expression;
}

std::string quoted_value(double value) { return "'" + format_number(value) + "'"; }

/// Expands list values in place so functions see one flat argument sequence.
std::vector<CellValue> flatten(const std::vector<Value>& args) {
  std::vector<CellValue> out;
  for (const auto& arg : args) {
    switch (arg.kind) {
      case Value::Kind::Number:
        out.emplace_back(arg.number_value);
        break;
      case Value::Kind::String:
        out.emplace_back(arg.string_value);
        break;
      case Value::Kind::Boolean:
        out.emplace_back(arg.bool_value);
        break;
      case Value::Kind::List:
        out.insert(out.end(), arg.list_value.begin(), arg.list_value.end());
        break;
    }
  }
  return out;
}

std::vector<double> numbers_only(const std::vector<CellValue>& values) {
  std::vector<double> out;
  for (const auto& value : values) {
    if (const auto* number = std::get_if<double>(&value)) out.push_back(*number);
  }
  return out;
}

/// Host-style numeric coercion used by ABS.
/// Blank text and empty lists are 0, a one-element list coerces its element,
/// and anything else that is not a number is NaN.
double coerce_to_number(const CellValue& value) {
  if (const auto* number = std::get_if<double>(&value)) return *number;
  if (const auto* flag = std::get_if<bool>(&value)) return *flag ? 1.0 : 0.0;
  const std::string trimmed = util::trim_ws(std::get<std::string>(value));
  if (trimmed.empty()) return 0.0;
  const char* begin = trimmed.c_str();
  char* end = nullptr;
  const double parsed = std::strtod(begin, &end);
  if (end != begin + trimmed.size()) return std::nan("");
  for (char c : trimmed) {
    if (std::isalpha(static_cast<unsigned char>(c)) && c != 'e' && c != 'E') return std::nan("");
  }
  return parsed;
}

double coerce_to_number(const Value& value) {
  switch (value.kind) {
    case Value::Kind::Number:
      return value.number_value;
    case Value::Kind::Boolean:
      return value.bool_value ? 1.0 : 0.0;
    case Value::Kind::String:
      return coerce_to_number(CellValue(value.string_value));
    case Value::Kind::List:
      if (value.list_value.empty()) return 0.0;
      if (value.list_value.size() > 1) return std::nan("");
      // A listed boolean prints as text first, which is not numeric.
      if (std::holds_alternative<bool>(value.list_value[0])) return std::nan("");
      return coerce_to_number(value.list_value[0]);
  }
  return std::nan("");
}

bool is_number(const EvaluationResult& result) {
  return result.ok() && result.value().kind == Value::Kind::Number;
}

}  // namespace

FormulaEvaluator::FormulaEvaluator(const Row& columns, ResultCache& cache)
    : columns_(columns), cache_(cache) {}

ColumnIndexResult FormulaEvaluator::resolve_column_index(const std::string& ref) const {
  ColumnIndexResult out;
  std::smatch match;
  if (!std::regex_search(ref, match, cell_key_expression())) {
    out.error = FormulaError{FormulaError::Kind::InvalidReference, kInvalidReference};
    return out;
  }
  const std::string digits = match.str(0).substr(1);
  size_t first_nonzero = digits.find_first_not_of('0');
  if (first_nonzero == std::string::npos) {
    // c0 names index -1.
    out.error = FormulaError{FormulaError::Kind::ColumnIndexOutOfRange, kColumnOutOfRange};
    return out;
  }
  if (digits.size() - first_nonzero > kMaxReferenceDigits) {
    out.error = FormulaError{FormulaError::Kind::ColumnIndexOutOfRange, kColumnOutOfRange};
    return out;
  }
  size_t one_based = 0;
  for (size_t i = first_nonzero; i < digits.size(); ++i) {
    one_based = one_based * 10 + static_cast<size_t>(digits[i] - '0');
  }
  const size_t index = one_based - 1;
  if (index >= columns_.size()) {
    out.error = FormulaError{FormulaError::Kind::ColumnIndexOutOfRange, kColumnOutOfRange};
    return out;
  }
  out.index = index;
  return out;
}

EvaluationResult FormulaEvaluator::resolve_column_value(const std::string& ref) const {
  ColumnIndexResult resolved = resolve_column_index(ref);
  if (!resolved.ok()) {
    return make_error(*resolved.error);
  }
  return make_ok(from_cell(columns_[resolved.index]));
}

EvaluationResult FormulaEvaluator::resolve_range(const std::string& start_ref,
                                                 const std::string& end_ref) const {
  ColumnIndexResult start = resolve_column_index(start_ref);
  if (!start.ok()) {
    return make_error(*start.error);
  }
  ColumnIndexResult end = resolve_column_index(end_ref);
  if (!end.ok()) {
    return make_error(*end.error);
  }
  std::vector<CellValue> values;
  for (size_t i = start.index; i <= end.index; ++i) {
    values.push_back(columns_[i]);
  }
  return make_ok(make_list(std::move(values)));
}

EvaluationResult FormulaEvaluator::eval_binary(const std::string& op,
                                               const EvaluationResult& left,
                                               const EvaluationResult& right) const {
  if (!left.ok()) return left;
  if (!right.ok()) return right;
  if (!is_number(left) || !is_number(right)) {
    // String and date arithmetic are not supported.
    return make_error(FormulaError::Kind::Unimplemented, kNotImplemented);
  }
  const double a = left.value().number_value;
  const double b = right.value().number_value;
  double value = 0.0;
  if (op == "+") {
    value = a + b;
  } else if (op == "-") {
    value = a - b;
  } else if (op == "*") {
    value = a * b;
  } else if (op == "/") {
    value = a / b;
  } else if (op == "^") {
    value = std::pow(a, b);
  } else if (op == "%") {
    value = std::fmod(a, b);
  } else {
    return make_error(FormulaError::Kind::ArithmeticInvalid, "'undefined'");
  }
  if (std::isinf(value) || std::isnan(value)) {
    return make_error(FormulaError::Kind::ArithmeticInvalid, quoted_value(value));
  }
  return make_ok(make_number(value));
}

EvaluationResult FormulaEvaluator::eval_comparison(const std::string& op,
                                                   const EvaluationResult& left,
                                                   const EvaluationResult& right) const {
  if (!left.ok()) return left;
  if (!right.ok()) return right;
  if (!is_number(left) || !is_number(right)) {
    return make_error(FormulaError::Kind::Unimplemented, kNotImplemented);
  }
  const double a = left.value().number_value;
  const double b = right.value().number_value;
  if (op == "=") return make_ok(make_boolean(a == b));
  if (op == "<>") return make_ok(make_boolean(a != b));
  if (op == ">") return make_ok(make_boolean(a > b));
  if (op == "<") return make_ok(make_boolean(a < b));
  if (op == ">=") return make_ok(make_boolean(a >= b));
  if (op == "<=") return make_ok(make_boolean(a <= b));
  return make_error(FormulaError::Kind::Unimplemented, kNotImplemented);
}

EvaluationResult FormulaEvaluator::eval_unary(const std::string& op,
                                              const EvaluationResult& operand) const {
  if (!operand.ok()) return operand;
  if (!is_number(operand)) {
    return make_error(FormulaError::Kind::Unimplemented, kNotImplemented);
  }
  const double a = operand.value().number_value;
  if (op == "+") return make_ok(make_number(a));
  if (op == "-") return make_ok(make_number(-a));
  return make_error(FormulaError::Kind::Unimplemented, kNotImplemented);
}

EvaluationResult FormulaEvaluator::eval_function(const std::string& name,
                                                 const std::vector<const FormulaNode*>& args) const {
  try {
    return apply_function(util::to_upper(name), args);
  } catch (const std::exception& ex) {
    return make_error(FormulaError::Kind::InternalFailure, ex.what());
  }
}

std::vector<Value> FormulaEvaluator::gather_args(const std::vector<const FormulaNode*>& args) const {
  std::vector<Value> out;
  out.reserve(args.size());
  for (const FormulaNode* node : args) {
    const EvaluationResult& result = cache_.get(node);
    if (!result.ok()) {
      return {};
    }
    out.push_back(result.value());
  }
  return out;
}

EvaluationResult FormulaEvaluator::apply_function(
    const std::string& name, const std::vector<const FormulaNode*>& arg_nodes) const {
  // IF and IFERROR read branch results straight from the cache so an error in
  // the branch that is not taken never reaches the result.
  if (name == "IF") {
    if (arg_nodes.size() != 3) {
      return make_error(FormulaError::Kind::ArityError, kRequiresThreeArguments);
    }
    const EvaluationResult& condition = cache_.get(arg_nodes[0]);
    const EvaluationResult& when_true = cache_.get(arg_nodes[1]);
    const EvaluationResult& when_false = cache_.get(arg_nodes[2]);
    return condition.ok() && is_truthy(condition.value()) ? when_true : when_false;
  }
  if (name == "IFERROR") {
    if (arg_nodes.size() != 2) {
      return make_error(FormulaError::Kind::ArityError, kRequiresTwoArguments);
    }
    const EvaluationResult& tried = cache_.get(arg_nodes[0]);
    const EvaluationResult& fallback = cache_.get(arg_nodes[1]);
    return tried.ok() ? tried : fallback;
  }

  const std::vector<Value> args = gather_args(arg_nodes);
  const std::vector<CellValue> flat = flatten(args);

  if (name == "SUM") {
    double sum = 0.0;
    for (double n : numbers_only(flat)) sum += n;
    return make_ok(make_number(sum));
  }
  if (name == "AVG") {
    const std::vector<double> numbers = numbers_only(flat);
    if (numbers.empty()) {
      return make_error(FormulaError::Kind::ArityError, kRequiresOneArgument);
    }
    double sum = 0.0;
    for (double n : numbers) sum += n;
    return make_ok(make_number(sum / static_cast<double>(numbers.size())));
  }
  if (name == "MOD") {
    const std::vector<double> numbers = numbers_only(flat);
    if (numbers.size() != 2) {
      return make_error(FormulaError::Kind::ArityError, kModArity);
    }
    return make_ok(make_number(std::fmod(numbers[0], numbers[1])));
  }
  if (name == "ABS") {
    // Rejects only when several flattened values arrive and the first
    // unflattened argument is not a number; otherwise the first argument is
    // coerced, so ABS() and ABS("x") yield NaN rather than an error.
    if (flat.size() > 1 && (args.empty() || args[0].kind != Value::Kind::Number)) {
      return make_error(FormulaError::Kind::ArityError, kAbsArity);
    }
    const double operand = args.empty() ? std::nan("") : coerce_to_number(args[0]);
    return make_ok(make_number(std::fabs(operand)));
  }
  if (name == "MIN" || name == "MAX") {
    const std::vector<double> numbers = numbers_only(flat);
    if (numbers.empty()) {
      return make_error(FormulaError::Kind::ArityError, kRequiresOneArgument);
    }
    const double picked = name == "MIN" ? *std::min_element(numbers.begin(), numbers.end())
                                        : *std::max_element(numbers.begin(), numbers.end());
    return make_ok(make_number(picked));
  }
  if (name == "COUNT") {
    return make_ok(make_number(static_cast<double>(flat.size())));
  }
  if (name == "OR") {
    if (flat.empty()) {
      return make_error(FormulaError::Kind::ArityError, kRequiresOneArgument);
    }
    bool any = std::any_of(flat.begin(), flat.end(),
                           [](const CellValue& v) { return is_truthy(v); });
    return make_ok(make_boolean(any));
  }
  if (name == "AND") {
    if (flat.empty()) {
      return make_error(FormulaError::Kind::ArityError, kRequiresOneArgument);
    }
    bool all = std::all_of(flat.begin(), flat.end(),
                           [](const CellValue& v) { return is_truthy(v); });
    return make_ok(make_boolean(all));
  }
  return make_error(FormulaError::Kind::Unimplemented, kNotImplemented);
}

}  // namespace xlformula
