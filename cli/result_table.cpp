#include "result_table.h"

#include <algorithm>
#include <utility>
#include <variant>

#include "xlformula/diagnostics.h"

namespace xlformula::cli {

ResultCell cell_from_value(const CellValue& value) {
  ResultCell cell;
  if (const double* number = std::get_if<double>(&value)) {
    cell.kind = ResultCell::Kind::Number;
    cell.number = *number;
  } else if (std::holds_alternative<bool>(value)) {
    cell.kind = ResultCell::Kind::Boolean;
  } else {
    cell.kind = ResultCell::Kind::String;
  }
  cell.text = format_cell(value);
  return cell;
}

ResultCell cell_from_result(const EvaluationResult& result) {
  ResultCell cell;
  if (!result.ok()) {
    cell.kind = ResultCell::Kind::Error;
    cell.text = "#ERROR: " + result.error().message;
    return cell;
  }
  const Value& value = result.value();
  switch (value.kind) {
    case Value::Kind::Number:
      cell.kind = ResultCell::Kind::Number;
      cell.number = value.number_value;
      break;
    case Value::Kind::Boolean:
      cell.kind = ResultCell::Kind::Boolean;
      break;
    case Value::Kind::String:
    case Value::Kind::List:
      cell.kind = ResultCell::Kind::String;
      break;
  }
  cell.text = format_value(value);
  return cell;
}

ResultTable evaluate_table(const RowSet& input,
                           const std::vector<FormulaColumn>& formulas,
                           std::vector<CellWarning>& warnings) {
  ResultTable table;
  size_t width = input.header.size();
  for (const auto& row : input.rows) {
    width = std::max(width, row.size());
  }
  table.columns.reserve(width + formulas.size());
  for (size_t i = 0; i < width; ++i) {
    if (i < input.header.size() && !input.header[i].empty()) {
      table.columns.push_back(input.header[i]);
    } else {
      table.columns.push_back("c" + std::to_string(i + 1));
    }
  }
  for (const auto& formula : formulas) {
    table.columns.push_back(formula.name);
  }

  table.rows.reserve(input.rows.size());
  for (size_t r = 0; r < input.rows.size(); ++r) {
    const Row& row = input.rows[r];
    std::vector<ResultCell> out;
    out.reserve(table.columns.size());
    for (size_t i = 0; i < width; ++i) {
      out.push_back(i < row.size() ? cell_from_value(row[i]) : ResultCell{});
    }
    for (const auto& formula : formulas) {
      EvaluationResult result = evaluate_prepared(formula.prepared, row);
      if (!result.ok()) {
        warnings.push_back(CellWarning{r + 1, formula.name, formula.text, result.error()});
      }
      out.push_back(cell_from_result(result));
    }
    table.rows.push_back(std::move(out));
  }
  return table;
}

std::string render_plain_table(const ResultTable& table) {
  std::string out;
  for (size_t i = 0; i < table.columns.size(); ++i) {
    if (i > 0) out += '\t';
    out += table.columns[i];
  }
  for (const auto& row : table.rows) {
    out += '\n';
    for (size_t i = 0; i < table.columns.size(); ++i) {
      if (i > 0) out += '\t';
      if (i < row.size() && row[i].kind != ResultCell::Kind::Null) out += row[i].text;
    }
  }
  return out;
}

std::string render_cell_warning(const CellWarning& warning) {
  const Diagnostic diagnostic = make_evaluation_diagnostic(warning.formula, warning.error);
  return "row " + std::to_string(warning.row) + ", " + warning.column + ": " +
         render_diagnostics_text({diagnostic});
}

}  // namespace xlformula::cli
