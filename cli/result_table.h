#pragma once

#include <memory>
#include <string>
#include <vector>

#include "xlformula/row_source.h"
#include "xlformula/xlformula.h"

namespace xlformula::cli {

/// One rendered cell. Numbers keep their double next to the display text.
struct ResultCell {
  enum class Kind { Null, Number, String, Boolean, Error } kind = Kind::Null;
  std::string text;
  double number = 0.0;
};

struct ResultTable {
  std::vector<std::string> columns;
  std::vector<std::vector<ResultCell>> rows;
};

struct FormulaColumn {
  std::string name;
  std::string text;
  std::shared_ptr<const PreparedFormulaHandle> prepared;
};

/// A formula that evaluated to an error on one row.
struct CellWarning {
  size_t row = 0;
  std::string column;
  std::string formula;
  FormulaError error;
};

ResultCell cell_from_value(const CellValue& value);
ResultCell cell_from_result(const EvaluationResult& result);
/// Builds the output table: input columns followed by one column per formula.
/// Short rows are padded with nulls; error results are collected into warnings.
ResultTable evaluate_table(const RowSet& input,
                           const std::vector<FormulaColumn>& formulas,
                           std::vector<CellWarning>& warnings);
/// Renders the table as tab-separated text with a header line.
/// Null cells print as empty fields.
std::string render_plain_table(const ResultTable& table);
/// Renders one warning as "row R, fN: " followed by its evaluation diagnostic.
std::string render_cell_warning(const CellWarning& warning);

}  // namespace xlformula::cli
