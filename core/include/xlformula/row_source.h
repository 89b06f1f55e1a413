#pragma once

#include <string>
#include <vector>

#include "xlformula/value.h"

namespace xlformula {

struct CsvOptions {
  char delimiter = ',';
  /// When set, the first record is returned as column names instead of a row.
  bool has_header = false;
};

/// Rows parsed from CSV input plus the optional header names.
struct RowSet {
  std::vector<std::string> header;
  std::vector<Row> rows;
};

/// Parses CSV text into typed rows.
/// Unquoted numeric cells become numbers, TRUE/FALSE become booleans, and
/// everything else (including every quoted cell) stays a string.
/// MUST throw std::runtime_error on an unterminated quoted cell.
RowSet parse_csv_rows(const std::string& text, const CsvOptions& options = {});
/// Loads rows from a CSV file.
/// MUST throw std::runtime_error when the file cannot be read.
RowSet load_rows_from_file(const std::string& path, const CsvOptions& options = {});
/// Types a single unquoted CSV cell.
CellValue infer_cell(const std::string& text);

}  // namespace xlformula
