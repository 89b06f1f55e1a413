#include "xlformula/row_source.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "../util/string_util.h"

namespace xlformula {

namespace {

struct CsvField {
  std::string text;
  bool quoted = false;
};

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

bool looks_numeric(const std::string& text) {
  if (text.empty()) return false;
  const char* begin = text.c_str();
  char* end = nullptr;
  std::strtod(begin, &end);
  if (end != begin + text.size()) return false;
  // strtod accepts inf/nan/hex spellings that spreadsheets treat as text.
  for (char c : text) {
    if (std::isalpha(static_cast<unsigned char>(c)) && c != 'e' && c != 'E') return false;
  }
  return true;
}

/// Splits CSV text into records of fields.
/// MUST keep delimiters, quotes and newlines inside quoted fields verbatim.
std::vector<std::vector<CsvField>> split_records(const std::string& text, char delimiter) {
  std::vector<std::vector<CsvField>> records;
  std::vector<CsvField> record;
  CsvField field;
  bool in_quotes = false;
  bool field_started = false;
  size_t quote_start = 0;

  auto end_field = [&]() {
    record.push_back(std::move(field));
    field = CsvField{};
    field_started = false;
  };
  auto end_record = [&]() {
    end_field();
    // A lone empty field is a blank line, not a record.
    if (!(record.size() == 1 && record[0].text.empty() && !record[0].quoted)) {
      records.push_back(std::move(record));
    }
    record.clear();
  };

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.text.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.text.push_back(c);
      }
      continue;
    }
    if (c == '"' && !field_started) {
      in_quotes = true;
      field.quoted = true;
      field_started = true;
      quote_start = i;
      continue;
    }
    if (c == delimiter) {
      end_field();
      continue;
    }
    if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
      end_record();
      continue;
    }
    if (c == '\n') {
      end_record();
      continue;
    }
    field.text.push_back(c);
    field_started = true;
  }
  if (in_quotes) {
    throw std::runtime_error("Unterminated quoted CSV field at byte " + std::to_string(quote_start));
  }
  if (field_started || !record.empty()) {
    end_record();
  }
  return records;
}

}  // namespace

CellValue infer_cell(const std::string& text) {
  const std::string trimmed = util::trim_ws(text);
  if (looks_numeric(trimmed)) {
    return std::strtod(trimmed.c_str(), nullptr);
  }
  const std::string upper = util::to_upper(trimmed);
  if (upper == "TRUE") return true;
  if (upper == "FALSE") return false;
  return text;
}

RowSet parse_csv_rows(const std::string& text, const CsvOptions& options) {
  RowSet out;
  std::vector<std::vector<CsvField>> records = split_records(text, options.delimiter);
  size_t first = 0;
  if (options.has_header && !records.empty()) {
    for (const auto& field : records[0]) {
      out.header.push_back(util::trim_ws(field.text));
    }
    first = 1;
  }
  out.rows.reserve(records.size() - first);
  for (size_t r = first; r < records.size(); ++r) {
    Row row;
    row.reserve(records[r].size());
    for (const auto& field : records[r]) {
      if (field.quoted) {
        row.emplace_back(field.text);
      } else {
        row.push_back(infer_cell(field.text));
      }
    }
    out.rows.push_back(std::move(row));
  }
  return out;
}

RowSet load_rows_from_file(const std::string& path, const CsvOptions& options) {
  return parse_csv_rows(read_file(path), options);
}

}  // namespace xlformula
