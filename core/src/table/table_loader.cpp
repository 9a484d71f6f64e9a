#include "sqlc/table.h"

#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../util/string_util.h"

namespace sqlc {

namespace {

struct Record {
  std::vector<std::string> fields;
  size_t line = 0;
  bool blank = false;
};

/// Splits delimited text into records, honoring double-quoted fields.
/// MUST keep delimiters and newlines inside quotes and MUST unescape doubled quotes.
/// Inputs are text/delimiter; outputs are records; unterminated quotes throw.
std::vector<Record> split_records(const std::string& text, char delimiter) {
  std::vector<Record> records;
  Record current;
  current.line = 1;
  std::string field;
  bool in_quotes = false;
  bool at_field_start = true;
  bool record_touched = false;
  bool record_quoted = false;
  size_t line = 1;
  size_t quote_line = 0;

  auto finish_record = [&]() {
    current.fields.push_back(std::move(field));
    field.clear();
    current.blank = current.fields.size() == 1 && !record_quoted &&
                    util::trim_ws(current.fields.front()).empty();
    records.push_back(std::move(current));
    current = Record{};
    current.line = line;
    at_field_start = true;
    record_touched = false;
    record_quoted = false;
  };

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        if (c == '\n') ++line;
        field.push_back(c);
      }
      continue;
    }
    if (c == '"' && at_field_start) {
      in_quotes = true;
      at_field_start = false;
      record_touched = true;
      record_quoted = true;
      quote_line = line;
      continue;
    }
    if (c == delimiter) {
      current.fields.push_back(std::move(field));
      field.clear();
      at_field_start = true;
      record_touched = true;
      continue;
    }
    if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
      continue;
    }
    if (c == '\n') {
      ++line;
      finish_record();
      continue;
    }
    field.push_back(c);
    at_field_start = false;
    record_touched = true;
  }
  if (in_quotes) {
    throw TableLoadError("line " + std::to_string(quote_line) + ": unterminated quoted field");
  }
  if (record_touched) {
    finish_record();
  }
  return records;
}

/// Infers Number only when the column has rows and every value parses as numeric.
DataType infer_type(const std::vector<Record>& rows, size_t column) {
  if (rows.empty()) return DataType::String;
  for (const auto& row : rows) {
    if (!util::parse_number(util::trim_ws(row.fields[column])).has_value()) {
      return DataType::String;
    }
  }
  return DataType::Number;
}

}  // namespace

/// Parses delimited text into a typed table.
/// MUST reject empty input, empty or duplicate header names and ragged rows.
/// Inputs are text/delimiter; outputs are Table; failures throw TableLoadError.
Table parse_table(const std::string& text, char delimiter) {
  std::vector<Record> records = split_records(text, delimiter);
  std::vector<Record> rows;
  std::optional<Record> header;
  for (auto& record : records) {
    if (record.blank) continue;
    if (!header.has_value()) {
      header = std::move(record);
    } else {
      rows.push_back(std::move(record));
    }
  }
  if (!header.has_value()) {
    throw TableLoadError("input has no header row");
  }

  Table table;
  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < header->fields.size(); ++i) {
    std::string name = util::trim_ws(header->fields[i]);
    if (name.empty()) {
      throw TableLoadError("line " + std::to_string(header->line) + ": column " +
                           std::to_string(i + 1) + " has an empty name");
    }
    if (!seen.insert(name).second) {
      throw TableLoadError("line " + std::to_string(header->line) + ": duplicate column name '" +
                           name + "'");
    }
    table.columns.push_back(Column{name, DataType::String});
  }

  for (const auto& row : rows) {
    if (row.fields.size() != table.columns.size()) {
      throw TableLoadError("line " + std::to_string(row.line) + ": expected " +
                           std::to_string(table.columns.size()) + " fields but found " +
                           std::to_string(row.fields.size()));
    }
  }

  for (size_t i = 0; i < table.columns.size(); ++i) {
    table.columns[i].type = infer_type(rows, i);
  }

  table.rows.reserve(rows.size());
  for (const auto& record : rows) {
    Row row;
    row.values.reserve(record.fields.size());
    for (size_t i = 0; i < record.fields.size(); ++i) {
      if (table.columns[i].type == DataType::Number) {
        row.values.emplace_back(*util::parse_number(util::trim_ws(record.fields[i])));
      } else {
        row.values.emplace_back(record.fields[i]);
      }
    }
    table.rows.push_back(std::move(row));
  }
  return table;
}

/// Reads a delimited file and parses it into a table.
/// MUST throw on IO failures and MUST prefix parse errors with the path.
/// Inputs are path/delimiter; outputs are Table with file IO side effects.
Table load_table(const std::string& path, char delimiter) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw TableLoadError("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  std::string text = buffer.str();
  // WHY: spreadsheet exports often start with a UTF-8 byte order mark.
  if (text.rfind("\xEF\xBB\xBF", 0) == 0) {
    text.erase(0, 3);
  }
  try {
    return parse_table(text, delimiter);
  } catch (const TableLoadError& e) {
    throw TableLoadError(path + ": " + e.what());
  }
}

}  // namespace sqlc
