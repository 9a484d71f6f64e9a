#include "export/export_sinks.h"

#include <fstream>
#include <memory>
#include <vector>

#include "util/string_util.h"

#ifdef SQLC_USE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace sqlc::cli {

namespace {

std::string csv_escape(const std::string& value, char delimiter) {
  bool needs_quotes = false;
  for (char c : value) {
    if (c == delimiter || c == '"' || c == '\n' || c == '\r') {
      needs_quotes = true;
      break;
    }
  }
  if (!needs_quotes) return value;
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char c : value) {
    if (c == '"') {
      out.push_back('"');
      out.push_back('"');
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

std::string extension_of(const std::string& path) {
  size_t slash = path.find_last_of("/\\");
  size_t dot = path.rfind('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
  return util::to_lower(path.substr(dot + 1));
}

#ifdef SQLC_USE_ARROW
arrow::Status build_parquet_table(const Table& table, std::shared_ptr<arrow::Table>& out) {
  std::vector<std::shared_ptr<arrow::Field>> fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;
  fields.reserve(table.columns.size());
  arrays.reserve(table.columns.size());
  for (size_t i = 0; i < table.columns.size(); ++i) {
    const Column& column = table.columns[i];
    std::shared_ptr<arrow::Array> array;
    if (column.type == DataType::Number) {
      arrow::DoubleBuilder builder;
      for (const auto& row : table.rows) {
        ARROW_RETURN_NOT_OK(builder.Append(std::get<double>(row.values[i])));
      }
      ARROW_RETURN_NOT_OK(builder.Finish(&array));
      fields.push_back(arrow::field(column.name, arrow::float64(), false));
    } else {
      arrow::StringBuilder builder;
      for (const auto& row : table.rows) {
        ARROW_RETURN_NOT_OK(builder.Append(value_to_string(row.values[i])));
      }
      ARROW_RETURN_NOT_OK(builder.Finish(&array));
      fields.push_back(arrow::field(column.name, arrow::utf8(), false));
    }
    arrays.push_back(array);
  }
  out = arrow::Table::Make(arrow::schema(fields), arrays);
  return arrow::Status::OK();
}
#endif

}  // namespace

std::string format_csv(const Table& table, char delimiter) {
  std::string out;
  for (size_t i = 0; i < table.columns.size(); ++i) {
    if (i > 0) out.push_back(delimiter);
    out += csv_escape(table.columns[i].name, delimiter);
  }
  out.push_back('\n');
  for (const auto& row : table.rows) {
    for (size_t i = 0; i < row.values.size(); ++i) {
      if (i > 0) out.push_back(delimiter);
      out += csv_escape(value_to_string(row.values[i]), delimiter);
    }
    out.push_back('\n');
  }
  return out;
}

bool write_csv(const Table& table, const std::string& path, std::string& error) {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    error = "Failed to open file for writing: " + path;
    return false;
  }
  out << format_csv(table, ',');
  if (!out) {
    error = "Failed to write file: " + path;
    return false;
  }
  return true;
}

bool write_parquet(const Table& table, const std::string& path, std::string& error) {
  if (table.columns.empty()) {
    error = "Parquet export requires at least one column";
    return false;
  }
#ifdef SQLC_USE_ARROW
  std::shared_ptr<arrow::Table> arrow_table;
  auto st = build_parquet_table(table, arrow_table);
  if (!st.ok()) {
    error = st.ToString();
    return false;
  }
  auto output_res = arrow::io::FileOutputStream::Open(path);
  if (!output_res.ok()) {
    error = output_res.status().ToString();
    return false;
  }
  auto output = *output_res;
  st = parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), output, 1024);
  if (!st.ok()) {
    error = st.ToString();
    return false;
  }
  return true;
#else
  (void)path;
  error = "Parquet export requires Apache Arrow feature";
  return false;
#endif
}

bool export_table(const Table& table, const std::string& path, std::string& error) {
  std::string ext = extension_of(path);
  if (ext == "csv") {
    return write_csv(table, path, error);
  }
  if (ext == "parquet") {
    return write_parquet(table, path, error);
  }
  error = "Unsupported export format for " + path + " (use .csv or .parquet)";
  return false;
}

}  // namespace sqlc::cli
