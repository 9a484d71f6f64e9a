#include "test_utils.h"

#include <fstream>
#include <sstream>
#include <variant>

#include "test_harness.h"

sqlc::Table students_table() {
  using sqlc::DataType;
  return make_table({{"name", DataType::String},
                     {"age", DataType::Number},
                     {"grade", DataType::String},
                     {"city", DataType::String}},
                    {{std::string("Ann"), 22.0, std::string("A"), std::string("Chicago")},
                     {std::string("Bo"), 19.0, std::string("B"), std::string("New York")},
                     {std::string("Cy"), 22.0, std::string("A"), std::string("Chicago")}});
}

sqlc::Table make_table(const std::vector<sqlc::Column>& columns,
                       const std::vector<std::vector<sqlc::Value>>& rows) {
  sqlc::Table table;
  table.columns = columns;
  for (const auto& values : rows) {
    table.rows.push_back(sqlc::Row{values});
  }
  return table;
}

sqlc::Table run_query(const std::string& query, const sqlc::Table& table) {
  sqlc::QueryOutcome outcome = sqlc::compile_and_run(query, table);
  if (const auto* failure = std::get_if<sqlc::QueryFailure>(&outcome)) {
    expect_true(false, "query failed: " + query + " (" + failure->message + ")");
    return sqlc::Table{};
  }
  return std::get<sqlc::Table>(outcome);
}

sqlc::QueryFailure run_failing_query(const std::string& query, const sqlc::Table& table) {
  sqlc::QueryOutcome outcome = sqlc::compile_and_run(query, table);
  if (const auto* failure = std::get_if<sqlc::QueryFailure>(&outcome)) {
    return *failure;
  }
  expect_true(false, "query unexpectedly succeeded: " + query);
  return sqlc::QueryFailure{};
}

std::vector<std::string> column_names(const sqlc::Table& table) {
  std::vector<std::string> names;
  for (const auto& column : table.columns) {
    names.push_back(column.name);
  }
  return names;
}

std::vector<std::string> column_values(const sqlc::Table& table, const std::string& column) {
  std::vector<std::string> values;
  auto index = table.find_column(column);
  if (!index.has_value()) return values;
  for (const auto& row : table.rows) {
    values.push_back(sqlc::value_to_string(row.values[*index]));
  }
  return values;
}

std::string read_file_to_string(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void write_string_to_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream file(path, std::ios::binary);
  file << content;
}
