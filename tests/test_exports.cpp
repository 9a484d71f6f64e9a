#include "test_harness.h"
#include "test_utils.h"

#include <filesystem>

#include "export/export_sinks.h"

namespace {

void test_format_csv_students() {
  auto result = run_query("SELECT name, age FROM students WHERE age > 20", students_table());
  std::string expected =
      "name,age\n"
      "Ann,22\n"
      "Cy,22\n";
  expect_str(sqlc::cli::format_csv(result), expected, "csv text");
}

void test_csv_escaping() {
  auto table = make_table({{"col1", sqlc::DataType::String}, {"col2", sqlc::DataType::String}},
                          {{std::string("a,b"), std::string("He said \"hi\"")},
                           {std::string("line1\nline2"), std::string("plain")}});
  auto path = std::filesystem::temp_directory_path() / "sqlc_csv_escape_test.csv";
  std::string error;
  bool ok = sqlc::cli::write_csv(table, path.string(), error);
  expect_true(ok, "csv escaping write ok");
  expect_true(error.empty(), "csv escaping no error");
  std::string content = read_file_to_string(path);
  std::filesystem::remove(path);
  std::string expected =
      "col1,col2\n"
      "\"a,b\",\"He said \"\"hi\"\"\"\n"
      "\"line1\nline2\",plain\n";
  expect_str(content, expected, "csv escaping content");
}

void test_csv_custom_delimiter_quotes_delimiter() {
  auto table = make_table({{"city", sqlc::DataType::String}},
                          {{std::string("a;b")}, {std::string("a,b")}});
  expect_str(sqlc::cli::format_csv(table, ';'), "city\n\"a;b\"\na,b\n", "semicolon quoting");
}

void test_csv_export_round_trips_through_loader() {
  auto result = run_query("SELECT * FROM students ORDER BY name DESC", students_table());
  auto path = std::filesystem::temp_directory_path() / "sqlc_csv_roundtrip_test.csv";
  std::string error;
  bool ok = sqlc::cli::export_table(result, path.string(), error);
  expect_true(ok, "export by extension ok");
  auto loaded = sqlc::load_table(path.string());
  std::filesystem::remove(path);
  expect_eq(loaded.rows.size(), 3, "reloaded rows");
  expect_true(loaded.columns.size() == 4 && loaded.columns[1].type == sqlc::DataType::Number,
              "reloaded age is Number");
  auto cities = column_values(loaded, "city");
  expect_true(cities.size() == 3 && cities[1] == "New York", "reloaded cities");
}

void test_csv_export_keeps_full_precision() {
  auto table = sqlc::parse_table("id\n1234567890123456\n0.1\n");
  expect_str(sqlc::cli::format_csv(table), "id\n1234567890123456\n0.1\n", "no digits lost");
}

void test_export_unknown_extension() {
  std::string error;
  bool ok = sqlc::cli::export_table(students_table(), "out.xlsx", error);
  expect_true(!ok, "unknown extension rejected");
  expect_str(error, "Unsupported export format for out.xlsx (use .csv or .parquet)",
             "unknown extension message");
}

void test_export_open_failure() {
  std::string error;
  bool ok = sqlc::cli::export_table(students_table(), "/nonexistent/sqlc/out.csv", error);
  expect_true(!ok, "unwritable path fails");
  expect_str(error, "Failed to open file for writing: /nonexistent/sqlc/out.csv", "open failure");
}

void test_parquet_export() {
  auto path = std::filesystem::temp_directory_path() / "sqlc_parquet_test.parquet";
  std::string error;
  bool ok = sqlc::cli::export_table(students_table(), path.string(), error);
#ifdef SQLC_USE_ARROW
  expect_true(ok, "parquet export ok");
  expect_true(std::filesystem::exists(path), "parquet file written");
  std::filesystem::remove(path);
#else
  expect_true(!ok, "parquet export unavailable");
  expect_str(error, "Parquet export requires Apache Arrow feature", "parquet unavailable message");
#endif
}

}  // namespace

void register_export_tests(std::vector<TestCase>& tests) {
  tests.push_back({"format_csv_students", test_format_csv_students});
  tests.push_back({"csv_escaping", test_csv_escaping});
  tests.push_back({"csv_custom_delimiter_quotes_delimiter",
                   test_csv_custom_delimiter_quotes_delimiter});
  tests.push_back({"csv_export_round_trips_through_loader",
                   test_csv_export_round_trips_through_loader});
  tests.push_back({"csv_export_keeps_full_precision", test_csv_export_keeps_full_precision});
  tests.push_back({"export_unknown_extension", test_export_unknown_extension});
  tests.push_back({"export_open_failure", test_export_open_failure});
  tests.push_back({"parquet_export", test_parquet_export});
}
