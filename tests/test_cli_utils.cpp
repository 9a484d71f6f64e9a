#include "test_harness.h"
#include "test_utils.h"

#include <stdexcept>

#include "cli_args.h"
#include "cli_utils.h"

namespace {

bool parse_args(const std::vector<std::string>& args, sqlc::cli::CliOptions& options,
                std::string& error) {
  std::vector<std::string> storage = {"sqlc"};
  storage.insert(storage.end(), args.begin(), args.end());
  std::vector<char*> argv;
  for (auto& arg : storage) {
    argv.push_back(arg.data());
  }
  return sqlc::cli::parse_cli_args(static_cast<int>(argv.size()), argv.data(), options, error);
}

void test_table_stem() {
  expect_str(sqlc::cli::table_stem("data/students.csv"), "students", "stem strips dirs and ext");
  expect_str(sqlc::cli::table_stem("people"), "people", "stem without extension");
}

void test_select_input_single_ignores_name() {
  std::vector<sqlc::cli::LoadedInput> inputs;
  inputs.push_back({"students", "students.csv", students_table()});
  std::string error;
  const auto* input = sqlc::cli::select_input(inputs, "anything", error);
  expect_true(input != nullptr && input->name == "students", "single input always used");
}

void test_select_input_by_name() {
  std::vector<sqlc::cli::LoadedInput> inputs;
  inputs.push_back({"students", "students.csv", students_table()});
  inputs.push_back({"courses", "courses.csv", sqlc::Table{}});
  std::string error;
  const auto* input = sqlc::cli::select_input(inputs, "courses", error);
  expect_true(input != nullptr && input->name == "courses", "matched by stem");
  const auto* missing = sqlc::cli::select_input(inputs, "rooms", error);
  expect_true(missing == nullptr, "unknown table rejected");
  expect_str(error, "Unknown table: rooms (loaded: students, courses)", "unknown table message");
}

void test_select_input_none_loaded() {
  std::vector<sqlc::cli::LoadedInput> inputs;
  std::string error;
  expect_true(sqlc::cli::select_input(inputs, "students", error) == nullptr, "no inputs");
  expect_true(!error.empty(), "no inputs message");
}

void test_format_failure_caret() {
  const std::string query = "SELECT FROM students";
  auto compiled = sqlc::compile_query(query);
  expect_true(compiled.failure.has_value(), "query fails");
  if (!compiled.failure.has_value()) return;
  std::string expected =
      "Error (parse): Expected identifier or '*' but found 'FROM'\n"
      "  SELECT FROM students\n"
      "         ^";
  expect_str(sqlc::cli::format_failure(query, *compiled.failure, false), expected, "caret output");
}

void test_format_failure_multiline() {
  const std::string query = "SELECT name\nFROM t WHERE x = 'a";
  auto compiled = sqlc::compile_query(query);
  expect_true(compiled.failure.has_value(), "query fails");
  if (!compiled.failure.has_value()) return;
  std::string expected =
      "Error (lex): Unterminated string literal\n"
      "  FROM t WHERE x = 'a\n"
      "                   ^";
  expect_str(sqlc::cli::format_failure(query, *compiled.failure, false), expected,
             "caret on failing line");
}

void test_format_failure_without_position() {
  sqlc::QueryFailure failure{sqlc::QueryFailure::Stage::Exec, "Unknown column: x", std::nullopt};
  expect_str(sqlc::cli::format_failure("SELECT x FROM t", failure, false),
             "Error (exec): Unknown column: x", "exec failure has no caret");
  std::string colored = sqlc::cli::format_failure("SELECT x FROM t", failure, true);
  expect_true(colored.find("\033[31m") == 0, "colored label");
}

void test_render_plain() {
  auto result = run_query("SELECT name, age FROM students WHERE grade = 'B'", students_table());
  expect_str(sqlc::cli::render_plain(result), "name\tage\nBo\t19\n", "plain output");
}

void test_build_json() {
  auto result = run_query("SELECT name, age FROM students WHERE age < 20", students_table());
#ifdef SQLC_USE_NLOHMANN_JSON
  std::string expected =
      "[\n"
      "  {\n"
      "    \"name\": \"Bo\",\n"
      "    \"age\": 19\n"
      "  }\n"
      "]";
  expect_str(sqlc::cli::build_json(result), expected, "json keeps column order");
#else
  bool threw = false;
  try {
    sqlc::cli::build_json(result);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  expect_true(threw, "json unavailable without nlohmann/json");
#endif
}

void test_json_keys_keep_repeated_columns() {
  auto result = run_query("SELECT city, name, city FROM students WHERE name = 'Bo'",
                          students_table());
  auto keys = sqlc::cli::json_keys(result);
  expect_eq(keys.size(), 3, "one key per column");
  if (keys.size() == 3) {
    expect_true(keys[0] == "city" && keys[1] == "name" && keys[2] == "city_2", "repeat suffixed");
  }
  auto clash = make_table({{"a", sqlc::DataType::String}, {"a_2", sqlc::DataType::String},
                           {"a", sqlc::DataType::String}},
                          {});
  auto clash_keys = sqlc::cli::json_keys(clash);
  expect_true(clash_keys.size() == 3 && clash_keys[2] == "a_3", "suffix skips taken names");
#ifdef SQLC_USE_NLOHMANN_JSON
  std::string expected =
      "[\n"
      "  {\n"
      "    \"city\": \"New York\",\n"
      "    \"name\": \"Bo\",\n"
      "    \"city_2\": \"New York\"\n"
      "  }\n"
      "]";
  expect_str(sqlc::cli::build_json(result), expected, "json keeps all three values");
#endif
}

void test_colorize_json_disabled() {
  std::string json = "[{\"a\": 1}]";
  expect_str(sqlc::cli::colorize_json(json, false), json, "colorize disabled is identity");
  expect_true(sqlc::cli::colorize_json(json, true) != json, "colorize enabled adds codes");
}

void test_parse_cli_args_flags() {
  sqlc::cli::CliOptions options;
  std::string error;
  bool ok = parse_args({"--query", "SELECT * FROM t", "--input", "a.csv", "--input", "b.csv",
                        "--mode", "json", "--delimiter", "\\t", "--max-rows", "5", "--explain",
                        "--highlight", "off", "--color=disabled", "--export", "out.csv"},
                       options, error);
  expect_true(ok, "flags parse");
  expect_str(options.query, "SELECT * FROM t", "query flag");
  expect_eq(options.inputs.size(), 2, "repeatable input");
  expect_true(options.output_mode == std::optional<std::string>("json"), "mode flag");
  expect_true(options.delimiter == std::optional<char>('\t'), "tab delimiter");
  expect_true(options.max_rows == std::optional<size_t>(5), "max rows flag");
  expect_true(options.show == std::vector<sqlc::Phase>{sqlc::Phase::Plan}, "explain shows plan");
  expect_true(options.highlight == std::optional<bool>(false), "highlight flag");
  expect_true(options.color == std::optional<bool>(false), "color flag");
  expect_str(options.export_path, "out.csv", "export flag");
}

void test_parse_cli_args_unset_overrides() {
  sqlc::cli::CliOptions options;
  std::string error;
  expect_true(parse_args({"--query", "SELECT a FROM t"}, options, error), "minimal flags");
  expect_true(!options.output_mode.has_value(), "mode unset");
  expect_true(!options.max_rows.has_value(), "max rows unset");
  expect_true(!options.highlight.has_value(), "highlight unset");
}

void test_parse_cli_args_show() {
  sqlc::cli::CliOptions options;
  std::string error;
  expect_true(parse_args({"--show", "ir,tokens", "--explain", "--show", "tokens"}, options, error),
              "show flags parse");
  expect_true(options.show == std::vector<sqlc::Phase>{sqlc::Phase::IR, sqlc::Phase::Tokens,
                                                       sqlc::Phase::Plan},
              "phases deduplicated");
  sqlc::cli::CliOptions all;
  expect_true(parse_args({"--show", "all"}, all, error), "show all parses");
  expect_eq(all.show.size(), 4, "all phases");
  sqlc::cli::CliOptions bad;
  expect_true(!parse_args({"--show", "tokens,bytecode"}, bad, error), "unknown phase");
  expect_str(error, "Invalid --show value: tokens,bytecode (use tokens|ast|ir|plan|all)",
             "show message");
}

void test_render_phases() {
  std::vector<sqlc::PhaseView> views = {{sqlc::Phase::Ast, "Select\n"},
                                        {sqlc::Phase::Plan, "Scan t\n"}};
  expect_str(sqlc::cli::render_phases(views, false), "== AST ==\nSelect\n\n== Plan ==\nScan t\n",
             "phase headers");
  std::string colored = sqlc::cli::render_phases(views, true);
  expect_true(colored.find("\033[36m== AST ==\033[0m") != std::string::npos, "colored header");
  expect_str(sqlc::cli::render_phases({}, false), "", "no views");
}

void test_parse_cli_args_errors() {
  sqlc::cli::CliOptions options;
  std::string error;
  expect_true(!parse_args({"--highlight", "maybe"}, options, error), "bad highlight");
  expect_str(error, "Invalid --highlight value (use on|off)", "highlight message");
  error.clear();
  expect_true(!parse_args({"--query"}, options, error), "missing value");
  expect_str(error, "Missing value for --query", "missing value message");
  error.clear();
  expect_true(!parse_args({"--max-rows", "ten"}, options, error), "bad max rows");
  error.clear();
  expect_true(!parse_args({"--delimiter", "::"}, options, error), "bad delimiter");
  error.clear();
  expect_true(!parse_args({"--bogus"}, options, error), "unknown flag");
  expect_str(error, "Unknown argument: --bogus", "unknown flag message");
}

}  // namespace

void register_cli_utils_tests(std::vector<TestCase>& tests) {
  tests.push_back({"table_stem", test_table_stem});
  tests.push_back({"select_input_single_ignores_name", test_select_input_single_ignores_name});
  tests.push_back({"select_input_by_name", test_select_input_by_name});
  tests.push_back({"select_input_none_loaded", test_select_input_none_loaded});
  tests.push_back({"format_failure_caret", test_format_failure_caret});
  tests.push_back({"format_failure_multiline", test_format_failure_multiline});
  tests.push_back({"format_failure_without_position", test_format_failure_without_position});
  tests.push_back({"render_plain", test_render_plain});
  tests.push_back({"build_json", test_build_json});
  tests.push_back({"json_keys_keep_repeated_columns", test_json_keys_keep_repeated_columns});
  tests.push_back({"colorize_json_disabled", test_colorize_json_disabled});
  tests.push_back({"parse_cli_args_flags", test_parse_cli_args_flags});
  tests.push_back({"parse_cli_args_unset_overrides", test_parse_cli_args_unset_overrides});
  tests.push_back({"parse_cli_args_show", test_parse_cli_args_show});
  tests.push_back({"render_phases", test_render_phases});
  tests.push_back({"parse_cli_args_errors", test_parse_cli_args_errors});
}
