#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include <unistd.h>

#include "cli_args.h"
#include "cli_utils.h"
#include "config.h"
#include "export/export_sinks.h"
#include "render/duckbox_renderer.h"
#include "sqlc/sqlc.h"
#include "ui/color.h"

using namespace sqlc::cli;

namespace {

struct RunSettings {
  std::string output_mode = "duckbox";
  size_t max_rows = 40;
  bool highlight = true;
  bool color = true;
  char delimiter = ',';
};

/// Layers config file values under explicit flags.
/// MUST let every flag given on the command line win over the config file.
RunSettings resolve_settings(const CliSettings& config, const CliOptions& options) {
  RunSettings settings;
  if (config.output_mode) settings.output_mode = *config.output_mode;
  if (config.max_rows) settings.max_rows = *config.max_rows;
  if (config.highlight) settings.highlight = *config.highlight;
  if (config.color) settings.color = *config.color;
  if (config.delimiter) settings.delimiter = *config.delimiter;
  if (options.output_mode) settings.output_mode = *options.output_mode;
  if (options.max_rows) settings.max_rows = *options.max_rows;
  if (options.highlight) settings.highlight = *options.highlight;
  if (options.color) settings.color = *options.color;
  if (options.delimiter) settings.delimiter = *options.delimiter;
  return settings;
}

void print_error(const std::string& message, bool color) {
  if (color) std::cerr << kColor.red;
  std::cerr << "Error: " << message;
  if (color) std::cerr << kColor.reset;
  std::cerr << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string error;
  if (!parse_cli_args(argc, argv, options, error)) {
    std::cerr << error << "\n";
    std::cerr << "Run 'sqlc --help' for usage.\n";
    return 1;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }

  CliSettings config;
  std::string config_path = resolve_config_path();
  if (!load_config(config_path, config, error)) {
    std::cerr << config_path << ": " << error << std::endl;
    return 1;
  }
  RunSettings settings = resolve_settings(config, options);

  if (settings.output_mode != "duckbox" && settings.output_mode != "json" &&
      settings.output_mode != "plain" && settings.output_mode != "csv") {
    std::cerr << "Invalid --mode value (use duckbox|json|plain|csv)\n";
    return 1;
  }
  bool stdout_tty = isatty(fileno(stdout)) != 0;
  bool stderr_tty = isatty(fileno(stderr)) != 0;
  bool color_out = settings.color && stdout_tty;
  bool color_err = settings.color && stderr_tty;

  std::string query;
  try {
    if (!options.query.empty()) {
      query = options.query;
    } else if (!options.query_file.empty()) {
      query = read_file(options.query_file);
    } else {
      std::ostringstream buffer;
      buffer << std::cin.rdbuf();
      query = buffer.str();
    }
  } catch (const std::exception& ex) {
    print_error(ex.what(), color_err);
    return 1;
  }

  if (!options.show.empty()) {
    sqlc::InspectResult inspected = sqlc::inspect_query(query, options.show);
    std::cout << render_phases(inspected.views, color_out);
    if (inspected.failure.has_value()) {
      std::cout << std::flush;
      std::cerr << format_failure(query, *inspected.failure, color_err) << std::endl;
      return 1;
    }
    if (options.inputs.empty()) return 0;
    std::cout << std::endl;
  }

  sqlc::CompileResult compiled = sqlc::compile_query(query);
  if (compiled.failure.has_value()) {
    std::cerr << format_failure(query, *compiled.failure, color_err) << std::endl;
    return 1;
  }
  const sqlc::Plan& plan = *compiled.plan;

  try {
    std::vector<LoadedInput> inputs;
    inputs.reserve(options.inputs.size());
    for (const auto& path : options.inputs) {
      inputs.push_back(LoadedInput{table_stem(path), path, sqlc::load_table(path, settings.delimiter)});
    }
    const LoadedInput* input = select_input(inputs, plan.table, error);
    if (input == nullptr) {
      print_error(error, color_err);
      return 1;
    }

    sqlc::QueryOutcome outcome = sqlc::run_plan(plan, input->table);
    if (const auto* failure = std::get_if<sqlc::QueryFailure>(&outcome)) {
      std::cerr << format_failure(query, *failure, color_err) << std::endl;
      return 1;
    }
    const sqlc::Table& result = std::get<sqlc::Table>(outcome);

    if (settings.output_mode == "duckbox") {
      sqlc::render::DuckboxOptions render_options;
      render_options.max_width = 0;
      render_options.max_rows = settings.max_rows;
      render_options.highlight = settings.highlight;
      render_options.is_tty = color_out;
      std::cout << sqlc::render::render_duckbox(result, render_options) << std::endl;
    } else if (settings.output_mode == "json") {
      std::cout << colorize_json(build_json(result), color_out) << std::endl;
    } else if (settings.output_mode == "csv") {
      std::cout << format_csv(result, settings.delimiter);
    } else {
      std::cout << render_plain(result);
    }

    if (!options.export_path.empty()) {
      if (!export_table(result, options.export_path, error)) {
        print_error(error, color_err);
        return 1;
      }
      std::cerr << "Wrote " << result.rows.size() << " rows to " << options.export_path
                << std::endl;
    }
    return 0;
  } catch (const std::exception& ex) {
    print_error(ex.what(), color_err);
    return 1;
  }
}
