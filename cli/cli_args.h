#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "sqlc/sqlc.h"

namespace sqlc::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// Optional fields stay unset when the flag was not given so config values can fill them.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string query;
  std::string query_file;
  std::vector<std::string> inputs;
  std::optional<std::string> output_mode;
  std::optional<char> delimiter;
  std::optional<size_t> max_rows;
  std::optional<bool> highlight;
  std::optional<bool> color;
  std::string export_path;
  /// Compiler phases to display before running; --explain adds Plan.
  std::vector<sqlc::Phase> show;
  bool show_help = false;
};

/// Prints the brief startup help shown when no arguments are provided.
/// MUST remain user-facing and MUST not throw on stream failures.
/// Inputs are the output stream; side effects are writing help text.
void print_startup_help(std::ostream& os);
/// Prints the full help text for explicit --help.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on unknown flags, missing values and invalid values.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace sqlc::cli
