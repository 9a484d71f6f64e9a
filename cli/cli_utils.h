#pragma once

#include <string>
#include <vector>

#include "sqlc/sqlc.h"

namespace sqlc::cli {

/// Pairs a loaded table with the name FROM clauses use to address it.
struct LoadedInput {
  std::string name;
  std::string path;
  Table table;
};

/// Reads a file into memory for CLI queries that need filesystem input.
/// MUST throw on missing/unreadable files.
/// Inputs are a path; outputs are contents; side effects are file reads/errors.
std::string read_file(const std::string& path);
/// Returns the file name of path without directories or extension.
std::string table_stem(const std::string& path);
/// Picks the input a plan should run against.
/// MUST use the only input when exactly one is loaded and MUST match by name otherwise.
/// Inputs are loaded inputs/table name; outputs are the match or nullptr with error set.
const LoadedInput* select_input(const std::vector<LoadedInput>& inputs,
                                const std::string& table_name,
                                std::string& error);
/// Formats a query failure with its stage label and a caret under the failing position.
/// MUST omit the caret when the failure carries no position.
/// Inputs are query/failure/color flag; outputs are diagnostic text with no side effects.
std::string format_failure(const std::string& query, const QueryFailure& failure, bool color);
/// Applies ANSI coloring to JSON for readability when enabled.
/// MUST NOT alter JSON semantics and MUST be disabled for non-TTY output.
/// Inputs are JSON text and a flag; outputs are colored text with no side effects.
std::string colorize_json(const std::string& input, bool enable);
/// Returns one unique JSON key per column; a repeated name gets `_2`, `_3`, ... appended.
std::vector<std::string> json_keys(const Table& table);
/// Serializes a table as a JSON array of objects keyed by json_keys in column order.
/// MUST emit Number cells as JSON numbers; throws when JSON support is not built in.
std::string build_json(const Table& table);
/// Renders compiler phase views under `== Title ==` headers separated by blank lines.
/// Inputs are views/color flag; outputs are text with no side effects.
std::string render_phases(const std::vector<PhaseView>& views, bool color);
/// Renders a table as tab-separated lines with a header line.
std::string render_plain(const Table& table);

}  // namespace sqlc::cli
