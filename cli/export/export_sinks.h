#pragma once

#include <string>

#include "sqlc/table.h"

namespace sqlc::cli {

/// Formats a table as delimited text with a header line.
/// MUST quote fields containing the delimiter, quotes or line breaks.
std::string format_csv(const Table& table, char delimiter = ',');
bool write_csv(const Table& table, const std::string& path, std::string& error);
bool write_parquet(const Table& table, const std::string& path, std::string& error);
/// Writes a table to path, choosing CSV or Parquet from the file extension.
/// MUST reject unknown extensions and MUST report IO failures through error.
/// Inputs are table/path; outputs are success/error; side effects are file writes.
bool export_table(const Table& table, const std::string& path, std::string& error);

}  // namespace sqlc::cli
