#pragma once

#include <cstddef>
#include <string>

#include "sqlc/table.h"

namespace sqlc::render {

/// Controls how render_duckbox lays out a table.
/// A zero max_rows renders every row; a zero max_width asks the terminal for its width.
struct DuckboxOptions {
  size_t max_rows = 40;
  size_t max_width = 0;
  bool highlight = true;
  bool is_tty = false;
};

/// Renders a table as a box-drawn grid with a typed header row.
/// MUST right-align Number columns and MUST report truncated rows in a footer.
/// Inputs are table/options; outputs are text with no side effects beyond the terminal width query.
std::string render_duckbox(const Table& table, const DuckboxOptions& options);

}  // namespace sqlc::render
