#include "render/duckbox_renderer.h"

#include <algorithm>
#include <clocale>
#include <cstring>
#include <cwchar>
#include <sstream>
#include <string>
#include <vector>

#include <sys/ioctl.h>
#include <unistd.h>

namespace sqlc::render {

namespace {

constexpr size_t kFallbackWidth = 120;

size_t detect_terminal_width() {
  struct winsize w {};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
    return static_cast<size_t>(w.ws_col);
  }
  return kFallbackWidth;
}

void ensure_locale() {
  static bool initialized = false;
  if (!initialized) {
    std::setlocale(LC_CTYPE, "");
    initialized = true;
  }
}

/// Decodes the character at ptr and reports its terminal column count.
/// Returns the bytes consumed, or 0 at an embedded NUL. Invalid bytes are one column wide.
size_t next_glyph(const char* ptr, size_t remaining, mbstate_t& state, size_t& columns) {
  wchar_t wc;
  size_t len = std::mbrtowc(&wc, ptr, remaining, &state);
  if (len == static_cast<size_t>(-1) || len == static_cast<size_t>(-2)) {
    std::memset(&state, 0, sizeof(state));
    columns = 1;
    return 1;
  }
  if (len == 0) {
    columns = 0;
    return 0;
  }
  int w = ::wcwidth(wc);
  columns = w < 0 ? 1 : static_cast<size_t>(w);
  return len;
}

size_t display_width(const std::string& value) {
  ensure_locale();
  mbstate_t state{};
  size_t width = 0;
  size_t offset = 0;
  while (offset < value.size()) {
    size_t columns = 0;
    size_t len = next_glyph(value.data() + offset, value.size() - offset, state, columns);
    if (len == 0) break;
    width += columns;
    offset += len;
  }
  return width;
}

std::string sanitize_cell(std::string value) {
  for (char& c : value) {
    if (c == '\n') c = ' ';
    if (c == '\r') c = ' ';
    if (c == '\t') c = ' ';
  }
  return value;
}

/// Cuts value to fit width columns, ending in an ellipsis when anything was dropped.
std::string truncate_with_ellipsis(const std::string& value, size_t width) {
  if (display_width(value) <= width) return value;
  const std::string ellipsis = "…";
  if (width == 0) return "";
  if (width == 1) return ellipsis;
  size_t ellipsis_width = display_width(ellipsis);
  size_t target = width > ellipsis_width ? width - ellipsis_width : 0;
  mbstate_t state{};
  size_t offset = 0;
  size_t used = 0;
  while (offset < value.size()) {
    size_t columns = 0;
    size_t len = next_glyph(value.data() + offset, value.size() - offset, state, columns);
    if (len == 0 || used + columns > target) break;
    offset += len;
    used += columns;
  }
  return value.substr(0, offset) + ellipsis;
}

std::string pad_cell(const std::string& value, size_t width, bool right_align) {
  size_t w = display_width(value);
  if (w >= width) return value;
  size_t pad = width - w;
  if (right_align) {
    return std::string(pad, ' ') + value;
  }
  return value + std::string(pad, ' ');
}

std::string build_separator(const std::vector<size_t>& widths,
                            const std::string& left,
                            const std::string& mid,
                            const std::string& right) {
  std::ostringstream oss;
  oss << left;
  for (size_t i = 0; i < widths.size(); ++i) {
    for (size_t j = 0; j < widths[i] + 2; ++j) {
      oss << "─";
    }
    if (i + 1 < widths.size()) {
      oss << mid;
    }
  }
  oss << right;
  return oss.str();
}

}  // namespace

std::string render_duckbox(const Table& table, const DuckboxOptions& options) {
  size_t max_rows = options.max_rows == 0 ? table.rows.size() : options.max_rows;
  size_t rows_to_render = std::min(table.rows.size(), max_rows);
  size_t max_width = options.max_width == 0 ? detect_terminal_width() : options.max_width;
  if (max_width < 20) max_width = 20;

  std::vector<std::string> headers;
  std::vector<std::string> types;
  headers.reserve(table.columns.size());
  types.reserve(table.columns.size());
  for (const auto& column : table.columns) {
    headers.push_back(sanitize_cell(column.name));
    types.push_back(to_string(column.type));
  }

  std::vector<std::vector<std::string>> table_rows;
  table_rows.reserve(rows_to_render);
  for (size_t i = 0; i < rows_to_render; ++i) {
    std::vector<std::string> cells;
    cells.reserve(headers.size());
    for (const auto& value : table.rows[i].values) {
      cells.push_back(sanitize_cell(value_to_string(value)));
    }
    table_rows.push_back(std::move(cells));
  }

  if (headers.empty()) {
    return "(no columns)";
  }

  std::vector<size_t> widths(headers.size(), 0);
  for (size_t i = 0; i < headers.size(); ++i) {
    widths[i] = std::max(display_width(headers[i]), display_width(types[i]));
  }
  for (const auto& row : table_rows) {
    for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
      widths[i] = std::max(widths[i], display_width(row[i]));
    }
  }
  for (auto& w : widths) {
    w = std::max<size_t>(w, 4);
  }

  auto total_width = [&]() {
    size_t total = 1;
    for (auto w : widths) {
      total += w + 3;
    }
    return total;
  };

  while (total_width() > max_width) {
    size_t idx = 0;
    size_t max_w = 0;
    for (size_t i = 0; i < widths.size(); ++i) {
      if (widths[i] > max_w) {
        max_w = widths[i];
        idx = i;
      }
    }
    if (max_w <= 4) break;
    widths[idx]--;
  }

  bool styled = options.highlight && options.is_tty;
  std::ostringstream oss;
  oss << build_separator(widths, "┌", "┬", "┐") << "\n";
  oss << "│";
  for (size_t i = 0; i < headers.size(); ++i) {
    std::string padded = pad_cell(truncate_with_ellipsis(headers[i], widths[i]), widths[i], false);
    if (styled) {
      padded = "\033[1m" + padded + "\033[0m";
    }
    oss << " " << padded << " │";
  }
  oss << "\n│";
  for (size_t i = 0; i < types.size(); ++i) {
    std::string padded = pad_cell(truncate_with_ellipsis(types[i], widths[i]), widths[i], false);
    if (styled) {
      padded = "\033[2m" + padded + "\033[0m";
    }
    oss << " " << padded << " │";
  }
  oss << "\n";
  oss << build_separator(widths, "├", "┼", "┤") << "\n";

  for (const auto& row : table_rows) {
    oss << "│";
    for (size_t i = 0; i < headers.size(); ++i) {
      const std::string& raw = i < row.size() ? row[i] : std::string();
      std::string cell = truncate_with_ellipsis(raw, widths[i]);
      bool right_align = table.columns[i].type == DataType::Number;
      oss << " " << pad_cell(cell, widths[i], right_align) << " │";
    }
    oss << "\n";
  }

  if (table.rows.size() > rows_to_render) {
    size_t content_width = total_width() >= 4 ? total_width() - 4 : 0;
    std::ostringstream msg;
    msg << "… truncated, showing first " << rows_to_render << " of " << table.rows.size()
        << " rows …";
    std::string text = truncate_with_ellipsis(msg.str(), content_width);
    text = pad_cell(text, content_width, false);
    oss << "│ " << text << " │\n";
  }

  oss << build_separator(widths, "└", "┴", "┘");
  return oss.str();
}

}  // namespace sqlc::render
