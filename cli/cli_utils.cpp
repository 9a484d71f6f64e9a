#include "cli_utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "ui/color.h"

#ifdef SQLC_USE_NLOHMANN_JSON
#include <nlohmann/json.hpp>
#endif

namespace sqlc::cli {

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string table_stem(const std::string& path) {
  return std::filesystem::path(path).stem().string();
}

const LoadedInput* select_input(const std::vector<LoadedInput>& inputs,
                                const std::string& table_name,
                                std::string& error) {
  if (inputs.empty()) {
    error = "No input table loaded (use --input <path>)";
    return nullptr;
  }
  if (inputs.size() == 1) {
    return &inputs.front();
  }
  for (const auto& input : inputs) {
    if (input.name == table_name) return &input;
  }
  std::string loaded;
  for (const auto& input : inputs) {
    if (!loaded.empty()) loaded += ", ";
    loaded += input.name;
  }
  error = "Unknown table: " + table_name + " (loaded: " + loaded + ")";
  return nullptr;
}

/// Formats a failure as a stage-labelled message with an optional caret line.
/// MUST place the caret on the line containing the position for multi-line queries.
/// Inputs are query/failure/color; outputs are text with no side effects.
std::string format_failure(const std::string& query, const QueryFailure& failure, bool color) {
  std::ostringstream oss;
  if (color) oss << kColor.red;
  oss << "Error (" << to_string(failure.stage) << "): ";
  if (color) oss << kColor.reset;
  oss << failure.message;
  if (!failure.position.has_value()) {
    return oss.str();
  }
  size_t pos = std::min(*failure.position, query.size());
  size_t line_start = 0;
  if (pos > 0) {
    size_t newline = query.rfind('\n', pos - 1);
    if (newline != std::string::npos) line_start = newline + 1;
  }
  size_t line_end = query.find('\n', line_start);
  if (line_end == std::string::npos) line_end = query.size();
  std::string line = query.substr(line_start, line_end - line_start);
  std::string pad;
  for (size_t i = line_start; i < pos; ++i) {
    // WHY: tabs keep their width so the caret lines up under the token.
    pad.push_back(query[i] == '\t' ? '\t' : ' ');
  }
  oss << "\n  " << line << "\n  " << pad;
  if (color) oss << kColor.yellow;
  oss << "^";
  if (color) oss << kColor.reset;
  return oss.str();
}

std::string colorize_json(const std::string& input, bool enable) {
  if (!enable) return input;
  std::string out;
  out.reserve(input.size() * 2);
  bool in_string = false;
  bool escape = false;
  for (size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
        out += '"';
        out += kColor.reset;
        continue;
      }
      out += c;
      continue;
    }

    if (c == '"') {
      in_string = true;
      out += kColor.green;
      out += '"';
      continue;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') {
      out += kColor.cyan;
      while (i < input.size() &&
             (std::isdigit(static_cast<unsigned char>(input[i])) || input[i] == '.' || input[i] == '-' ||
              input[i] == 'e' || input[i] == 'E' || input[i] == '+')) {
        out += input[i++];
      }
      --i;
      out += kColor.reset;
      continue;
    }

    if (input.compare(i, 4, "true") == 0 || input.compare(i, 5, "false") == 0) {
      size_t len = input.compare(i, 4, "true") == 0 ? 4 : 5;
      out += kColor.yellow;
      out.append(input, i, len);
      out += kColor.reset;
      i += len - 1;
      continue;
    }

    if (input.compare(i, 4, "null") == 0) {
      out += kColor.magenta;
      out.append(input, i, 4);
      out += kColor.reset;
      i += 3;
      continue;
    }

    if (c == '{' || c == '}' || c == '[' || c == ']' || c == ':' || c == ',') {
      out += kColor.dim;
      out += c;
      out += kColor.reset;
      continue;
    }

    out += c;
  }
  return out;
}

std::vector<std::string> json_keys(const Table& table) {
  std::vector<std::string> keys;
  keys.reserve(table.columns.size());
  for (const auto& column : table.columns) {
    std::string key = column.name;
    // WHY: a repeated projection must not overwrite the earlier value in the object.
    for (int suffix = 2; std::find(keys.begin(), keys.end(), key) != keys.end(); ++suffix) {
      key = column.name + "_" + std::to_string(suffix);
    }
    keys.push_back(std::move(key));
  }
  return keys;
}

std::string build_json(const Table& table) {
#ifdef SQLC_USE_NLOHMANN_JSON
  using nlohmann::ordered_json;
  const std::vector<std::string> keys = json_keys(table);
  ordered_json out = ordered_json::array();
  for (const auto& row : table.rows) {
    ordered_json obj = ordered_json::object();
    for (size_t i = 0; i < table.columns.size(); ++i) {
      const Value& value = row.values[i];
      if (const double* number = std::get_if<double>(&value)) {
        double whole = 0.0;
        if (std::modf(*number, &whole) == 0.0 && std::fabs(*number) < 9.0e15) {
          obj[keys[i]] = static_cast<int64_t>(*number);
        } else {
          obj[keys[i]] = *number;
        }
      } else {
        obj[keys[i]] = std::get<std::string>(value);
      }
    }
    out.push_back(obj);
  }
  return out.dump(2);
#else
  (void)table;
  throw std::runtime_error("JSON output requires nlohmann/json feature");
#endif
}

std::string render_phases(const std::vector<PhaseView>& views, bool color) {
  std::ostringstream oss;
  for (size_t i = 0; i < views.size(); ++i) {
    if (i > 0) oss << "\n";
    const char* title = "Plan";
    switch (views[i].phase) {
      case Phase::Tokens: title = "Tokens"; break;
      case Phase::Ast: title = "AST"; break;
      case Phase::IR: title = "IR"; break;
      case Phase::Plan: title = "Plan"; break;
    }
    if (color) oss << kColor.cyan;
    oss << "== " << title << " ==";
    if (color) oss << kColor.reset;
    oss << "\n" << views[i].text;
  }
  return oss.str();
}

std::string render_plain(const Table& table) {
  std::ostringstream oss;
  for (size_t i = 0; i < table.columns.size(); ++i) {
    if (i > 0) oss << "\t";
    oss << table.columns[i].name;
  }
  oss << "\n";
  for (const auto& row : table.rows) {
    for (size_t i = 0; i < row.values.size(); ++i) {
      if (i > 0) oss << "\t";
      oss << value_to_string(row.values[i]);
    }
    oss << "\n";
  }
  return oss.str();
}

}  // namespace sqlc::cli
