#include "config.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "util/string_util.h"

namespace sqlc::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = util::to_lower(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

bool parse_size(const std::string& raw, size_t& out) {
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(raw, &pos);
    if (pos != raw.size()) return false;
    out = static_cast<size_t>(value);
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

std::string parse_string_value(const std::string& raw, bool& ok) {
  std::string trimmed = util::trim_ws(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if ((trimmed.front() == '"' && trimmed.back() == '"') ||
      (trimmed.front() == '\'' && trimmed.back() == '\'')) {
    if (trimmed.size() < 2) {
      ok = false;
      return {};
    }
    ok = true;
    return trimmed.substr(1, trimmed.size() - 2);
  }
  ok = true;
  return trimmed;
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("SQLC_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "sqlc" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "sqlc" / "config.toml").string();
  }
  return "sqlc.config.toml";
}

bool load_config(const std::string& path, CliSettings& out, std::string& error) {
  out = CliSettings{};
  if (path.empty()) return true;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return true;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = util::trim_ws(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = util::trim_ws(trimmed.substr(0, eq));
    std::string value = util::trim_ws(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    bool ok = false;
    if (full_key == "output.mode") {
      std::string parsed = parse_string_value(value, ok);
      if (!ok) {
        error = "Invalid output.mode at line " + std::to_string(line_no);
        return false;
      }
      out.output_mode = parsed;
    } else if (full_key == "output.max_rows") {
      size_t parsed = 0;
      if (!parse_size(value, parsed)) {
        error = "Invalid output.max_rows at line " + std::to_string(line_no);
        return false;
      }
      out.max_rows = parsed;
    } else if (full_key == "output.highlight") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid output.highlight at line " + std::to_string(line_no);
        return false;
      }
      out.highlight = parsed;
    } else if (full_key == "output.color") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid output.color at line " + std::to_string(line_no);
        return false;
      }
      out.color = parsed;
    } else if (full_key == "input.delimiter") {
      std::string parsed = parse_string_value(value, ok);
      if (parsed == "\\t") parsed = "\t";
      if (!ok || parsed.size() != 1) {
        error = "Invalid input.delimiter at line " + std::to_string(line_no) +
                " (expected a single character)";
        return false;
      }
      out.delimiter = parsed[0];
    }
  }
  return true;
}

}  // namespace sqlc::cli
