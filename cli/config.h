#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace sqlc::cli {

/// Settings read from the config file; unset fields fall back to CLI defaults.
struct CliSettings {
  std::optional<std::string> output_mode;
  std::optional<size_t> max_rows;
  std::optional<bool> highlight;
  std::optional<bool> color;
  std::optional<char> delimiter;
};

/// Resolves the config path from SQLC_CONFIG, XDG_CONFIG_HOME, then HOME.
std::string resolve_config_path();
/// Loads `[section]` / `key = value` settings from a TOML-style file.
/// MUST treat a missing file as empty settings and MUST report the line of invalid values.
/// Inputs are path; outputs are settings/error; side effects are file reads.
bool load_config(const std::string& path, CliSettings& out, std::string& error);

}  // namespace sqlc::cli
