#pragma once

#include <optional>
#include <string>

namespace sqlc::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
/// Inputs are strings; outputs are lowercase strings with no side effects.
std::string to_lower(const std::string& s);
/// Converts a string to uppercase for keyword matching.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
/// Inputs are strings; outputs are uppercase strings with no side effects.
std::string to_upper(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
/// Inputs are strings; outputs are trimmed strings with no side effects.
std::string trim_ws(const std::string& s);
/// Parses a complete decimal number (optional sign, fraction and exponent).
/// MUST reject partial parses, empty input, inf and nan.
/// Inputs are strings; outputs are optional doubles with no side effects.
std::optional<double> parse_number(const std::string& s);
/// Formats a double the way cells and literals are displayed ("22", "3.5").
/// MUST round-trip through parse_number to the same value.
std::string format_number(double value);

}  // namespace sqlc::util
