#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace sqlc {

/// Enumerates the value types a column or literal can carry.
/// MUST stay in sync with the alternatives of Value.
enum class DataType { Number, String };

/// Holds a single typed cell or literal value.
/// Index 0 is Number, index 1 is String; use value_type() instead of index().
using Value = std::variant<double, std::string>;

/// Describes one column of a table schema.
struct Column {
  std::string name;
  DataType type = DataType::String;
};

/// Represents one record positionally aligned with Table::columns.
struct Row {
  std::vector<Value> values;
};

/// Represents a dataset as named, typed columns and an ordered sequence of rows.
/// MUST keep every row the same width as the column list.
/// Inputs are loader or executor output; consumers treat it as immutable.
struct Table {
  std::vector<Column> columns;
  std::vector<Row> rows;

  /// Returns the index of the first column named col, or nullopt when absent.
  std::optional<size_t> find_column(const std::string& col) const {
    for (size_t i = 0; i < columns.size(); ++i) {
      if (columns[i].name == col) return i;
    }
    return std::nullopt;
  }
};

/// Reports unreadable or malformed delimited input.
class TableLoadError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Returns the type tag of a value.
DataType value_type(const Value& value);
/// Returns the user-facing name of a data type ("Number" or "String").
const char* to_string(DataType type);
/// Formats a value as text; integral numbers print without a fraction or exponent and
/// other numbers use the shortest text that reads back to the same double.
/// MUST be deterministic because string comparisons and exports depend on it.
std::string value_to_string(const Value& value);

/// Parses delimited text whose first line is the header into a typed table.
/// MUST infer Number for a column only when every value parses as numeric.
/// Inputs are text/delimiter; failures throw TableLoadError.
Table parse_table(const std::string& text, char delimiter = ',');
/// Reads a delimited file from disk and parses it with parse_table.
/// MUST throw TableLoadError on IO failures and malformed rows.
/// Inputs are path/delimiter; side effects are file reads.
Table load_table(const std::string& path, char delimiter = ',');

}  // namespace sqlc
