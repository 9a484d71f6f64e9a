#include "sqlc/table.h"

#include "../util/string_util.h"

namespace sqlc {

DataType value_type(const Value& value) {
  return std::holds_alternative<double>(value) ? DataType::Number : DataType::String;
}

const char* to_string(DataType type) {
  switch (type) {
    case DataType::Number: return "Number";
    case DataType::String: return "String";
  }
  return "?";
}

std::string value_to_string(const Value& value) {
  if (const auto* number = std::get_if<double>(&value)) {
    return util::format_number(*number);
  }
  return std::get<std::string>(value);
}

}  // namespace sqlc
