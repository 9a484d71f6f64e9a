#include "executor_internal.h"

namespace sqlc::executor_internal {

namespace {

/// Compares strings with default lexicographic ordering.
/// MUST use exact byte comparison for deterministic results.
/// Inputs are strings; outputs are comparison integers.
int compare_string(const std::string& left, const std::string& right) {
  if (left < right) return -1;
  if (left > right) return 1;
  return 0;
}

int compare_number(double left, double right) {
  if (left < right) return -1;
  if (left > right) return 1;
  return 0;
}

}  // namespace

int compare_cells(const Value& left, const Value& right) {
  DataType left_type = value_type(left);
  DataType right_type = value_type(right);
  if (left_type == DataType::Number && right_type == DataType::Number) {
    return compare_number(std::get<double>(left), std::get<double>(right));
  }
  if (left_type == DataType::String && right_type == DataType::String) {
    return compare_string(std::get<std::string>(left), std::get<std::string>(right));
  }
  // WHY: loaded columns are homogeneous; mixed cells only arise from hand-built tables.
  return left_type == DataType::Number ? -1 : 1;
}

}  // namespace sqlc::executor_internal
