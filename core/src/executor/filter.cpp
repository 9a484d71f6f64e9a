#include "executor_internal.h"

#include <memory>
#include <optional>

#include "../util/string_util.h"

namespace sqlc::executor_internal {

namespace {

/// Orders a cell against a Number literal.
/// MUST coerce String cells with the strict numeric grammar and throw when they do not parse.
int compare_to_number(const Value& cell, double literal, const std::string& column) {
  double value = 0.0;
  if (value_type(cell) == DataType::Number) {
    value = std::get<double>(cell);
  } else {
    std::optional<double> parsed = util::parse_number(std::get<std::string>(cell));
    if (!parsed.has_value()) {
      throw ExecutionError::type_mismatch(column, DataType::Number, DataType::String);
    }
    value = *parsed;
  }
  if (value < literal) return -1;
  if (value > literal) return 1;
  return 0;
}

/// Orders a cell against a String literal; Number cells compare through their display text.
int compare_to_string(const Value& cell, const std::string& literal) {
  std::string value = value_to_string(cell);
  if (value < literal) return -1;
  if (value > literal) return 1;
  return 0;
}

bool apply_op(ir::CompareOp op, int cmp) {
  switch (op) {
    case ir::CompareOp::Eq: return cmp == 0;
    case ir::CompareOp::NotEq: return cmp != 0;
    case ir::CompareOp::Lt: return cmp < 0;
    case ir::CompareOp::Gt: return cmp > 0;
    case ir::CompareOp::Le: return cmp <= 0;
    case ir::CompareOp::Ge: return cmp >= 0;
  }
  return false;
}

bool eval_comparison(const ir::Comparison& cmp, const ColumnIndex& index, const Row& row) {
  const Value& cell = row.values.at(resolve_column(index, cmp.column));
  int result = 0;
  if (value_type(cmp.literal) == DataType::Number) {
    result = compare_to_number(cell, std::get<double>(cmp.literal), cmp.column);
  } else {
    result = compare_to_string(cell, std::get<std::string>(cmp.literal));
  }
  return apply_op(cmp.op, result);
}

}  // namespace

void check_predicate_columns(const ir::Predicate& predicate, const ColumnIndex& index) {
  if (std::holds_alternative<ir::Comparison>(predicate)) {
    resolve_column(index, std::get<ir::Comparison>(predicate).column);
    return;
  }
  const auto& logical = *std::get<std::shared_ptr<const ir::Logical>>(predicate);
  check_predicate_columns(logical.left, index);
  check_predicate_columns(logical.right, index);
}

bool eval_predicate(const ir::Predicate& predicate, const ColumnIndex& index, const Row& row) {
  if (std::holds_alternative<ir::Comparison>(predicate)) {
    return eval_comparison(std::get<ir::Comparison>(predicate), index, row);
  }
  const auto& logical = *std::get<std::shared_ptr<const ir::Logical>>(predicate);
  bool left = eval_predicate(logical.left, index, row);
  if (logical.op == ir::Logical::Op::And) {
    return left && eval_predicate(logical.right, index, row);
  }
  return left || eval_predicate(logical.right, index, row);
}

}  // namespace sqlc::executor_internal
