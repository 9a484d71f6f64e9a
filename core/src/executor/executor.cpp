#include "../executor.h"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <utility>
#include <vector>

#include "executor_internal.h"

namespace sqlc {

ExecutionError::ExecutionError(Kind kind,
                               std::string column,
                               DataType expected,
                               DataType found,
                               const std::string& message)
    : std::runtime_error(message),
      kind_(kind),
      column_(std::move(column)),
      expected_(expected),
      found_(found) {}

ExecutionError ExecutionError::unknown_column(const std::string& column) {
  return ExecutionError(Kind::UnknownColumn, column, DataType::String, DataType::String,
                        "Unknown column: " + column);
}

ExecutionError ExecutionError::type_mismatch(const std::string& column,
                                             DataType expected,
                                             DataType found) {
  return ExecutionError(Kind::TypeMismatch, column, expected, found,
                        "Type mismatch on column " + column + ": expected " +
                            to_string(expected) + " but found " + to_string(found));
}

namespace executor_internal {

ColumnIndex build_column_index(const Table& table) {
  ColumnIndex index;
  for (size_t i = 0; i < table.columns.size(); ++i) {
    index.emplace(table.columns[i].name, i);
  }
  return index;
}

size_t resolve_column(const ColumnIndex& index, const std::string& column) {
  auto it = index.find(column);
  if (it == index.end()) {
    throw ExecutionError::unknown_column(column);
  }
  return it->second;
}

}  // namespace executor_internal

/// Executes the plan over row ids into the source table and materializes at the end.
/// MUST keep projection and sorting independent so ORDER BY may use non-selected columns.
/// Inputs are plan/table; outputs are a new Table with no side effects.
Table execute_plan(const Plan& plan, const Table& table) {
  using executor_internal::resolve_column;
  executor_internal::ColumnIndex index = executor_internal::build_column_index(table);

  std::vector<size_t> row_ids(table.rows.size());
  std::iota(row_ids.begin(), row_ids.end(), 0);
  std::vector<size_t> output_columns(table.columns.size());
  std::iota(output_columns.begin(), output_columns.end(), 0);

  for (const auto& operation : plan.operations) {
    if (const auto* filter = std::get_if<FilterOp>(&operation)) {
      executor_internal::check_predicate_columns(filter->predicate, index);
      std::vector<size_t> kept;
      kept.reserve(row_ids.size());
      for (size_t id : row_ids) {
        if (executor_internal::eval_predicate(filter->predicate, index, table.rows[id])) {
          kept.push_back(id);
        }
      }
      row_ids = std::move(kept);
    } else if (const auto* project = std::get_if<ProjectOp>(&operation)) {
      if (project->all_columns) continue;
      output_columns.clear();
      for (const auto& column : project->columns) {
        output_columns.push_back(resolve_column(index, column));
      }
    } else if (const auto* sort = std::get_if<SortOp>(&operation)) {
      size_t key = resolve_column(index, sort->column);
      bool descending = sort->direction == ir::SortDirection::Desc;
      std::stable_sort(row_ids.begin(), row_ids.end(), [&](size_t left, size_t right) {
        int cmp = executor_internal::compare_cells(table.rows[left].values[key],
                                                   table.rows[right].values[key]);
        return descending ? cmp > 0 : cmp < 0;
      });
    } else if (const auto* limit = std::get_if<LimitOp>(&operation)) {
      size_t begin = std::min(limit->offset, row_ids.size());
      size_t end = begin + std::min(limit->count, row_ids.size() - begin);
      row_ids = std::vector<size_t>(row_ids.begin() + static_cast<std::ptrdiff_t>(begin),
                                    row_ids.begin() + static_cast<std::ptrdiff_t>(end));
    }
  }

  Table result;
  result.columns.reserve(output_columns.size());
  for (size_t col : output_columns) {
    result.columns.push_back(table.columns[col]);
  }
  result.rows.reserve(row_ids.size());
  for (size_t id : row_ids) {
    Row row;
    row.values.reserve(output_columns.size());
    for (size_t col : output_columns) {
      row.values.push_back(table.rows[id].values[col]);
    }
    result.rows.push_back(std::move(row));
  }
  return result;
}

}  // namespace sqlc
