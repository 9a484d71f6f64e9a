#pragma once

#include <string>
#include <unordered_map>

#include "../executor.h"

namespace sqlc::executor_internal {

/// Maps column names to their first position in the schema.
using ColumnIndex = std::unordered_map<std::string, size_t>;

ColumnIndex build_column_index(const Table& table);
/// Looks up a column or throws UnknownColumn with the exact name.
size_t resolve_column(const ColumnIndex& index, const std::string& column);

/// Compares two cells for ORDER BY sorting.
/// MUST return 0 for equality so stable sorting keeps ties in source order.
/// Numbers order numerically, strings by byte (UTF-8 code point) order, numbers before strings.
int compare_cells(const Value& left, const Value& right);

/// Resolves every column the predicate references, left to right.
/// MUST throw UnknownColumn before any row is evaluated.
void check_predicate_columns(const ir::Predicate& predicate, const ColumnIndex& index);
/// Evaluates a predicate against one row with left-to-right short-circuiting.
/// MUST throw TypeMismatch when a Number literal meets a non-numeric cell.
bool eval_predicate(const ir::Predicate& predicate, const ColumnIndex& index, const Row& row);

}  // namespace sqlc::executor_internal
