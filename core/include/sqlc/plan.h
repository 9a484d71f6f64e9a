#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "sqlc/ir.h"

namespace sqlc {

/// Keeps only rows for which the predicate holds.
struct FilterOp {
  ir::Predicate predicate;
};

/// Selects output columns; all_columns keeps the source order.
struct ProjectOp {
  bool all_columns = false;
  std::vector<std::string> columns;
};

/// Orders rows by a column of the source (pre-projection) row.
struct SortOp {
  std::string column;
  ir::SortDirection direction = ir::SortDirection::Asc;
};

/// Skips offset rows and keeps at most count of the rest.
struct LimitOp {
  size_t count = 0;
  size_t offset = 0;
};

using Operation = std::variant<FilterOp, ProjectOp, SortOp, LimitOp>;

/// Ordered relational operations ready for execution against a table.
/// MUST list operations as filter, project, sort, limit with absent ones omitted.
struct Plan {
  std::string table;
  std::vector<Operation> operations;
};

/// Renders a plan one operation per line for display (the EXPLAIN view).
/// MUST be deterministic; side effects are none.
std::string describe_plan(const Plan& plan);

}  // namespace sqlc
