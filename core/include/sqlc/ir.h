#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sqlc/table.h"

namespace sqlc::ir {

/// Canonical comparison operators; every source spelling maps to exactly one.
enum class CompareOp { Eq, NotEq, Lt, Gt, Le, Ge };

/// Returns the canonical symbol for an operator ("=", "!=", "<", ">", "<=", ">=").
const char* to_symbol(CompareOp op);

/// Compares one column of the current row against a typed literal.
struct Comparison {
  std::string column;
  CompareOp op = CompareOp::Eq;
  Value literal;
};

struct Logical;
/// Predicate tree; inner nodes are shared and immutable so plans can alias IR subtrees.
using Predicate = std::variant<Comparison, std::shared_ptr<const Logical>>;

struct Logical {
  enum class Op { And, Or } op = Op::And;
  Predicate left;
  Predicate right;
};

enum class SortDirection { Asc, Desc };

struct OrderSpec {
  std::string column;
  SortDirection direction = SortDirection::Asc;
};

struct LimitSpec {
  size_t count = 0;
  size_t offset = 0;
};

/// Normalized, schema-agnostic form of one SELECT.
/// MUST carry literal types resolved so later stages never inspect token text.
struct Query {
  std::string op = "select";
  /// True for SELECT *; columns is empty in that case.
  bool all_columns = false;
  std::vector<std::string> columns;
  std::string table;
  std::optional<Predicate> filter;
  std::optional<OrderSpec> order_by;
  std::optional<LimitSpec> limit;
};

/// Renders a predicate on one line with canonical operators, e.g. `a = 1 OR (b > 2 AND c < 3)`.
std::string describe_predicate(const Predicate& predicate);
/// Renders a query one field per line (op, table, columns, then filter/order_by/limit when set).
/// MUST be deterministic; side effects are none.
std::string describe_query(const Query& query);

}  // namespace sqlc::ir
