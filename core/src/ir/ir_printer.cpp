#include <sstream>
#include <variant>

#include "sqlc/ir.h"
#include "../util/string_util.h"

namespace sqlc::ir {

namespace {

std::string literal_to_string(const Value& value) {
  if (value_type(value) == DataType::Number) {
    return util::format_number(std::get<double>(value));
  }
  return "'" + std::get<std::string>(value) + "'";
}

void print_predicate(std::ostream& os, const Predicate& predicate, bool nested) {
  if (std::holds_alternative<Comparison>(predicate)) {
    const auto& cmp = std::get<Comparison>(predicate);
    os << cmp.column << " " << to_symbol(cmp.op) << " " << literal_to_string(cmp.literal);
    return;
  }
  const auto& logical = *std::get<std::shared_ptr<const Logical>>(predicate);
  if (nested) os << "(";
  print_predicate(os, logical.left, true);
  os << (logical.op == Logical::Op::And ? " AND " : " OR ");
  print_predicate(os, logical.right, true);
  if (nested) os << ")";
}

}  // namespace

/// Inner boolean nodes are parenthesized to make the parsed grouping visible.
std::string describe_predicate(const Predicate& predicate) {
  std::ostringstream os;
  print_predicate(os, predicate, false);
  return os.str();
}

std::string describe_query(const Query& query) {
  std::ostringstream os;
  os << "op: " << query.op << "\n";
  os << "table: " << query.table << "\n";
  os << "columns: ";
  if (query.all_columns) os << "*";
  for (size_t i = 0; i < query.columns.size(); ++i) {
    if (i > 0) os << ", ";
    os << query.columns[i];
  }
  os << "\n";
  if (query.filter.has_value()) {
    os << "filter: " << describe_predicate(*query.filter) << "\n";
  }
  if (query.order_by.has_value()) {
    os << "order_by: " << query.order_by->column
       << (query.order_by->direction == SortDirection::Desc ? " DESC" : " ASC") << "\n";
  }
  if (query.limit.has_value()) {
    os << "limit: " << query.limit->count << " offset " << query.limit->offset << "\n";
  }
  return os.str();
}

}  // namespace sqlc::ir
