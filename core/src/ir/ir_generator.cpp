#include "ir_generator.h"

#include <memory>
#include <type_traits>

#include "../util/string_util.h"

namespace sqlc {

namespace {

ir::CompareOp lower_op(CompareExpr::Op op) {
  switch (op) {
    case CompareExpr::Op::Eq: return ir::CompareOp::Eq;
    case CompareExpr::Op::NotEq: return ir::CompareOp::NotEq;
    case CompareExpr::Op::Lt: return ir::CompareOp::Lt;
    case CompareExpr::Op::Gt: return ir::CompareOp::Gt;
    case CompareExpr::Op::Le: return ir::CompareOp::Le;
    case CompareExpr::Op::Ge: return ir::CompareOp::Ge;
  }
  return ir::CompareOp::Eq;
}

/// Resolves a literal to its typed value from the token kind it came from.
/// The parser only accepts Number literals that parse to a finite double.
Value lower_literal(const Literal& literal) {
  if (literal.kind == Literal::Kind::Number) {
    return util::parse_number(literal.text).value();
  }
  return literal.text;
}

ir::Predicate lower_expr(const Expr& expr) {
  return std::visit(
      [](const auto& node) -> ir::Predicate {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, CompareExpr>) {
          return ir::Comparison{node.column.name, lower_op(node.op), lower_literal(node.literal)};
        } else {
          auto logical = std::make_shared<ir::Logical>();
          logical->op = node->op == BinaryExpr::Op::And ? ir::Logical::Op::And
                                                        : ir::Logical::Op::Or;
          logical->left = lower_expr(node->left);
          logical->right = lower_expr(node->right);
          return std::shared_ptr<const ir::Logical>(std::move(logical));
        }
      },
      expr);
}

}  // namespace

ir::Query lower(const SelectStatement& stmt) {
  ir::Query query;
  if (std::holds_alternative<StarColumns>(stmt.columns)) {
    query.all_columns = true;
  } else {
    for (const auto& column : std::get<std::vector<Identifier>>(stmt.columns)) {
      query.columns.push_back(column.name);
    }
  }
  query.table = stmt.table.name;
  if (stmt.where.has_value()) {
    query.filter = lower_expr(*stmt.where);
  }
  if (stmt.order_by.has_value()) {
    query.order_by = ir::OrderSpec{stmt.order_by->column.name,
                                   stmt.order_by->descending ? ir::SortDirection::Desc
                                                             : ir::SortDirection::Asc};
  }
  if (stmt.limit.has_value()) {
    query.limit = ir::LimitSpec{stmt.limit->count, stmt.limit->offset.value_or(0)};
  }
  return query;
}

namespace ir {

const char* to_symbol(CompareOp op) {
  switch (op) {
    case CompareOp::Eq: return "=";
    case CompareOp::NotEq: return "!=";
    case CompareOp::Lt: return "<";
    case CompareOp::Gt: return ">";
    case CompareOp::Le: return "<=";
    case CompareOp::Ge: return ">=";
  }
  return "?";
}

}  // namespace ir

}  // namespace sqlc
