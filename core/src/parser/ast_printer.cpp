#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

#include "../query_parser.h"

namespace sqlc {

namespace {

void indent(std::ostream& os, int depth) {
  os << std::string(static_cast<size_t>(depth) * 2, ' ');
}

std::string literal_as_written(const Literal& literal) {
  if (literal.kind == Literal::Kind::String) return "'" + literal.text + "'";
  return literal.text;
}

void print_expr(std::ostream& os, const Expr& expr, int depth) {
  std::visit(
      [&](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        indent(os, depth);
        if constexpr (std::is_same_v<T, CompareExpr>) {
          os << "Compare " << node.column.name << " " << node.op_text << " "
             << literal_as_written(node.literal) << "\n";
        } else {
          os << (node->op == BinaryExpr::Op::And ? "And" : "Or") << "\n";
          print_expr(os, node->left, depth + 1);
          print_expr(os, node->right, depth + 1);
        }
      },
      expr);
}

}  // namespace

/// Prints the statement as an indented tree; operators and literals appear as written.
std::string describe_ast(const SelectStatement& stmt) {
  std::ostringstream os;
  os << "Select\n";
  indent(os, 1);
  os << "Columns: ";
  if (std::holds_alternative<StarColumns>(stmt.columns)) {
    os << "*";
  } else {
    const auto& columns = std::get<std::vector<Identifier>>(stmt.columns);
    for (size_t i = 0; i < columns.size(); ++i) {
      if (i > 0) os << ", ";
      os << columns[i].name;
    }
  }
  os << "\n";
  indent(os, 1);
  os << "From: " << stmt.table.name << "\n";
  if (stmt.where.has_value()) {
    indent(os, 1);
    os << "Where:\n";
    print_expr(os, *stmt.where, 2);
  }
  if (stmt.order_by.has_value()) {
    indent(os, 1);
    os << "OrderBy: " << stmt.order_by->column.name
       << (stmt.order_by->descending ? " DESC" : " ASC") << "\n";
  }
  if (stmt.limit.has_value()) {
    indent(os, 1);
    os << "Limit: " << stmt.limit->count;
    if (stmt.limit->offset.has_value()) os << " OFFSET " << *stmt.limit->offset;
    os << "\n";
  }
  return os.str();
}

}  // namespace sqlc
