#include <sstream>
#include <type_traits>
#include <variant>

#include "sqlc/plan.h"

namespace sqlc {

/// Renders each operation on its own line, e.g. `Filter age > 20` then `Project name, age`.
std::string describe_plan(const Plan& plan) {
  std::ostringstream os;
  os << "Scan " << plan.table << "\n";
  for (const auto& operation : plan.operations) {
    std::visit(
        [&](const auto& op) {
          using T = std::decay_t<decltype(op)>;
          if constexpr (std::is_same_v<T, FilterOp>) {
            os << "Filter " << ir::describe_predicate(op.predicate);
          } else if constexpr (std::is_same_v<T, ProjectOp>) {
            os << "Project ";
            if (op.all_columns) {
              os << "*";
            }
            for (size_t i = 0; i < op.columns.size(); ++i) {
              if (i > 0) os << ", ";
              os << op.columns[i];
            }
          } else if constexpr (std::is_same_v<T, SortOp>) {
            os << "Sort " << op.column
               << (op.direction == ir::SortDirection::Desc ? " DESC" : " ASC");
          } else {
            os << "Limit " << op.count;
            if (op.offset > 0) os << " OFFSET " << op.offset;
          }
          os << "\n";
        },
        operation);
  }
  return os.str();
}

}  // namespace sqlc
