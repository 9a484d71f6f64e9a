#include "plan_generator.h"

namespace sqlc {

Plan generate_plan(const ir::Query& query) {
  Plan plan;
  plan.table = query.table;
  if (query.filter.has_value()) {
    plan.operations.push_back(FilterOp{*query.filter});
  }
  plan.operations.push_back(ProjectOp{query.all_columns, query.columns});
  // WHY: the sort key names a source column, so it stays valid after projection drops it.
  if (query.order_by.has_value()) {
    plan.operations.push_back(SortOp{query.order_by->column, query.order_by->direction});
  }
  if (query.limit.has_value()) {
    plan.operations.push_back(LimitOp{query.limit->count, query.limit->offset});
  }
  return plan;
}

}  // namespace sqlc
