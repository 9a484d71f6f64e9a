#pragma once

#include "sqlc/ir.h"
#include "sqlc/plan.h"

namespace sqlc {

/// Translates IR into the ordered operation plan.
/// MUST emit filter, project, sort, limit in that order, omitting absent clauses,
/// and MUST always emit exactly one project operation.
/// Inputs are ir::Query; outputs are Plan with no side effects.
Plan generate_plan(const ir::Query& query);

}  // namespace sqlc
