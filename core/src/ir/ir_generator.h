#pragma once

#include "../ast.h"
#include "sqlc/ir.h"

namespace sqlc {

/// Lowers a parsed statement into the normalized IR.
/// MUST canonicalize operators and resolve literal types exactly once.
/// MUST NOT consult any table schema; it is total over well-formed ASTs.
/// Inputs are SelectStatement; outputs are ir::Query with no side effects.
ir::Query lower(const SelectStatement& stmt);

}  // namespace sqlc
