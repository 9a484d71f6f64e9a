#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sqlc/plan.h"
#include "sqlc/table.h"

namespace sqlc {

/// Describes why a query did not produce a table and which stage stopped it.
/// MUST carry a position for Lex and Parse failures and MAY omit it otherwise.
/// Inputs are stage diagnostics; side effects are none.
struct QueryFailure {
  enum class Stage { Lex, Parse, IR, Plan, Exec } stage = Stage::Parse;
  std::string message;
  std::optional<size_t> position;
};

/// Returns the user-facing stage label ("lex", "parse", "ir", "plan", "exec").
const char* to_string(QueryFailure::Stage stage);

/// Wraps either a compiled plan or the failure that stopped compilation.
/// MUST contain exactly one of plan or failure.
struct CompileResult {
  std::optional<Plan> plan;
  std::optional<QueryFailure> failure;
};

/// Either the result table or the failure that stopped the pipeline.
using QueryOutcome = std::variant<Table, QueryFailure>;

/// Compiler phases whose intermediate form can be displayed, in pipeline order.
enum class Phase { Tokens, Ast, IR, Plan };

/// Returns the phase name used on the command line ("tokens", "ast", "ir", "plan").
const char* to_string(Phase phase);

/// Text rendering of one compiler phase.
struct PhaseView {
  Phase phase = Phase::Plan;
  std::string text;
};

/// Views of the requested phases plus the failure that stopped compilation, if any.
/// Views for phases that completed before a failure are still present.
struct InspectResult {
  std::vector<PhaseView> views;
  std::optional<QueryFailure> failure;
};

/// Compiles query text through lexer, parser, IR and plan generation.
/// MUST stop at the first failing stage and MUST NOT throw on invalid queries.
/// Inputs are query text; outputs are CompileResult with no side effects.
CompileResult compile_query(const std::string& query);
/// Executes a compiled plan against a table without mutating it.
/// MUST convert execution errors into an Exec failure.
/// Inputs are plan/table; outputs are QueryOutcome with no side effects.
QueryOutcome run_plan(const Plan& plan, const Table& table);
/// Compiles and executes query text against a table in one call.
/// MUST be equivalent to compile_query followed by run_plan.
/// Inputs are query/table; outputs are QueryOutcome with no side effects.
QueryOutcome compile_and_run(const std::string& query, const Table& table);
/// Compiles query text and renders the requested phases.
/// MUST emit views in pipeline order once per phase and MUST stop after the last requested phase.
/// Inputs are query text/phases; outputs are InspectResult with no side effects.
InspectResult inspect_query(const std::string& query, const std::vector<Phase>& phases);

}  // namespace sqlc
