#include "sqlc/sqlc.h"

#include <algorithm>
#include <utility>

#include "../executor.h"
#include "../ir/ir_generator.h"
#include "../plan/plan_generator.h"
#include "../query_parser.h"

namespace sqlc {

const char* to_string(QueryFailure::Stage stage) {
  switch (stage) {
    case QueryFailure::Stage::Lex: return "lex";
    case QueryFailure::Stage::Parse: return "parse";
    case QueryFailure::Stage::IR: return "ir";
    case QueryFailure::Stage::Plan: return "plan";
    case QueryFailure::Stage::Exec: return "exec";
  }
  return "?";
}

const char* to_string(Phase phase) {
  switch (phase) {
    case Phase::Tokens: return "tokens";
    case Phase::Ast: return "ast";
    case Phase::IR: return "ir";
    case Phase::Plan: return "plan";
  }
  return "?";
}

/// Runs lexer, parser, IR and plan generation, stopping at the first failing stage.
/// IR and plan generation are total, so only Lex and Parse failures can surface here.
CompileResult compile_query(const std::string& query) {
  CompileResult result;
  LexResult lexed = tokenize(query);
  if (lexed.error.has_value()) {
    result.failure = QueryFailure{QueryFailure::Stage::Lex, lexed.error->message,
                                  lexed.error->position};
    return result;
  }
  ParseResult parsed = parse_tokens(lexed.tokens);
  if (!parsed.statement.has_value()) {
    result.failure = QueryFailure{QueryFailure::Stage::Parse, parsed.syntax_error->message,
                                  parsed.syntax_error->position};
    return result;
  }
  result.plan = generate_plan(lower(*parsed.statement));
  return result;
}

QueryOutcome run_plan(const Plan& plan, const Table& table) {
  try {
    return execute_plan(plan, table);
  } catch (const ExecutionError& e) {
    return QueryFailure{QueryFailure::Stage::Exec, e.what(), std::nullopt};
  }
}

QueryOutcome compile_and_run(const std::string& query, const Table& table) {
  CompileResult compiled = compile_query(query);
  if (!compiled.plan.has_value()) {
    return *compiled.failure;
  }
  return run_plan(*compiled.plan, table);
}

InspectResult inspect_query(const std::string& query, const std::vector<Phase>& phases) {
  InspectResult result;
  auto wanted = [&](Phase phase) {
    return std::find(phases.begin(), phases.end(), phase) != phases.end();
  };
  auto last_wanted = [&](Phase phase) {
    for (const auto& requested : phases) {
      if (static_cast<int>(requested) > static_cast<int>(phase)) return false;
    }
    return true;
  };
  if (phases.empty()) return result;

  LexResult lexed = tokenize(query);
  if (lexed.error.has_value()) {
    result.failure = QueryFailure{QueryFailure::Stage::Lex, lexed.error->message,
                                  lexed.error->position};
    return result;
  }
  if (wanted(Phase::Tokens)) result.views.push_back({Phase::Tokens, describe_tokens(lexed.tokens)});
  if (last_wanted(Phase::Tokens)) return result;

  ParseResult parsed = parse_tokens(lexed.tokens);
  if (!parsed.statement.has_value()) {
    result.failure = QueryFailure{QueryFailure::Stage::Parse, parsed.syntax_error->message,
                                  parsed.syntax_error->position};
    return result;
  }
  if (wanted(Phase::Ast)) result.views.push_back({Phase::Ast, describe_ast(*parsed.statement)});
  if (last_wanted(Phase::Ast)) return result;

  ir::Query lowered = lower(*parsed.statement);
  if (wanted(Phase::IR)) result.views.push_back({Phase::IR, ir::describe_query(lowered)});
  if (last_wanted(Phase::IR)) return result;

  result.views.push_back({Phase::Plan, describe_plan(generate_plan(lowered))});
  return result;
}

}  // namespace sqlc
