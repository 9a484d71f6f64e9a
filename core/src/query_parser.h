#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ast.h"
#include "parser/lexer.h"
#include "parser/tokens.h"

namespace sqlc {

/// Describes a parse failure at the first token that did not fit the grammar.
/// MUST report positions relative to the original input string.
/// Inputs are parser diagnostics; outputs are error details only.
struct SyntaxError {
  std::string message;
  size_t position = 0;
  std::vector<TokenType> expected;
  Token found;
};

/// Wraps either a parsed SelectStatement or the failure that stopped parsing.
/// MUST contain exactly one of statement, lex_error or syntax_error.
/// Inputs are parser outputs; side effects are none.
struct ParseResult {
  std::optional<SelectStatement> statement;
  std::optional<LexError> lex_error;
  std::optional<SyntaxError> syntax_error;
};

/// Parses an End-terminated token stream into an AST.
/// MUST return errors without throwing and MUST stop at the first mismatch.
/// Inputs are tokens; outputs are ParseResult with optional syntax_error.
ParseResult parse_tokens(const std::vector<Token>& tokens);
/// Tokenizes and parses query text.
/// MUST report lexical failures through lex_error without invoking the parser.
/// Inputs are query text; outputs are ParseResult with optional error.
ParseResult parse_query(const std::string& input);
/// Renders a parsed statement as an indented tree for display.
/// MUST be deterministic; side effects are none.
std::string describe_ast(const SelectStatement& stmt);

}  // namespace sqlc
