#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../query_parser.h"
#include "tokens.h"

namespace sqlc {

/// Implements recursive-descent parsing over a token stream.
/// MUST preserve token order and MUST set error_ on first failure.
/// Inputs are lexer tokens; outputs are ParseResult with no side effects.
class Parser {
 public:
  explicit Parser(const std::vector<Token>& tokens);
  ParseResult parse();

 private:
  bool parse_query_body(SelectStatement& stmt);
  bool parse_select_list(ColumnSelection& columns);
  bool parse_order_by(SelectStatement::OrderBy& order_by);
  bool parse_limit(SelectStatement::Limit& limit);
  bool parse_count(const char* clause, size_t& out);

  bool parse_expr(Expr& out);
  bool parse_and_expr(Expr& out);
  bool parse_cmp_expr(Expr& out);
  bool parse_compare_op(CompareExpr& cmp);
  bool parse_literal(Literal& out);

  bool parse_identifier(Identifier& out);
  bool consume(TokenType type);
  bool set_error(std::vector<TokenType> expected);
  bool set_error(std::vector<TokenType> expected, const std::string& message);
  ParseResult error_result();

  void advance();
  static Span token_span(const Token& token);
  static std::string describe_expected(const std::vector<TokenType>& expected);
  static std::string describe_found(const Token& token);

  const std::vector<Token>& tokens_;
  size_t index_ = 0;
  Token current_{};
  std::optional<SyntaxError> error_;
};

}  // namespace sqlc
