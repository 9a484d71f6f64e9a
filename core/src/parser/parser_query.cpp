#include "parser_internal.h"

#include <stdexcept>
#include <utility>

namespace sqlc {

/// Constructs a parser positioned on the first token.
/// MUST treat an empty stream as immediately exhausted.
Parser::Parser(const std::vector<Token>& tokens) : tokens_(tokens) {
  if (!tokens_.empty()) {
    current_ = tokens_.front();
  }
}

/// Parses a full statement and returns either the AST or a SyntaxError.
/// MUST consume all tokens or report the first unexpected trailing token.
/// Inputs are internal state; outputs are ParseResult.
ParseResult Parser::parse() {
  SelectStatement stmt;
  if (!parse_query_body(stmt)) return error_result();
  stmt.span = Span{0, current_.pos};
  ParseResult res;
  res.statement = std::move(stmt);
  return res;
}

/// Parses SELECT/FROM and the optional WHERE, ORDER BY and LIMIT clauses in order.
/// MUST keep the expected set of the terminal check in step with the clauses still allowed.
/// Inputs are token streams; outputs are SelectStatement or errors.
bool Parser::parse_query_body(SelectStatement& stmt) {
  if (!consume(TokenType::KeywordSelect)) return false;
  if (!parse_select_list(stmt.columns)) return false;
  if (!consume(TokenType::KeywordFrom)) return false;
  if (!parse_identifier(stmt.table)) return false;

  std::vector<TokenType> trailing = {TokenType::KeywordWhere, TokenType::KeywordOrder,
                                     TokenType::KeywordLimit, TokenType::Semicolon,
                                     TokenType::End};

  if (current_.type == TokenType::KeywordWhere) {
    advance();
    Expr expr;
    if (!parse_expr(expr)) return false;
    stmt.where = std::move(expr);
    trailing = {TokenType::KeywordAnd, TokenType::KeywordOr, TokenType::KeywordOrder,
                TokenType::KeywordLimit, TokenType::Semicolon, TokenType::End};
  }

  if (current_.type == TokenType::KeywordOrder) {
    SelectStatement::OrderBy order_by;
    if (!parse_order_by(order_by)) return false;
    trailing = {TokenType::KeywordLimit, TokenType::Semicolon, TokenType::End};
    if (order_by.span.end == order_by.column.span.end) {
      trailing.insert(trailing.begin(), {TokenType::KeywordAsc, TokenType::KeywordDesc});
    }
    stmt.order_by = std::move(order_by);
  }

  if (current_.type == TokenType::KeywordLimit) {
    SelectStatement::Limit limit;
    if (!parse_limit(limit)) return false;
    trailing = {TokenType::Semicolon, TokenType::End};
    if (!limit.offset.has_value()) {
      trailing.insert(trailing.begin(), TokenType::KeywordOffset);
    }
    stmt.limit = limit;
  }

  if (current_.type == TokenType::Semicolon) {
    advance();
    trailing = {TokenType::End};
  }
  if (current_.type != TokenType::End) {
    return set_error(std::move(trailing));
  }
  return true;
}

/// Parses ORDER BY <column> [ASC|DESC]; ASC is the default.
bool Parser::parse_order_by(SelectStatement::OrderBy& order_by) {
  size_t start = current_.pos;
  advance();
  if (!consume(TokenType::KeywordBy)) return false;
  if (!parse_identifier(order_by.column)) return false;
  order_by.span = Span{start, order_by.column.span.end};
  if (current_.type == TokenType::KeywordAsc || current_.type == TokenType::KeywordDesc) {
    order_by.descending = current_.type == TokenType::KeywordDesc;
    order_by.span.end = token_span(current_).end;
    advance();
  }
  return true;
}

/// Parses LIMIT <count> [OFFSET <count>].
bool Parser::parse_limit(SelectStatement::Limit& limit) {
  size_t start = current_.pos;
  advance();
  if (!parse_count("LIMIT", limit.count)) return false;
  limit.span = Span{start, current_.pos};
  if (current_.type == TokenType::KeywordOffset) {
    advance();
    size_t offset = 0;
    if (!parse_count("OFFSET", offset)) return false;
    limit.offset = offset;
    limit.span.end = current_.pos;
  }
  return true;
}

/// Parses a non-negative integer literal for LIMIT/OFFSET.
/// MUST reject decimals and values that do not fit in size_t.
bool Parser::parse_count(const char* clause, size_t& out) {
  if (current_.type != TokenType::Number) {
    return set_error({TokenType::Number});
  }
  if (current_.text.find('.') != std::string::npos) {
    return set_error({TokenType::Number},
                     std::string(clause) + " expects a non-negative integer but found '" +
                         current_.text + "'");
  }
  try {
    out = static_cast<size_t>(std::stoull(current_.text));
  } catch (const std::out_of_range&) {
    return set_error({TokenType::Number},
                     std::string(clause) + " value is out of range: " + current_.text);
  }
  advance();
  return true;
}

ParseResult parse_tokens(const std::vector<Token>& tokens) {
  Parser parser(tokens);
  return parser.parse();
}

ParseResult parse_query(const std::string& input) {
  LexResult lexed = tokenize(input);
  if (lexed.error.has_value()) {
    ParseResult res;
    res.lex_error = lexed.error;
    return res;
  }
  return parse_tokens(lexed.tokens);
}

}  // namespace sqlc
