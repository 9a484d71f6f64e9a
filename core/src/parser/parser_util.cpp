#include "parser_internal.h"

#include <sstream>
#include <utility>

namespace sqlc {

/// Consumes an identifier token into an AST identifier.
/// MUST report the identifier as the only expected kind on mismatch.
/// Inputs are tokens; outputs are success or error.
bool Parser::parse_identifier(Identifier& out) {
  if (current_.type != TokenType::Identifier) {
    return set_error({TokenType::Identifier});
  }
  out.name = current_.text;
  out.span = token_span(current_);
  advance();
  return true;
}

/// Consumes a token of the expected type or sets a parse error.
/// MUST advance the token stream on success.
/// Inputs are token type; outputs are success or error.
bool Parser::consume(TokenType type) {
  if (current_.type != type) {
    return set_error({type});
  }
  advance();
  return true;
}

bool Parser::set_error(std::vector<TokenType> expected) {
  std::string message =
      "Expected " + describe_expected(expected) + " but found " + describe_found(current_);
  return set_error(std::move(expected), message);
}

/// Records the first parse error for reporting.
/// MUST preserve the earliest error so later failures never overwrite it.
/// Inputs are expected kinds/message; outputs are false with stored error.
bool Parser::set_error(std::vector<TokenType> expected, const std::string& message) {
  if (!error_.has_value()) {
    error_ = SyntaxError{message, current_.pos, std::move(expected), current_};
  }
  return false;
}

ParseResult Parser::error_result() {
  ParseResult res;
  res.syntax_error = error_;
  return res;
}

/// Advances to the next token in the stream.
/// MUST stay on the End token once reached so lookahead never runs past the input.
void Parser::advance() {
  if (current_.type == TokenType::End) return;
  ++index_;
  if (index_ < tokens_.size()) {
    current_ = tokens_[index_];
    return;
  }
  current_ = Token{TokenType::End, "", current_.pos + current_.text.size()};
}

Span Parser::token_span(const Token& token) {
  return Span{token.pos, token.pos + token.text.size()};
}

std::string Parser::describe_expected(const std::vector<TokenType>& expected) {
  std::ostringstream oss;
  for (size_t i = 0; i < expected.size(); ++i) {
    if (i > 0) oss << (i + 1 == expected.size() ? " or " : ", ");
    oss << to_string(expected[i]);
  }
  return oss.str();
}

std::string Parser::describe_found(const Token& token) {
  if (token.type == TokenType::End) return "end of input";
  if (token.type == TokenType::String) return "string '" + token.text + "'";
  return "'" + token.text + "'";
}

}  // namespace sqlc
