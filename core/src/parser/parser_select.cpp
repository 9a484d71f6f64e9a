#include "parser_internal.h"

#include <utility>

namespace sqlc {

/// Parses the SELECT projection list: '*' or one or more comma-separated identifiers.
/// MUST keep identifiers in source order, duplicates included.
/// Inputs are token stream; outputs are the column selection or errors.
bool Parser::parse_select_list(ColumnSelection& columns) {
  if (current_.type == TokenType::Star) {
    columns = StarColumns{token_span(current_)};
    advance();
    return true;
  }
  if (current_.type != TokenType::Identifier) {
    return set_error({TokenType::Identifier, TokenType::Star});
  }
  std::vector<Identifier> names;
  while (true) {
    Identifier name;
    if (!parse_identifier(name)) return false;
    names.push_back(std::move(name));
    if (current_.type != TokenType::Comma) break;
    advance();
  }
  // WHY: after a column the list either continues or FROM follows.
  if (current_.type != TokenType::KeywordFrom) {
    return set_error({TokenType::Comma, TokenType::KeywordFrom});
  }
  columns = std::move(names);
  return true;
}

}  // namespace sqlc
