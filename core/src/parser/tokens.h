#pragma once

#include <cstddef>
#include <string>

namespace sqlc {

/// Enumerates lexical tokens produced by the query lexer.
/// MUST remain consistent with parser expectations and keyword mapping.
/// Inputs are characters; outputs are token kinds with no side effects.
enum class TokenType {
  Identifier,
  String,
  Number,
  Comma,
  Semicolon,
  Star,
  End,
  KeywordSelect,
  KeywordFrom,
  KeywordWhere,
  KeywordAnd,
  KeywordOr,
  KeywordOrder,
  KeywordBy,
  KeywordAsc,
  KeywordDesc,
  KeywordLimit,
  KeywordOffset,
  Equal,
  NotEqual,
  Less,
  LessEqual,
  Greater,
  GreaterEqual
};

/// Represents a single token with source text and position metadata.
/// MUST track byte positions to support precise error reporting.
/// String tokens hold the unquoted content; keywords keep the original spelling.
struct Token {
  TokenType type = TokenType::End;
  std::string text;
  size_t pos = 0;
};

/// Returns a short description of a token kind for diagnostics.
const char* to_string(TokenType type);

}  // namespace sqlc
