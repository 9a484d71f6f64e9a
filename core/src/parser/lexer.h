#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tokens.h"

namespace sqlc {

/// Describes a lexical failure with a message and byte position.
/// MUST report positions relative to the original input string.
struct LexError {
  std::string message;
  size_t position = 0;
};

/// Wraps either the full token stream or the first LexError.
/// MUST end the token stream with an End token when error is empty.
struct LexResult {
  std::vector<Token> tokens;
  std::optional<LexError> error;
};

/// Tokenizes query input into a stream for the parser.
/// MUST be deterministic and MUST not skip meaningful characters.
/// Inputs are query strings; outputs are tokens with position metadata.
class Lexer {
 public:
  /// Constructs a lexer over a stable input string reference.
  /// MUST NOT outlive the referenced input buffer.
  /// Inputs are the query string; side effects are none.
  explicit Lexer(const std::string& input);
  /// Produces the next token from the input stream.
  /// MUST return End at input exhaustion and false (with error() set) on invalid input.
  /// Inputs are internal state; outputs are tokens with positions.
  bool next(Token& out);
  const std::optional<LexError>& error() const { return error_; }

 private:
  /// Lexes a quoted string token, failing on unterminated input.
  /// MUST capture raw contents and MUST stop at the matching quote.
  bool lex_string(Token& out);
  /// Lexes identifiers and recognizes keyword forms.
  /// MUST map keywords case-insensitively and preserve original text.
  Token lex_identifier_or_keyword();
  /// Lexes an integer or decimal literal token.
  /// MUST only consume a '.' that is followed by a digit.
  Token lex_number();
  bool lex_operator(Token& out);
  void skip_ws();
  bool set_error(const std::string& message, size_t position);
  static bool is_ident_start(char c);
  static bool is_ident_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
  std::optional<LexError> error_;
};

/// Tokenizes a whole query, stopping at the first lexical error.
/// Inputs are query text; outputs are LexResult with no side effects.
LexResult tokenize(const std::string& input);
/// Renders a token stream for display, one token per line.
std::string describe_tokens(const std::vector<Token>& tokens);

}  // namespace sqlc
