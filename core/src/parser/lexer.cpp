#include "lexer.h"

#include <cctype>
#include <iomanip>
#include <sstream>

#include "../util/string_util.h"

namespace sqlc {

Lexer::Lexer(const std::string& input) : input_(input) {}

bool Lexer::next(Token& out) {
  skip_ws();
  if (pos_ >= input_.size()) {
    out = Token{TokenType::End, "", pos_};
    return true;
  }

  char c = input_[pos_];
  if (c == ',') {
    ++pos_;
    out = Token{TokenType::Comma, ",", pos_ - 1};
    return true;
  }
  if (c == ';') {
    ++pos_;
    out = Token{TokenType::Semicolon, ";", pos_ - 1};
    return true;
  }
  if (c == '*') {
    ++pos_;
    out = Token{TokenType::Star, "*", pos_ - 1};
    return true;
  }
  if (c == '\'' || c == '\"') {
    return lex_string(out);
  }
  if (std::isdigit(static_cast<unsigned char>(c))) {
    out = lex_number();
    return true;
  }
  if (is_ident_start(c)) {
    out = lex_identifier_or_keyword();
    return true;
  }
  if (lex_operator(out)) {
    return true;
  }
  if (error_.has_value()) return false;
  return set_error(std::string("Unexpected character '") + c + "'", pos_);
}

bool Lexer::lex_operator(Token& out) {
  char c = input_[pos_];
  char n = pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';
  size_t start = pos_;
  if (c == '=') {
    ++pos_;
    out = Token{TokenType::Equal, "=", start};
    return true;
  }
  if (c == '!') {
    if (n == '=') {
      pos_ += 2;
      out = Token{TokenType::NotEqual, "!=", start};
      return true;
    }
    // WHY: a lone '!' has no meaning in the grammar; report it instead of guessing.
    set_error("Unexpected character '!' (did you mean '!=')", start);
    return false;
  }
  if (c == '<') {
    if (n == '=') {
      pos_ += 2;
      out = Token{TokenType::LessEqual, "<=", start};
    } else if (n == '>') {
      pos_ += 2;
      out = Token{TokenType::NotEqual, "<>", start};
    } else {
      ++pos_;
      out = Token{TokenType::Less, "<", start};
    }
    return true;
  }
  if (c == '>') {
    if (n == '=') {
      pos_ += 2;
      out = Token{TokenType::GreaterEqual, ">=", start};
    } else {
      ++pos_;
      out = Token{TokenType::Greater, ">", start};
    }
    return true;
  }
  return false;
}

bool Lexer::lex_string(Token& out) {
  size_t start = pos_;
  char quote = input_[pos_++];
  std::string text;
  while (pos_ < input_.size()) {
    char c = input_[pos_++];
    if (c == quote) {
      out = Token{TokenType::String, text, start};
      return true;
    }
    text.push_back(c);
  }
  return set_error("Unterminated string literal", start);
}

Token Lexer::lex_identifier_or_keyword() {
  size_t start = pos_;
  std::string out;
  while (pos_ < input_.size() && is_ident_char(input_[pos_])) {
    out.push_back(input_[pos_++]);
  }
  std::string upper = util::to_upper(out);
  if (upper == "SELECT") return Token{TokenType::KeywordSelect, out, start};
  if (upper == "FROM") return Token{TokenType::KeywordFrom, out, start};
  if (upper == "WHERE") return Token{TokenType::KeywordWhere, out, start};
  if (upper == "AND") return Token{TokenType::KeywordAnd, out, start};
  if (upper == "OR") return Token{TokenType::KeywordOr, out, start};
  if (upper == "ORDER") return Token{TokenType::KeywordOrder, out, start};
  if (upper == "BY") return Token{TokenType::KeywordBy, out, start};
  if (upper == "ASC") return Token{TokenType::KeywordAsc, out, start};
  if (upper == "DESC") return Token{TokenType::KeywordDesc, out, start};
  if (upper == "LIMIT") return Token{TokenType::KeywordLimit, out, start};
  if (upper == "OFFSET") return Token{TokenType::KeywordOffset, out, start};
  return Token{TokenType::Identifier, out, start};
}

Token Lexer::lex_number() {
  size_t start = pos_;
  std::string out;
  while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
    out.push_back(input_[pos_++]);
  }
  if (pos_ + 1 < input_.size() && input_[pos_] == '.' &&
      std::isdigit(static_cast<unsigned char>(input_[pos_ + 1]))) {
    out.push_back(input_[pos_++]);
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_]))) {
      out.push_back(input_[pos_++]);
    }
  }
  return Token{TokenType::Number, out, start};
}

void Lexer::skip_ws() {
  while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
    ++pos_;
  }
}

bool Lexer::set_error(const std::string& message, size_t position) {
  if (!error_.has_value()) {
    error_ = LexError{message, position};
  }
  return false;
}

bool Lexer::is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool Lexer::is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

LexResult tokenize(const std::string& input) {
  LexResult result;
  Lexer lexer(input);
  while (true) {
    Token token;
    if (!lexer.next(token)) {
      result.tokens.clear();
      result.error = lexer.error();
      return result;
    }
    result.tokens.push_back(token);
    if (token.type == TokenType::End) break;
  }
  return result;
}

/// Lists tokens one per line as `position kind text`; string text is shown quoted.
std::string describe_tokens(const std::vector<Token>& tokens) {
  std::ostringstream os;
  for (const auto& token : tokens) {
    os << std::left << std::setw(6) << token.pos;
    if (token.type == TokenType::End) {
      os << to_string(token.type) << "\n";
      continue;
    }
    os << std::setw(16) << to_string(token.type);
    if (token.type == TokenType::String) {
      os << "'" << token.text << "'";
    } else {
      os << token.text;
    }
    os << "\n";
  }
  return os.str();
}

const char* to_string(TokenType type) {
  switch (type) {
    case TokenType::Identifier: return "identifier";
    case TokenType::String: return "string literal";
    case TokenType::Number: return "number literal";
    case TokenType::Comma: return "','";
    case TokenType::Semicolon: return "';'";
    case TokenType::Star: return "'*'";
    case TokenType::End: return "end of input";
    case TokenType::KeywordSelect: return "SELECT";
    case TokenType::KeywordFrom: return "FROM";
    case TokenType::KeywordWhere: return "WHERE";
    case TokenType::KeywordAnd: return "AND";
    case TokenType::KeywordOr: return "OR";
    case TokenType::KeywordOrder: return "ORDER";
    case TokenType::KeywordBy: return "BY";
    case TokenType::KeywordAsc: return "ASC";
    case TokenType::KeywordDesc: return "DESC";
    case TokenType::KeywordLimit: return "LIMIT";
    case TokenType::KeywordOffset: return "OFFSET";
    case TokenType::Equal: return "'='";
    case TokenType::NotEqual: return "'!='";
    case TokenType::Less: return "'<'";
    case TokenType::LessEqual: return "'<='";
    case TokenType::Greater: return "'>'";
    case TokenType::GreaterEqual: return "'>='";
  }
  return "?";
}

}  // namespace sqlc
