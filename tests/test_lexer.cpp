#include "test_harness.h"

#include "parser/lexer.h"

namespace {

using sqlc::TokenType;

void test_lex_select_statement() {
  auto result = sqlc::tokenize("SELECT name, age FROM students WHERE age > 20");
  expect_true(!result.error.has_value(), "lex select ok");
  std::vector<TokenType> expected = {
      TokenType::KeywordSelect, TokenType::Identifier, TokenType::Comma,
      TokenType::Identifier,    TokenType::KeywordFrom, TokenType::Identifier,
      TokenType::KeywordWhere,  TokenType::Identifier, TokenType::Greater,
      TokenType::Number,        TokenType::End};
  expect_eq(result.tokens.size(), expected.size(), "lex select token count");
  for (size_t i = 0; i < expected.size() && i < result.tokens.size(); ++i) {
    expect_true(result.tokens[i].type == expected[i],
                "lex select token " + std::to_string(i) + " type");
  }
  if (result.tokens.size() == expected.size()) {
    expect_eq(result.tokens[1].pos, 7, "name position");
    expect_eq(result.tokens[10].pos, 45, "end position is input length");
  }
}

void test_lex_keywords_case_insensitive() {
  auto result = sqlc::tokenize("select * From t order BY x desc limit 2 offset 1");
  expect_true(!result.error.has_value(), "lex keywords ok");
  if (result.tokens.size() >= 12) {
    expect_true(result.tokens[0].type == TokenType::KeywordSelect, "select keyword");
    expect_true(result.tokens[0].text == "select", "keyword keeps original text");
    expect_true(result.tokens[2].type == TokenType::KeywordFrom, "from keyword");
    expect_true(result.tokens[4].type == TokenType::KeywordOrder, "order keyword");
    expect_true(result.tokens[5].type == TokenType::KeywordBy, "by keyword");
    expect_true(result.tokens[7].type == TokenType::KeywordDesc, "desc keyword");
    expect_true(result.tokens[8].type == TokenType::KeywordLimit, "limit keyword");
    expect_true(result.tokens[10].type == TokenType::KeywordOffset, "offset keyword");
  } else {
    expect_true(false, "lex keywords token count");
  }
}

void test_lex_string_literals() {
  auto result = sqlc::tokenize("city = 'New York' OR city = \"Chicago\"");
  expect_true(!result.error.has_value(), "lex strings ok");
  expect_eq(result.tokens.size(), 8, "lex strings token count");
  if (result.tokens.size() == 8) {
    expect_true(result.tokens[2].type == TokenType::String, "single-quoted string");
    expect_true(result.tokens[2].text == "New York", "string text excludes quotes");
    expect_eq(result.tokens[2].pos, 7, "string position is opening quote");
    expect_true(result.tokens[6].text == "Chicago", "double-quoted string");
  }
}

void test_lex_empty_string_literal() {
  auto result = sqlc::tokenize("name = ''");
  expect_true(!result.error.has_value(), "empty string ok");
  if (result.tokens.size() == 4) {
    expect_true(result.tokens[2].type == TokenType::String, "empty string type");
    expect_true(result.tokens[2].text.empty(), "empty string text");
  } else {
    expect_true(false, "empty string token count");
  }
}

void test_lex_numbers() {
  auto result = sqlc::tokenize("3.5 42 0.25");
  expect_true(!result.error.has_value(), "lex numbers ok");
  if (result.tokens.size() >= 3) {
    expect_true(result.tokens[0].text == "3.5", "decimal number");
    expect_true(result.tokens[1].text == "42", "integer number");
    expect_true(result.tokens[2].text == "0.25", "leading zero decimal");
  } else {
    expect_true(false, "lex numbers token count");
  }
}

void test_lex_comparison_operators() {
  auto result = sqlc::tokenize("= != <> < <= > >=");
  expect_true(!result.error.has_value(), "lex operators ok");
  std::vector<TokenType> expected = {TokenType::Equal,     TokenType::NotEqual,
                                     TokenType::NotEqual,  TokenType::Less,
                                     TokenType::LessEqual, TokenType::Greater,
                                     TokenType::GreaterEqual, TokenType::End};
  expect_eq(result.tokens.size(), expected.size(), "operator token count");
  for (size_t i = 0; i < expected.size() && i < result.tokens.size(); ++i) {
    expect_true(result.tokens[i].type == expected[i], "operator " + std::to_string(i));
  }
}

void test_lex_identifier_with_underscore_and_digits() {
  auto result = sqlc::tokenize("_col1 unknown_col");
  expect_true(!result.error.has_value(), "identifiers ok");
  if (result.tokens.size() == 3) {
    expect_true(result.tokens[0].text == "_col1", "leading underscore identifier");
    expect_true(result.tokens[1].text == "unknown_col", "embedded underscore identifier");
  } else {
    expect_true(false, "identifier token count");
  }
}

void test_lex_semicolon() {
  auto result = sqlc::tokenize("SELECT * FROM t;");
  expect_true(!result.error.has_value(), "semicolon ok");
  if (result.tokens.size() == 6) {
    expect_true(result.tokens[4].type == TokenType::Semicolon, "semicolon token");
  } else {
    expect_true(false, "semicolon token count");
  }
}

void test_lex_unterminated_string() {
  auto result = sqlc::tokenize("SELECT * FROM t WHERE name = 'Ann");
  expect_true(result.error.has_value(), "unterminated string errors");
  expect_true(result.tokens.empty(), "no tokens on error");
  if (result.error.has_value()) {
    expect_eq(result.error->position, 29, "unterminated string position");
    expect_true(result.error->message == "Unterminated string literal", "unterminated message");
  }
}

void test_lex_unexpected_character() {
  auto result = sqlc::tokenize("SELECT name FROM t WHERE age # 3");
  expect_true(result.error.has_value(), "unexpected character errors");
  if (result.error.has_value()) {
    expect_eq(result.error->position, 29, "unexpected character position");
    expect_true(result.error->message == "Unexpected character '#'", "unexpected character message");
  }
}

void test_lex_lone_bang() {
  auto result = sqlc::tokenize("age ! 3");
  expect_true(result.error.has_value(), "lone bang errors");
  if (result.error.has_value()) {
    expect_eq(result.error->position, 4, "lone bang position");
  }
}

void test_lex_empty_input() {
  auto result = sqlc::tokenize("   ");
  expect_true(!result.error.has_value(), "empty input ok");
  expect_eq(result.tokens.size(), 1, "empty input yields End");
  if (!result.tokens.empty()) {
    expect_true(result.tokens[0].type == TokenType::End, "only End");
  }
}

void test_describe_tokens() {
  auto result = sqlc::tokenize("SELECT a FROM t WHERE a = 'x'");
  expect_true(!result.error.has_value(), "describe tokens input lexes");
  std::string expected =
      "0     SELECT          SELECT\n"
      "7     identifier      a\n"
      "9     FROM            FROM\n"
      "14    identifier      t\n"
      "16    WHERE           WHERE\n"
      "22    identifier      a\n"
      "24    '='             =\n"
      "26    string literal  'x'\n"
      "29    end of input\n";
  expect_str(sqlc::describe_tokens(result.tokens), expected, "token listing");
}

}  // namespace

void register_lexer_tests(std::vector<TestCase>& tests) {
  tests.push_back({"lex_select_statement", test_lex_select_statement});
  tests.push_back({"lex_keywords_case_insensitive", test_lex_keywords_case_insensitive});
  tests.push_back({"lex_string_literals", test_lex_string_literals});
  tests.push_back({"lex_empty_string_literal", test_lex_empty_string_literal});
  tests.push_back({"lex_numbers", test_lex_numbers});
  tests.push_back({"lex_comparison_operators", test_lex_comparison_operators});
  tests.push_back({"lex_identifier_with_underscore_and_digits",
                   test_lex_identifier_with_underscore_and_digits});
  tests.push_back({"lex_semicolon", test_lex_semicolon});
  tests.push_back({"lex_unterminated_string", test_lex_unterminated_string});
  tests.push_back({"lex_unexpected_character", test_lex_unexpected_character});
  tests.push_back({"lex_lone_bang", test_lex_lone_bang});
  tests.push_back({"lex_empty_input", test_lex_empty_input});
  tests.push_back({"describe_tokens", test_describe_tokens});
}
