#include "parser_internal.h"

#include <memory>
#include <utility>

#include "../util/string_util.h"

namespace sqlc {

/// Parses an expression with OR precedence.
/// MUST build BinaryExpr nodes in left-associative order.
/// Inputs are tokens; outputs are Expr or errors.
bool Parser::parse_expr(Expr& out) {
  Expr left;
  if (!parse_and_expr(left)) return false;
  while (current_.type == TokenType::KeywordOr) {
    Token op = current_;
    advance();
    Expr right;
    if (!parse_and_expr(right)) return false;
    auto node = std::make_shared<BinaryExpr>();
    node->op = BinaryExpr::Op::Or;
    node->left = std::move(left);
    node->right = std::move(right);
    node->span = Span{op.pos, current_.pos};
    left = node;
  }
  out = std::move(left);
  return true;
}

/// Parses an expression with AND precedence.
/// MUST build BinaryExpr nodes in left-associative order.
/// Inputs are tokens; outputs are Expr or errors.
bool Parser::parse_and_expr(Expr& out) {
  Expr left;
  if (!parse_cmp_expr(left)) return false;
  while (current_.type == TokenType::KeywordAnd) {
    Token op = current_;
    advance();
    Expr right;
    if (!parse_cmp_expr(right)) return false;
    auto node = std::make_shared<BinaryExpr>();
    node->op = BinaryExpr::Op::And;
    node->left = std::move(left);
    node->right = std::move(right);
    node->span = Span{op.pos, current_.pos};
    left = node;
  }
  out = std::move(left);
  return true;
}

/// Parses `column op literal`.
/// Inputs are tokens; outputs are CompareExpr or errors.
bool Parser::parse_cmp_expr(Expr& out) {
  CompareExpr cmp;
  if (!parse_identifier(cmp.column)) return false;
  if (!parse_compare_op(cmp)) return false;
  if (!parse_literal(cmp.literal)) return false;
  cmp.span = Span{cmp.column.span.start, cmp.literal.span.end};
  out = std::move(cmp);
  return true;
}

bool Parser::parse_compare_op(CompareExpr& cmp) {
  switch (current_.type) {
    case TokenType::Equal:
      cmp.op = CompareExpr::Op::Eq;
      break;
    case TokenType::NotEqual:
      cmp.op = CompareExpr::Op::NotEq;
      break;
    case TokenType::Less:
      cmp.op = CompareExpr::Op::Lt;
      break;
    case TokenType::Greater:
      cmp.op = CompareExpr::Op::Gt;
      break;
    case TokenType::LessEqual:
      cmp.op = CompareExpr::Op::Le;
      break;
    case TokenType::GreaterEqual:
      cmp.op = CompareExpr::Op::Ge;
      break;
    default:
      return set_error({TokenType::Equal, TokenType::NotEqual, TokenType::Less,
                        TokenType::Greater, TokenType::LessEqual, TokenType::GreaterEqual});
  }
  cmp.op_text = current_.text;
  advance();
  return true;
}

/// Parses a string or number literal, keeping its raw text for the IR generator.
/// MUST reject number literals that do not fit a double.
bool Parser::parse_literal(Literal& out) {
  if (current_.type == TokenType::String) {
    out.kind = Literal::Kind::String;
  } else if (current_.type == TokenType::Number) {
    if (!util::parse_number(current_.text).has_value()) {
      return set_error({TokenType::Number},
                       "Number literal is out of range: " + current_.text);
    }
    out.kind = Literal::Kind::Number;
  } else {
    return set_error({TokenType::String, TokenType::Number});
  }
  out.text = current_.text;
  // String tokens drop their quotes; the span covers them.
  size_t quotes = out.kind == Literal::Kind::String ? 2 : 0;
  out.span = Span{current_.pos, current_.pos + current_.text.size() + quotes};
  advance();
  return true;
}

}  // namespace sqlc
