#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqlc {

struct Span {
  size_t start = 0;
  size_t end = 0;
};

struct Identifier {
  std::string name;
  Span span;
};

/// A literal as written; the IR generator resolves its value from kind and text.
struct Literal {
  enum class Kind { String, Number } kind = Kind::String;
  std::string text;
  Span span;
};

struct CompareExpr {
  enum class Op { Eq, NotEq, Lt, Gt, Le, Ge } op = Op::Eq;
  /// Original operator spelling ("<>" and "!=" both map to NotEq).
  std::string op_text;
  Identifier column;
  Literal literal;
  Span span;
};

struct BinaryExpr;
using Expr = std::variant<CompareExpr, std::shared_ptr<BinaryExpr>>;

struct BinaryExpr {
  enum class Op { And, Or } op = Op::And;
  Expr left;
  Expr right;
  Span span;
};

struct StarColumns {
  Span span;
};

using ColumnSelection = std::variant<StarColumns, std::vector<Identifier>>;

struct SelectStatement {
  struct OrderBy {
    Identifier column;
    bool descending = false;
    Span span;
  };
  struct Limit {
    size_t count = 0;
    std::optional<size_t> offset;
    Span span;
  };
  ColumnSelection columns;
  Identifier table;
  std::optional<Expr> where;
  std::optional<OrderBy> order_by;
  std::optional<Limit> limit;
  Span span;
};

}  // namespace sqlc
