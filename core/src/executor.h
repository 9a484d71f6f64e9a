#pragma once

#include <stdexcept>
#include <string>

#include "sqlc/plan.h"
#include "sqlc/table.h"

namespace sqlc {

/// Reports a plan that cannot run against the given table.
/// MUST name the offending column; TypeMismatch also carries both types.
class ExecutionError : public std::runtime_error {
 public:
  enum class Kind { UnknownColumn, TypeMismatch };

  static ExecutionError unknown_column(const std::string& column);
  static ExecutionError type_mismatch(const std::string& column, DataType expected, DataType found);

  Kind kind() const { return kind_; }
  const std::string& column() const { return column_; }
  DataType expected() const { return expected_; }
  DataType found() const { return found_; }

 private:
  ExecutionError(Kind kind,
                 std::string column,
                 DataType expected,
                 DataType found,
                 const std::string& message);

  Kind kind_;
  std::string column_;
  DataType expected_;
  DataType found_;
};

/// Executes a plan against a table and materializes the result.
/// MUST NOT mutate the input and MUST evaluate the sort key against source rows.
/// Inputs are plan/table; outputs are a new Table; failures throw ExecutionError.
Table execute_plan(const Plan& plan, const Table& table);

}  // namespace sqlc
