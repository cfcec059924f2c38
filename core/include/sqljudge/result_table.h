#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sqljudge {

/// One typed scalar read from a backing store.
/// Temporal marks text that the store declared as a DATE/TIME/TIMESTAMP column.
/// Blob bytes and temporal text both live in `text`.
struct Value {
  enum class Type { Null, Integer, Real, Text, Blob, Temporal };

  Type type = Type::Null;
  int64_t integer = 0;
  double real = 0.0;
  std::string text;

  static Value null();
  static Value from_integer(int64_t v);
  static Value from_real(double v);
  static Value from_text(std::string v);
  static Value from_blob(std::string bytes);
  static Value from_temporal(std::string v);

  bool is_null() const { return type == Type::Null; }
};

/// Renders a raw value for learner-facing previews (NULL prints as NULL).
std::string value_to_display(const Value& value);

/// Materialized result of one statement.
/// MUST keep every row aligned positionally with `columns`; column names are unique.
/// Never mutated after the executor returns it.
struct ResultTable {
  std::vector<std::string> columns;
  /// Declared column types when the store reports them, otherwise empty strings.
  std::vector<std::string> column_types;
  std::vector<std::vector<Value>> rows;
};

/// Validates the ResultTable shape.
/// Throws JudgeError{ExecutionError} on duplicate column names (learner-fixable)
/// and JudgeError{InternalFault} when a row is not aligned with the columns.
void validate_result_table(const ResultTable& table);

}  // namespace sqljudge
