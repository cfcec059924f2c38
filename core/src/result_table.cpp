#include "sqljudge/result_table.h"

#include <unordered_set>
#include <utility>

#include "sqljudge/errors.h"
#include "util/string_util.h"

namespace sqljudge {

Value Value::null() { return Value{}; }

Value Value::from_integer(int64_t v) {
  Value out;
  out.type = Type::Integer;
  out.integer = v;
  return out;
}

Value Value::from_real(double v) {
  Value out;
  out.type = Type::Real;
  out.real = v;
  return out;
}

Value Value::from_text(std::string v) {
  Value out;
  out.type = Type::Text;
  out.text = std::move(v);
  return out;
}

Value Value::from_blob(std::string bytes) {
  Value out;
  out.type = Type::Blob;
  out.text = std::move(bytes);
  return out;
}

Value Value::from_temporal(std::string v) {
  Value out;
  out.type = Type::Temporal;
  out.text = std::move(v);
  return out;
}

std::string value_to_display(const Value& value) {
  switch (value.type) {
    case Value::Type::Null:
      return "NULL";
    case Value::Type::Integer:
      return std::to_string(value.integer);
    case Value::Type::Real:
      return util::format_real(value.real);
    case Value::Type::Blob:
      return util::format_blob(value.text);
    case Value::Type::Text:
    case Value::Type::Temporal:
      return value.text;
  }
  return "";
}

void validate_result_table(const ResultTable& table) {
  std::unordered_set<std::string> seen;
  for (const auto& name : table.columns) {
    if (!seen.insert(name).second) {
      throw JudgeError(ErrorKind::ExecutionError,
                       "Duplicate column name '" + name +
                           "' in result; give each selected column a unique alias");
    }
  }
  if (!table.column_types.empty() && table.column_types.size() != table.columns.size()) {
    throw JudgeError(ErrorKind::InternalFault, "Column type list does not match column list");
  }
  for (size_t i = 0; i < table.rows.size(); ++i) {
    if (table.rows[i].size() != table.columns.size()) {
      throw JudgeError(ErrorKind::InternalFault,
                       "Row " + std::to_string(i) + " has " +
                           std::to_string(table.rows[i].size()) + " values for " +
                           std::to_string(table.columns.size()) + " columns");
    }
  }
}

}  // namespace sqljudge
