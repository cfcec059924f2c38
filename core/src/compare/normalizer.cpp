#include "sqljudge/normalizer.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "sqljudge/errors.h"
#include "util/string_util.h"

namespace sqljudge {

namespace {

// Doubles at or beyond 2^63 do not fit int64 and stay non-exact.
constexpr double kInt64Bound = 9223372036854775808.0;

int kind_rank(CanonicalValue::Kind kind) {
  switch (kind) {
    case CanonicalValue::Kind::Null:
      return 0;
    case CanonicalValue::Kind::Number:
      return 1;
    case CanonicalValue::Kind::NaN:
      return 2;
    case CanonicalValue::Kind::Text:
      return 3;
    case CanonicalValue::Kind::Blob:
      return 4;
  }
  return 5;
}

template <typename T>
int three_way(const T& a, const T& b) {
  if (a < b) return -1;
  if (b < a) return 1;
  return 0;
}

long double as_long_double(const CanonicalValue& v) {
  return v.exact_integer ? static_cast<long double>(v.integer) : static_cast<long double>(v.number);
}

CanonicalValue text_value(std::string text) {
  CanonicalValue out;
  out.kind = CanonicalValue::Kind::Text;
  out.text = std::move(text);
  return out;
}

}  // namespace

CanonicalValue canonicalize_value(const Value& value, const ComparisonPolicy& policy) {
  CanonicalValue out;
  switch (value.type) {
    case Value::Type::Null:
      return out;
    case Value::Type::Integer:
      out.kind = CanonicalValue::Kind::Number;
      out.exact_integer = true;
      out.integer = value.integer;
      out.number = static_cast<double>(value.integer);
      return out;
    case Value::Type::Real: {
      const double v = value.real;
      if (std::isnan(v)) {
        out.kind = CanonicalValue::Kind::NaN;
        return out;
      }
      out.kind = CanonicalValue::Kind::Number;
      out.approximate = true;
      out.number = v == 0.0 ? 0.0 : v;
      if (std::isfinite(v) && std::trunc(v) == v && v >= -kInt64Bound && v < kInt64Bound) {
        out.exact_integer = true;
        out.integer = static_cast<int64_t>(v);
      }
      return out;
    }
    case Value::Type::Temporal: {
      std::string canonical;
      if (canonicalize_temporal(value.text, canonical, true)) return text_value(std::move(canonical));
      return text_value(policy.case_insensitive_text ? util::to_lower(value.text) : value.text);
    }
    case Value::Type::Text: {
      std::string canonical;
      if (policy.temporal_text_detection && canonicalize_temporal(value.text, canonical, false)) {
        return text_value(std::move(canonical));
      }
      return text_value(policy.case_insensitive_text ? util::to_lower(value.text) : value.text);
    }
    case Value::Type::Blob:
      out.kind = CanonicalValue::Kind::Blob;
      out.text = value.text;
      return out;
  }
  throw JudgeError(ErrorKind::InternalFault, "Unknown value type");
}

int compare_exact(const CanonicalValue& a, const CanonicalValue& b) {
  const int rank = three_way(kind_rank(a.kind), kind_rank(b.kind));
  if (rank != 0) return rank;
  switch (a.kind) {
    case CanonicalValue::Kind::Null:
    case CanonicalValue::Kind::NaN:
      return 0;
    case CanonicalValue::Kind::Number:
      if (a.exact_integer && b.exact_integer) return three_way(a.integer, b.integer);
      return three_way(as_long_double(a), as_long_double(b));
    case CanonicalValue::Kind::Text:
    case CanonicalValue::Kind::Blob:
      return three_way(a.text, b.text);
  }
  return 0;
}

int compare_rows_exact(const CanonicalRow& a, const CanonicalRow& b) {
  const size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    const int c = compare_exact(a[i], b[i]);
    if (c != 0) return c;
  }
  return three_way(a.size(), b.size());
}

bool values_equivalent(const CanonicalValue& a, const CanonicalValue& b,
                       const ComparisonPolicy& policy) {
  if (compare_exact(a, b) == 0) return true;
  if (a.kind != CanonicalValue::Kind::Number || b.kind != CanonicalValue::Kind::Number) return false;
  // Tolerance only absorbs floating storage; two exact integers must match exactly.
  if (!a.approximate && !b.approximate) return false;
  const long double x = as_long_double(a);
  const long double y = as_long_double(b);
  if (std::isinf(static_cast<double>(x)) || std::isinf(static_cast<double>(y))) return false;
  const long double diff = std::fabs(x - y);
  if (diff <= policy.float_abs_tolerance) return true;
  const long double scale = std::max(std::fabs(x), std::fabs(y));
  return diff <= policy.float_rel_tolerance * scale;
}

bool rows_equivalent(const CanonicalRow& a, const CanonicalRow& b, const ComparisonPolicy& policy) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (!values_equivalent(a[i], b[i], policy)) return false;
  }
  return true;
}

NormalizedTable normalize(const ResultTable& table, const ComparisonPolicy& policy) {
  validate_result_table(table);
  NormalizedTable out;
  out.policy = policy;

  std::vector<std::string> keys;
  keys.reserve(table.columns.size());
  for (const auto& name : table.columns) {
    keys.push_back(policy.case_insensitive_columns ? util::to_lower(name) : name);
  }
  std::vector<size_t> order(table.columns.size());
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    if (keys[a] != keys[b]) return keys[a] < keys[b];
    return table.columns[a] < table.columns[b];
  });
  for (size_t i = 1; i < order.size(); ++i) {
    if (keys[order[i]] == keys[order[i - 1]]) {
      throw JudgeError(ErrorKind::ExecutionError,
                       "Result has duplicate column name '" + table.columns[order[i]] +
                           "' when column case is ignored; alias the columns apart");
    }
  }
  for (size_t idx : order) {
    out.columns.push_back(table.columns[idx]);
    out.column_keys.push_back(keys[idx]);
  }

  out.rows.reserve(table.rows.size());
  for (const auto& row : table.rows) {
    CanonicalRow canonical;
    canonical.reserve(order.size());
    for (size_t idx : order) canonical.push_back(canonicalize_value(row[idx], policy));
    out.rows.push_back(std::move(canonical));
  }
  std::sort(out.rows.begin(), out.rows.end(),
            [](const CanonicalRow& a, const CanonicalRow& b) { return compare_rows_exact(a, b) < 0; });
  return out;
}

std::string render_canonical(const CanonicalValue& value) {
  switch (value.kind) {
    case CanonicalValue::Kind::Null:
      return "NULL";
    case CanonicalValue::Kind::NaN:
      return "NaN";
    case CanonicalValue::Kind::Number:
      if (value.exact_integer) return std::to_string(value.integer);
      return util::format_real(value.number);
    case CanonicalValue::Kind::Text:
      return value.text;
    case CanonicalValue::Kind::Blob:
      return util::format_blob(value.text);
  }
  return "";
}

}  // namespace sqljudge
