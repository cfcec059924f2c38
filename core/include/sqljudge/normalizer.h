#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sqljudge/config.h"
#include "sqljudge/result_table.h"

namespace sqljudge {

/// Scalar after canonicalization.
/// Numbers keep an exact int64 when integral, so 1 and 1.0 are the same value;
/// `approximate` marks numbers that came from floating storage and may use tolerance.
struct CanonicalValue {
  enum class Kind { Null, Number, NaN, Text, Blob };

  Kind kind = Kind::Null;
  bool exact_integer = false;
  bool approximate = false;
  int64_t integer = 0;
  double number = 0.0;
  std::string text;
};

using CanonicalRow = std::vector<CanonicalValue>;

/// Canonical form of a ResultTable.
/// `columns` holds the original names in canonical (lexical key) order and `column_keys`
/// the comparison keys; every row is re-projected into that order and the row list
/// is sorted by exact value order, so the table reads as a multiset.
struct NormalizedTable {
  std::vector<std::string> columns;
  std::vector<std::string> column_keys;
  std::vector<CanonicalRow> rows;
  ComparisonPolicy policy;
};

/// Canonicalizes a table under `policy`.
NormalizedTable normalize(const ResultTable& table, const ComparisonPolicy& policy);
/// Canonicalizes a single value (exposed for tests and previews).
CanonicalValue canonicalize_value(const Value& value, const ComparisonPolicy& policy);

/// Total order without tolerance: Null < Number < NaN < Text < Blob.
int compare_exact(const CanonicalValue& a, const CanonicalValue& b);
int compare_rows_exact(const CanonicalRow& a, const CanonicalRow& b);
/// Equality under the numeric tolerance of `policy`.
bool values_equivalent(const CanonicalValue& a, const CanonicalValue& b, const ComparisonPolicy& policy);
bool rows_equivalent(const CanonicalRow& a, const CanonicalRow& b, const ComparisonPolicy& policy);

/// Renders a canonical value for previews (NULL, NaN, x'..' for blobs).
std::string render_canonical(const CanonicalValue& value);

/// Parses ISO-8601-like timestamps ("YYYY-MM-DD[ T]HH:MM[:SS[.f]][Z|+HH[:MM]]").
/// Returns false when `text` is not a full timestamp; on success writes the UTC form
/// "YYYY-MM-DDTHH:MM:SS.ffffffZ". Date-only text yields "YYYY-MM-DD".
bool canonicalize_temporal(const std::string& text, std::string& out, bool allow_date_only);

/// True when both tables have identical column sets and row multisets.
bool equivalent(const NormalizedTable& a, const NormalizedTable& b);

}  // namespace sqljudge
