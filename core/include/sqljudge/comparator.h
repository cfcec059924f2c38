#pragma once

#include <cstddef>
#include <vector>

#include "sqljudge/normalizer.h"
#include "sqljudge/verdict.h"

namespace sqljudge {

/// Multiset difference between two normalized tables, in canonical order.
struct RowDifference {
  std::vector<CanonicalRow> missing;
  std::vector<CanonicalRow> extra;
};

/// Computes reference-minus-candidate (missing) and candidate-minus-reference (extra).
/// Rows pair up through a maximum matching under the policy tolerance, so the counts
/// are the smallest possible; both lists stay in canonical order.
/// Deterministic for the same inputs.
RowDifference diff_rows(const NormalizedTable& reference, const NormalizedTable& candidate);

/// Produces Pass, Fail/ColumnMismatch or Fail/RowMismatch.
/// The mismatch preview holds at most reference.policy.preview_rows rows per side.
Verdict compare(const NormalizedTable& reference, const NormalizedTable& candidate);

}  // namespace sqljudge
