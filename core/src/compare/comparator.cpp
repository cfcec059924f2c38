#include "sqljudge/comparator.h"

#include <algorithm>
#include <map>
#include <set>
#include <string>

#include "util/string_util.h"

namespace sqljudge {

namespace {

std::vector<std::string> render_row(const CanonicalRow& row) {
  std::vector<std::string> out;
  out.reserve(row.size());
  for (const auto& value : row) out.push_back(render_canonical(value));
  return out;
}

std::vector<std::vector<std::string>> render_rows(const std::vector<CanonicalRow>& rows, size_t limit) {
  std::vector<std::vector<std::string>> out;
  const size_t n = std::min(rows.size(), limit);
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) out.push_back(render_row(rows[i]));
  return out;
}

std::string plural(size_t count, const char* noun) {
  return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

struct ExactRowLess {
  bool operator()(const CanonicalRow& a, const CanonicalRow& b) const { return compare_rows_exact(a, b) < 0; }
};

/// Row indices of both sides that fall under one bucket key, in canonical order.
struct RowBucket {
  std::vector<size_t> ref;
  std::vector<size_t> cand;
};

/// Maximum matching between the reference and candidate rows of one bucket.
/// Identical rows are paired first; augmenting paths then re-route pairs until no
/// unmatched reference row can reach an unmatched candidate row.
class RowMatcher {
 public:
  RowMatcher(const std::vector<CanonicalRow>& ref, const std::vector<CanonicalRow>& cand,
             const RowBucket& bucket, const ComparisonPolicy& policy)
      : ref_(ref),
        cand_(cand),
        bucket_(bucket),
        policy_(policy),
        ref_match_(bucket.ref.size(), -1),
        cand_match_(bucket.cand.size(), -1),
        visited_(bucket.cand.size(), false) {}

  void run() {
    size_t u = 0;
    size_t v = 0;
    while (u < bucket_.ref.size() && v < bucket_.cand.size()) {
      const int c = compare_rows_exact(ref_row(u), cand_row(v));
      if (c == 0) {
        ref_match_[u] = static_cast<long>(v);
        cand_match_[v] = static_cast<long>(u);
        ++u;
        ++v;
      } else if (c < 0) {
        ++u;
      } else {
        ++v;
      }
    }
    for (size_t r = 0; r < bucket_.ref.size(); ++r) {
      if (ref_match_[r] >= 0) continue;
      std::fill(visited_.begin(), visited_.end(), false);
      augment(r);
    }
  }

  long ref_match(size_t u) const { return ref_match_[u]; }
  long cand_match(size_t v) const { return cand_match_[v]; }

 private:
  const CanonicalRow& ref_row(size_t u) const { return ref_[bucket_.ref[u]]; }
  const CanonicalRow& cand_row(size_t v) const { return cand_[bucket_.cand[v]]; }

  bool augment(size_t u) {
    for (size_t v = 0; v < bucket_.cand.size(); ++v) {
      if (visited_[v] || !rows_equivalent(ref_row(u), cand_row(v), policy_)) continue;
      visited_[v] = true;
      if (cand_match_[v] < 0 || augment(static_cast<size_t>(cand_match_[v]))) {
        cand_match_[v] = static_cast<long>(u);
        ref_match_[u] = static_cast<long>(v);
        return true;
      }
    }
    return false;
  }

  const std::vector<CanonicalRow>& ref_;
  const std::vector<CanonicalRow>& cand_;
  const RowBucket& bucket_;
  const ComparisonPolicy& policy_;
  std::vector<long> ref_match_;
  std::vector<long> cand_match_;
  std::vector<bool> visited_;
};

}  // namespace

RowDifference diff_rows(const NormalizedTable& reference, const NormalizedTable& candidate) {
  const ComparisonPolicy& policy = reference.policy;
  const auto& ref = reference.rows;
  const auto& cand = candidate.rows;

  // Rows that can be equivalent share a bucket key: exact values, except that numbers in
  // columns holding any floating value collapse to one placeholder.
  size_t width = 0;
  if (!ref.empty()) width = ref.front().size();
  else if (!cand.empty()) width = cand.front().size();
  std::vector<bool> tolerant(width, false);
  auto mark_tolerant = [&](const std::vector<CanonicalRow>& rows) {
    for (const auto& row : rows) {
      for (size_t c = 0; c < row.size() && c < width; ++c) {
        if (row[c].kind == CanonicalValue::Kind::Number && row[c].approximate) tolerant[c] = true;
      }
    }
  };
  mark_tolerant(ref);
  mark_tolerant(cand);
  auto bucket_key = [&](const CanonicalRow& row) {
    CanonicalRow key = row;
    for (size_t c = 0; c < key.size() && c < width; ++c) {
      if (tolerant[c] && key[c].kind == CanonicalValue::Kind::Number) {
        key[c] = CanonicalValue();
        key[c].kind = CanonicalValue::Kind::Number;
        key[c].exact_integer = true;
      }
    }
    return key;
  };

  std::map<CanonicalRow, RowBucket, ExactRowLess> buckets;
  for (size_t i = 0; i < ref.size(); ++i) buckets[bucket_key(ref[i])].ref.push_back(i);
  for (size_t j = 0; j < cand.size(); ++j) buckets[bucket_key(cand[j])].cand.push_back(j);

  std::vector<bool> ref_matched(ref.size(), false);
  std::vector<bool> cand_matched(cand.size(), false);
  for (auto& entry : buckets) {
    RowMatcher matcher(ref, cand, entry.second, policy);
    matcher.run();
    for (size_t u = 0; u < entry.second.ref.size(); ++u) {
      if (matcher.ref_match(u) >= 0) ref_matched[entry.second.ref[u]] = true;
    }
    for (size_t v = 0; v < entry.second.cand.size(); ++v) {
      if (matcher.cand_match(v) >= 0) cand_matched[entry.second.cand[v]] = true;
    }
  }

  RowDifference diff;
  for (size_t i = 0; i < ref.size(); ++i) {
    if (!ref_matched[i]) diff.missing.push_back(ref[i]);
  }
  for (size_t j = 0; j < cand.size(); ++j) {
    if (!cand_matched[j]) diff.extra.push_back(cand[j]);
  }
  return diff;
}

bool equivalent(const NormalizedTable& a, const NormalizedTable& b) {
  if (a.column_keys != b.column_keys || a.rows.size() != b.rows.size()) return false;
  const RowDifference diff = diff_rows(a, b);
  return diff.missing.empty() && diff.extra.empty();
}

Verdict compare(const NormalizedTable& reference, const NormalizedTable& candidate) {
  Verdict verdict;
  const size_t preview_rows = reference.policy.preview_rows;

  if (reference.column_keys != candidate.column_keys) {
    const std::set<std::string> ref_keys(reference.column_keys.begin(), reference.column_keys.end());
    const std::set<std::string> cand_keys(candidate.column_keys.begin(), candidate.column_keys.end());
    MismatchPreview preview;
    preview.columns = reference.columns;
    for (size_t i = 0; i < reference.columns.size(); ++i) {
      if (!cand_keys.count(reference.column_keys[i])) preview.missing_columns.push_back(reference.columns[i]);
    }
    for (size_t i = 0; i < candidate.columns.size(); ++i) {
      if (!ref_keys.count(candidate.column_keys[i])) preview.extra_columns.push_back(candidate.columns[i]);
    }
    std::string message = "Column mismatch:";
    if (!preview.missing_columns.empty()) {
      message += " missing columns [" + util::join(preview.missing_columns, ", ") + "]";
    }
    if (!preview.extra_columns.empty()) {
      if (!preview.missing_columns.empty()) message += ";";
      message += " unexpected columns [" + util::join(preview.extra_columns, ", ") + "]";
    }
    verdict.status = VerdictStatus::Fail;
    verdict.reason = ErrorKind::ColumnMismatch;
    verdict.message = message;
    verdict.mismatch = std::move(preview);
    return verdict;
  }

  RowDifference diff = diff_rows(reference, candidate);
  if (diff.missing.empty() && diff.extra.empty()) {
    verdict.status = VerdictStatus::Pass;
    verdict.message = "Result matches the reference (" + plural(reference.rows.size(), "row") + ")";
    return verdict;
  }

  MismatchPreview preview;
  preview.columns = reference.columns;
  preview.missing_count = diff.missing.size();
  preview.extra_count = diff.extra.size();
  preview.missing_rows = render_rows(diff.missing, preview_rows);
  preview.extra_rows = render_rows(diff.extra, preview_rows);
  verdict.status = VerdictStatus::Fail;
  verdict.reason = ErrorKind::RowMismatch;
  verdict.message = "Result differs from the reference: " + plural(diff.missing.size(), "missing row") +
                    ", " + plural(diff.extra.size(), "unexpected row");
  verdict.mismatch = std::move(preview);
  return verdict;
}

}  // namespace sqljudge
