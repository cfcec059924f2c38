#include "test_harness.h"
#include "test_utils.h"

#include <cmath>
#include <limits>
#include <vector>

#include "sqljudge/normalizer.h"

namespace {

using sqljudge::CanonicalValue;
using sqljudge::ComparisonPolicy;
using sqljudge::Value;

CanonicalValue canon(const Value& v, const ComparisonPolicy& policy = {}) {
  return sqljudge::canonicalize_value(v, policy);
}

void test_integer_and_real_are_one_number() {
  const auto one = canon(Value::from_integer(1));
  const auto one_real = canon(Value::from_real(1.0));
  expect_true(sqljudge::compare_exact(one, one_real) == 0, "1 == 1.0");
  expect_true(one_real.exact_integer && one_real.approximate, "integral real keeps exact form");
  expect_true(sqljudge::compare_exact(canon(Value::from_real(-0.0)), canon(Value::from_integer(0))) == 0,
              "negative zero folds to zero");
  const auto big = canon(Value::from_integer(9007199254740993LL));
  const auto big_real = canon(Value::from_real(9007199254740992.0));
  expect_true(sqljudge::compare_exact(big, big_real) != 0, "large integers compared exactly");
}

void test_null_is_distinct() {
  const auto null = canon(Value::null());
  expect_true(sqljudge::compare_exact(null, canon(Value::from_text(""))) != 0, "NULL differs from ''");
  expect_true(sqljudge::compare_exact(null, canon(Value::from_integer(0))) != 0, "NULL differs from 0");
  expect_true(sqljudge::compare_exact(null, canon(Value::null())) == 0, "NULL equals NULL");
  expect_true(!sqljudge::values_equivalent(null, canon(Value::from_real(0.0)), ComparisonPolicy{}),
              "tolerance never bridges NULL");
  expect_eq(sqljudge::render_canonical(null), "NULL", "NULL rendering");
}

void test_nan_matches_only_nan() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const auto a = canon(Value::from_real(nan));
  expect_true(a.kind == CanonicalValue::Kind::NaN, "nan kind");
  expect_true(sqljudge::compare_exact(a, canon(Value::from_real(nan))) == 0, "NaN equals NaN");
  expect_true(!sqljudge::values_equivalent(a, canon(Value::from_real(0.0)), ComparisonPolicy{}),
              "NaN differs from numbers");
  const double inf = std::numeric_limits<double>::infinity();
  ComparisonPolicy loose;
  loose.float_rel_tolerance = 1.0;
  expect_true(!sqljudge::values_equivalent(canon(Value::from_real(inf)), canon(Value::from_real(1e308)), loose),
              "infinity never within tolerance");
  expect_true(sqljudge::values_equivalent(canon(Value::from_real(inf)), canon(Value::from_real(inf)), loose),
              "infinity equals itself");
}

void test_tolerance_only_for_floating_values() {
  ComparisonPolicy policy;
  policy.float_abs_tolerance = 0.01;
  policy.float_rel_tolerance = 0.0;
  expect_true(sqljudge::values_equivalent(canon(Value::from_real(85.001)), canon(Value::from_real(85.0)), policy),
              "within absolute tolerance");
  expect_true(!sqljudge::values_equivalent(canon(Value::from_real(85.1)), canon(Value::from_real(85.0)), policy),
              "outside absolute tolerance");
  ComparisonPolicy wide;
  wide.float_abs_tolerance = 5.0;
  expect_true(!sqljudge::values_equivalent(canon(Value::from_integer(3)), canon(Value::from_integer(4)), wide),
              "integers never use tolerance");
  ComparisonPolicy relative;
  relative.float_abs_tolerance = 0.0;
  relative.float_rel_tolerance = 1e-3;
  expect_true(sqljudge::values_equivalent(canon(Value::from_real(1000.5)), canon(Value::from_integer(1000)),
                                          relative),
              "relative tolerance scales with magnitude");
}

void test_temporal_values_compare_in_utc() {
  std::string out;
  expect_true(sqljudge::canonicalize_temporal("2024-03-01T10:00:00+01:00", out, false), "offset parsed");
  expect_eq(out, "2024-03-01T09:00:00.000000Z", "converted to UTC");
  expect_true(sqljudge::canonicalize_temporal("2024-03-01 09:00", out, false), "minutes only");
  expect_eq(out, "2024-03-01T09:00:00.000000Z", "seconds default to zero");
  expect_true(sqljudge::canonicalize_temporal("2024-01-01 00:30:00.1234567-0100", out, false), "compact offset");
  expect_eq(out, "2024-01-01T01:30:00.123456Z", "fraction truncated to microseconds");
  expect_true(sqljudge::canonicalize_temporal("2024-03-01 00:15:00+02:00", out, false), "day rollback");
  expect_eq(out, "2024-02-29T22:15:00.000000Z", "leap day reached");
  expect_true(!sqljudge::canonicalize_temporal("2023-02-29 00:00:00", out, false), "invalid day rejected");
  expect_true(!sqljudge::canonicalize_temporal("2024-03-01", out, false), "date only needs permission");
  expect_true(sqljudge::canonicalize_temporal("2024-03-01", out, true), "date only allowed");
  expect_eq(out, "2024-03-01", "date only kept");

  const auto a = canon(Value::from_temporal("2024-03-01 09:00:00"));
  const auto b = canon(Value::from_text("2024-03-01T10:00:00+01:00"));
  expect_true(sqljudge::compare_exact(a, b) == 0, "same instant, different text");
  ComparisonPolicy no_detect;
  no_detect.temporal_text_detection = false;
  expect_true(sqljudge::compare_exact(a, canon(Value::from_text("2024-03-01T10:00:00+01:00"), no_detect)) != 0,
              "untyped text kept when detection is off");
}

void test_case_policies() {
  ComparisonPolicy folded;
  folded.case_insensitive_text = true;
  expect_true(sqljudge::compare_exact(canon(Value::from_text("Ada"), folded),
                                      canon(Value::from_text("ADA"), folded)) == 0,
              "case folded text");
  expect_true(sqljudge::compare_exact(canon(Value::from_text("Ada")), canon(Value::from_text("ADA"))) != 0,
              "case sensitive by default");

  auto table = make_table({"Name", "name"}, {{Value::from_text("a"), Value::from_text("b")}});
  ComparisonPolicy columns;
  columns.case_insensitive_columns = true;
  expect_true(throws_kind([&] { sqljudge::normalize(table, columns); }, sqljudge::ErrorKind::ExecutionError),
              "columns colliding after folding");
  expect_eq(sqljudge::normalize(table, ComparisonPolicy{}).columns.size(), 2, "distinct when case matters");
}

void test_normalize_reorders_columns_and_rows() {
  auto table = make_table({"b", "a"}, {
                                          {Value::from_text("y"), Value::from_integer(2)},
                                          {Value::null(), Value::from_integer(1)},
                                          {Value::from_text("x"), Value::from_integer(2)},
                                      });
  auto normalized = sqljudge::normalize(table, ComparisonPolicy{});
  expect_eq(normalized.columns[0], "a", "columns sorted");
  expect_eq(normalized.columns[1], "b", "second column");
  expect_eq(normalized.rows.size(), 3, "row count kept");
  expect_eq(sqljudge::render_canonical(normalized.rows[0][0]), "1", "rows sorted by first column");
  expect_eq(sqljudge::render_canonical(normalized.rows[0][1]), "NULL", "values follow their column");
  expect_eq(sqljudge::render_canonical(normalized.rows[1][1]), "x", "ties broken by next column");
  expect_eq(sqljudge::render_canonical(normalized.rows[2][1]), "y", "last row");

  auto reordered = make_table({"a", "b"}, {
                                              {Value::from_integer(2), Value::from_text("x")},
                                              {Value::from_real(1.0), Value::null()},
                                              {Value::from_integer(2), Value::from_text("y")},
                                          });
  expect_true(sqljudge::equivalent(normalized, sqljudge::normalize(reordered, ComparisonPolicy{})),
              "order of rows and columns does not matter");
  expect_eq(sqljudge::render_canonical(sqljudge::canonicalize_value(Value::from_blob("\x01\xff"), {})),
            "x'01ff'", "blob rendering");
}

}  // namespace

void register_normalizer_tests(std::vector<TestCase>& tests) {
  tests.push_back({"integer_and_real_are_one_number", test_integer_and_real_are_one_number});
  tests.push_back({"null_is_distinct", test_null_is_distinct});
  tests.push_back({"nan_matches_only_nan", test_nan_matches_only_nan});
  tests.push_back({"tolerance_only_for_floating_values", test_tolerance_only_for_floating_values});
  tests.push_back({"temporal_values_compare_in_utc", test_temporal_values_compare_in_utc});
  tests.push_back({"case_policies", test_case_policies});
  tests.push_back({"normalize_reorders_columns_and_rows", test_normalize_reorders_columns_and_rows});
}
