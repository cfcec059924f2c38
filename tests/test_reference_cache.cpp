#include "test_harness.h"
#include "test_utils.h"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "sqljudge/reference_cache.h"

namespace {

using namespace std::chrono_literals;
using sqljudge::ReferenceCache;

std::shared_ptr<const sqljudge::ResultTable> one_row(int64_t v) {
  return std::make_shared<const sqljudge::ResultTable>(
      make_table({"n"}, {{sqljudge::Value::from_integer(v)}}));
}

void test_cache_hit_and_key_separation() {
  ReferenceCache cache(8, 60s);
  expect_true(!cache.lookup("school", "SELECT 1").has_value(), "empty cache misses");
  cache.store("school", "SELECT 1", one_row(1), 12);
  auto hit = cache.lookup("school", "SELECT 1");
  expect_true(hit.has_value(), "stored entry found");
  expect_eq(static_cast<size_t>(hit->elapsed_ms), 12, "elapsed kept");
  expect_true(hit->table->rows[0][0].integer == 1, "table kept");
  expect_true(!cache.lookup("other", "SELECT 1").has_value(), "dataset is part of the key");
  expect_true(!cache.lookup("school", "SELECT  1").has_value(), "sql text is part of the key");
  cache.clear();
  expect_eq(cache.size(), 0, "clear empties");
}

void test_cache_entries_expire() {
  ReferenceCache cache(8, 20ms);
  cache.store("school", "SELECT 1", one_row(1), 1);
  std::this_thread::sleep_for(40ms);
  expect_true(!cache.lookup("school", "SELECT 1").has_value(), "expired entry misses");
  expect_eq(cache.size(), 0, "expired entry dropped");
}

void test_cache_evicts_least_recently_used() {
  ReferenceCache cache(2, 60s);
  cache.store("school", "a", one_row(1), 1);
  std::this_thread::sleep_for(2ms);
  cache.store("school", "b", one_row(2), 1);
  std::this_thread::sleep_for(2ms);
  expect_true(cache.lookup("school", "a").has_value(), "touch a");
  std::this_thread::sleep_for(2ms);
  cache.store("school", "c", one_row(3), 1);
  expect_eq(cache.size(), 2, "bounded");
  expect_true(cache.lookup("school", "a").has_value(), "recently used survives");
  expect_true(!cache.lookup("school", "b").has_value(), "least recently used evicted");
  expect_true(cache.lookup("school", "c").has_value(), "new entry present");
}

void test_cache_disabled_with_zero_entries() {
  ReferenceCache cache(0, 60s);
  cache.store("school", "SELECT 1", one_row(1), 1);
  expect_eq(cache.size(), 0, "nothing stored");
  expect_true(!cache.lookup("school", "SELECT 1").has_value(), "always misses");
}

}  // namespace

void register_reference_cache_tests(std::vector<TestCase>& tests) {
  tests.push_back({"cache_hit_and_key_separation", test_cache_hit_and_key_separation});
  tests.push_back({"cache_entries_expire", test_cache_entries_expire});
  tests.push_back({"cache_evicts_least_recently_used", test_cache_evicts_least_recently_used});
  tests.push_back({"cache_disabled_with_zero_entries", test_cache_disabled_with_zero_entries});
}
