#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "sqljudge/result_table.h"

namespace sqljudge {

/// LRU cache of reference results keyed by (dataset key, reference SQL).
/// Entries expire after `ttl`; failed executions are never stored.
class ReferenceCache {
 public:
  struct Entry {
    std::shared_ptr<const ResultTable> table;
    int64_t elapsed_ms = 0;
    std::chrono::steady_clock::time_point stored_at;
    std::chrono::steady_clock::time_point last_access;
  };

  ReferenceCache(size_t max_entries, std::chrono::milliseconds ttl);

  std::optional<Entry> lookup(const std::string& dataset_key, const std::string& sql);
  void store(const std::string& dataset_key,
             const std::string& sql,
             std::shared_ptr<const ResultTable> table,
             int64_t elapsed_ms);
  size_t size() const;
  void clear();

 private:
  static std::string make_key(const std::string& dataset_key, const std::string& sql);
  void evict_lru();

  const size_t max_entries_;
  const std::chrono::milliseconds ttl_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace sqljudge
