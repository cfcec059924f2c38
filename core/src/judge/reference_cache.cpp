#include "sqljudge/reference_cache.h"

#include <utility>

#include "sqljudge/log.h"

namespace sqljudge {

ReferenceCache::ReferenceCache(size_t max_entries, std::chrono::milliseconds ttl)
    : max_entries_(max_entries), ttl_(ttl) {}

std::string ReferenceCache::make_key(const std::string& dataset_key, const std::string& sql) {
  // Dataset keys cannot contain NUL, so the separator keeps keys unambiguous.
  std::string key = dataset_key;
  key.push_back('\0');
  key += sql;
  return key;
}

std::optional<ReferenceCache::Entry> ReferenceCache::lookup(const std::string& dataset_key,
                                                            const std::string& sql) {
  if (max_entries_ == 0) return std::nullopt;
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(make_key(dataset_key, sql));
  if (it == entries_.end()) return std::nullopt;
  if (now - it->second.stored_at > ttl_) {
    entries_.erase(it);
    return std::nullopt;
  }
  it->second.last_access = now;
  log::debug("reference cache hit for dataset '" + dataset_key + "'");
  return it->second;
}

void ReferenceCache::store(const std::string& dataset_key,
                           const std::string& sql,
                           std::shared_ptr<const ResultTable> table,
                           int64_t elapsed_ms) {
  if (max_entries_ == 0 || !table) return;
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(mu_);
  const std::string key = make_key(dataset_key, sql);
  auto it = entries_.find(key);
  if (it == entries_.end() && entries_.size() >= max_entries_) {
    evict_lru();
  }
  entries_[key] = Entry{std::move(table), elapsed_ms, now, now};
}

size_t ReferenceCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

void ReferenceCache::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
}

void ReferenceCache::evict_lru() {
  if (entries_.empty()) return;
  auto victim = entries_.begin();
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->second.last_access < victim->second.last_access) victim = it;
  }
  entries_.erase(victim);
}

}  // namespace sqljudge
