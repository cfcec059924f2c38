#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "sqljudge/backing_store.h"

namespace sqljudge {

class ConnectionPool;

/// Scoped lease on a pooled connection; returns it to the pool on destruction.
/// Move-only. MUST NOT outlive the pool it came from.
class PooledConnection {
 public:
  PooledConnection() = default;
  PooledConnection(ConnectionPool* pool, std::unique_ptr<StoreConnection> connection);
  PooledConnection(PooledConnection&& other) noexcept;
  PooledConnection& operator=(PooledConnection&& other) noexcept;
  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;
  ~PooledConnection();

  StoreConnection& operator*() const { return *connection_; }
  StoreConnection* operator->() const { return connection_.get(); }
  explicit operator bool() const { return connection_ != nullptr; }

 private:
  void release();

  ConnectionPool* pool_ = nullptr;
  std::unique_ptr<StoreConnection> connection_;
};

/// Bounded set of connections for one dataset.
/// Connections are opened lazily up to capacity and reused while healthy.
/// Waiters are served in no particular order.
class ConnectionPool {
 public:
  using Factory = std::function<std::unique_ptr<StoreConnection>()>;

  ConnectionPool(std::string name, size_t capacity, Factory factory);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /// Leases a connection, waiting at most `wait`.
  /// Throws JudgeError{PoolExhausted} on expiry and JudgeError{InternalFault} after close().
  PooledConnection acquire(std::chrono::milliseconds wait);

  const std::string& name() const { return name_; }
  size_t capacity() const { return capacity_; }
  /// Leases that could be granted right now without waiting.
  size_t available() const;
  size_t in_use() const;
  size_t idle() const;

  /// Interrupts leased connections and refuses further acquisitions.
  void close();

 private:
  friend class PooledConnection;
  void release(std::unique_ptr<StoreConnection> connection);

  const std::string name_;
  const size_t capacity_;
  Factory factory_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<std::unique_ptr<StoreConnection>> idle_;
  std::unordered_set<StoreConnection*> leased_;
  size_t opening_ = 0;
  bool closed_ = false;
};

}  // namespace sqljudge
