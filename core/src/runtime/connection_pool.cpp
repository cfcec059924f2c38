#include "sqljudge/connection_pool.h"

#include <utility>

#include "sqljudge/errors.h"
#include "sqljudge/log.h"

namespace sqljudge {

PooledConnection::PooledConnection(ConnectionPool* pool, std::unique_ptr<StoreConnection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
  other.pool_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
  if (this != &other) {
    release();
    pool_ = other.pool_;
    connection_ = std::move(other.connection_);
    other.pool_ = nullptr;
  }
  return *this;
}

PooledConnection::~PooledConnection() { release(); }

void PooledConnection::release() {
  if (pool_ != nullptr && connection_) {
    pool_->release(std::move(connection_));
  }
  pool_ = nullptr;
  connection_.reset();
}

ConnectionPool::ConnectionPool(std::string name, size_t capacity, Factory factory)
    : name_(std::move(name)), capacity_(capacity), factory_(std::move(factory)) {
  if (capacity_ == 0) {
    throw JudgeError(ErrorKind::InternalFault, "Pool '" + name_ + "' needs a positive capacity");
  }
}

ConnectionPool::~ConnectionPool() { close(); }

PooledConnection ConnectionPool::acquire(std::chrono::milliseconds wait) {
  std::unique_lock<std::mutex> lock(mu_);
  const bool granted = cv_.wait_for(lock, wait, [&] {
    return closed_ || !idle_.empty() || leased_.size() + opening_ < capacity_;
  });
  if (closed_) {
    throw JudgeError(ErrorKind::InternalFault, "Connection pool '" + name_ + "' is closed");
  }
  if (!granted) {
    log::warn("connection pool '" + name_ + "' exhausted after " + std::to_string(wait.count()) +
              " ms");
    throw JudgeError(ErrorKind::PoolExhausted,
                     "No connection available for dataset '" + name_ + "'; try again shortly");
  }
  if (!idle_.empty()) {
    std::unique_ptr<StoreConnection> conn = std::move(idle_.back());
    idle_.pop_back();
    leased_.insert(conn.get());
    return PooledConnection(this, std::move(conn));
  }

  // Open outside the lock; the slot is reserved through opening_.
  ++opening_;
  lock.unlock();
  std::unique_ptr<StoreConnection> conn;
  try {
    conn = factory_();
  } catch (...) {
    lock.lock();
    --opening_;
    lock.unlock();
    cv_.notify_one();
    throw;
  }
  lock.lock();
  --opening_;
  if (!conn) {
    lock.unlock();
    cv_.notify_one();
    throw JudgeError(ErrorKind::InternalFault, "Pool '" + name_ + "' factory returned no connection");
  }
  leased_.insert(conn.get());
  return PooledConnection(this, std::move(conn));
}

void ConnectionPool::release(std::unique_ptr<StoreConnection> connection) {
  connection->reset();
  {
    std::lock_guard<std::mutex> lock(mu_);
    leased_.erase(connection.get());
    if (!closed_ && connection->healthy()) {
      idle_.push_back(std::move(connection));
    }
  }
  // A dropped unhealthy connection is destroyed here and frees its slot.
  connection.reset();
  cv_.notify_one();
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (closed_) return 0;
  return capacity_ - leased_.size() - opening_;
}

size_t ConnectionPool::in_use() const {
  std::lock_guard<std::mutex> lock(mu_);
  return leased_.size();
}

size_t ConnectionPool::idle() const {
  std::lock_guard<std::mutex> lock(mu_);
  return idle_.size();
}

void ConnectionPool::close() {
  std::vector<std::unique_ptr<StoreConnection>> dropped;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) return;
    closed_ = true;
    for (StoreConnection* conn : leased_) conn->interrupt();
    dropped.swap(idle_);
  }
  cv_.notify_all();
}

}  // namespace sqljudge
