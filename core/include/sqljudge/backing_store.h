#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sqljudge/config.h"
#include "sqljudge/result_table.h"

namespace sqljudge {

/// Cooperative cancellation flag shared between a judge request and its executions.
class CancelToken {
 public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

/// Bounds handed to a store for one statement.
struct ExecutionBudget {
  std::chrono::steady_clock::time_point deadline;
  int timeout_ms = 0;
  size_t max_rows = 0;
  std::shared_ptr<const CancelToken> cancel;
};

struct ColumnInfo {
  std::string name;
  std::string declared_type;
};

struct TableSchema {
  std::string name;
  std::vector<ColumnInfo> columns;
};

/// One open, read-only session on a backing store.
/// Used by one thread at a time except interrupt(), which any thread may call.
class StoreConnection {
 public:
  virtual ~StoreConnection() = default;

  /// Runs a single statement under the budget.
  /// MUST throw JudgeError with ExecutionError (backend message verbatim in detail),
  /// ExecutionTimeout, ResultTooLarge or ForbiddenStatement; never truncates silently.
  virtual ResultTable execute(const std::string& sql, const ExecutionBudget& budget) = 0;
  /// Lists user tables and their columns in lexical table order.
  virtual std::vector<TableSchema> describe_columns(const ExecutionBudget& budget) = 0;
  /// Aborts the statement in flight, if any.
  virtual void interrupt() = 0;
  /// Discards any implicit transaction; marks the connection unhealthy on failure.
  virtual void reset() noexcept = 0;
  /// False once the connection should not be returned to a pool.
  virtual bool healthy() const = 0;
};

/// Factory for connections of one backend kind.
class BackingStore {
 public:
  virtual ~BackingStore() = default;
  virtual std::string kind() const = 0;
  /// Opens a read-only connection.
  /// MUST throw JudgeError{InternalFault} if the descriptor is malformed or unreachable.
  virtual std::unique_ptr<StoreConnection> connect(const ConnectionDescriptor& descriptor) = 0;
};

/// Returns the store for a backend name ("sqlite").
/// Throws JudgeError{InternalFault} for unsupported backends.
std::shared_ptr<BackingStore> make_backing_store(const std::string& backend);

}  // namespace sqljudge
