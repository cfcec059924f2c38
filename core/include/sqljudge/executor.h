#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sqljudge/backing_store.h"
#include "sqljudge/connection_pool.h"
#include "sqljudge/dataset_registry.h"
#include "sqljudge/result_table.h"

namespace sqljudge {

/// Timing of one execution, measured from the moment a connection was leased.
struct ExecutionStats {
  int64_t elapsed_ms = 0;
};

/// Per-call overrides for one execution.
/// `stats`, when set, is filled in whether the statement succeeds or throws;
/// time spent waiting for a pooled connection is not counted.
struct ExecuteOptions {
  std::optional<int> timeout_ms;
  std::shared_ptr<const CancelToken> cancel;
  ExecutionStats* stats = nullptr;
};

/// Sample of one table for learner-facing dataset previews.
struct TablePreview {
  TableSchema schema;
  ResultTable sample;
};

struct DatasetPreview {
  std::string dataset_key;
  std::string name;
  std::vector<TablePreview> tables;
};

/// Runs untrusted SQL against registered datasets.
/// Order per call: safety filter, bounded pool acquisition, deadline-bound execution,
/// capped materialization, then rollback of any implicit transaction.
/// One pool per dataset is created at construction; the pool map is never mutated after.
class SandboxedExecutor {
 public:
  /// Uses make_backing_store() for each dataset's backend.
  explicit SandboxedExecutor(std::shared_ptr<const DatasetRegistry> registry);
  /// Routes every dataset through `store` regardless of its backend name.
  SandboxedExecutor(std::shared_ptr<const DatasetRegistry> registry,
                    std::shared_ptr<BackingStore> store);
  ~SandboxedExecutor();

  SandboxedExecutor(const SandboxedExecutor&) = delete;
  SandboxedExecutor& operator=(const SandboxedExecutor&) = delete;

  /// Executes one read-only statement.
  /// Throws JudgeError{ForbiddenStatement} before any connection is opened when the
  /// filter rejects the text; otherwise PoolExhausted, ExecutionTimeout,
  /// ResultTooLarge, ExecutionError or InternalFault.
  ResultTable execute(const ConnectionDescriptor& target,
                      const std::string& sql,
                      const ExecuteOptions& options = {});

  /// Lists tables/columns through the same pool and limits.
  std::vector<TableSchema> describe_columns(const ConnectionDescriptor& target);
  /// Schema plus up to `sample_rows` rows per table.
  DatasetPreview describe_dataset(const std::string& dataset_key, size_t sample_rows = 5);

  /// Free connection slots for a dataset; throws UnknownDataset for unknown keys.
  size_t available_connections(const std::string& dataset_key) const;
  /// Interrupts in-flight statements and closes every pool.
  void shutdown();

  const DatasetRegistry& registry() const { return *registry_; }

 private:
  ConnectionPool& pool_for(const ConnectionDescriptor& target) const;

  std::shared_ptr<const DatasetRegistry> registry_;
  std::map<std::string, std::shared_ptr<BackingStore>> stores_;
  std::map<std::string, std::unique_ptr<ConnectionPool>> pools_;
};

/// Quotes an identifier for use inside generated SQL ("a""b").
std::string quote_identifier(const std::string& name);

}  // namespace sqljudge
