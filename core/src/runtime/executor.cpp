#include "sqljudge/executor.h"

#include <chrono>
#include <utility>

#include "sqljudge/errors.h"
#include "sqljudge/log.h"
#include "sqljudge/statement_filter.h"
#include "util/string_util.h"

namespace sqljudge {

namespace {

constexpr size_t kLoggedSqlBytes = 200;

ExecutionBudget make_budget(const ExecutionLimits& limits, int timeout_ms,
                            std::shared_ptr<const CancelToken> cancel) {
  ExecutionBudget budget;
  budget.timeout_ms = timeout_ms;
  budget.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  budget.max_rows = limits.max_rows;
  budget.cancel = std::move(cancel);
  return budget;
}

}  // namespace

SandboxedExecutor::SandboxedExecutor(std::shared_ptr<const DatasetRegistry> registry)
    : SandboxedExecutor(std::move(registry), nullptr) {}

SandboxedExecutor::SandboxedExecutor(std::shared_ptr<const DatasetRegistry> registry,
                                     std::shared_ptr<BackingStore> store)
    : registry_(std::move(registry)) {
  if (!registry_) {
    throw JudgeError(ErrorKind::InternalFault, "Executor requires a dataset registry");
  }
  for (const auto& ds : registry_->all()) {
    const ConnectionDescriptor descriptor = ds.connection;
    std::shared_ptr<BackingStore> backend = store;
    if (!backend) {
      auto it = stores_.find(descriptor.backend);
      if (it == stores_.end()) {
        it = stores_.emplace(descriptor.backend, make_backing_store(descriptor.backend)).first;
      }
      backend = it->second;
    }
    auto factory = [backend, descriptor]() { return backend->connect(descriptor); };
    pools_.emplace(ds.key, std::make_unique<ConnectionPool>(ds.key, descriptor.limits.pool_size,
                                                            std::move(factory)));
  }
}

SandboxedExecutor::~SandboxedExecutor() { shutdown(); }

ConnectionPool& SandboxedExecutor::pool_for(const ConnectionDescriptor& target) const {
  auto it = pools_.find(target.dataset_key);
  if (it == pools_.end() || !registry_->contains(target.dataset_key)) {
    throw JudgeError(ErrorKind::UnknownDataset, "Unknown dataset: " + target.dataset_key);
  }
  return *it->second;
}

ResultTable SandboxedExecutor::execute(const ConnectionDescriptor& target,
                                       const std::string& sql,
                                       const ExecuteOptions& options) {
  enforce_read_only(sql);
  ConnectionPool& pool = pool_for(target);
  const int timeout_ms = options.timeout_ms.value_or(target.limits.timeout_ms);
  if (timeout_ms <= 0) {
    throw JudgeError(ErrorKind::InvalidRequest, "Timeout must be a positive number of milliseconds");
  }

  PooledConnection lease =
      pool.acquire(std::chrono::milliseconds(target.limits.acquire_timeout_ms));
  struct ElapsedRecorder {
    ExecutionStats* stats;
    std::chrono::steady_clock::time_point started;
    ~ElapsedRecorder() {
      if (stats == nullptr) return;
      stats->elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    }
  } recorder{options.stats, std::chrono::steady_clock::now()};
  const ExecutionBudget budget = make_budget(target.limits, timeout_ms, options.cancel);
  log::debug("executing on dataset '" + target.dataset_key + "': " +
             util::abbreviate(sql, kLoggedSqlBytes));
  try {
    ResultTable table = lease->execute(sql, budget);
    validate_result_table(table);
    return table;
  } catch (const JudgeError& e) {
    if (e.kind() == ErrorKind::ExecutionTimeout) {
      log::warn("statement on dataset '" + target.dataset_key + "' timed out after " +
                std::to_string(timeout_ms) + " ms");
    }
    throw;
  }
}

std::vector<TableSchema> SandboxedExecutor::describe_columns(const ConnectionDescriptor& target) {
  ConnectionPool& pool = pool_for(target);
  PooledConnection lease =
      pool.acquire(std::chrono::milliseconds(target.limits.acquire_timeout_ms));
  return lease->describe_columns(make_budget(target.limits, target.limits.timeout_ms, nullptr));
}

DatasetPreview SandboxedExecutor::describe_dataset(const std::string& dataset_key,
                                                   size_t sample_rows) {
  const DatasetConfig& ds = registry_->dataset(dataset_key);
  DatasetPreview preview;
  preview.dataset_key = ds.key;
  preview.name = ds.name;
  for (auto& schema : describe_columns(ds.connection)) {
    TablePreview table;
    table.schema = std::move(schema);
    if (sample_rows > 0) {
      table.sample = execute(ds.connection, "SELECT * FROM " + quote_identifier(table.schema.name) +
                                                " LIMIT " + std::to_string(sample_rows));
    } else {
      for (const auto& col : table.schema.columns) {
        table.sample.columns.push_back(col.name);
        table.sample.column_types.push_back(col.declared_type);
      }
    }
    preview.tables.push_back(std::move(table));
  }
  return preview;
}

size_t SandboxedExecutor::available_connections(const std::string& dataset_key) const {
  return pool_for(registry_->resolve(dataset_key)).available();
}

void SandboxedExecutor::shutdown() {
  for (auto& kv : pools_) kv.second->close();
}

std::string quote_identifier(const std::string& name) {
  std::string out = "\"";
  for (char c : name) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

}  // namespace sqljudge
