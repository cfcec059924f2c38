#include "store/sqlite_store.h"

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <vector>

#include "sqljudge/errors.h"
#include "sqljudge/log.h"
#include "util/string_util.h"

namespace sqljudge {

namespace {

constexpr int kProgressOps = 1000;

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

bool is_temporal_decltype(const char* decl) {
  if (decl == nullptr) return false;
  const std::string upper = util::to_upper(decl);
  return upper.find("DATE") != std::string::npos || upper.find("TIME") != std::string::npos;
}

Value read_column(sqlite3_stmt* stmt, int col, bool temporal) {
  switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_NULL:
      return Value::null();
    case SQLITE_INTEGER:
      return Value::from_integer(sqlite3_column_int64(stmt, col));
    case SQLITE_FLOAT:
      return Value::from_real(sqlite3_column_double(stmt, col));
    case SQLITE_BLOB: {
      const void* data = sqlite3_column_blob(stmt, col);
      const int size = sqlite3_column_bytes(stmt, col);
      if (data == nullptr || size <= 0) return Value::from_blob(std::string());
      return Value::from_blob(std::string(static_cast<const char*>(data), static_cast<size_t>(size)));
    }
    default: {
      const unsigned char* data = sqlite3_column_text(stmt, col);
      const int size = sqlite3_column_bytes(stmt, col);
      std::string text;
      if (data != nullptr && size > 0) {
        text.assign(reinterpret_cast<const char*>(data), static_cast<size_t>(size));
      }
      return temporal ? Value::from_temporal(std::move(text)) : Value::from_text(std::move(text));
    }
  }
}

class SqliteConnection : public StoreConnection {
 public:
  SqliteConnection(sqlite3* db, std::string dataset_key)
      : db_(db), dataset_key_(std::move(dataset_key)) {
    sqlite3_progress_handler(db_, kProgressOps, &SqliteConnection::on_progress, this);
  }

  ~SqliteConnection() override {
    sqlite3_progress_handler(db_, 0, nullptr, nullptr);
    sqlite3_close_v2(db_);
  }

  ResultTable execute(const std::string& sql, const ExecutionBudget& budget) override {
    return run(sql, {}, budget, true);
  }

  std::vector<TableSchema> describe_columns(const ExecutionBudget& budget) override {
    ResultTable tables = run(
        "SELECT name FROM sqlite_master WHERE type IN ('table', 'view') "
        "AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' ORDER BY name",
        {}, budget, false);
    std::vector<TableSchema> out;
    out.reserve(tables.rows.size());
    for (const auto& row : tables.rows) {
      TableSchema schema;
      schema.name = row.at(0).text;
      ResultTable cols = run("SELECT name, type FROM pragma_table_info(?) ORDER BY cid",
                             {schema.name}, budget, false);
      for (const auto& col : cols.rows) {
        schema.columns.push_back(ColumnInfo{col.at(0).text, col.at(1).text});
      }
      out.push_back(std::move(schema));
    }
    return out;
  }

  void interrupt() override { sqlite3_interrupt(db_); }

  void reset() noexcept override {
    if (sqlite3_get_autocommit(db_) != 0) return;
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
      log::warn("rollback failed on dataset '" + dataset_key_ + "': " +
                (err != nullptr ? std::string(err) : std::string("unknown error")));
      healthy_ = false;
    }
    sqlite3_free(err);
  }

  bool healthy() const override { return healthy_; }

 private:
  enum class AbortReason { None, Timeout, Cancelled };

  static int on_progress(void* ctx) {
    auto* self = static_cast<SqliteConnection*>(ctx);
    const ExecutionBudget* budget = self->budget_;
    if (budget == nullptr) return 0;
    if (budget->cancel && budget->cancel->cancelled()) {
      self->abort_ = AbortReason::Cancelled;
      return 1;
    }
    if (std::chrono::steady_clock::now() >= budget->deadline) {
      self->abort_ = AbortReason::Timeout;
      return 1;
    }
    return 0;
  }

  [[noreturn]] void throw_interrupted(const ExecutionBudget& budget) const {
    if (abort_ == AbortReason::Timeout) {
      throw JudgeError(ErrorKind::ExecutionTimeout,
                       "Query exceeded the " + std::to_string(budget.timeout_ms) + " ms time limit");
    }
    if (abort_ == AbortReason::Cancelled) {
      throw JudgeError(ErrorKind::InternalFault, "execution cancelled");
    }
    throw JudgeError(ErrorKind::InternalFault, "execution interrupted");
  }

  [[noreturn]] void throw_backend_error(int rc, const ExecutionBudget& budget) const {
    if (rc == SQLITE_INTERRUPT) throw_interrupted(budget);
    const std::string message = sqlite3_errmsg(db_);
    if ((rc & 0xff) == SQLITE_READONLY || (rc & 0xff) == SQLITE_AUTH) {
      throw JudgeError(ErrorKind::ForbiddenStatement, message, message);
    }
    throw JudgeError(ErrorKind::ExecutionError, message, message);
  }

  /// Runs one statement. Anything past the first statement must be whitespace or comments.
  ResultTable run(const std::string& sql,
                  const std::vector<std::string>& params,
                  const ExecutionBudget& budget,
                  bool enforce_cap) {
    struct BudgetScope {
      SqliteConnection* self;
      ~BudgetScope() { self->budget_ = nullptr; }
    } scope{this};
    budget_ = &budget;
    abort_ = AbortReason::None;

    if (budget.cancel && budget.cancel->cancelled()) {
      abort_ = AbortReason::Cancelled;
      throw_interrupted(budget);
    }
    if (std::chrono::steady_clock::now() >= budget.deadline) {
      abort_ = AbortReason::Timeout;
      throw_interrupted(budget);
    }

    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, &tail);
    StatementPtr stmt(raw);
    if (rc != SQLITE_OK) throw_backend_error(rc, budget);
    if (!stmt) {
      throw JudgeError(ErrorKind::InvalidRequest, "SQL text contains no statement");
    }
    ensure_single_statement(sql, tail, budget);
    if (sqlite3_stmt_readonly(stmt.get()) == 0) {
      throw JudgeError(ErrorKind::ForbiddenStatement, "Only read-only statements can be executed");
    }
    for (size_t i = 0; i < params.size(); ++i) {
      rc = sqlite3_bind_text(stmt.get(), static_cast<int>(i + 1), params[i].c_str(),
                             static_cast<int>(params[i].size()), SQLITE_TRANSIENT);
      if (rc != SQLITE_OK) throw_backend_error(rc, budget);
    }

    ResultTable table;
    const int column_count = sqlite3_column_count(stmt.get());
    std::vector<bool> temporal(static_cast<size_t>(column_count), false);
    for (int i = 0; i < column_count; ++i) {
      const char* name = sqlite3_column_name(stmt.get(), i);
      const char* decl = sqlite3_column_decltype(stmt.get(), i);
      table.columns.push_back(name != nullptr ? name : "");
      table.column_types.push_back(decl != nullptr ? decl : "");
      temporal[static_cast<size_t>(i)] = is_temporal_decltype(decl);
    }

    while (true) {
      rc = sqlite3_step(stmt.get());
      if (rc == SQLITE_DONE) break;
      if (rc != SQLITE_ROW) throw_backend_error(rc, budget);
      if (enforce_cap && table.rows.size() >= budget.max_rows) {
        throw JudgeError(ErrorKind::ResultTooLarge,
                         "Result exceeds the limit of " + std::to_string(budget.max_rows) + " rows");
      }
      std::vector<Value> row;
      row.reserve(static_cast<size_t>(column_count));
      for (int i = 0; i < column_count; ++i) {
        row.push_back(read_column(stmt.get(), i, temporal[static_cast<size_t>(i)]));
      }
      table.rows.push_back(std::move(row));
    }
    return table;
  }

  void ensure_single_statement(const std::string& sql, const char* tail,
                               const ExecutionBudget& budget) {
    const char* end = sql.c_str() + sql.size();
    while (tail != nullptr && tail < end) {
      sqlite3_stmt* raw = nullptr;
      const char* next = nullptr;
      const int rc = sqlite3_prepare_v2(db_, tail, static_cast<int>(end - tail), &raw, &next);
      StatementPtr extra(raw);
      if (rc != SQLITE_OK) throw_backend_error(rc, budget);
      if (extra) {
        const size_t pos = static_cast<size_t>(tail - sql.c_str());
        throw JudgeError(ErrorKind::ForbiddenStatement, "Only a single statement may be executed",
                         pos, static_cast<size_t>(next - tail));
      }
      if (next == tail) break;
      tail = next;
    }
  }

  sqlite3* db_;
  std::string dataset_key_;
  const ExecutionBudget* budget_ = nullptr;
  AbortReason abort_ = AbortReason::None;
  bool healthy_ = true;
};

}  // namespace

std::string sqlite_read_only_uri(const std::string& path) {
  // An explicit URI keeps its own parameters; SQLITE_OPEN_READONLY still caps the mode.
  if (path.rfind("file:", 0) == 0) {
    return path + (path.find('?') == std::string::npos ? "?" : "&") + "mode=ro";
  }
  std::string out = "file:";
  for (char c : path) {
    switch (c) {
      case '%':
        out += "%25";
        break;
      case '?':
        out += "%3f";
        break;
      case '#':
        out += "%23";
        break;
      default:
        out.push_back(c);
    }
  }
  out += "?mode=ro";
  return out;
}

std::unique_ptr<StoreConnection> SqliteStore::connect(const ConnectionDescriptor& descriptor) {
  if (descriptor.database.empty()) {
    throw JudgeError(ErrorKind::InternalFault,
                     "Dataset '" + descriptor.dataset_key + "' has no database path");
  }
  if (!descriptor.read_only) {
    throw JudgeError(ErrorKind::InternalFault,
                     "Refusing writable connection for dataset '" + descriptor.dataset_key + "'");
  }
  const std::string uri = sqlite_read_only_uri(descriptor.database);
  sqlite3* db = nullptr;
  const int rc = sqlite3_open_v2(uri.c_str(), &db, SQLITE_OPEN_READONLY | SQLITE_OPEN_URI, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    sqlite3_close_v2(db);
    throw JudgeError(ErrorKind::InternalFault,
                     "Cannot open dataset '" + descriptor.dataset_key + "': " + message, message);
  }
  sqlite3_extended_result_codes(db, 1);
  sqlite3_limit(db, SQLITE_LIMIT_ATTACHED, 0);
#ifdef SQLITE_DBCONFIG_DEFENSIVE
  sqlite3_db_config(db, SQLITE_DBCONFIG_DEFENSIVE, 1, nullptr);
#endif
#ifdef SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION
  sqlite3_db_config(db, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 0, nullptr);
#endif
  sqlite3_busy_timeout(db, descriptor.limits.timeout_ms);

  char* err = nullptr;
  if (sqlite3_exec(db, "PRAGMA query_only = ON", nullptr, nullptr, &err) != SQLITE_OK) {
    std::string message = err != nullptr ? err : "unknown error";
    sqlite3_free(err);
    sqlite3_close_v2(db);
    throw JudgeError(ErrorKind::InternalFault,
                     "Cannot restrict dataset '" + descriptor.dataset_key + "': " + message, message);
  }
  log::debug("opened read-only connection for dataset '" + descriptor.dataset_key + "'");
  return std::make_unique<SqliteConnection>(db, descriptor.dataset_key);
}

}  // namespace sqljudge
