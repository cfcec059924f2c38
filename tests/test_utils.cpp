#include "test_utils.h"

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

std::atomic<int> g_dir_counter{0};

struct Handle {
  sqlite3* db = nullptr;
  explicit Handle(const std::filesystem::path& path) {
    const int rc = sqlite3_open_v2(path.string().c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
      std::string message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
      sqlite3_close(db);
      throw std::runtime_error("cannot open fixture database: " + message);
    }
  }
  ~Handle() { sqlite3_close(db); }
};

}  // namespace

TempDir::TempDir(const std::string& prefix) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  path_ = std::filesystem::temp_directory_path() /
          (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(g_dir_counter++));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void exec_writable(const std::filesystem::path& db, const std::string& sql) {
  Handle handle(db);
  char* err = nullptr;
  if (sqlite3_exec(handle.db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string message = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("fixture statement failed: " + message);
  }
}

int64_t count_rows(const std::filesystem::path& db, const std::string& table) {
  Handle handle(db);
  sqlite3_stmt* stmt = nullptr;
  const std::string sql = "SELECT COUNT(*) FROM " + table;
  if (sqlite3_prepare_v2(handle.db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error(sqlite3_errmsg(handle.db));
  }
  int64_t count = -1;
  if (sqlite3_step(stmt) == SQLITE_ROW) count = sqlite3_column_int64(stmt, 0);
  sqlite3_finalize(stmt);
  return count;
}

std::filesystem::path create_school_db(const std::filesystem::path& dir) {
  const std::filesystem::path db = dir / "school.db";
  exec_writable(db,
                "CREATE TABLE students (id INTEGER PRIMARY KEY, name TEXT NOT NULL);"
                "CREATE TABLE scores (student_id INTEGER, subject TEXT, score REAL, taken_at DATETIME);"
                "INSERT INTO students VALUES (1, 'Ada'), (2, 'Grace'), (3, 'Linus');"
                "INSERT INTO scores VALUES"
                " (1, 'math', 90.0, '2024-03-01 09:00:00'),"
                " (1, 'art', 80.0, '2024-03-02 09:00:00'),"
                " (2, 'math', 85.0, '2024-03-01T10:00:00+01:00'),"
                " (2, 'art', 85.0, '2024-03-02 10:00:00'),"
                " (3, 'math', 70.5, '2024-03-01 11:00:00'),"
                " (3, 'art', NULL, NULL);");
  return db;
}

sqljudge::DatasetConfig make_dataset(const std::string& key, const std::filesystem::path& db) {
  sqljudge::DatasetConfig ds;
  ds.key = key;
  ds.name = key;
  ds.connection.dataset_key = key;
  ds.connection.backend = "sqlite";
  ds.connection.database = db.string();
  ds.connection.read_only = true;
  ds.connection.limits.timeout_ms = 2000;
  ds.connection.limits.max_rows = 1000;
  ds.connection.limits.pool_size = 2;
  ds.connection.limits.acquire_timeout_ms = 200;
  return ds;
}

std::shared_ptr<const sqljudge::DatasetRegistry> make_registry(
    const std::vector<sqljudge::DatasetConfig>& datasets) {
  return std::make_shared<const sqljudge::DatasetRegistry>(datasets);
}

sqljudge::ResultTable make_table(const std::vector<std::string>& columns,
                                 const std::vector<std::vector<sqljudge::Value>>& rows) {
  sqljudge::ResultTable table;
  table.columns = columns;
  table.column_types.assign(columns.size(), "");
  table.rows = rows;
  return table;
}

std::string read_file_to_string(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}
