#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "sqljudge/config.h"
#include "sqljudge/dataset_registry.h"
#include "sqljudge/errors.h"
#include "sqljudge/result_table.h"

/// Temporary directory removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& prefix);
  ~TempDir();
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

/// Runs statements through a separate writable handle the engine never sees.
void exec_writable(const std::filesystem::path& db, const std::string& sql);
/// Row count of a table, read through a writable handle.
int64_t count_rows(const std::filesystem::path& db, const std::string& table);

/// Builds the "school" fixture: scores(student_id, subject, score, taken_at) and
/// students(id, name). Returns the database path.
std::filesystem::path create_school_db(const std::filesystem::path& dir);

/// Dataset entry for a fixture database with small test limits.
sqljudge::DatasetConfig make_dataset(const std::string& key, const std::filesystem::path& db);
std::shared_ptr<const sqljudge::DatasetRegistry> make_registry(
    const std::vector<sqljudge::DatasetConfig>& datasets);

sqljudge::ResultTable make_table(const std::vector<std::string>& columns,
                                 const std::vector<std::vector<sqljudge::Value>>& rows);

std::string read_file_to_string(const std::filesystem::path& path);

/// True when fn throws a JudgeError of `kind`.
template <typename Fn>
bool throws_kind(Fn&& fn, sqljudge::ErrorKind kind) {
  try {
    fn();
  } catch (const sqljudge::JudgeError& e) {
    return e.kind() == kind;
  }
  return false;
}
