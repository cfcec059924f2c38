#pragma once

#include <memory>
#include <string>

#include "sqljudge/backing_store.h"

namespace sqljudge {

/// SQLite backend. `database` in the descriptor is a file path, opened through a
/// read-only URI with PRAGMA query_only set and ATTACH disabled.
class SqliteStore : public BackingStore {
 public:
  std::string kind() const override { return "sqlite"; }
  std::unique_ptr<StoreConnection> connect(const ConnectionDescriptor& descriptor) override;
};

/// Builds the "file:<path>?mode=ro" URI, escaping characters SQLite treats as delimiters.
std::string sqlite_read_only_uri(const std::string& path);

}  // namespace sqljudge
