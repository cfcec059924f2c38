#include "sqljudge/backing_store.h"

#include "sqljudge/errors.h"
#include "store/sqlite_store.h"
#include "util/string_util.h"

namespace sqljudge {

std::shared_ptr<BackingStore> make_backing_store(const std::string& backend) {
  const std::string name = util::to_lower(backend);
  if (name == "sqlite" || name == "sqlite3") {
    return std::make_shared<SqliteStore>();
  }
  throw JudgeError(ErrorKind::InternalFault, "Unsupported backend: " + backend);
}

}  // namespace sqljudge
