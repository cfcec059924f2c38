#include "sqljudge/version.h"

namespace sqljudge {

namespace {

#ifndef SQLJUDGE_VERSION
#define SQLJUDGE_VERSION "0.0.0"
#endif

#ifndef SQLJUDGE_GIT_COMMIT
#define SQLJUDGE_GIT_COMMIT "unknown"
#endif

#ifndef SQLJUDGE_GIT_DIRTY
#define SQLJUDGE_GIT_DIRTY 0
#endif

}  // namespace

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = SQLJUDGE_VERSION;
  info.git_commit = SQLJUDGE_GIT_COMMIT;
  info.git_dirty = (SQLJUDGE_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace sqljudge
