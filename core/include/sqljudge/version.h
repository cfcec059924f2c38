#pragma once

#include <string>

namespace sqljudge {

/// Build version and source provenance.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Returns compile-time version/provenance for the current core build.
/// MUST not perform IO and MUST be safe to call frequently.
VersionInfo get_version_info();
/// Returns a human-readable version + provenance string.
std::string version_string();

}  // namespace sqljudge
