#include "cli_utils.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sqljudge::cli {

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::string resolve_config_path(const CliOptions& options) {
  if (!options.config_path.empty()) return options.config_path;
  const char* env = std::getenv("SQLJUDGE_CONFIG");
  if (env != nullptr && *env) return env;
  return "";
}

std::string resolve_sql(const std::string& inline_sql, const std::string& file) {
  if (!file.empty()) return read_file(file);
  return inline_sql;
}

}  // namespace sqljudge::cli
