#pragma once

#include <string>

#include "cli_args.h"

namespace sqljudge::cli {

/// Reads a whole file; throws std::runtime_error when it cannot be opened.
std::string read_file(const std::string& path);
/// --config value, else $SQLJUDGE_CONFIG, else empty.
std::string resolve_config_path(const CliOptions& options);
/// Inline SQL or the contents of the matching file flag.
std::string resolve_sql(const std::string& inline_sql, const std::string& file);

}  // namespace sqljudge::cli
