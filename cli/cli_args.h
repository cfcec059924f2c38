#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace sqljudge::cli {

struct CliOptions {
  std::string config_path;
  std::string dataset;
  std::string reference;
  std::string reference_file;
  std::string candidate;
  std::string candidate_file;
  std::string run_sql;
  std::string export_path;
  std::string lint_sql;
  std::string format = "text";
  std::optional<int> timeout_ms;
  bool run = false;
  bool lint = false;
  bool describe = false;
  bool list_datasets = false;
  bool show_help = false;
  bool show_version = false;
};

void print_startup_help(std::ostream& os);
void print_help(std::ostream& os);
/// Parses argv; returns false with a one-line error on invalid usage.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace sqljudge::cli
