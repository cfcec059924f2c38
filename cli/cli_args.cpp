#include "cli_args.h"

#include <stdexcept>
#include <string>

namespace sqljudge::cli {

namespace {

bool take_value(int argc, char** argv, int& i, const std::string& flag, std::string& out,
                std::string& error) {
  if (i + 1 >= argc) {
    error = "Missing value for " + flag;
    return false;
  }
  out = argv[++i];
  return true;
}

}  // namespace

/// Prints the startup help so users see baseline usage without flags.
void print_startup_help(std::ostream& os) {
  os << "sqljudge - judge SQL answers against reference queries\n\n";
  os << "Usage:\n";
  os << "  sqljudge --dataset <key> --reference <sql> --candidate <sql>\n";
  os << "  sqljudge --dataset <key> --reference-file <file> --candidate-file <file>\n";
  os << "           [--config <file>] [--format text|json] [--timeout-ms <n>]\n";
  os << "  sqljudge --dataset <key> --run <sql> [--export <path>]\n";
  os << "  sqljudge --dataset <key> --describe\n";
  os << "  sqljudge --list-datasets\n";
  os << "  sqljudge --lint \"<sql>\" [--format text|json]\n";
  os << "  sqljudge --version\n\n";
  os << "Notes:\n";
  os << "  - The config file defaults to $SQLJUDGE_CONFIG.\n";
  os << "  - Exit codes: 0=pass, 1=fail, 2=CLI/IO usage error, 3=error verdict.\n\n";
  os << "Examples:\n";
  os << "  sqljudge --config judge.json --dataset school \\\n";
  os << "    --reference \"SELECT student_id, AVG(score) AS avg FROM scores GROUP BY student_id\" \\\n";
  os << "    --candidate \"SELECT AVG(score) AS avg, student_id FROM scores GROUP BY 2\"\n";
  os << "  sqljudge --lint \"DELETE FROM scores\"\n";
}

/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags.
void print_help(std::ostream& os) {
  os << "Usage: sqljudge --dataset <key> (--reference <sql>|--reference-file <file>)\n";
  os << "                (--candidate <sql>|--candidate-file <file>)\n";
  os << "                [--config <file>] [--format text|json] [--timeout-ms <n>]\n";
  os << "       sqljudge --dataset <key> --run <sql> [--export <path>]\n";
  os << "       sqljudge --dataset <key> --describe [--format text|json]\n";
  os << "       sqljudge --list-datasets\n";
  os << "       sqljudge --lint \"<sql>\" [--format text|json]\n";
  os << "       sqljudge --version\n";
  os << "--config defaults to $SQLJUDGE_CONFIG; SQLJUDGE_LOG_LEVEL sets log verbosity.\n";
  os << "--export picks CSV, JSON, NDJSON or Parquet from the file extension.\n";
  os << "--lint runs the read-only statement check without touching a dataset.\n";
  os << "Exit codes: 0=pass, 1=fail, 2=CLI/IO usage error, 3=error verdict.\n";
}

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags and conflicting modes.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config") {
      if (!take_value(argc, argv, i, arg, options.config_path, error)) return false;
    } else if (arg == "--dataset") {
      if (!take_value(argc, argv, i, arg, options.dataset, error)) return false;
    } else if (arg == "--reference") {
      if (!take_value(argc, argv, i, arg, options.reference, error)) return false;
    } else if (arg == "--reference-file") {
      if (!take_value(argc, argv, i, arg, options.reference_file, error)) return false;
    } else if (arg == "--candidate") {
      if (!take_value(argc, argv, i, arg, options.candidate, error)) return false;
    } else if (arg == "--candidate-file") {
      if (!take_value(argc, argv, i, arg, options.candidate_file, error)) return false;
    } else if (arg == "--run") {
      if (!take_value(argc, argv, i, arg, options.run_sql, error)) return false;
      options.run = true;
    } else if (arg == "--export") {
      if (!take_value(argc, argv, i, arg, options.export_path, error)) return false;
    } else if (arg == "--lint") {
      if (!take_value(argc, argv, i, arg, options.lint_sql, error)) return false;
      options.lint = true;
    } else if (arg == "--format") {
      if (!take_value(argc, argv, i, arg, options.format, error)) return false;
    } else if (arg == "--timeout-ms") {
      std::string value;
      if (!take_value(argc, argv, i, arg, value, error)) return false;
      int parsed = 0;
      size_t consumed = 0;
      try {
        parsed = std::stoi(value, &consumed);
      } catch (const std::exception&) {
        consumed = 0;
      }
      if (consumed != value.size() || parsed <= 0) {
        error = "Invalid --timeout-ms value (use a positive integer)";
        return false;
      }
      options.timeout_ms = parsed;
    } else if (arg == "--describe") {
      options.describe = true;
    } else if (arg == "--list-datasets") {
      options.list_datasets = true;
    } else if (arg == "--help") {
      options.show_help = true;
    } else if (arg == "--version") {
      options.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }

  if (options.format != "text" && options.format != "json") {
    error = "Invalid --format value (use text|json)";
    return false;
  }
  if (!options.reference.empty() && !options.reference_file.empty()) {
    error = "--reference and --reference-file are mutually exclusive";
    return false;
  }
  if (!options.candidate.empty() && !options.candidate_file.empty()) {
    error = "--candidate and --candidate-file are mutually exclusive";
    return false;
  }
  const bool judging = !options.reference.empty() || !options.reference_file.empty() ||
                       !options.candidate.empty() || !options.candidate_file.empty();
  const int modes = (judging ? 1 : 0) + (options.run ? 1 : 0) + (options.lint ? 1 : 0) +
                    (options.describe ? 1 : 0) + (options.list_datasets ? 1 : 0);
  if (modes > 1) {
    error = "Choose one of judging, --run, --lint, --describe or --list-datasets";
    return false;
  }
  if (!options.export_path.empty() && !options.run) {
    error = "--export is only supported with --run";
    return false;
  }
  if ((judging || options.run || options.describe) && options.dataset.empty() &&
      !options.show_help && !options.show_version) {
    error = "Missing --dataset";
    return false;
  }
  if (judging && !options.show_help && !options.show_version) {
    if (options.reference.empty() && options.reference_file.empty()) {
      error = "Missing --reference or --reference-file";
      return false;
    }
    if (options.candidate.empty() && options.candidate_file.empty()) {
      error = "Missing --candidate or --candidate-file";
      return false;
    }
  }
  return true;
}

}  // namespace sqljudge::cli
