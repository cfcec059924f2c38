#include "test_harness.h"
#include "test_utils.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "cli_args.h"
#include "cli_utils.h"
#include "render/table_renderer.h"

namespace {

template <size_t N>
bool parse(const char* (&argv)[N], sqljudge::cli::CliOptions& options, std::string& error) {
  return sqljudge::cli::parse_cli_args(static_cast<int>(N), const_cast<char**>(argv), options, error);
}

void test_parse_cli_args_accepts_judge_flags() {
  const char* argv[] = {
      "sqljudge", "--config",    "judge.json", "--dataset", "school", "--reference",
      "SELECT 1", "--candidate", "SELECT 1",   "--format",  "json",   "--timeout-ms",
      "250",
  };
  sqljudge::cli::CliOptions options;
  std::string error;
  expect_true(parse(argv, options, error), "judge flags parsed");
  expect_eq(options.config_path, "judge.json", "config path");
  expect_eq(options.dataset, "school", "dataset");
  expect_eq(options.reference, "SELECT 1", "reference sql");
  expect_eq(options.format, "json", "format");
  expect_true(options.timeout_ms.has_value() && *options.timeout_ms == 250, "timeout parsed");
}

void test_parse_cli_args_rejects_missing_value() {
  const char* argv[] = {"sqljudge", "--dataset"};
  sqljudge::cli::CliOptions options;
  std::string error;
  expect_true(!parse(argv, options, error), "missing value is rejected");
  expect_eq(error, "Missing value for --dataset", "missing value has clear error");
}

void test_parse_cli_args_rejects_unknown_argument() {
  const char* argv[] = {"sqljudge", "--unknown"};
  sqljudge::cli::CliOptions options;
  std::string error;
  expect_true(!parse(argv, options, error), "unknown argument is rejected");
  expect_eq(error, "Unknown argument: --unknown", "unknown argument has clear error");
}

void test_parse_cli_args_rejects_bad_timeout() {
  const char* argv[] = {"sqljudge", "--dataset", "school", "--run", "SELECT 1", "--timeout-ms", "12ms"};
  sqljudge::cli::CliOptions options;
  std::string error;
  expect_true(!parse(argv, options, error), "non numeric timeout rejected");
  expect_eq(error, "Invalid --timeout-ms value (use a positive integer)", "timeout error");

  const char* negative[] = {"sqljudge", "--timeout-ms", "-5"};
  sqljudge::cli::CliOptions other;
  expect_true(!parse(negative, other, error), "negative timeout rejected");
}

void test_parse_cli_args_rejects_conflicting_modes() {
  const char* argv[] = {"sqljudge", "--dataset", "school", "--run", "SELECT 1", "--describe"};
  sqljudge::cli::CliOptions options;
  std::string error;
  expect_true(!parse(argv, options, error), "two modes rejected");
  expect_eq(error, "Choose one of judging, --run, --lint, --describe or --list-datasets", "mode error");

  const char* both[] = {"sqljudge", "--dataset", "school", "--reference", "SELECT 1",
                        "--reference-file", "ref.sql", "--candidate", "SELECT 1"};
  sqljudge::cli::CliOptions again;
  expect_true(!parse(both, again, error), "inline and file reference rejected");
  expect_eq(error, "--reference and --reference-file are mutually exclusive", "exclusive error");

  const char* export_only[] = {"sqljudge", "--dataset", "school", "--export", "out.csv"};
  sqljudge::cli::CliOptions third;
  expect_true(!parse(export_only, third, error), "export without run rejected");
  expect_eq(error, "--export is only supported with --run", "export error");
}

void test_parse_cli_args_requires_dataset_and_both_queries() {
  const char* no_dataset[] = {"sqljudge", "--reference", "SELECT 1", "--candidate", "SELECT 1"};
  sqljudge::cli::CliOptions options;
  std::string error;
  expect_true(!parse(no_dataset, options, error), "dataset required");
  expect_eq(error, "Missing --dataset", "dataset error");

  const char* no_candidate[] = {"sqljudge", "--dataset", "school", "--reference", "SELECT 1"};
  sqljudge::cli::CliOptions other;
  expect_true(!parse(no_candidate, other, error), "candidate required");
  expect_eq(error, "Missing --candidate or --candidate-file", "candidate error");

  const char* lint[] = {"sqljudge", "--lint", "DELETE FROM t"};
  sqljudge::cli::CliOptions lint_options;
  expect_true(parse(lint, lint_options, error), "lint needs no dataset");
  expect_true(lint_options.lint, "lint mode set");
}

void test_cli_resolves_sql_and_config() {
  TempDir dir("sqljudge_cli");
  const auto file = dir.path() / "candidate.sql";
  {
    std::ofstream out(file);
    out << "SELECT name FROM students";
  }
  expect_eq(sqljudge::cli::resolve_sql("", file.string()), "SELECT name FROM students", "sql read from file");
  expect_eq(sqljudge::cli::resolve_sql("SELECT 1", ""), "SELECT 1", "inline sql kept");
  bool threw = false;
  try {
    sqljudge::cli::resolve_sql("", (dir.path() / "missing.sql").string());
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).rfind("Failed to open file: ", 0) == 0;
  }
  expect_true(threw, "missing file reported");

  sqljudge::cli::CliOptions options;
  options.config_path = "explicit.json";
  expect_eq(sqljudge::cli::resolve_config_path(options), "explicit.json", "flag wins");
}

void test_render_table_box() {
  auto table = make_table({"id", "name"}, {{sqljudge::Value::from_integer(1), sqljudge::Value::from_text("Ada")}});
  const std::string expected =
      "┌────┬──────┐\n"
      "│ id │ name │\n"
      "├────┼──────┤\n"
      "│ 1  │ Ada  │\n"
      "└────┴──────┘\n"
      "1 row\n";
  expect_eq(sqljudge::render::render_table(table, sqljudge::render::TableOptions{}), expected, "box table");

  auto many = make_table({"n"}, {{sqljudge::Value::from_integer(1)},
                                 {sqljudge::Value::from_integer(2)},
                                 {sqljudge::Value::null()}});
  sqljudge::render::TableOptions limited;
  limited.max_rows = 2;
  const std::string out = sqljudge::render::render_table(many, limited);
  expect_true(out.find("3 rows (2 shown)") != std::string::npos, "truncation footer");
  expect_true(out.find("NULL") == std::string::npos, "hidden rows not rendered");
}

}  // namespace

void register_cli_args_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parse_cli_args_accepts_judge_flags", test_parse_cli_args_accepts_judge_flags});
  tests.push_back({"parse_cli_args_rejects_missing_value", test_parse_cli_args_rejects_missing_value});
  tests.push_back({"parse_cli_args_rejects_unknown_argument", test_parse_cli_args_rejects_unknown_argument});
  tests.push_back({"parse_cli_args_rejects_bad_timeout", test_parse_cli_args_rejects_bad_timeout});
  tests.push_back({"parse_cli_args_rejects_conflicting_modes", test_parse_cli_args_rejects_conflicting_modes});
  tests.push_back({"parse_cli_args_requires_dataset_and_both_queries",
                   test_parse_cli_args_requires_dataset_and_both_queries});
  tests.push_back({"cli_resolves_sql_and_config", test_cli_resolves_sql_and_config});
  tests.push_back({"render_table_box", test_render_table_box});
}
