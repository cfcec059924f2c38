#include "test_harness.h"

#include <string>
#include <vector>

#include "sqljudge/diagnostics.h"
#include "sqljudge/version.h"

namespace {

using sqljudge::Diagnostic;
using sqljudge::ErrorKind;
using sqljudge::JudgeError;

void test_lint_forbidden_keyword_has_stable_code_and_span() {
  std::vector<Diagnostic> diagnostics = sqljudge::lint_statement("SELECT 1;\nDELETE FROM scores");
  expect_eq(diagnostics.size(), 1, "one diagnostic");
  if (diagnostics.empty()) return;
  const auto& first = diagnostics.front();
  expect_true(first.severity == sqljudge::DiagnosticSeverity::Error, "severity is error");
  expect_eq(first.code, "SQJ-SAFE-0003", "multiple statement code");
  expect_eq(first.span.start_line, 2, "span line");
  expect_eq(first.span.start_col, 1, "span col");
  expect_true(!first.help.empty(), "help present");
}

void test_lint_suggests_quoting_keyword_columns() {
  auto column = sqljudge::lint_statement("SELECT start FROM bookings");
  expect_eq(column.size(), 1, "one diagnostic for bare column");
  if (column.empty()) return;
  expect_eq(column[0].code, "SQJ-SAFE-0001", "forbidden keyword code");
  expect_eq(column[0].help,
            "Remove START; practice datasets are read-only and only queries are judged. "
            "If START names a column or table, write it in double quotes: \"start\".",
            "quoting hint for column-like keyword");

  auto write = sqljudge::lint_statement("SELECT * FROM scores WHERE 1 = 1 DELETE");
  expect_eq(write.size(), 1, "one diagnostic for DELETE");
  if (write.empty()) return;
  expect_true(write[0].help.find("double quotes") == std::string::npos, "no quoting hint for DELETE");
}

void test_lint_clean_query_has_no_diagnostics() {
  expect_eq(sqljudge::lint_statement("SELECT * FROM scores").size(), 0, "clean query");
}

void test_lint_codes_per_issue() {
  expect_eq(sqljudge::lint_statement("DROP TABLE scores").front().code, "SQJ-SAFE-0001",
            "forbidden keyword code");
  expect_eq(sqljudge::lint_statement("EXPLAIN SELECT 1").front().code, "SQJ-SAFE-0002",
            "leading keyword code");
  expect_eq(sqljudge::lint_statement("SELECT 'open").front().code, "SQJ-SAFE-0004",
            "ambiguous lexeme code");
}

void test_diagnostic_text_renderer_matches_golden_snippet() {
  std::vector<Diagnostic> diagnostics = sqljudge::lint_statement("SELECT * INTO t FROM scores");
  expect_eq(diagnostics.size(), 1, "diagnostic available");
  if (diagnostics.empty()) return;
  const std::string expected =
      "ERROR[SQJ-SAFE-0001]: Statement contains forbidden keyword INTO; only read-only queries "
      "are allowed\n"
      " --> line 1, col 10\n"
      "  |\n"
      "1 | SELECT * INTO t FROM scores\n"
      "  |          ^^^^\n"
      "help: Remove INTO; practice datasets are read-only and only queries are judged.\n";
  expect_eq(sqljudge::render_diagnostics_text(diagnostics), expected, "text golden");
}

void test_diagnostic_json_renderer_matches_snapshot() {
  std::vector<Diagnostic> diagnostics = sqljudge::lint_statement("SELECT 1; SELECT 2");
  expect_eq(diagnostics.size(), 1, "diagnostic available");
  if (diagnostics.empty()) return;
  const std::string expected =
      "[{\"severity\":\"ERROR\",\"code\":\"SQJ-SAFE-0003\","
      "\"message\":\"Only one statement may be submitted at a time\","
      "\"help\":\"Submit a single query; remove everything after the first semicolon.\","
      "\"span\":{\"start_line\":1,\"start_col\":11,\"end_line\":1,\"end_col\":17,"
      "\"byte_start\":10,\"byte_end\":16},"
      "\"snippet\":\" --> line 1, col 11\\n  |\\n1 | SELECT 1; SELECT 2\\n  |           ^^^^^^\"}]";
  expect_eq(sqljudge::render_diagnostics_json(diagnostics), expected, "json snapshot");
}

void test_error_diagnostic_locates_backend_token() {
  const std::string sql = "SELECT nme FROM students";
  JudgeError error(ErrorKind::ExecutionError, "no such column: nme", "no such column: nme");
  Diagnostic d = sqljudge::make_error_diagnostic(sql, error);
  expect_eq(d.code, "SQJ-RUN-0001", "execution error code");
  expect_eq(d.span.byte_start, 7, "column token located");
  expect_eq(d.span.byte_end, 10, "column token end");
  expect_true(d.snippet.find("^^^") != std::string::npos, "caret under token");

  JudgeError syntax(ErrorKind::ExecutionError, "near \"FORM\": syntax error");
  Diagnostic s = sqljudge::make_error_diagnostic("SELECT * FORM scores", syntax);
  expect_eq(s.span.byte_start, 9, "syntax token located");

  JudgeError table(ErrorKind::ExecutionError, "no such table: main.scorez");
  Diagnostic t = sqljudge::make_error_diagnostic("SELECT * FROM scorez", table);
  expect_eq(t.span.byte_start, 14, "qualified table name falls back to last segment");
}

void test_error_diagnostic_codes_by_kind() {
  const std::string sql = "SELECT 1";
  expect_eq(sqljudge::make_error_diagnostic(sql, JudgeError(ErrorKind::ExecutionTimeout, "t")).code,
            "SQJ-RUN-0002", "timeout code");
  expect_eq(sqljudge::make_error_diagnostic(sql, JudgeError(ErrorKind::ResultTooLarge, "r")).code,
            "SQJ-RUN-0003", "too large code");
  Diagnostic pool = sqljudge::make_error_diagnostic(sql, JudgeError(ErrorKind::PoolExhausted, "p"));
  expect_eq(pool.code, "SQJ-RUN-0004", "pool code");
  expect_true(pool.snippet.empty(), "request-level errors carry no code frame");
  Diagnostic forbidden = sqljudge::make_error_diagnostic(
      "DELETE FROM scores", JudgeError(ErrorKind::ForbiddenStatement, "forbidden"));
  expect_eq(forbidden.code, "SQJ-SAFE-0001", "forbidden statement reuses filter diagnostic");
}

void test_version_info_is_populated() {
  sqljudge::VersionInfo info = sqljudge::get_version_info();
  expect_true(!info.version.empty(), "version present");
  expect_true(sqljudge::version_string().find(info.version) != std::string::npos,
              "version string includes version");
}

}  // namespace

void register_diagnostics_tests(std::vector<TestCase>& tests) {
  tests.push_back({"lint_forbidden_keyword_has_stable_code_and_span",
                   test_lint_forbidden_keyword_has_stable_code_and_span});
  tests.push_back({"lint_suggests_quoting_keyword_columns", test_lint_suggests_quoting_keyword_columns});
  tests.push_back({"lint_clean_query_has_no_diagnostics", test_lint_clean_query_has_no_diagnostics});
  tests.push_back({"lint_codes_per_issue", test_lint_codes_per_issue});
  tests.push_back({"diagnostic_text_renderer_matches_golden_snippet",
                   test_diagnostic_text_renderer_matches_golden_snippet});
  tests.push_back({"diagnostic_json_renderer_matches_snapshot",
                   test_diagnostic_json_renderer_matches_snapshot});
  tests.push_back({"error_diagnostic_locates_backend_token", test_error_diagnostic_locates_backend_token});
  tests.push_back({"error_diagnostic_codes_by_kind", test_error_diagnostic_codes_by_kind});
  tests.push_back({"version_info_is_populated", test_version_info_is_populated});
}
