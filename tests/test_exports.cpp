#include "test_harness.h"
#include "test_utils.h"

#include <filesystem>
#include <limits>
#include <sstream>

#include "export/export_sinks.h"
#include "sqljudge/executor.h"

namespace {

using sqljudge::Value;
using sqljudge::cli::ExportFormat;

sqljudge::ResultTable mixed_table() {
  return make_table({"id", "label", "score"}, {
                                                  {Value::from_integer(1), Value::from_text("a,b"), Value::from_real(2.5)},
                                                  {Value::from_integer(2), Value::from_text("He said \"hi\""), Value::null()},
                                              });
}

void test_csv_escaping() {
  auto table = make_table({"col1", "col2"}, {
                                                {Value::from_text("a,b"), Value::from_text("He said \"hi\"")},
                                                {Value::from_text("line1\nline2"), Value::from_text("plain")},
                                            });
  std::ostringstream out;
  sqljudge::cli::write_csv(table, out);
  std::string expected =
      "col1,col2\n"
      "\"a,b\",\"He said \"\"hi\"\"\"\n"
      "\"line1\nline2\",plain\n";
  expect_eq(out.str(), expected, "csv escaping content");
}

void test_json_and_ndjson_keep_types() {
  auto table = mixed_table();
  table.rows.push_back({Value::from_integer(3), Value::from_blob("\x0a"),
                        Value::from_real(std::numeric_limits<double>::infinity())});
  std::ostringstream json;
  sqljudge::cli::write_json(table, json);
  expect_eq(json.str(),
            "[{\"id\":1,\"label\":\"a,b\",\"score\":2.5},"
            "{\"id\":2,\"label\":\"He said \\\"hi\\\"\",\"score\":null},"
            "{\"id\":3,\"label\":\"x'0a'\",\"score\":\"Infinity\"}]\n",
            "json rows keep column order and types");

  std::ostringstream ndjson;
  sqljudge::cli::write_ndjson(mixed_table(), ndjson);
  expect_eq(ndjson.str(),
            "{\"id\":1,\"label\":\"a,b\",\"score\":2.5}\n"
            "{\"id\":2,\"label\":\"He said \\\"hi\\\"\",\"score\":null}\n",
            "one object per line");
}

void test_export_format_by_extension() {
  expect_true(sqljudge::cli::export_format_for_path("out.CSV") == ExportFormat::Csv, "csv");
  expect_true(sqljudge::cli::export_format_for_path("out.json") == ExportFormat::Json, "json");
  expect_true(sqljudge::cli::export_format_for_path("out.jsonl") == ExportFormat::Ndjson, "jsonl");
  expect_true(sqljudge::cli::export_format_for_path("out.ndjson") == ExportFormat::Ndjson, "ndjson");
  expect_true(sqljudge::cli::export_format_for_path("out.parquet") == ExportFormat::Parquet, "parquet");
  expect_true(sqljudge::cli::export_format_for_path("out") == ExportFormat::None, "no extension");

  std::string error;
  expect_true(!sqljudge::cli::export_table(mixed_table(), "out.xlsx", error), "unknown extension rejected");
  expect_eq(error, "Unknown export format for out.xlsx (use .csv, .json, .ndjson or .parquet)",
            "unknown extension error");
}

void test_csv_export_of_query_result() {
  TempDir dir("sqljudge_export");
  const auto db = create_school_db(dir.path());
  auto registry = make_registry({make_dataset("school", db)});
  sqljudge::SandboxedExecutor executor(registry);
  auto table = executor.execute(registry->resolve("school"),
                                "SELECT s.name, sc.score FROM students s JOIN scores sc ON sc.student_id = s.id "
                                "WHERE sc.subject = 'art' ORDER BY s.id");
  const auto path = dir.path() / "art.csv";
  std::string error;
  expect_true(sqljudge::cli::export_table(table, path.string(), error), "csv export ok");
  expect_true(error.empty(), "csv export no error");
  expect_eq(read_file_to_string(path), "name,score\nAda,80\nGrace,85\nLinus,\n", "NULL exported as empty field");
}

#ifdef SQLJUDGE_USE_ARROW
void test_parquet_export_smoke() {
  TempDir dir("sqljudge_parquet");
  const auto path = dir.path() / "rows.parquet";
  std::string error;
  bool ok = sqljudge::cli::export_table(mixed_table(), path.string(), error);
  expect_true(ok, "parquet export smoke ok");
  expect_true(error.empty(), "parquet export smoke no error");
  expect_true(std::filesystem::exists(path), "parquet file created");
  if (std::filesystem::exists(path)) {
    expect_true(std::filesystem::file_size(path) > 0, "parquet file non-empty");
  }
}
#else
void test_parquet_requires_arrow() {
  std::string error;
  expect_true(!sqljudge::cli::export_table(mixed_table(), "rows.parquet", error), "parquet unavailable");
  expect_true(error.find("SQLJUDGE_WITH_ARROW") != std::string::npos, "error names the build option");
}
#endif

}  // namespace

void register_export_tests(std::vector<TestCase>& tests) {
  tests.push_back({"csv_escaping", test_csv_escaping});
  tests.push_back({"json_and_ndjson_keep_types", test_json_and_ndjson_keep_types});
  tests.push_back({"export_format_by_extension", test_export_format_by_extension});
  tests.push_back({"csv_export_of_query_result", test_csv_export_of_query_result});
#ifdef SQLJUDGE_USE_ARROW
  tests.push_back({"parquet_export_smoke", test_parquet_export_smoke});
#else
  tests.push_back({"parquet_requires_arrow", test_parquet_requires_arrow});
#endif
}
