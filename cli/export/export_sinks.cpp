#include "export/export_sinks.h"

#include <cmath>
#include <fstream>
#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include "util/string_util.h"

#ifdef SQLJUDGE_USE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace sqljudge::cli {

namespace {

std::string csv_escape(const std::string& value) {
  bool needs_quotes = false;
  for (char c : value) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') {
      needs_quotes = true;
      break;
    }
  }
  if (!needs_quotes) return value;
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char c : value) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

nlohmann::ordered_json value_to_json(const Value& value) {
  switch (value.type) {
    case Value::Type::Null:
      return nullptr;
    case Value::Type::Integer:
      return value.integer;
    case Value::Type::Real:
      // JSON has no NaN/Infinity; keep them readable as strings.
      if (!std::isfinite(value.real)) {
        return util::format_real(value.real);
      }
      return value.real;
    case Value::Type::Blob:
      return util::format_blob(value.text);
    case Value::Type::Text:
    case Value::Type::Temporal:
      return value.text;
  }
  return nullptr;
}

nlohmann::ordered_json row_to_json(const ResultTable& table, const std::vector<Value>& row) {
  nlohmann::ordered_json out = nlohmann::ordered_json::object();
  for (size_t i = 0; i < table.columns.size() && i < row.size(); ++i) {
    out[table.columns[i]] = value_to_json(row[i]);
  }
  return out;
}

bool open_output(const std::string& path, std::ofstream& out, std::string& error) {
  out.open(path, std::ios::binary);
  if (!out) {
    error = "Failed to open file for writing: " + path;
    return false;
  }
  return true;
}

}  // namespace

ExportFormat export_format_for_path(const std::string& path) {
  const size_t dot = path.rfind('.');
  if (dot == std::string::npos) return ExportFormat::None;
  const std::string ext = util::to_lower(path.substr(dot + 1));
  if (ext == "csv") return ExportFormat::Csv;
  if (ext == "json") return ExportFormat::Json;
  if (ext == "ndjson" || ext == "jsonl") return ExportFormat::Ndjson;
  if (ext == "parquet") return ExportFormat::Parquet;
  return ExportFormat::None;
}

void write_csv(const ResultTable& table, std::ostream& out) {
  for (size_t i = 0; i < table.columns.size(); ++i) {
    if (i > 0) out << ",";
    out << csv_escape(table.columns[i]);
  }
  out << "\n";
  for (const auto& row : table.rows) {
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0) out << ",";
      // NULL exports as an empty field.
      if (!row[i].is_null()) out << csv_escape(value_to_display(row[i]));
    }
    out << "\n";
  }
}

void write_json(const ResultTable& table, std::ostream& out) {
  nlohmann::ordered_json rows = nlohmann::ordered_json::array();
  for (const auto& row : table.rows) rows.push_back(row_to_json(table, row));
  out << rows.dump() << "\n";
}

void write_ndjson(const ResultTable& table, std::ostream& out) {
  for (const auto& row : table.rows) {
    out << row_to_json(table, row).dump() << "\n";
  }
}

bool write_parquet(const ResultTable& table, const std::string& path, std::string& error) {
#ifdef SQLJUDGE_USE_ARROW
  std::vector<std::shared_ptr<arrow::StringBuilder>> builders;
  builders.reserve(table.columns.size());
  for (size_t i = 0; i < table.columns.size(); ++i) {
    builders.push_back(std::make_shared<arrow::StringBuilder>());
  }
  for (const auto& row : table.rows) {
    for (size_t i = 0; i < builders.size(); ++i) {
      arrow::Status st = row[i].is_null() ? builders[i]->AppendNull()
                                          : builders[i]->Append(value_to_display(row[i]));
      if (!st.ok()) {
        error = st.ToString();
        return false;
      }
    }
  }
  std::vector<std::shared_ptr<arrow::Field>> fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;
  for (size_t i = 0; i < builders.size(); ++i) {
    fields.push_back(arrow::field(table.columns[i], arrow::utf8(), true));
    std::shared_ptr<arrow::Array> array;
    auto st = builders[i]->Finish(&array);
    if (!st.ok()) {
      error = st.ToString();
      return false;
    }
    arrays.push_back(array);
  }
  auto arrow_table = arrow::Table::Make(arrow::schema(fields), arrays);
  auto output_res = arrow::io::FileOutputStream::Open(path);
  if (!output_res.ok()) {
    error = output_res.status().ToString();
    return false;
  }
  auto st = parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), *output_res, 1024);
  if (!st.ok()) {
    error = st.ToString();
    return false;
  }
  return true;
#else
  (void)table;
  (void)path;
  error = "Parquet export requires the Apache Arrow feature (SQLJUDGE_WITH_ARROW)";
  return false;
#endif
}

bool export_table(const ResultTable& table, const std::string& path, std::string& error) {
  const ExportFormat format = export_format_for_path(path);
  if (format == ExportFormat::None) {
    error = "Unknown export format for " + path + " (use .csv, .json, .ndjson or .parquet)";
    return false;
  }
  if (format == ExportFormat::Parquet) return write_parquet(table, path, error);
  std::ofstream out;
  if (!open_output(path, out, error)) return false;
  if (format == ExportFormat::Csv) {
    write_csv(table, out);
  } else if (format == ExportFormat::Json) {
    write_json(table, out);
  } else {
    write_ndjson(table, out);
  }
  out.flush();
  if (!out) {
    error = "Failed to write file: " + path;
    return false;
  }
  return true;
}

}  // namespace sqljudge::cli
