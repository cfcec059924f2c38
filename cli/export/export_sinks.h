#pragma once

#include <ostream>
#include <string>

#include "sqljudge/result_table.h"

namespace sqljudge::cli {

enum class ExportFormat { None, Csv, Json, Ndjson, Parquet };

/// Maps a path's extension (.csv, .json, .ndjson/.jsonl, .parquet) to a format.
ExportFormat export_format_for_path(const std::string& path);

void write_csv(const ResultTable& table, std::ostream& out);
void write_json(const ResultTable& table, std::ostream& out);
void write_ndjson(const ResultTable& table, std::ostream& out);
/// Needs Apache Arrow; fails with a clear error when built without it.
bool write_parquet(const ResultTable& table, const std::string& path, std::string& error);

/// Writes `table` to `path` in the format named by its extension.
/// Returns false with `error` set on unknown extensions or IO failures.
bool export_table(const ResultTable& table, const std::string& path, std::string& error);

}  // namespace sqljudge::cli
