#include "sqljudge/verdict.h"

#include <sstream>

#include <nlohmann/json.hpp>

#include "util/string_util.h"

namespace sqljudge {

namespace {

using ordered_json = nlohmann::ordered_json;

void write_rows(std::ostringstream& out, const char* label,
                const std::vector<std::vector<std::string>>& rows, size_t total) {
  if (total == 0) return;
  out << label << " (" << total << (rows.size() < total ? ", showing " + std::to_string(rows.size()) : "")
      << "):\n";
  for (const auto& row : rows) {
    out << "  (" << util::join(row, ", ") << ")\n";
  }
}

ordered_json rows_to_json(const std::vector<std::vector<std::string>>& rows) {
  ordered_json out = ordered_json::array();
  for (const auto& row : rows) out.push_back(row);
  return out;
}

}  // namespace

const char* verdict_status_name(VerdictStatus status) {
  switch (status) {
    case VerdictStatus::Pass:
      return "Pass";
    case VerdictStatus::Fail:
      return "Fail";
    case VerdictStatus::Error:
      return "Error";
  }
  return "Error";
}

std::string render_verdict_text(const Verdict& verdict) {
  std::ostringstream out;
  out << verdict_status_name(verdict.status);
  if (verdict.reason.has_value()) out << " (" << error_kind_name(*verdict.reason) << ")";
  out << ": " << verdict.message << "\n";
  out << "elapsed: " << verdict.elapsed_ms << " ms";
  out << " (reference " << verdict.reference_elapsed_ms << " ms"
      << (verdict.reference_from_cache ? ", cached" : "") << ")\n";

  if (verdict.mismatch.has_value()) {
    const MismatchPreview& m = *verdict.mismatch;
    if (!m.missing_columns.empty() || !m.extra_columns.empty()) {
      if (!m.missing_columns.empty()) {
        out << "missing columns: " << util::join(m.missing_columns, ", ") << "\n";
      }
      if (!m.extra_columns.empty()) {
        out << "unexpected columns: " << util::join(m.extra_columns, ", ") << "\n";
      }
    } else {
      out << "columns: (" << util::join(m.columns, ", ") << ")\n";
      write_rows(out, "missing rows", m.missing_rows, m.missing_count);
      write_rows(out, "unexpected rows", m.extra_rows, m.extra_count);
    }
  }
  if (!verdict.diagnostics.empty()) {
    out << "\n" << render_diagnostics_text(verdict.diagnostics);
  }
  return out.str();
}

std::string render_verdict_json(const Verdict& verdict) {
  ordered_json out;
  out["status"] = verdict_status_name(verdict.status);
  out["reason"] = verdict.reason.has_value() ? ordered_json(error_kind_name(*verdict.reason))
                                             : ordered_json(nullptr);
  out["message"] = verdict.message;
  out["elapsed_ms"] = verdict.elapsed_ms;
  out["reference_elapsed_ms"] = verdict.reference_elapsed_ms;
  out["reference_from_cache"] = verdict.reference_from_cache;
  if (verdict.mismatch.has_value()) {
    const MismatchPreview& m = *verdict.mismatch;
    ordered_json preview;
    preview["columns"] = m.columns;
    preview["missing_columns"] = m.missing_columns;
    preview["extra_columns"] = m.extra_columns;
    preview["missing_count"] = m.missing_count;
    preview["extra_count"] = m.extra_count;
    preview["missing_rows"] = rows_to_json(m.missing_rows);
    preview["extra_rows"] = rows_to_json(m.extra_rows);
    out["preview"] = std::move(preview);
  } else {
    out["preview"] = nullptr;
  }
  if (verdict.result_preview.has_value()) {
    const ResultPreview& r = *verdict.result_preview;
    ordered_json result;
    result["columns"] = r.columns;
    result["rows"] = rows_to_json(r.rows);
    result["total_rows"] = r.total_rows;
    out["result"] = std::move(result);
  }
  out["diagnostics"] = ordered_json::parse(render_diagnostics_json(verdict.diagnostics));
  return out.dump();
}

}  // namespace sqljudge
