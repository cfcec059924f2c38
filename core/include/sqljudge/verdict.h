#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sqljudge/diagnostics.h"
#include "sqljudge/errors.h"

namespace sqljudge {

enum class VerdictStatus { Pass, Fail, Error };

const char* verdict_status_name(VerdictStatus status);

/// Bounded listing of rows that differ between reference and candidate.
/// Rows are rendered in canonical column order.
struct MismatchPreview {
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> missing_rows;
  std::vector<std::vector<std::string>> extra_rows;
  size_t missing_count = 0;
  size_t extra_count = 0;
  std::vector<std::string> missing_columns;
  std::vector<std::string> extra_columns;
};

/// First rows of the candidate's own result, in its own column order.
struct ResultPreview {
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;
  size_t total_rows = 0;
};

/// Final judgment for one request. Produced once and never mutated by the engine.
/// `reason` is the ErrorKind on Error and ColumnMismatch/RowMismatch on Fail.
struct Verdict {
  VerdictStatus status = VerdictStatus::Error;
  std::optional<ErrorKind> reason;
  std::string message;
  int64_t elapsed_ms = 0;
  int64_t reference_elapsed_ms = 0;
  bool reference_from_cache = false;
  std::optional<MismatchPreview> mismatch;
  std::optional<ResultPreview> result_preview;
  std::vector<Diagnostic> diagnostics;
};

/// Multi-line human-readable rendering used by the CLI.
std::string render_verdict_text(const Verdict& verdict);
/// JSON rendering with stable key order.
std::string render_verdict_json(const Verdict& verdict);

}  // namespace sqljudge
