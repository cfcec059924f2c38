#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sqljudge/errors.h"
#include "sqljudge/statement_filter.h"

namespace sqljudge {

enum class DiagnosticSeverity {
  Error,
  Warning,
  Note,
};

/// Source span in byte offsets and 1-based line/column coordinates.
struct DiagnosticSpan {
  size_t start_line = 1;
  size_t start_col = 1;
  size_t end_line = 1;
  size_t end_col = 1;
  size_t byte_start = 0;
  size_t byte_end = 0;
};

/// Learner-facing diagnostic attached to Error verdicts.
/// MUST carry a stable code and actionable help.
struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Error;
  std::string code;
  std::string message;
  std::string help;
  DiagnosticSpan span;
  std::string snippet;
};

/// Builds a diagnostic for a statement rejected by the safety filter.
Diagnostic make_statement_diagnostic(const std::string& sql, const StatementCheck& check);
/// Builds a diagnostic for any engine error raised while running `sql`.
/// Spans are best effort: explicit error positions first, then tokens named in
/// backend messages such as `near "X": syntax error` or `no such column: X`.
Diagnostic make_error_diagnostic(const std::string& sql, const JudgeError& error);

/// Renders diagnostics as text blocks with a caret code frame.
/// MUST be deterministic for stable golden tests.
std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics);
/// Renders diagnostics as a JSON array with stable key order.
std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics);

/// Runs only the safety filter and returns its diagnostics (empty when allowed).
std::vector<Diagnostic> lint_statement(const std::string& sql);

}  // namespace sqljudge
