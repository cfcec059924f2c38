#include "sqljudge/diagnostics.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <sstream>
#include <string_view>

#include <nlohmann/json.hpp>

#include "util/string_util.h"

namespace sqljudge {

namespace {

// Forbidden words that often name columns in practice datasets.
bool often_an_identifier(const std::string& keyword) {
  static const char* const kWords[] = {"START", "DO", "LOAD", "EDIT", "SET", "LOCK",
                                       "RESET", "COPY", "CLUSTER", "IMPORT", "NOTIFY"};
  return std::find(std::begin(kWords), std::end(kWords), keyword) != std::end(kWords);
}

bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

DiagnosticSpan span_from_bytes(const std::string& sql, size_t byte_start, size_t byte_end) {
  DiagnosticSpan span;
  const size_t size = sql.size();
  if (size == 0) return span;
  span.byte_start = std::min(byte_start, size - 1);
  span.byte_end = std::min(std::max(byte_end, span.byte_start + 1), size);

  auto [start_line, start_col] = util::line_col_from_offset(sql, span.byte_start);
  auto [end_line, end_col] = util::line_col_from_offset(sql, span.byte_end);
  span.start_line = start_line;
  span.start_col = start_col;
  span.end_line = end_line;
  span.end_col = end_col;
  return span;
}

std::optional<DiagnosticSpan> find_identifier_span(const std::string& sql,
                                                   const std::string& identifier) {
  if (identifier.empty()) return std::nullopt;
  const std::string lower_sql = util::to_lower(sql);
  const std::string lower_ident = util::to_lower(identifier);
  size_t pos = 0;
  while (true) {
    pos = lower_sql.find(lower_ident, pos);
    if (pos == std::string::npos) return std::nullopt;
    const bool left_ok = pos == 0 || !is_ident_char(sql[pos - 1]) ||
                         !is_ident_char(lower_ident.front());
    const size_t right = pos + lower_ident.size();
    const bool right_ok = right >= sql.size() || !is_ident_char(sql[right]) ||
                          !is_ident_char(lower_ident.back());
    if (left_ok && right_ok) {
      return span_from_bytes(sql, pos, right);
    }
    ++pos;
  }
}

/// Pulls the subject out of messages like `near "X": syntax error` or `no such table: X`.
std::optional<std::string> message_subject(std::string_view message) {
  const size_t near = message.find("near \"");
  if (near != std::string_view::npos) {
    const size_t start = near + 6;
    const size_t end = message.find('"', start);
    if (end != std::string_view::npos && end > start) {
      return std::string(message.substr(start, end - start));
    }
  }
  static const char* kPrefixes[] = {"no such column: ", "no such table: ",
                                    "no such function: ", "ambiguous column name: "};
  for (const char* prefix : kPrefixes) {
    const size_t at = message.find(prefix);
    if (at == std::string_view::npos) continue;
    const size_t start = at + std::string_view(prefix).size();
    size_t end = start;
    while (end < message.size() && !std::isspace(static_cast<unsigned char>(message[end]))) {
      ++end;
    }
    if (end > start) return std::string(message.substr(start, end - start));
  }
  return std::nullopt;
}

DiagnosticSpan best_effort_span(const std::string& sql, const std::string& message) {
  if (auto subject = message_subject(message); subject.has_value()) {
    if (auto span = find_identifier_span(sql, *subject); span.has_value()) return *span;
    const size_t dot = subject->rfind('.');
    if (dot != std::string::npos) {
      if (auto span = find_identifier_span(sql, subject->substr(dot + 1)); span.has_value()) {
        return *span;
      }
    }
  }
  return span_from_bytes(sql, 0, 1);
}

std::string render_code_frame(const std::string& sql, const DiagnosticSpan& span) {
  if (util::is_blank(sql)) return "";
  size_t line_start = 0;
  size_t current_line = 1;
  while (current_line < span.start_line && line_start < sql.size()) {
    size_t nl = sql.find('\n', line_start);
    if (nl == std::string::npos) break;
    line_start = nl + 1;
    ++current_line;
  }
  size_t line_end = sql.find('\n', line_start);
  if (line_end == std::string::npos) line_end = sql.size();
  std::string line_text = sql.substr(line_start, line_end - line_start);
  if (!line_text.empty() && line_text.back() == '\r') line_text.pop_back();

  const size_t caret_start = span.start_col > 0 ? span.start_col - 1 : 0;
  if (caret_start > line_text.size()) return "";
  size_t caret_width = 1;
  if (span.start_line == span.end_line && span.end_col > span.start_col) {
    caret_width = span.end_col - span.start_col;
  }
  caret_width = std::max<size_t>(1, std::min(caret_width, line_text.size() + 1 - caret_start));
  const size_t line_digits = std::to_string(span.start_line).size();

  std::ostringstream out;
  out << " --> line " << span.start_line << ", col " << span.start_col << "\n";
  out << std::string(line_digits, ' ') << " |\n";
  out << span.start_line << " | " << line_text << "\n";
  out << std::string(line_digits, ' ') << " | " << std::string(caret_start, ' ')
      << std::string(caret_width, '^');
  return out.str();
}

std::string severity_name(DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::Error:
      return "ERROR";
    case DiagnosticSeverity::Warning:
      return "WARNING";
    case DiagnosticSeverity::Note:
      return "NOTE";
  }
  return "ERROR";
}

void set_error_code_help(Diagnostic& d, ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ForbiddenStatement:
      d.code = "SQJ-SAFE-0005";
      d.help = "Only read-only SELECT queries can be judged.";
      return;
    case ErrorKind::ExecutionTimeout:
      d.code = "SQJ-RUN-0002";
      d.help = "Simplify the query or filter earlier; it must finish within the time limit.";
      return;
    case ErrorKind::ResultTooLarge:
      d.code = "SQJ-RUN-0003";
      d.help = "Filter or aggregate the result so it stays under the row limit.";
      return;
    case ErrorKind::PoolExhausted:
      d.code = "SQJ-RUN-0004";
      d.help = "The dataset is busy; resubmit in a moment.";
      return;
    case ErrorKind::UnknownDataset:
      d.code = "SQJ-REQ-0001";
      d.help = "Pick one of the registered practice datasets.";
      return;
    case ErrorKind::InvalidRequest:
      d.code = "SQJ-REQ-0002";
      d.help = "Enter a SQL query before submitting.";
      return;
    case ErrorKind::InternalFault:
      d.code = "SQJ-INT-0001";
      d.help = "This is a problem on our side; resubmit or report it.";
      return;
    case ErrorKind::ExecutionError:
    case ErrorKind::ColumnMismatch:
    case ErrorKind::RowMismatch:
      break;
  }
  d.code = "SQJ-RUN-0001";
  d.help = "Fix the error reported by the database and resubmit.";
}

bool is_request_level(ErrorKind kind) {
  return kind == ErrorKind::UnknownDataset || kind == ErrorKind::InvalidRequest ||
         kind == ErrorKind::PoolExhausted || kind == ErrorKind::InternalFault;
}

nlohmann::ordered_json span_to_json(const DiagnosticSpan& span) {
  nlohmann::ordered_json out;
  out["start_line"] = span.start_line;
  out["start_col"] = span.start_col;
  out["end_line"] = span.end_line;
  out["end_col"] = span.end_col;
  out["byte_start"] = span.byte_start;
  out["byte_end"] = span.byte_end;
  return out;
}

}  // namespace

Diagnostic make_statement_diagnostic(const std::string& sql, const StatementCheck& check) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = check.message;
  d.span = span_from_bytes(sql, check.position, check.position + std::max<size_t>(1, check.length));
  switch (check.issue) {
    case StatementIssue::ForbiddenKeyword:
      d.code = "SQJ-SAFE-0001";
      d.help = "Remove " + (check.keyword.empty() ? std::string("the write statement") : check.keyword) +
               "; practice datasets are read-only and only queries are judged.";
      if (often_an_identifier(check.keyword)) {
        d.help += " If " + check.keyword + " names a column or table, write it in double quotes: \"" +
                  util::to_lower(check.keyword) + "\".";
      }
      break;
    case StatementIssue::LeadingKeyword:
      d.code = "SQJ-SAFE-0002";
      d.help = "Start the statement with SELECT or WITH.";
      break;
    case StatementIssue::MultipleStatements:
      d.code = "SQJ-SAFE-0003";
      d.help = "Submit a single query; remove everything after the first semicolon.";
      break;
    case StatementIssue::AmbiguousLexeme:
      d.code = "SQJ-SAFE-0004";
      d.help = "Close every string and comment, and avoid backslashes inside string literals.";
      break;
    case StatementIssue::Empty:
      d.code = "SQJ-REQ-0002";
      d.help = "Enter a SQL query before submitting.";
      break;
    case StatementIssue::None:
      d.severity = DiagnosticSeverity::Note;
      d.code = "SQJ-SAFE-0000";
      d.help = "The statement passed the read-only check.";
      break;
  }
  d.snippet = check.issue == StatementIssue::Empty ? "" : render_code_frame(sql, d.span);
  return d;
}

Diagnostic make_error_diagnostic(const std::string& sql, const JudgeError& error) {
  if (error.kind() == ErrorKind::ForbiddenStatement || error.kind() == ErrorKind::InvalidRequest) {
    StatementCheck check = check_statement(sql);
    if (!check.allowed) return make_statement_diagnostic(sql, check);
  }
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = error.what();
  set_error_code_help(d, error.kind());
  if (is_request_level(error.kind())) return d;
  if (error.position().has_value()) {
    d.span = span_from_bytes(sql, *error.position(),
                             *error.position() + std::max<size_t>(1, error.length()));
  } else {
    const std::string& source = error.detail().empty() ? d.message : error.detail();
    d.span = best_effort_span(sql, source);
  }
  d.snippet = render_code_frame(sql, d.span);
  return d;
}

std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    out << severity_name(d.severity) << "[" << d.code << "]: " << d.message << "\n";
    if (!d.snippet.empty()) out << d.snippet << "\n";
    out << "help: " << d.help << "\n";
    if (i + 1 < diagnostics.size()) out << "\n";
  }
  return out.str();
}

std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics) {
  nlohmann::ordered_json out = nlohmann::ordered_json::array();
  for (const auto& d : diagnostics) {
    nlohmann::ordered_json item;
    item["severity"] = severity_name(d.severity);
    item["code"] = d.code;
    item["message"] = d.message;
    item["help"] = d.help;
    item["span"] = span_to_json(d.span);
    item["snippet"] = d.snippet;
    out.push_back(std::move(item));
  }
  return out.dump();
}

std::vector<Diagnostic> lint_statement(const std::string& sql) {
  std::vector<Diagnostic> out;
  StatementCheck check = check_statement(sql);
  if (!check.allowed) out.push_back(make_statement_diagnostic(sql, check));
  return out;
}

}  // namespace sqljudge
