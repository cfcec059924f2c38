#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sqljudge {

enum class StatementIssue {
  None,
  Empty,
  LeadingKeyword,
  ForbiddenKeyword,
  MultipleStatements,
  AmbiguousLexeme,
};

/// Outcome of the lexical safety scan.
/// position/length locate the offending lexeme as byte offsets into the SQL text.
struct StatementCheck {
  bool allowed = false;
  StatementIssue issue = StatementIssue::None;
  std::string message;
  std::string keyword;
  size_t position = 0;
  size_t length = 0;
};

/// Conservative read-only check: the first keyword must be SELECT, WITH or VALUES
/// (optionally behind parentheses) and no write/DDL/session keyword may appear
/// outside string literals, quoted identifiers or comments.
/// MUST prefer rejecting an acceptable query over accepting a writing one.
StatementCheck check_statement(const std::string& sql);

/// Upper-case keywords rejected anywhere in a statement.
/// Matching is by bare word, so columns or tables named after one of these
/// (`start`, `set`, `load`) MUST be written as quoted identifiers ("start").
const std::vector<std::string>& forbidden_keywords();

/// Throws JudgeError{ForbiddenStatement} (or InvalidRequest for empty text)
/// when check_statement() rejects the SQL.
void enforce_read_only(const std::string& sql);

}  // namespace sqljudge
