#include "sqljudge/statement_filter.h"

#include <algorithm>
#include <unordered_set>

#include "lang/sql_lexer.h"
#include "sqljudge/errors.h"
#include "util/string_util.h"

namespace sqljudge {

namespace {

const std::unordered_set<std::string>& forbidden_set() {
  static const std::unordered_set<std::string> kSet(forbidden_keywords().begin(),
                                                    forbidden_keywords().end());
  return kSet;
}

bool is_leading_keyword(const std::string& upper) {
  return upper == "SELECT" || upper == "WITH" || upper == "VALUES";
}

StatementCheck reject(StatementIssue issue, std::string message, const SqlToken& token) {
  StatementCheck out;
  out.allowed = false;
  out.issue = issue;
  out.message = std::move(message);
  out.position = token.pos;
  out.length = std::max<size_t>(1, token.length);
  if (token.type == SqlTokenType::Word) out.keyword = util::to_upper(token.text);
  return out;
}

}  // namespace

const std::vector<std::string>& forbidden_keywords() {
  // Data change, DDL, privilege, session and file-access words of the common dialects.
  // REPLACE is absent: it is also a string function, and REPLACE INTO needs INTO.
  static const std::vector<std::string> kKeywords = {
      "INSERT",   "UPDATE",    "DELETE",     "MERGE",     "UPSERT",
      "DROP",     "ALTER",     "CREATE",     "TRUNCATE",  "RENAME",   "GRANT",
      "REVOKE",   "ATTACH",    "DETACH",     "PRAGMA",    "VACUUM",   "REINDEX",
      "ANALYZE",  "CALL",      "EXEC",       "EXECUTE",   "DO",       "HANDLER",
      "LOAD",     "LOCK",      "UNLOCK",     "SET",       "RESET",    "COPY",
      "INTO",     "OUTFILE",   "DUMPFILE",   "COMMIT",    "ROLLBACK", "SAVEPOINT",
      "BEGIN",    "START",     "DECLARE",    "PREPARE",   "DEALLOCATE", "SHUTDOWN",
      "KILL",     "LISTEN",    "NOTIFY",     "CLUSTER",   "IMPORT",   "INSTALL",
      "UNINSTALL", "FLUSH",    "PURGE",      "OPTIMIZE",  "REPAIR",   "LOAD_EXTENSION",
      "WRITEFILE", "READFILE", "EDIT",       "FSDIR",
  };
  return kKeywords;
}

StatementCheck check_statement(const std::string& sql) {
  SqlLexer lexer(sql);
  bool seen_leading = false;
  bool seen_any = false;
  bool after_terminator = false;

  while (true) {
    SqlToken token = lexer.next();
    if (token.type == SqlTokenType::Invalid) {
      return reject(StatementIssue::AmbiguousLexeme, token.text, token);
    }
    if (token.type == SqlTokenType::End) break;
    seen_any = true;

    if (token.type == SqlTokenType::Semicolon) {
      after_terminator = true;
      continue;
    }
    if (after_terminator) {
      return reject(StatementIssue::MultipleStatements,
                    "Only one statement may be submitted at a time", token);
    }

    const std::string upper =
        token.type == SqlTokenType::Word ? util::to_upper(token.text) : std::string();
    if (!upper.empty() && forbidden_set().count(upper) > 0) {
      return reject(StatementIssue::ForbiddenKeyword,
                    "Statement contains forbidden keyword " + upper +
                        "; only read-only queries are allowed",
                    token);
    }
    if (!seen_leading) {
      if (token.type == SqlTokenType::LParen) continue;
      if (!is_leading_keyword(upper)) {
        const std::string found = upper.empty() ? token.text : upper;
        return reject(StatementIssue::LeadingKeyword,
                      "Statement must start with SELECT or WITH (found " + found + ")", token);
      }
      seen_leading = true;
    }
  }

  if (!seen_any || (!seen_leading && after_terminator)) {
    StatementCheck out;
    out.issue = StatementIssue::Empty;
    out.message = "SQL text is empty";
    return out;
  }
  if (!seen_leading) {
    StatementCheck out;
    out.issue = StatementIssue::LeadingKeyword;
    out.message = "Statement must start with SELECT or WITH";
    return out;
  }
  StatementCheck out;
  out.allowed = true;
  return out;
}

void enforce_read_only(const std::string& sql) {
  StatementCheck check = check_statement(sql);
  if (check.allowed) return;
  if (check.issue == StatementIssue::Empty) {
    throw JudgeError(ErrorKind::InvalidRequest, check.message);
  }
  throw JudgeError(ErrorKind::ForbiddenStatement, check.message, check.position, check.length);
}

}  // namespace sqljudge
