#pragma once

#include <cstddef>
#include <string>

namespace sqljudge {

enum class SqlTokenType {
  Word,
  QuotedIdentifier,
  String,
  Number,
  LParen,
  RParen,
  Semicolon,
  Symbol,
  End,
  Invalid,
};

struct SqlToken {
  SqlTokenType type = SqlTokenType::End;
  std::string text;
  size_t pos = 0;
  size_t length = 0;
};

/// Dialect-agnostic SQL tokenizer for the safety scan.
/// Anything it cannot classify with certainty becomes an Invalid token so the
/// caller rejects the statement instead of guessing.
/// Inputs are SQL text; outputs are tokens with byte positions.
class SqlLexer {
 public:
  /// MUST NOT outlive the referenced input buffer.
  explicit SqlLexer(const std::string& input);
  /// Produces the next token; returns End at exhaustion and Invalid (sticky) on errors.
  SqlToken next();

 private:
  SqlToken lex_string();
  SqlToken lex_quoted_identifier(char close);
  SqlToken lex_word();
  SqlToken lex_number();
  /// Skips whitespace and comments (`-- ` followed by whitespace, `/* */`).
  /// MUST flag unterminated and MySQL executable (`/*!`) comments.
  void skip_ws_and_comments();
  SqlToken make_token(SqlTokenType type, const std::string& text, size_t start) const;
  void set_error(const std::string& message, size_t position);

  static bool is_word_start(char c);
  static bool is_word_char(char c);

  const std::string& input_;
  size_t pos_ = 0;
  bool has_error_ = false;
  std::string error_message_;
  size_t error_position_ = 0;
};

}  // namespace sqljudge
