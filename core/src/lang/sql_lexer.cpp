#include "lang/sql_lexer.h"

#include <cctype>

namespace sqljudge {

SqlLexer::SqlLexer(const std::string& input) : input_(input) {}

SqlToken SqlLexer::next() {
  if (!has_error_) skip_ws_and_comments();
  if (has_error_) {
    SqlToken token = make_token(SqlTokenType::Invalid, error_message_, error_position_);
    token.length = 1;
    return token;
  }
  if (pos_ >= input_.size()) {
    return make_token(SqlTokenType::End, "", pos_);
  }

  const size_t start = pos_;
  const char c = input_[pos_];
  if (c == '(') {
    ++pos_;
    return make_token(SqlTokenType::LParen, "(", start);
  }
  if (c == ')') {
    ++pos_;
    return make_token(SqlTokenType::RParen, ")", start);
  }
  if (c == ';') {
    ++pos_;
    return make_token(SqlTokenType::Semicolon, ";", start);
  }
  if (c == '\'') {
    return lex_string();
  }
  if (c == '"') return lex_quoted_identifier('"');
  if (c == '`') return lex_quoted_identifier('`');
  if (c == '[') return lex_quoted_identifier(']');
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return lex_number();
  }
  if (is_word_start(c)) {
    return lex_word();
  }
  ++pos_;
  return make_token(SqlTokenType::Symbol, std::string(1, c), start);
}

SqlToken SqlLexer::lex_string() {
  const size_t start = pos_;
  ++pos_;
  std::string out;
  while (pos_ < input_.size()) {
    const char c = input_[pos_++];
    if (c == '\\') {
      // WHY: dialects disagree on backslash escapes, so a literal's end is ambiguous.
      set_error("Backslash inside a string literal is ambiguous across SQL dialects", pos_ - 1);
      return next();
    }
    if (c == '\'') {
      if (pos_ < input_.size() && input_[pos_] == '\'') {
        out.push_back('\'');
        ++pos_;
        continue;
      }
      SqlToken token = make_token(SqlTokenType::String, out, start);
      token.length = pos_ - start;
      return token;
    }
    out.push_back(c);
  }
  set_error("Unterminated string literal", start);
  return next();
}

SqlToken SqlLexer::lex_quoted_identifier(char close) {
  const size_t start = pos_;
  ++pos_;
  std::string out;
  while (pos_ < input_.size()) {
    const char c = input_[pos_++];
    if (c == close) {
      if (close != ']' && pos_ < input_.size() && input_[pos_] == close) {
        out.push_back(close);
        ++pos_;
        continue;
      }
      SqlToken token = make_token(SqlTokenType::QuotedIdentifier, out, start);
      token.length = pos_ - start;
      return token;
    }
    out.push_back(c);
  }
  set_error("Unterminated quoted identifier", start);
  return next();
}

SqlToken SqlLexer::lex_word() {
  const size_t start = pos_;
  while (pos_ < input_.size() && is_word_char(input_[pos_])) {
    ++pos_;
  }
  SqlToken token = make_token(SqlTokenType::Word, input_.substr(start, pos_ - start), start);
  token.length = pos_ - start;
  return token;
}

SqlToken SqlLexer::lex_number() {
  const size_t start = pos_;
  while (pos_ < input_.size() &&
         (std::isalnum(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '.')) {
    ++pos_;
  }
  SqlToken token = make_token(SqlTokenType::Number, input_.substr(start, pos_ - start), start);
  token.length = pos_ - start;
  return token;
}

void SqlLexer::skip_ws_and_comments() {
  while (true) {
    const size_t before = pos_;
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
      ++pos_;
    }
    // WHY: only "-- " is a comment in every dialect; "--x" and "#" stay visible to the scan.
    if (pos_ + 1 < input_.size() && input_[pos_] == '-' && input_[pos_ + 1] == '-' &&
        (pos_ + 2 >= input_.size() ||
         std::isspace(static_cast<unsigned char>(input_[pos_ + 2])))) {
      while (pos_ < input_.size() && input_[pos_] != '\n') {
        ++pos_;
      }
      continue;
    }
    if (pos_ + 1 < input_.size() && input_[pos_] == '/' && input_[pos_ + 1] == '*') {
      const size_t start = pos_;
      if (pos_ + 2 < input_.size() && (input_[pos_ + 2] == '!' || input_[pos_ + 2] == '+')) {
        set_error("Executable or hint comments are not allowed", start);
        return;
      }
      pos_ += 2;
      bool closed = false;
      while (pos_ < input_.size()) {
        if (pos_ + 1 < input_.size() && input_[pos_] == '*' && input_[pos_ + 1] == '/') {
          pos_ += 2;
          closed = true;
          break;
        }
        ++pos_;
      }
      if (!closed) {
        set_error("Unterminated block comment", start);
        return;
      }
      continue;
    }
    if (pos_ == before) {
      break;
    }
  }
}

SqlToken SqlLexer::make_token(SqlTokenType type, const std::string& text, size_t start) const {
  SqlToken token;
  token.type = type;
  token.text = text;
  token.pos = start;
  token.length = text.size();
  return token;
}

void SqlLexer::set_error(const std::string& message, size_t position) {
  if (has_error_) return;
  has_error_ = true;
  error_message_ = message;
  error_position_ = position;
}

bool SqlLexer::is_word_start(char c) {
  const auto uc = static_cast<unsigned char>(c);
  // Non-ASCII bytes are treated as identifier characters (UTF-8 names).
  return std::isalpha(uc) || c == '_' || uc >= 0x80;
}

bool SqlLexer::is_word_char(char c) {
  const auto uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || c == '_' || c == '$' || uc >= 0x80;
}

}  // namespace sqljudge
