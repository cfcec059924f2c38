#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace sqljudge {

/// Classifies every way a judgment can end without a Pass.
/// MUST remain stable: names are part of the text/JSON verdict contract.
enum class ErrorKind {
  UnknownDataset,
  ForbiddenStatement,
  PoolExhausted,
  ExecutionTimeout,
  ResultTooLarge,
  ExecutionError,
  ColumnMismatch,
  RowMismatch,
  InvalidRequest,
  InternalFault,
};

/// Returns the stable name for an error kind (e.g. "ExecutionTimeout").
const char* error_kind_name(ErrorKind kind);

/// Single exception type thrown by engine components.
/// MUST carry the backend diagnostic verbatim in detail() when one exists.
/// position() is a byte offset into the offending SQL text when known.
class JudgeError : public std::runtime_error {
 public:
  JudgeError(ErrorKind kind, const std::string& message);
  JudgeError(ErrorKind kind, const std::string& message, std::string detail);
  JudgeError(ErrorKind kind, const std::string& message, size_t position, size_t length);

  ErrorKind kind() const { return kind_; }
  const std::string& detail() const { return detail_; }
  std::optional<size_t> position() const { return position_; }
  size_t length() const { return length_; }

 private:
  ErrorKind kind_;
  std::string detail_;
  std::optional<size_t> position_;
  size_t length_ = 0;
};

}  // namespace sqljudge
