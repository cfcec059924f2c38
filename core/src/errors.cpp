#include "sqljudge/errors.h"

#include <utility>

namespace sqljudge {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UnknownDataset:
      return "UnknownDataset";
    case ErrorKind::ForbiddenStatement:
      return "ForbiddenStatement";
    case ErrorKind::PoolExhausted:
      return "PoolExhausted";
    case ErrorKind::ExecutionTimeout:
      return "ExecutionTimeout";
    case ErrorKind::ResultTooLarge:
      return "ResultTooLarge";
    case ErrorKind::ExecutionError:
      return "ExecutionError";
    case ErrorKind::ColumnMismatch:
      return "ColumnMismatch";
    case ErrorKind::RowMismatch:
      return "RowMismatch";
    case ErrorKind::InvalidRequest:
      return "InvalidRequest";
    case ErrorKind::InternalFault:
      return "InternalFault";
  }
  return "InternalFault";
}

JudgeError::JudgeError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

JudgeError::JudgeError(ErrorKind kind, const std::string& message, std::string detail)
    : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

JudgeError::JudgeError(ErrorKind kind, const std::string& message, size_t position, size_t length)
    : std::runtime_error(message), kind_(kind), position_(position), length_(length) {}

}  // namespace sqljudge
