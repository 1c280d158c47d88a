#include "core/errors/error.hpp"

#include <utility>

namespace batchexec::core::errors {

std::string_view ToStableErrorCode(const ErrorCode code) {
  switch (code) {
  case ErrorCode::kNone:
    return "OK";
  case ErrorCode::kSyntax:
    return "SYNTAX";
  case ErrorCode::kDuplicateAttribute:
    return "DUPLICATE_ATTRIBUTE";
  case ErrorCode::kUnknownAttribute:
    return "UNKNOWN_ATTRIBUTE";
  case ErrorCode::kReadOnlyViolation:
    return "READ_ONLY_VIOLATION";
  case ErrorCode::kInvalidKind:
    return "INVALID_KIND";
  case ErrorCode::kUnknownClass:
    return "UNKNOWN_CLASS";
  case ErrorCode::kUnknownKey:
    return "UNKNOWN_KEY";
  }
  return "UNKNOWN";
}

bool Fail(Error& error, const ErrorCode code, std::string message) {
  error.code = code;
  error.message = std::move(message);
  return false;
}

std::string FormatError(const Error& error) {
  std::string out(ToStableErrorCode(error.code));
  if (!error.message.empty()) {
    out += ": ";
    out += error.message;
  }
  return out;
}

} // namespace batchexec::core::errors
