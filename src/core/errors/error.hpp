#pragma once

#include <string>
#include <string_view>

namespace batchexec::core::errors {

// Failure classes raised by the attribute and LoV registries.
//
// Registries report these without mutating state; the host decides whether a
// failure is fatal (see Executive::Cough).
enum class ErrorCode {
  kNone = 0,
  kSyntax,
  kDuplicateAttribute,
  kUnknownAttribute,
  kReadOnlyViolation,
  kInvalidKind,
  kUnknownClass,
  kUnknownKey,
};

// Stable upper-case token for logs, e.g. "READ_ONLY_VIOLATION".
std::string_view ToStableErrorCode(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::kNone;
  std::string message;

  bool ok() const {
    return code == ErrorCode::kNone;
  }

  void Clear() {
    code = ErrorCode::kNone;
    message.clear();
  }
};

// Fills `error` and returns false so call sites can `return Fail(...)`.
bool Fail(Error& error, ErrorCode code, std::string message);

// Single-line rendering: "<STABLE_CODE>: <message>".
std::string FormatError(const Error& error);

} // namespace batchexec::core::errors
