#pragma once

namespace batchexec::core::errors {

// Process-exit contract used when the executive escalates a failure.
//
// 0/1/2 keep their conventional shell meanings. kFatal is reserved for
// failures escalated by a host running with `fatal=1`, so wrapper scripts can
// tell a policy abort apart from an ordinary command failure.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kFatal = 70,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace batchexec::core::errors
