#ifndef SANDBOX_EXECUTION_RESULT_HPP
#define SANDBOX_EXECUTION_RESULT_HPP

#include <string>

#include "absl/types/optional.h"
#include "nlohmann/json.hpp"

namespace sandbox {

// Exit code reported for executions that ran out of time.
static const constexpr int kTimeoutExitCode = 124;

// Outcome of one execution. Built only through the factories, which keep
// success == (exit_code == 0 && !timed_out).
class ExecutionResult {
 public:
  static ExecutionResult Success(std::string stdout_text,
                                 std::string stderr_text,
                                 double execution_time,
                                 absl::optional<double> memory_used_mb);

  // The code ran and exited with a non-zero code, or could not run at all.
  // An exit_code of 0 is turned into 1.
  static ExecutionResult Failure(std::string stdout_text,
                                 std::string stderr_text, int exit_code,
                                 double execution_time,
                                 absl::optional<double> memory_used_mb,
                                 absl::optional<std::string> error_message);

  static ExecutionResult Timeout(std::string stdout_text,
                                 std::string stderr_text,
                                 double execution_time, int timeout_seconds);

  const std::string& Stdout() const { return stdout_; }
  const std::string& Stderr() const { return stderr_; }
  int ExitCode() const { return exit_code_; }
  double ExecutionTime() const { return execution_time_; }
  bool Succeeded() const { return success_; }
  bool TimedOut() const { return timed_out_; }
  const absl::optional<double>& MemoryUsedMb() const {
    return memory_used_mb_;
  }
  const absl::optional<std::string>& ErrorMessage() const {
    return error_message_;
  }

  // Optional fields are null when absent.
  nlohmann::json ToJson() const;

 private:
  ExecutionResult() = default;

  std::string stdout_;
  std::string stderr_;
  int exit_code_ = 0;
  double execution_time_ = 0;
  bool success_ = false;
  bool timed_out_ = false;
  absl::optional<double> memory_used_mb_;
  absl::optional<std::string> error_message_;
};

}  // namespace sandbox

#endif
