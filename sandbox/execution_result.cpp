#include "sandbox/execution_result.hpp"

#include "absl/strings/str_cat.h"

namespace sandbox {

ExecutionResult ExecutionResult::Success(
    std::string stdout_text, std::string stderr_text, double execution_time,
    absl::optional<double> memory_used_mb) {
  ExecutionResult result;
  result.stdout_ = std::move(stdout_text);
  result.stderr_ = std::move(stderr_text);
  result.exit_code_ = 0;
  result.execution_time_ = execution_time;
  result.success_ = true;
  result.memory_used_mb_ = memory_used_mb;
  return result;
}

ExecutionResult ExecutionResult::Failure(
    std::string stdout_text, std::string stderr_text, int exit_code,
    double execution_time, absl::optional<double> memory_used_mb,
    absl::optional<std::string> error_message) {
  ExecutionResult result;
  result.stdout_ = std::move(stdout_text);
  result.stderr_ = std::move(stderr_text);
  result.exit_code_ = exit_code == 0 ? 1 : exit_code;
  result.execution_time_ = execution_time;
  result.memory_used_mb_ = memory_used_mb;
  result.error_message_ = std::move(error_message);
  return result;
}

ExecutionResult ExecutionResult::Timeout(std::string stdout_text,
                                         std::string stderr_text,
                                         double execution_time,
                                         int timeout_seconds) {
  ExecutionResult result;
  result.stdout_ = std::move(stdout_text);
  result.stderr_ = std::move(stderr_text);
  result.exit_code_ = kTimeoutExitCode;
  result.execution_time_ = execution_time;
  result.timed_out_ = true;
  result.error_message_ =
      absl::StrCat("Timeout after ", timeout_seconds, "s");
  return result;
}

nlohmann::json ExecutionResult::ToJson() const {
  nlohmann::json json = {
      {"stdout", stdout_},
      {"stderr", stderr_},
      {"exit_code", exit_code_},
      {"execution_time", execution_time_},
      {"success", success_},
      {"timed_out", timed_out_},
      {"memory_used_mb", nullptr},
      {"error_message", nullptr},
  };
  if (memory_used_mb_) json["memory_used_mb"] = *memory_used_mb_;
  if (error_message_) json["error_message"] = *error_message_;
  return json;
}

}  // namespace sandbox
