#include "sandbox/sandbox.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "glog/logging.h"

namespace sandbox {

namespace {

bool IsBlank(const std::string& code) {
  for (char c : code) {
    if (!absl::ascii_isspace(c)) return false;
  }
  return true;
}

std::string Outcome(const ExecutionResult& result) {
  if (result.Succeeded()) return "success";
  if (result.TimedOut()) return "timeout";
  return "failure";
}

}  // namespace

double ExecutionTimer::Elapsed() const {
  if (stopped_) return *stopped_;
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start_)
      .count();
}

double ExecutionTimer::Stop() {
  if (!stopped_) stopped_ = Elapsed();
  return *stopped_;
}

AttributedOutput AttributeOutput(const std::string& log,
                                 absl::optional<int> exit_code,
                                 int timeout_seconds) {
  AttributedOutput output;
  if (!exit_code) {
    output.stdout_text = log;
    output.stderr_text =
        absl::StrCat("Execution timed out after ", timeout_seconds, "s");
  } else if (*exit_code == 0) {
    output.stdout_text = log;
  } else {
    output.stderr_text = log;
  }
  return output;
}

ExecutionResult MakeResult(AttributedOutput output,
                           absl::optional<int> exit_code,
                           double execution_time,
                           absl::optional<double> memory_used_mb,
                           int timeout_seconds) {
  if (!exit_code) {
    return ExecutionResult::Timeout(std::move(output.stdout_text),
                                    std::move(output.stderr_text),
                                    execution_time, timeout_seconds);
  }
  if (*exit_code == 0) {
    return ExecutionResult::Success(std::move(output.stdout_text),
                                    std::move(output.stderr_text),
                                    execution_time, memory_used_mb);
  }
  return ExecutionResult::Failure(
      std::move(output.stdout_text), std::move(output.stderr_text), *exit_code,
      execution_time, memory_used_mb,
      absl::StrCat("Process exited with code ", *exit_code));
}

NetworkMode EffectiveNetwork(const ResourceLimits& limits) {
  if (limits.Network() != NetworkMode::ALLOWLIST) return limits.Network();
  LOG(WARNING) << "Domain allowlists are not enforced; running with no "
                  "network access instead";
  return NetworkMode::NONE;
}

Sandbox::Sandbox(ResourceLimits limits, std::shared_ptr<util::EventSink> events)
    : limits_(std::move(limits)), events_(std::move(events)) {}

ExecutionResult Sandbox::Execute(const std::string& code) {
  if (IsBlank(code)) {
    ExecutionResult result = ExecutionResult::Failure(
        "", "Error: Empty code provided", 1, 0.0, absl::nullopt,
        std::string("Empty code provided"));
    Report("rejected", result.ExitCode(), 0.0);
    return result;
  }
  ExecutionTimer timer;
  try {
    ExecutionResult result = ExecuteInternal(code);
    VLOG(1) << BackendName() << " execution finished: exit code "
            << result.ExitCode() << " in " << result.ExecutionTime() << "s";
    Report(Outcome(result), result.ExitCode(), result.ExecutionTime());
    return result;
  } catch (const sandbox_error& e) {
    LOG(ERROR) << BackendName() << " execution failed: " << e.what();
    Report("error", -1, timer.Stop());
    throw;
  } catch (const std::exception& e) {
    std::string msg =
        absl::StrCat(BackendName(), " execution failed: ", e.what());
    LOG(ERROR) << msg;
    Report("error", -1, timer.Stop());
    throw sandbox_error(msg);
  }
}

void Sandbox::Report(const std::string& outcome, int exit_code,
                     double duration) {
  util::EventSink::Fields tags = {{"backend", BackendName()},
                                  {"outcome", outcome}};
  util::EventSink::Fields fields = tags;
  fields["exit_code"] = absl::StrCat(exit_code);
  fields["duration_seconds"] = absl::StrFormat("%.3f", duration);
  util::SafeLog(events_.get(), "execution_finished", fields);
  util::SafeRecordMetric(events_.get(), "sandbox.execution.duration_seconds",
                         duration, tags);
  util::SafeRecordMetric(events_.get(), "sandbox.execution.count", 1, tags);
}

}  // namespace sandbox
