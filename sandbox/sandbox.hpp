#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "absl/types/optional.h"
#include "sandbox/execution_result.hpp"
#include "sandbox/resource_limits.hpp"
#include "util/event_sink.hpp"

namespace sandbox {

// The execution environment could not be provisioned.
class sandbox_error : public std::runtime_error {
 public:
  explicit sandbox_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Wall-clock time of an execution, from the start of provisioning to the
// start of teardown.
class ExecutionTimer {
 public:
  ExecutionTimer() : start_(std::chrono::steady_clock::now()) {}

  // Seconds since construction, or since construction until the first call
  // to Stop if there was one.
  double Elapsed() const;
  // Freezes the measure and returns it. Further calls return the same value.
  double Stop();

 private:
  std::chrono::steady_clock::time_point start_;
  absl::optional<double> stopped_;
};

struct AttributedOutput {
  std::string stdout_text;
  std::string stderr_text;
};

// Backends only see stdout and stderr merged. A successful run gets the log
// as stdout, a failed run as stderr. A timed out run keeps the partial log as
// stdout and gets the timeout message as stderr. exit_code is nullopt for
// timed out runs.
AttributedOutput AttributeOutput(const std::string& log,
                                 absl::optional<int> exit_code,
                                 int timeout_seconds);

// Builds the result of a run that finished (exit_code set) or timed out.
ExecutionResult MakeResult(AttributedOutput output,
                           absl::optional<int> exit_code,
                           double execution_time,
                           absl::optional<double> memory_used_mb,
                           int timeout_seconds);

// Network mode actually granted to an execution unit. Domain allowlists are
// not enforced by any backend, so they get no network at all.
NetworkMode EffectiveNetwork(const ResourceLimits& limits);

// Runs untrusted code in ephemeral isolated units. Every call to Execute uses
// a fresh unit, destroyed before Execute returns.
class Sandbox {
 public:
  // Runs code within the limits of this sandbox. Problems caused by the code
  // (errors, non-zero exit codes, timeouts) are reported in the result.
  // Throws sandbox_error if the execution environment failed, including
  // unexpected errors escaping the backend.
  // Safe to call concurrently.
  ExecutionResult Execute(const std::string& code);

  const ResourceLimits& Limits() const { return limits_; }

  // Short name used in logs and metrics, e.g. "docker".
  virtual std::string BackendName() const = 0;

  virtual ~Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

 protected:
  Sandbox(ResourceLimits limits, std::shared_ptr<util::EventSink> events);

  // Called with non-blank code only.
  virtual ExecutionResult ExecuteInternal(const std::string& code) = 0;

 private:
  void Report(const std::string& outcome, int exit_code, double duration);

  ResourceLimits limits_;
  std::shared_ptr<util::EventSink> events_;
};

}  // namespace sandbox

#endif
