#ifndef SANDBOX_ORCHESTRATOR_SANDBOX_HPP
#define SANDBOX_ORCHESTRATOR_SANDBOX_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "backend/orchestrator.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

struct JobSettings {
  std::string ns = "default";
  std::string image = "python:3.12-slim";
  // The code is appended as the last argument.
  std::vector<std::string> command = {"python", "-c"};
  // Seconds the cluster keeps a finished job around.
  int ttl_seconds = 300;
  std::chrono::milliseconds poll_interval = std::chrono::seconds(1);
};

// Sandbox running every execution as a one-off batch job.
class OrchestratorSandbox : public Sandbox {
 public:
  // Pod label selected by the cluster NetworkPolicies.
  static const constexpr char* kNetworkLabel = "codebox.network";

  // Checks that the namespace exists. Throws sandbox_error otherwise.
  OrchestratorSandbox(ResourceLimits limits,
                      std::shared_ptr<backend::Orchestrator> orchestrator,
                      JobSettings settings,
                      std::shared_ptr<util::EventSink> events =
                          util::DefaultEventSink());

  std::string BackendName() const override { return "kubernetes"; }

  // Job manifest running code.
  nlohmann::json BuildJobManifest(const std::string& name,
                                  const std::string& code) const;

  // Unique job name: code-exec-<unix time>-<code hash>-<32 random bits>.
  static std::string JobName(const std::string& code);

 protected:
  ExecutionResult ExecuteInternal(const std::string& code) override;

 private:
  // Deletes the job and its pods. Never throws.
  void Cleanup(const std::string& name);
  std::string FetchLog(const std::string& name, std::string* error);

  std::shared_ptr<backend::Orchestrator> orchestrator_;
  JobSettings settings_;
};

}  // namespace sandbox

#endif
