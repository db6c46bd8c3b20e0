#ifndef SANDBOX_CONTAINER_SANDBOX_HPP
#define SANDBOX_CONTAINER_SANDBOX_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "backend/container_engine.hpp"
#include "sandbox/sandbox.hpp"

namespace sandbox {

struct ContainerSettings {
  std::string image = "python:3.12-slim";
  // The code is appended as the last argument.
  std::vector<std::string> command = {"python", "-c"};
};

// Sandbox running every execution in a fresh container.
class ContainerSandbox : public Sandbox {
 public:
  // Label put on every container, used to find leftovers.
  static const constexpr char* kManagedLabel = "codebox.managed";

  // Checks that the engine is reachable and the image available, pulling it
  // if needed. Throws sandbox_error otherwise.
  ContainerSandbox(ResourceLimits limits,
                   std::shared_ptr<backend::ContainerEngine> engine,
                   ContainerSettings settings,
                   std::shared_ptr<util::EventSink> events =
                       util::DefaultEventSink());

  std::string BackendName() const override { return "docker"; }

  // Removes containers left behind by processes that died while executing,
  // created more than older_than ago. Returns how many were removed.
  size_t RemoveStale(std::chrono::seconds older_than);

  // Container definition for the given code.
  backend::ContainerSpec BuildSpec(const std::string& code) const;

 protected:
  ExecutionResult ExecuteInternal(const std::string& code) override;

 private:
  // Stops and removes the container. Never throws.
  void Cleanup(const std::string& id);
  void StopOrKill(const std::string& id);
  absl::optional<double> SampleMemoryMb(const std::string& id);

  std::shared_ptr<backend::ContainerEngine> engine_;
  ContainerSettings settings_;
};

}  // namespace sandbox

#endif
