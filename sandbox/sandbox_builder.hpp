#ifndef SANDBOX_SANDBOX_BUILDER_HPP
#define SANDBOX_SANDBOX_BUILDER_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "sandbox/resource_limits.hpp"
#include "sandbox/sandbox.hpp"
#include "util/event_sink.hpp"

namespace sandbox {

struct SandboxOptions {
  enum class Kind { AUTO, DOCKER, KUBERNETES };
  Kind kind = Kind::AUTO;

  std::string image = "python:3.12-slim";
  std::vector<std::string> command = {"python", "-c"};

  std::string docker_endpoint = "unix:///var/run/docker.sock";
  std::chrono::milliseconds request_timeout = std::chrono::seconds(60);

  std::string k8s_namespace = "default";
  int job_ttl_seconds = 300;
  std::string kubeconfig;
  std::string kube_context;
  std::string kubectl = "kubectl";
  std::string service_account_dir =
      "/var/run/secrets/kubernetes.io/serviceaccount";
  std::chrono::milliseconds poll_interval = std::chrono::seconds(1);

  std::shared_ptr<util::EventSink> events = util::DefaultEventSink();

  // Options from the command line flags. Throws std::invalid_argument on
  // invalid values.
  static SandboxOptions FromFlags();
};

// Throws std::invalid_argument on names other than auto, docker, kubernetes.
SandboxOptions::Kind ParseKind(const std::string& name);

class SandboxBuilder {
 public:
  // Builds the sandbox selected by options. AUTO picks Kubernetes when
  // running inside a cluster, Docker otherwise. Throws sandbox_error if the
  // backend is not available.
  static std::unique_ptr<Sandbox> Create(const ResourceLimits& limits,
                                         const SandboxOptions& options);

  // The kind Create would build.
  static SandboxOptions::Kind Resolve(const SandboxOptions& options);
};

}  // namespace sandbox

#endif
