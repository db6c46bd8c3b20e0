#include "sandbox/sandbox_builder.hpp"

#include <stdexcept>
#include <system_error>

#include "absl/memory/memory.h"
#include "absl/strings/str_split.h"
#include "backend/docker_engine.hpp"
#include "backend/kubectl_orchestrator.hpp"
#include "sandbox/container_sandbox.hpp"
#include "sandbox/orchestrator_sandbox.hpp"
#include "util/flags.hpp"

namespace sandbox {

SandboxOptions::Kind ParseKind(const std::string& name) {
  if (name == "auto") return SandboxOptions::Kind::AUTO;
  if (name == "docker") return SandboxOptions::Kind::DOCKER;
  if (name == "kubernetes") return SandboxOptions::Kind::KUBERNETES;
  throw std::invalid_argument("Unknown backend: " + name);
}

SandboxOptions SandboxOptions::FromFlags() {
  SandboxOptions options;
  options.kind = ParseKind(FLAGS_backend);
  options.image = FLAGS_image;
  options.command = absl::StrSplit(FLAGS_command, ',', absl::SkipEmpty());
  if (options.command.empty()) {
    throw std::invalid_argument("--command must not be empty");
  }
  options.docker_endpoint = FLAGS_docker_endpoint;
  if (FLAGS_http_timeout_seconds <= 0) {
    throw std::invalid_argument("--http_timeout_seconds must be positive");
  }
  options.request_timeout = std::chrono::seconds(FLAGS_http_timeout_seconds);
  options.k8s_namespace = FLAGS_k8s_namespace;
  options.job_ttl_seconds = FLAGS_k8s_job_ttl;
  options.kubeconfig = FLAGS_kubeconfig;
  options.kube_context = FLAGS_kube_context;
  options.kubectl = FLAGS_kubectl;
  if (FLAGS_poll_interval_millis <= 0) {
    throw std::invalid_argument("--poll_interval_millis must be positive");
  }
  options.poll_interval = std::chrono::milliseconds(FLAGS_poll_interval_millis);
  return options;
}

SandboxOptions::Kind SandboxBuilder::Resolve(const SandboxOptions& options) {
  if (options.kind != SandboxOptions::Kind::AUTO) return options.kind;
  if (backend::KubectlOrchestrator::InCluster(options.service_account_dir)) {
    return SandboxOptions::Kind::KUBERNETES;
  }
  return SandboxOptions::Kind::DOCKER;
}

std::unique_ptr<Sandbox> SandboxBuilder::Create(const ResourceLimits& limits,
                                                const SandboxOptions& options) {
  if (Resolve(options) == SandboxOptions::Kind::KUBERNETES) {
    backend::KubectlOptions kubectl;
    kubectl.kubectl = options.kubectl;
    kubectl.kubeconfig = options.kubeconfig;
    kubectl.context = options.kube_context;
    kubectl.service_account_dir = options.service_account_dir;
    kubectl.request_timeout = options.request_timeout;
    JobSettings settings;
    settings.ns = options.k8s_namespace;
    settings.image = options.image;
    settings.command = options.command;
    settings.ttl_seconds = options.job_ttl_seconds;
    settings.poll_interval = options.poll_interval;
    std::shared_ptr<backend::Orchestrator> orchestrator;
    try {
      orchestrator = std::make_shared<backend::KubectlOrchestrator>(kubectl);
    } catch (const std::system_error& e) {
      throw sandbox_error(
          std::string("Kubernetes not available: ") + e.what());
    }
    return absl::make_unique<OrchestratorSandbox>(limits, orchestrator,
                                                  settings, options.events);
  }

  ContainerSettings settings;
  settings.image = options.image;
  settings.command = options.command;
  std::shared_ptr<backend::ContainerEngine> engine;
  try {
    engine = std::make_shared<backend::DockerEngine>(options.docker_endpoint,
                                                     options.request_timeout);
  } catch (const util::http_error& e) {
    throw sandbox_error(std::string("Docker not available: ") + e.what());
  }
  return absl::make_unique<ContainerSandbox>(limits, engine, settings,
                                             options.events);
}

}  // namespace sandbox
