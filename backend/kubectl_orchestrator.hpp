#ifndef BACKEND_KUBECTL_ORCHESTRATOR_HPP
#define BACKEND_KUBECTL_ORCHESTRATOR_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "backend/orchestrator.hpp"
#include "util/file.hpp"

namespace backend {

struct KubectlOptions {
  std::string kubectl = "kubectl";
  // Explicit kubeconfig. If empty, the in-cluster service account is used
  // when available, then KUBECONFIG or kubectl's default.
  std::string kubeconfig;
  std::string context;
  std::string service_account_dir =
      "/var/run/secrets/kubernetes.io/serviceaccount";
  std::chrono::milliseconds request_timeout = std::chrono::seconds(60);
};

// Orchestrator driving the Kubernetes API through the kubectl binary. Every
// call spawns one kubectl process.
class KubectlOrchestrator : public Orchestrator {
 public:
  explicit KubectlOrchestrator(KubectlOptions options);

  // True when running inside a pod with a mounted service account.
  static bool InCluster(const std::string& service_account_dir);

  void ReadNamespace(const std::string& ns) override;
  void CreateJob(const std::string& ns,
                 const nlohmann::json& manifest) override;
  JobStatus ReadJobStatus(const std::string& ns,
                          const std::string& name) override;
  std::vector<std::string> ListPodNames(const std::string& ns,
                                        const std::string& selector) override;
  std::string ReadPodLog(const std::string& ns,
                         const std::string& pod) override;
  void DeleteJob(const std::string& ns, const std::string& name) override;

  // Path of the kubeconfig passed to kubectl; empty means kubectl's default.
  const std::string& Kubeconfig() const { return kubeconfig_; }

 private:
  std::string Run(const std::vector<std::string>& args,
                  const std::string& input = "");
  nlohmann::json RunJson(const std::vector<std::string>& args);

  KubectlOptions options_;
  std::unique_ptr<util::TempDir> config_dir_;
  std::string kubeconfig_;
};

// Converts a failed kubectl invocation into not_found or api_error.
[[noreturn]] void ThrowKubectlError(const std::string& what,
                                    const std::string& stderr_output);

}  // namespace backend

#endif
