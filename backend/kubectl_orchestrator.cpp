#include "backend/kubectl_orchestrator.hpp"

#include <cstdlib>
#include <map>

#include "absl/memory/memory.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/subprocess.hpp"

namespace {

static const constexpr char* kConfigTempBase = "/tmp/codebox";

const std::map<std::string, int>& ReasonStatus() {
  static const std::map<std::string, int>* reasons =
      new std::map<std::string, int>{{"BadRequest", 400},
                                     {"Unauthorized", 401},
                                     {"Forbidden", 403},
                                     {"NotFound", 404},
                                     {"AlreadyExists", 409},
                                     {"Conflict", 409},
                                     {"Invalid", 422},
                                     {"TooManyRequests", 429},
                                     {"InternalError", 500},
                                     {"ServiceUnavailable", 503}};
  return *reasons;
}

// Writes a kubeconfig using the pod's service account.
std::string WriteInClusterConfig(const std::string& dir,
                                 const std::string& service_account_dir) {
  std::string server =
      absl::StrCat("https://", std::getenv("KUBERNETES_SERVICE_HOST"), ":",
                   std::getenv("KUBERNETES_SERVICE_PORT"));
  nlohmann::json cluster;
  cluster["name"] = "in-cluster";
  cluster["cluster"]["server"] = server;
  cluster["cluster"]["certificate-authority"] =
      util::File::JoinPath(service_account_dir, "ca.crt");
  nlohmann::json user;
  user["name"] = "service-account";
  user["user"]["tokenFile"] =
      util::File::JoinPath(service_account_dir, "token");
  nlohmann::json context;
  context["name"] = "in-cluster";
  context["context"]["cluster"] = "in-cluster";
  context["context"]["user"] = "service-account";

  nlohmann::json config;
  config["apiVersion"] = "v1";
  config["kind"] = "Config";
  config["clusters"] = nlohmann::json::array({cluster});
  config["users"] = nlohmann::json::array({user});
  config["contexts"] = nlohmann::json::array({context});
  config["current-context"] = "in-cluster";
  // kubectl reads JSON kubeconfigs too.
  std::string path = util::File::JoinPath(dir, "kubeconfig");
  util::File::Write(path, config.dump(2));
  return path;
}

}  // namespace

namespace backend {

void ThrowKubectlError(const std::string& what,
                       const std::string& stderr_output) {
  std::string msg = absl::StrCat(
      what, ": ", absl::StripAsciiWhitespace(stderr_output));
  static const std::string kPrefix = "Error from server (";
  size_t pos = stderr_output.find(kPrefix);
  if (pos != std::string::npos) {
    size_t start = pos + kPrefix.size();
    size_t end = stderr_output.find(')', start);
    std::string reason = stderr_output.substr(start, end - start);
    if (reason == "NotFound") throw not_found(msg);
    auto it = ReasonStatus().find(reason);
    if (it != ReasonStatus().end()) throw api_error(it->second, msg);
  }
  throw api_error(0, msg);
}

bool KubectlOrchestrator::InCluster(const std::string& service_account_dir) {
  return std::getenv("KUBERNETES_SERVICE_HOST") != nullptr &&
         std::getenv("KUBERNETES_SERVICE_PORT") != nullptr &&
         util::File::Exists(util::File::JoinPath(service_account_dir, "token"));
}

KubectlOrchestrator::KubectlOrchestrator(KubectlOptions options)
    : options_(std::move(options)) {
  if (!options_.kubeconfig.empty()) {
    kubeconfig_ = options_.kubeconfig;
  } else if (InCluster(options_.service_account_dir)) {
    config_dir_ = absl::make_unique<util::TempDir>(kConfigTempBase);
    kubeconfig_ =
        WriteInClusterConfig(config_dir_->Path(), options_.service_account_dir);
    LOG(INFO) << "Using in-cluster service account configuration";
  } else {
    LOG(INFO) << "Using local kubeconfig";
  }
}

std::string KubectlOrchestrator::Run(const std::vector<std::string>& args,
                                     const std::string& input) {
  std::vector<std::string> cmd = {options_.kubectl};
  if (!kubeconfig_.empty()) cmd.push_back("--kubeconfig=" + kubeconfig_);
  if (!options_.context.empty()) {
    cmd.push_back("--context=" + options_.context);
  }
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
      options_.request_timeout);
  cmd.push_back(absl::StrCat("--request-timeout=", seconds.count(), "s"));
  cmd.insert(cmd.end(), args.begin(), args.end());
  std::string what = absl::StrJoin(args, " ");
  VLOG(1) << "Running kubectl " << what;

  util::SubprocessResult result;
  try {
    // kubectl enforces its own timeout; ours only guards against hangs.
    result = util::Subprocess::Run(cmd, input,
                                   options_.request_timeout +
                                       std::chrono::seconds(5));
  } catch (const util::subprocess_error& e) {
    throw api_error(0, absl::StrCat("kubectl ", what, ": ", e.what()));
  }
  if (result.killed) {
    throw api_error(0, absl::StrCat("kubectl ", what, ": timed out"));
  }
  if (result.status_code != 0 || result.signal != 0) {
    ThrowKubectlError("kubectl " + what, result.error);
  }
  return result.output;
}

nlohmann::json KubectlOrchestrator::RunJson(
    const std::vector<std::string>& args) {
  std::string output = Run(args);
  nlohmann::json value = nlohmann::json::parse(output, nullptr, false);
  if (value.is_discarded()) {
    throw api_error(0, "kubectl " + absl::StrJoin(args, " ") +
                           ": invalid JSON output");
  }
  return value;
}

void KubectlOrchestrator::ReadNamespace(const std::string& ns) {
  Run({"get", "namespace", ns, "-o", "name"});
}

void KubectlOrchestrator::CreateJob(const std::string& ns,
                                    const nlohmann::json& manifest) {
  Run({"create", "-n", ns, "-f", "-", "-o", "name"}, manifest.dump());
}

JobStatus KubectlOrchestrator::ReadJobStatus(const std::string& ns,
                                             const std::string& name) {
  nlohmann::json job = RunJson({"get", "job", name, "-n", ns, "-o", "json"});
  JobStatus status;
  try {
    if (!job.count("status") || !job["status"].is_object()) return status;
    const nlohmann::json& s = job["status"];
    status.active = s.value("active", 0);
    status.succeeded = s.value("succeeded", 0);
    status.failed = s.value("failed", 0);
    if (s.count("conditions") && s["conditions"].is_array()) {
      for (const nlohmann::json& condition : s["conditions"]) {
        if (condition.value("type", "") == "Failed" &&
            condition.value("status", "") == "True") {
          status.failure_reason = condition.value("reason", "");
        }
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw api_error(0, absl::StrCat("kubectl get job ", name,
                                    ": unexpected status: ", e.what()));
  }
  return status;
}

std::vector<std::string> KubectlOrchestrator::ListPodNames(
    const std::string& ns, const std::string& selector) {
  nlohmann::json pods =
      RunJson({"get", "pods", "-n", ns, "-l", selector, "-o", "json"});
  std::vector<std::string> names;
  try {
    if (!pods.count("items") || !pods["items"].is_array()) return names;
    for (const nlohmann::json& pod : pods["items"]) {
      if (pod.count("metadata") && pod["metadata"].count("name")) {
        names.push_back(pod["metadata"]["name"].get<std::string>());
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw api_error(0, absl::StrCat("kubectl get pods -l ", selector,
                                    ": unexpected pod list: ", e.what()));
  }
  return names;
}

std::string KubectlOrchestrator::ReadPodLog(const std::string& ns,
                                            const std::string& pod) {
  return Run({"logs", pod, "-n", ns});
}

void KubectlOrchestrator::DeleteJob(const std::string& ns,
                                    const std::string& name) {
  Run({"delete", "job", name, "-n", ns, "--cascade=background",
       "--wait=false"});
}

}  // namespace backend
