#include "sandbox/orchestrator_sandbox.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <functional>
#include <thread>

#include "absl/hash/hash.h"
#include "absl/random/random.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/synchronization/mutex.h"
#include "glog/logging.h"

namespace sandbox {

namespace {

static const constexpr int kRunAsUser = 1000;
static const constexpr char* kDeadlineExceeded = "DeadlineExceeded";

nlohmann::json TmpVolume(const std::string& name, int size_mb) {
  nlohmann::json volume;
  volume["name"] = name;
  volume["emptyDir"]["medium"] = "Memory";
  volume["emptyDir"]["sizeLimit"] = absl::StrCat(size_mb, "Mi");
  return volume;
}

nlohmann::json VolumeMount(const std::string& name, const std::string& path) {
  nlohmann::json mount;
  mount["name"] = name;
  mount["mountPath"] = path;
  return mount;
}

// Deletes the job when the execution leaves scope, whatever the path.
class JobGuard {
 public:
  JobGuard(std::function<void(const std::string&)> cleanup, std::string name)
      : cleanup_(std::move(cleanup)), name_(std::move(name)) {}
  ~JobGuard() { cleanup_(name_); }
  JobGuard(const JobGuard&) = delete;
  JobGuard& operator=(const JobGuard&) = delete;

 private:
  std::function<void(const std::string&)> cleanup_;
  std::string name_;
};

}  // namespace

constexpr const char* OrchestratorSandbox::kNetworkLabel;

OrchestratorSandbox::OrchestratorSandbox(
    ResourceLimits limits, std::shared_ptr<backend::Orchestrator> orchestrator,
    JobSettings settings, std::shared_ptr<util::EventSink> events)
    : Sandbox(std::move(limits), std::move(events)),
      orchestrator_(std::move(orchestrator)),
      settings_(std::move(settings)) {
  try {
    orchestrator_->ReadNamespace(settings_.ns);
  } catch (const backend::not_found& e) {
    throw sandbox_error(
        absl::StrCat("Namespace '", settings_.ns, "' does not exist"));
  } catch (const backend::api_error& e) {
    throw sandbox_error(absl::StrCat("Kubernetes not available: ", e.what()));
  }
  LOG(INFO) << "Kubernetes sandbox ready: namespace=" << settings_.ns
            << " image=" << settings_.image << " " << Limits().DebugString();
}

std::string OrchestratorSandbox::JobName(const std::string& code) {
  static absl::Mutex gen_mutex;
  static absl::BitGen* gen = new absl::BitGen;
  uint32_t random;
  {
    absl::MutexLock lck(&gen_mutex);
    random = absl::Uniform<uint32_t>(*gen);
  }
  uint32_t hash = static_cast<uint32_t>(absl::Hash<std::string>{}(code));
  return absl::StrFormat("code-exec-%d-%08x-%08x",
                         static_cast<int64_t>(time(nullptr)), hash, random);
}

nlohmann::json OrchestratorSandbox::BuildJobManifest(
    const std::string& name, const std::string& code) const {
  const ResourceLimits& limits = Limits();
  int millicores = std::max(
      1, static_cast<int>(std::lround(limits.CpuQuota() * 1000)));
  std::string cpu = absl::StrCat(millicores, "m");
  std::string memory = absl::StrCat(limits.MemoryLimitMb(), "Mi");

  nlohmann::json container;
  container["name"] = "executor";
  container["image"] = settings_.image;
  std::vector<std::string> command = settings_.command;
  command.push_back(code);
  container["command"] = command;
  container["resources"]["requests"] = {{"cpu", cpu}, {"memory", memory}};
  container["resources"]["limits"] = {{"cpu", cpu}, {"memory", memory}};
  nlohmann::json& security = container["securityContext"];
  security["allowPrivilegeEscalation"] = false;
  security["runAsNonRoot"] = true;
  security["runAsUser"] = kRunAsUser;
  security["readOnlyRootFilesystem"] = true;
  security["capabilities"]["drop"] = nlohmann::json::array({"ALL"});
  container["volumeMounts"] = nlohmann::json::array(
      {VolumeMount("tmp", "/tmp"), VolumeMount("var-tmp", "/var/tmp")});

  nlohmann::json pod;
  pod["restartPolicy"] = "Never";
  pod["automountServiceAccountToken"] = false;
  pod["securityContext"]["runAsNonRoot"] = true;
  pod["securityContext"]["runAsUser"] = kRunAsUser;
  pod["securityContext"]["fsGroup"] = kRunAsUser;
  pod["containers"] = nlohmann::json::array({container});
  pod["volumes"] =
      nlohmann::json::array({TmpVolume("tmp", limits.DiskQuotaMb()),
                             TmpVolume("var-tmp", limits.DiskQuotaMb())});

  nlohmann::json job;
  job["apiVersion"] = "batch/v1";
  job["kind"] = "Job";
  job["metadata"]["name"] = name;
  job["metadata"]["labels"]["app"] = "code-execution";
  job["metadata"]["labels"]["codebox.managed"] = "true";
  job["spec"]["backoffLimit"] = 0;
  job["spec"]["ttlSecondsAfterFinished"] = settings_.ttl_seconds;
  job["spec"]["activeDeadlineSeconds"] = limits.TimeoutSeconds();
  nlohmann::json& labels = job["spec"]["template"]["metadata"]["labels"];
  labels["app"] = "code-execution";
  labels[kNetworkLabel] = NetworkModeName(EffectiveNetwork(limits));
  job["spec"]["template"]["spec"] = pod;
  return job;
}

ExecutionResult OrchestratorSandbox::ExecuteInternal(const std::string& code) {
  const int timeout = Limits().TimeoutSeconds();
  ExecutionTimer timer;
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(timeout);
  std::string name = JobName(code);
  try {
    orchestrator_->CreateJob(settings_.ns, BuildJobManifest(name, code));
  } catch (const backend::api_error& e) {
    throw sandbox_error(
        absl::StrCat("Failed to create Kubernetes job: ", e.what()));
  }
  VLOG(1) << "Created job " << name;
  JobGuard guard([this](const std::string& job) { Cleanup(job); }, name);

  absl::optional<int> exit_code;
  while (true) {
    backend::JobStatus status;
    try {
      status = orchestrator_->ReadJobStatus(settings_.ns, name);
    } catch (const backend::not_found& e) {
      double execution_time = timer.Stop();
      LOG(WARNING) << "Job " << name << " disappeared while running";
      return ExecutionResult::Failure(
          "", "", 1, execution_time, absl::nullopt,
          absl::StrCat("Job ", name, " disappeared before completing"));
    } catch (const std::exception& e) {
      throw sandbox_error(
          absl::StrCat("Kubernetes execution failed: ", e.what()));
    }
    if (status.succeeded > 0) {
      exit_code = 0;
      break;
    }
    if (status.failed > 0 && status.failure_reason != kDeadlineExceeded) {
      exit_code = 1;
      break;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline || status.failure_reason == kDeadlineExceeded) break;
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(settings_.poll_interval,
                                                      deadline - now));
  }
  double execution_time = timer.Stop();

  if (!exit_code) {
    VLOG(1) << "Job " << name << " timed out after " << timeout << "s";
    return MakeResult(AttributeOutput("", absl::nullopt, timeout),
                      absl::nullopt, execution_time, absl::nullopt, timeout);
  }

  std::string log_error;
  std::string log = FetchLog(name, &log_error);
  AttributedOutput output = AttributeOutput(log, exit_code, timeout);
  if (!log_error.empty()) {
    output.stdout_text.clear();
    output.stderr_text = log_error;
  }
  return MakeResult(std::move(output), exit_code, execution_time,
                    absl::nullopt, timeout);
}

std::string OrchestratorSandbox::FetchLog(const std::string& name,
                                          std::string* error) {
  try {
    std::vector<std::string> pods =
        orchestrator_->ListPodNames(settings_.ns, "job-name=" + name);
    if (pods.empty()) {
      *error = "Error: No pod found for job";
      return "";
    }
    return orchestrator_->ReadPodLog(settings_.ns, pods[0]);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Failed to get logs for job " << name << ": " << e.what();
    *error = absl::StrCat("Error retrieving logs: ", e.what());
    return "";
  }
}

void OrchestratorSandbox::Cleanup(const std::string& name) {
  try {
    orchestrator_->DeleteJob(settings_.ns, name);
    VLOG(1) << "Deleted job " << name;
  } catch (const backend::not_found& e) {
    VLOG(1) << "Job " << name << " already deleted";
  } catch (const std::exception& e) {
    LOG(WARNING) << "Failed to delete job " << name << ": " << e.what();
  }
}

}  // namespace sandbox
