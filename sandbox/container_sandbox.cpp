#include "sandbox/container_sandbox.hpp"

#include <ctime>
#include <functional>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"

namespace sandbox {

namespace {

static const constexpr int64_t kMegabyte = 1024 * 1024;
static const constexpr auto kStopGrace = std::chrono::seconds(1);

// Removes the container when the execution leaves scope, whatever the path.
class ContainerGuard {
 public:
  ContainerGuard(std::function<void(const std::string&)> cleanup,
                 std::string id)
      : cleanup_(std::move(cleanup)), id_(std::move(id)) {}
  ~ContainerGuard() { cleanup_(id_); }
  ContainerGuard(const ContainerGuard&) = delete;
  ContainerGuard& operator=(const ContainerGuard&) = delete;

 private:
  std::function<void(const std::string&)> cleanup_;
  std::string id_;
};

}  // namespace

constexpr const char* ContainerSandbox::kManagedLabel;

ContainerSandbox::ContainerSandbox(
    ResourceLimits limits, std::shared_ptr<backend::ContainerEngine> engine,
    ContainerSettings settings, std::shared_ptr<util::EventSink> events)
    : Sandbox(std::move(limits), std::move(events)),
      engine_(std::move(engine)),
      settings_(std::move(settings)) {
  try {
    engine_->Ping();
  } catch (const backend::api_error& e) {
    throw sandbox_error(absl::StrCat("Docker not available: ", e.what()));
  }
  try {
    if (!engine_->HasImage(settings_.image)) {
      LOG(INFO) << "Image " << settings_.image << " not found locally";
      engine_->PullImage(settings_.image);
    }
  } catch (const backend::api_error& e) {
    throw sandbox_error(
        absl::StrCat("Failed to pull image ", settings_.image, ": ", e.what()));
  }
  LOG(INFO) << "Docker sandbox ready: image=" << settings_.image << " "
            << Limits().DebugString();
}

backend::ContainerSpec ContainerSandbox::BuildSpec(
    const std::string& code) const {
  const ResourceLimits& limits = Limits();
  backend::ContainerSpec spec;
  spec.image = settings_.image;
  spec.command = settings_.command;
  spec.command.push_back(code);
  spec.labels[kManagedLabel] = "true";

  spec.memory_bytes = limits.MemoryLimitMb() * kMegabyte;
  spec.memory_swap_bytes = spec.memory_bytes;
  spec.nano_cpus = static_cast<int64_t>(limits.CpuQuota() * 1e9);
  spec.pids_limit = limits.MaxProcesses();

  spec.network_mode =
      EffectiveNetwork(limits) == NetworkMode::UNRESTRICTED ? "bridge" : "none";
  spec.readonly_rootfs = true;
  spec.cap_drop = {"ALL"};
  spec.security_opt = {"no-new-privileges"};
  std::string tmpfs = absl::StrCat("rw,size=", limits.DiskQuotaMb(), "m");
  spec.tmpfs["/tmp"] = tmpfs;
  spec.tmpfs["/var/tmp"] = tmpfs;
  return spec;
}

ExecutionResult ContainerSandbox::ExecuteInternal(const std::string& code) {
  const int timeout = Limits().TimeoutSeconds();
  ExecutionTimer timer;
  std::string id;
  try {
    id = engine_->Create(BuildSpec(code));
  } catch (const backend::api_error& e) {
    throw sandbox_error(absl::StrCat("Failed to create container: ", e.what()));
  }
  ContainerGuard guard([this](const std::string& c) { Cleanup(c); }, id);

  absl::optional<int> exit_code;
  try {
    engine_->Start(id);
    exit_code = engine_->Wait(id, std::chrono::seconds(timeout));
  } catch (const backend::api_error& e) {
    throw sandbox_error(absl::StrCat("Docker execution failed: ", e.what()));
  }
  double execution_time = timer.Stop();
  if (!exit_code) {
    VLOG(1) << "Container " << id << " timed out after " << timeout << "s";
    StopOrKill(id);
  }

  AttributedOutput output;
  try {
    output = AttributeOutput(engine_->Logs(id), exit_code, timeout);
  } catch (const backend::api_error& e) {
    LOG(WARNING) << "Failed to get logs of container " << id << ": "
                 << e.what();
    output.stderr_text = absl::StrCat("Error retrieving logs: ", e.what());
  }
  absl::optional<double> memory_mb;
  if (exit_code) memory_mb = SampleMemoryMb(id);
  return MakeResult(std::move(output), exit_code, execution_time, memory_mb,
                    timeout);
}

absl::optional<double> ContainerSandbox::SampleMemoryMb(const std::string& id) {
  try {
    absl::optional<int64_t> bytes = engine_->MaxMemoryUsageBytes(id);
    if (bytes) return static_cast<double>(*bytes) / kMegabyte;
  } catch (const std::exception& e) {
    VLOG(1) << "No memory stats for " << id << ": " << e.what();
  }
  return absl::nullopt;
}

void ContainerSandbox::StopOrKill(const std::string& id) {
  try {
    engine_->Stop(id, kStopGrace);
    return;
  } catch (const backend::not_found& e) {
    return;
  } catch (const backend::api_error& e) {
    LOG(WARNING) << "Failed to stop container " << id << ": " << e.what();
  }
  try {
    engine_->Kill(id);
  } catch (const backend::api_error& e) {
    LOG(WARNING) << "Failed to kill container " << id << ": " << e.what();
  }
}

void ContainerSandbox::Cleanup(const std::string& id) {
  try {
    if (engine_->Inspect(id).running) StopOrKill(id);
    engine_->Remove(id, true);
    VLOG(1) << "Removed container " << id;
  } catch (const backend::not_found& e) {
    VLOG(1) << "Container " << id << " already gone";
  } catch (const std::exception& e) {
    LOG(WARNING) << "Failed to clean up container " << id << ": " << e.what();
  }
}

size_t ContainerSandbox::RemoveStale(std::chrono::seconds older_than) {
  std::vector<backend::ContainerSummary> containers;
  try {
    containers = engine_->List(absl::StrCat(kManagedLabel, "=true"));
  } catch (const backend::api_error& e) {
    throw sandbox_error(absl::StrCat("Failed to list containers: ", e.what()));
  }
  int64_t cutoff = static_cast<int64_t>(time(nullptr)) - older_than.count();
  size_t removed = 0;
  for (const backend::ContainerSummary& container : containers) {
    if (container.created > cutoff) continue;
    try {
      engine_->Remove(container.id, true);
      removed++;
    } catch (const backend::not_found& e) {
      continue;
    } catch (const backend::api_error& e) {
      LOG(WARNING) << "Failed to remove stale container " << container.id
                   << ": " << e.what();
    }
  }
  if (removed > 0) LOG(INFO) << "Removed " << removed << " stale containers";
  return removed;
}

}  // namespace sandbox
