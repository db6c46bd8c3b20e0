#include "sandbox/resource_limits.hpp"

#include <cstdint>
#include <limits>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace sandbox {

namespace {

int Strictness(NetworkMode mode) {
  switch (mode) {
    case NetworkMode::NONE:
      return 0;
    case NetworkMode::ALLOWLIST:
      return 1;
    case NetworkMode::UNRESTRICTED:
      return 2;
  }
  return 2;
}

template <typename T>
void CheckRange(const char* field, T value, T min, T max) {
  if (value < min || value > max) {
    throw resource_limit_error(absl::StrCat(field, " must be between ", min,
                                            " and ", max, ", got ", value));
  }
}

template <typename T>
T Get(const nlohmann::json& json, const char* key, T def) {
  if (!json.count(key)) return def;
  try {
    return json.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw resource_limit_error(absl::StrCat("Invalid value for ", key, ": ",
                                            json.at(key).dump()));
  }
}

// Integer field, range checked before narrowing so that large or fractional
// values cannot wrap into range.
int GetInt(const nlohmann::json& json, const char* key, int def, int min,
           int max) {
  if (!json.count(key)) return def;
  const nlohmann::json& value = json.at(key);
  if (!value.is_number_integer()) {
    throw resource_limit_error(
        absl::StrCat(key, " must be an integer, got ", value.dump()));
  }
  if (value.is_number_unsigned() &&
      value.get<uint64_t>() >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw resource_limit_error(absl::StrCat(key, " must be between ", min,
                                            " and ", max, ", got ",
                                            value.dump()));
  }
  int64_t wide = value.get<int64_t>();
  CheckRange<int64_t>(key, wide, min, max);
  return static_cast<int>(wide);
}

double GetNumber(const nlohmann::json& json, const char* key, double def) {
  if (!json.count(key)) return def;
  const nlohmann::json& value = json.at(key);
  // Booleans are not numbers in nlohmann::json.
  if (!value.is_number()) {
    throw resource_limit_error(
        absl::StrCat(key, " must be a number, got ", value.dump()));
  }
  return value.get<double>();
}

}  // namespace

constexpr int ResourceLimits::kMaxTimeoutSeconds;
constexpr int ResourceLimits::kMinMemoryMb;
constexpr int ResourceLimits::kMaxMemoryMb;
constexpr double ResourceLimits::kMaxCpuQuota;
constexpr int ResourceLimits::kMaxDiskMb;
constexpr int ResourceLimits::kMaxProcesses;

std::string NetworkModeName(NetworkMode mode) {
  switch (mode) {
    case NetworkMode::NONE:
      return "none";
    case NetworkMode::ALLOWLIST:
      return "allowlist";
    case NetworkMode::UNRESTRICTED:
      return "unrestricted";
  }
  return "unknown";
}

NetworkMode ParseNetworkMode(const std::string& name) {
  if (name == "none") return NetworkMode::NONE;
  if (name == "allowlist") return NetworkMode::ALLOWLIST;
  if (name == "unrestricted") return NetworkMode::UNRESTRICTED;
  throw resource_limit_error("Unknown network mode: " + name);
}

ResourceLimits::Builder& ResourceLimits::Builder::TimeoutSeconds(int value) {
  limits_.timeout_seconds_ = value;
  return *this;
}

ResourceLimits::Builder& ResourceLimits::Builder::MemoryLimitMb(int value) {
  limits_.memory_limit_mb_ = value;
  return *this;
}

ResourceLimits::Builder& ResourceLimits::Builder::CpuQuota(double value) {
  limits_.cpu_quota_ = value;
  return *this;
}

ResourceLimits::Builder& ResourceLimits::Builder::DiskQuotaMb(int value) {
  limits_.disk_quota_mb_ = value;
  return *this;
}

ResourceLimits::Builder& ResourceLimits::Builder::MaxProcesses(int value) {
  limits_.max_processes_ = value;
  return *this;
}

ResourceLimits::Builder& ResourceLimits::Builder::Network(NetworkMode value) {
  limits_.network_mode_ = value;
  return *this;
}

ResourceLimits::Builder& ResourceLimits::Builder::AllowedDomains(
    std::set<std::string> value) {
  limits_.allowed_domains_ = std::move(value);
  return *this;
}

ResourceLimits ResourceLimits::Builder::Build() const {
  limits_.Validate();
  return limits_;
}

void ResourceLimits::Validate() const {
  CheckRange("timeout_seconds", timeout_seconds_, 1, kMaxTimeoutSeconds);
  CheckRange("memory_limit_mb", memory_limit_mb_, kMinMemoryMb, kMaxMemoryMb);
  // NaN fails both comparisons, so test for the valid range instead.
  if (!(cpu_quota_ > 0 && cpu_quota_ < kMaxCpuQuota)) {
    throw resource_limit_error(
        absl::StrCat("cpu_quota must be greater than 0 and less than ",
                     kMaxCpuQuota, ", got ", cpu_quota_));
  }
  CheckRange("disk_quota_mb", disk_quota_mb_, 1, kMaxDiskMb);
  CheckRange("max_processes", max_processes_, 1, kMaxProcesses);
  for (const std::string& domain : allowed_domains_) {
    if (domain.empty()) {
      throw resource_limit_error("allowed_domains contains an empty domain");
    }
  }
}

ResourceLimits ResourceLimits::Development() {
  return Builder()
      .TimeoutSeconds(300)
      .MemoryLimitMb(2048)
      .CpuQuota(2.0)
      .DiskQuotaMb(1024)
      .MaxProcesses(10)
      .Network(NetworkMode::UNRESTRICTED)
      .Build();
}

ResourceLimits ResourceLimits::Production() {
  return Builder()
      .TimeoutSeconds(30)
      .MemoryLimitMb(512)
      .CpuQuota(1.0)
      .DiskQuotaMb(100)
      .MaxProcesses(1)
      .Network(NetworkMode::NONE)
      .Build();
}

ResourceLimits ResourceLimits::Testing() {
  return Builder()
      .TimeoutSeconds(10)
      .MemoryLimitMb(256)
      .CpuQuota(0.5)
      .DiskQuotaMb(50)
      .MaxProcesses(1)
      .Network(NetworkMode::NONE)
      .Build();
}

ResourceLimits ResourceLimits::DataProcessing() {
  return Builder()
      .TimeoutSeconds(120)
      .MemoryLimitMb(4096)
      .CpuQuota(4.0)
      .DiskQuotaMb(2048)
      .MaxProcesses(4)
      .Network(NetworkMode::NONE)
      .Build();
}

ResourceLimits ResourceLimits::Preset(const std::string& name) {
  if (name == "development") return Development();
  if (name == "production") return Production();
  if (name == "testing") return Testing();
  if (name == "data_processing") return DataProcessing();
  throw resource_limit_error("Unknown preset: " + name);
}

nlohmann::json ResourceLimits::ToJson() const {
  return {
      {"timeout_seconds", timeout_seconds_},
      {"memory_limit_mb", memory_limit_mb_},
      {"cpu_quota", cpu_quota_},
      {"disk_quota_mb", disk_quota_mb_},
      {"max_processes", max_processes_},
      {"network_mode", NetworkModeName(network_mode_)},
      {"allowed_domains", allowed_domains_},
  };
}

ResourceLimits ResourceLimits::FromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw resource_limit_error("Resource limits must be a JSON object");
  }
  ResourceLimits def;
  return Builder()
      .TimeoutSeconds(GetInt(json, "timeout_seconds", def.timeout_seconds_, 1,
                             kMaxTimeoutSeconds))
      .MemoryLimitMb(GetInt(json, "memory_limit_mb", def.memory_limit_mb_,
                            kMinMemoryMb, kMaxMemoryMb))
      .CpuQuota(GetNumber(json, "cpu_quota", def.cpu_quota_))
      .DiskQuotaMb(GetInt(json, "disk_quota_mb", def.disk_quota_mb_, 1,
                          kMaxDiskMb))
      .MaxProcesses(GetInt(json, "max_processes", def.max_processes_, 1,
                           kMaxProcesses))
      .Network(ParseNetworkMode(Get<std::string>(json, "network_mode", "none")))
      .AllowedDomains(Get(json, "allowed_domains", def.allowed_domains_))
      .Build();
}

bool ResourceLimits::IsWithin(const ResourceLimits& other) const {
  if (timeout_seconds_ > other.timeout_seconds_ ||
      memory_limit_mb_ > other.memory_limit_mb_ ||
      cpu_quota_ > other.cpu_quota_ || disk_quota_mb_ > other.disk_quota_mb_ ||
      max_processes_ > other.max_processes_) {
    return false;
  }
  if (Strictness(network_mode_) > Strictness(other.network_mode_)) {
    return false;
  }
  if (network_mode_ == NetworkMode::ALLOWLIST &&
      other.network_mode_ == NetworkMode::ALLOWLIST) {
    for (const std::string& domain : allowed_domains_) {
      if (!other.allowed_domains_.count(domain)) return false;
    }
  }
  return true;
}

std::string ResourceLimits::DebugString() const {
  std::string out = absl::StrCat(
      "timeout=", timeout_seconds_, "s memory=", memory_limit_mb_,
      "MB cpu=", cpu_quota_, " disk=", disk_quota_mb_,
      "MB procs=", max_processes_, " network=", NetworkModeName(network_mode_));
  if (!allowed_domains_.empty()) {
    absl::StrAppend(&out, " domains=", absl::StrJoin(allowed_domains_, ","));
  }
  return out;
}

bool ResourceLimits::operator==(const ResourceLimits& other) const {
  return timeout_seconds_ == other.timeout_seconds_ &&
         memory_limit_mb_ == other.memory_limit_mb_ &&
         cpu_quota_ == other.cpu_quota_ &&
         disk_quota_mb_ == other.disk_quota_mb_ &&
         max_processes_ == other.max_processes_ &&
         network_mode_ == other.network_mode_ &&
         allowed_domains_ == other.allowed_domains_;
}

}  // namespace sandbox
