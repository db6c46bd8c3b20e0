#ifndef SANDBOX_RESOURCE_LIMITS_HPP
#define SANDBOX_RESOURCE_LIMITS_HPP

#include <set>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

namespace sandbox {

// A field of ResourceLimits is outside of its valid range.
class resource_limit_error : public std::invalid_argument {
 public:
  explicit resource_limit_error(const std::string& msg)
      : std::invalid_argument(msg) {}
};

enum class NetworkMode { NONE, ALLOWLIST, UNRESTRICTED };

// "none", "allowlist" or "unrestricted".
std::string NetworkModeName(NetworkMode mode);
// Throws resource_limit_error on unknown names.
NetworkMode ParseNetworkMode(const std::string& name);

// Validated set of constraints applied to every execution of a sandbox.
// Instances are immutable; use Builder or one of the presets to get one.
class ResourceLimits {
 public:
  static const constexpr int kMaxTimeoutSeconds = 599;
  static const constexpr int kMinMemoryMb = 64;
  static const constexpr int kMaxMemoryMb = 16383;
  static const constexpr double kMaxCpuQuota = 16.0;
  static const constexpr int kMaxDiskMb = 16383;
  static const constexpr int kMaxProcesses = 100;

  class Builder;

  // Default limits: 30s, 512MB, 1 CPU, 100MB of disk, 1 process, no network.
  ResourceLimits() = default;

  static ResourceLimits Development();
  static ResourceLimits Production();
  static ResourceLimits Testing();
  static ResourceLimits DataProcessing();

  // Looks up a preset by its lowercase name (development, production,
  // testing, data_processing). Throws resource_limit_error if unknown.
  static ResourceLimits Preset(const std::string& name);

  int TimeoutSeconds() const { return timeout_seconds_; }
  int MemoryLimitMb() const { return memory_limit_mb_; }
  double CpuQuota() const { return cpu_quota_; }
  int DiskQuotaMb() const { return disk_quota_mb_; }
  int MaxProcesses() const { return max_processes_; }
  NetworkMode Network() const { return network_mode_; }
  const std::set<std::string>& AllowedDomains() const {
    return allowed_domains_;
  }

  nlohmann::json ToJson() const;
  // Missing keys take the default values. Throws resource_limit_error on
  // wrongly typed or out of range values.
  static ResourceLimits FromJson(const nlohmann::json& json);

  // True if every bound of this is at most as permissive as the one of other.
  bool IsWithin(const ResourceLimits& other) const;

  std::string DebugString() const;

  bool operator==(const ResourceLimits& other) const;
  bool operator!=(const ResourceLimits& other) const {
    return !(*this == other);
  }

 private:
  void Validate() const;

  int timeout_seconds_ = 30;
  int memory_limit_mb_ = 512;
  double cpu_quota_ = 1.0;
  int disk_quota_mb_ = 100;
  int max_processes_ = 1;
  NetworkMode network_mode_ = NetworkMode::NONE;
  std::set<std::string> allowed_domains_;
};

class ResourceLimits::Builder {
 public:
  Builder() = default;
  // Starts from the values of an existing instance.
  explicit Builder(const ResourceLimits& base) : limits_(base) {}

  Builder& TimeoutSeconds(int value);
  Builder& MemoryLimitMb(int value);
  Builder& CpuQuota(double value);
  Builder& DiskQuotaMb(int value);
  Builder& MaxProcesses(int value);
  Builder& Network(NetworkMode value);
  Builder& AllowedDomains(std::set<std::string> value);

  // Throws resource_limit_error naming the first invalid field.
  ResourceLimits Build() const;

 private:
  ResourceLimits limits_;
};

}  // namespace sandbox

#endif
