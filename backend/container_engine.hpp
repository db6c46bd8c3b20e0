#ifndef BACKEND_CONTAINER_ENGINE_HPP
#define BACKEND_CONTAINER_ENGINE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "backend/api_error.hpp"

namespace backend {

// Everything needed to create a container.
struct ContainerSpec {
  std::string image;
  std::vector<std::string> command;
  std::map<std::string, std::string> labels;

  int64_t memory_bytes = 0;
  int64_t memory_swap_bytes = 0;  // Equal to memory_bytes disables swap.
  int64_t nano_cpus = 0;
  int64_t pids_limit = 0;

  std::string network_mode = "none";
  bool readonly_rootfs = true;
  std::vector<std::string> cap_drop;
  std::vector<std::string> security_opt;
  // Mount point -> tmpfs options, e.g. "/tmp" -> "size=100m".
  std::map<std::string, std::string> tmpfs;
};

struct ContainerState {
  bool running = false;
  std::string status;
  int exit_code = 0;
};

struct ContainerSummary {
  std::string id;
  int64_t created = 0;  // Unix seconds.
  std::string state;
};

// Minimal view of a container engine. All methods throw api_error (or
// not_found) on failure.
class ContainerEngine {
 public:
  // Checks that the engine answers.
  virtual void Ping() = 0;
  virtual bool HasImage(const std::string& image) = 0;
  virtual void PullImage(const std::string& image) = 0;

  // Creates a container, without starting it, and returns its id.
  virtual std::string Create(const ContainerSpec& spec) = 0;
  virtual void Start(const std::string& id) = 0;

  // Waits for the container to stop. Returns its exit code, or nullopt if it
  // was still running when timeout expired.
  virtual absl::optional<int> Wait(const std::string& id,
                                   std::chrono::milliseconds timeout) = 0;

  // Sends SIGTERM, then SIGKILL after grace.
  virtual void Stop(const std::string& id, std::chrono::seconds grace) = 0;
  virtual void Kill(const std::string& id) = 0;

  // Returns stdout and stderr merged in arrival order.
  virtual std::string Logs(const std::string& id) = 0;

  // Peak memory usage, if the engine reports it.
  virtual absl::optional<int64_t> MaxMemoryUsageBytes(
      const std::string& id) = 0;

  virtual ContainerState Inspect(const std::string& id) = 0;
  virtual void Remove(const std::string& id, bool force) = 0;

  // Lists all containers, running or not, carrying the label key=value.
  virtual std::vector<ContainerSummary> List(const std::string& label) = 0;

  ContainerEngine() = default;
  virtual ~ContainerEngine() = default;
  ContainerEngine(const ContainerEngine&) = delete;
  ContainerEngine& operator=(const ContainerEngine&) = delete;
  ContainerEngine(ContainerEngine&&) = delete;
  ContainerEngine& operator=(ContainerEngine&&) = delete;
};

}  // namespace backend

#endif
