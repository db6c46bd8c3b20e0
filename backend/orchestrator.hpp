#ifndef BACKEND_ORCHESTRATOR_HPP
#define BACKEND_ORCHESTRATOR_HPP

#include <string>
#include <vector>

#include "backend/api_error.hpp"
#include "nlohmann/json.hpp"

namespace backend {

struct JobStatus {
  int active = 0;
  int succeeded = 0;
  int failed = 0;
  // Reason of the Failed condition, e.g. DeadlineExceeded.
  std::string failure_reason;
};

// Minimal view of a cluster orchestrator running batch jobs. All methods
// throw api_error (or not_found) on failure.
class Orchestrator {
 public:
  // Throws not_found if the namespace does not exist.
  virtual void ReadNamespace(const std::string& ns) = 0;

  // Submits a Job manifest.
  virtual void CreateJob(const std::string& ns,
                         const nlohmann::json& manifest) = 0;
  virtual JobStatus ReadJobStatus(const std::string& ns,
                                  const std::string& name) = 0;
  virtual std::vector<std::string> ListPodNames(
      const std::string& ns, const std::string& selector) = 0;
  virtual std::string ReadPodLog(const std::string& ns,
                                 const std::string& pod) = 0;

  // Deletes the job and, in background, its pods.
  virtual void DeleteJob(const std::string& ns, const std::string& name) = 0;

  Orchestrator() = default;
  virtual ~Orchestrator() = default;
  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;
  Orchestrator(Orchestrator&&) = delete;
  Orchestrator& operator=(Orchestrator&&) = delete;
};

}  // namespace backend

#endif
