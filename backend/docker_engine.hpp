#ifndef BACKEND_DOCKER_ENGINE_HPP
#define BACKEND_DOCKER_ENGINE_HPP

#include <chrono>
#include <string>

#include "backend/container_engine.hpp"
#include "nlohmann/json.hpp"
#include "util/http_client.hpp"

namespace backend {

// ContainerEngine speaking the Docker Engine HTTP API.
class DockerEngine : public ContainerEngine {
 public:
  // endpoint as accepted by util::HttpClient. request_timeout bounds every
  // request except Wait and PullImage.
  DockerEngine(const std::string& endpoint,
               std::chrono::milliseconds request_timeout);

  void Ping() override;
  bool HasImage(const std::string& image) override;
  void PullImage(const std::string& image) override;
  std::string Create(const ContainerSpec& spec) override;
  void Start(const std::string& id) override;
  absl::optional<int> Wait(const std::string& id,
                           std::chrono::milliseconds timeout) override;
  void Stop(const std::string& id, std::chrono::seconds grace) override;
  void Kill(const std::string& id) override;
  std::string Logs(const std::string& id) override;
  absl::optional<int64_t> MaxMemoryUsageBytes(const std::string& id) override;
  ContainerState Inspect(const std::string& id) override;
  void Remove(const std::string& id, bool force) override;
  std::vector<ContainerSummary> List(const std::string& label) override;

 private:
  util::HttpResponse Call(const std::string& method, const std::string& path,
                          const std::string& body,
                          std::chrono::milliseconds timeout);

  util::HttpClient client_;
  std::chrono::milliseconds request_timeout_;
};

// Body of a POST /containers/create request.
nlohmann::json CreateRequest(const ContainerSpec& spec);

// Merges the multiplexed stdout/stderr frames of a log stream into a single
// text, in arrival order. Streams that are not multiplexed are returned as
// they are.
std::string DemultiplexLogs(const std::string& raw);

}  // namespace backend

#endif
