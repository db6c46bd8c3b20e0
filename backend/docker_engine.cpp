#include "backend/docker_engine.hpp"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"

namespace {

using backend::api_error;

static const constexpr char* kApiVersion = "/v1.41";
static const constexpr auto kPullTimeout = std::chrono::minutes(15);
static const constexpr size_t kFrameHeaderSize = 8;

// Extracts the "message" field Docker puts in error bodies.
std::string ErrorMessage(const util::HttpResponse& response) {
  nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_object() && body.count("message") &&
      body["message"].is_string()) {
    return body["message"].get<std::string>();
  }
  return response.body;
}

// Throws not_found for 404 and api_error for any other non 2xx/304 status.
void CheckStatus(const util::HttpResponse& response, const std::string& what) {
  if (response.status / 100 == 2 || response.status == 304) return;
  std::string msg = absl::StrCat(what, ": ", ErrorMessage(response));
  if (response.status == 404) throw backend::not_found(msg);
  throw api_error(response.status, msg);
}

nlohmann::json ParseBody(const util::HttpResponse& response,
                         const std::string& what) {
  nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);
  if (body.is_discarded()) {
    throw api_error(response.status, what + ": invalid JSON in response");
  }
  return body;
}

}  // namespace

namespace backend {

DockerEngine::DockerEngine(const std::string& endpoint,
                           std::chrono::milliseconds request_timeout)
    : client_(endpoint), request_timeout_(request_timeout) {}

util::HttpResponse DockerEngine::Call(const std::string& method,
                                      const std::string& path,
                                      const std::string& body,
                                      std::chrono::milliseconds timeout) {
  std::string full_path = absl::StrCat(kApiVersion, path);
  try {
    return client_.Request(method, full_path, body, timeout);
  } catch (const util::http_error& e) {
    throw api_error(0, absl::StrCat(method, " ", client_.Endpoint(), full_path,
                                    ": ", e.what()));
  }
}

void DockerEngine::Ping() {
  CheckStatus(Call("GET", "/_ping", "", request_timeout_), "ping");
}

bool DockerEngine::HasImage(const std::string& image) {
  util::HttpResponse response =
      Call("GET", "/images/" + image + "/json", "", request_timeout_);
  if (response.status == 404) return false;
  CheckStatus(response, "inspect image " + image);
  return true;
}

void DockerEngine::PullImage(const std::string& image) {
  std::string name = image;
  std::string tag = "latest";
  size_t colon = image.rfind(':');
  size_t slash = image.rfind('/');
  if (colon != std::string::npos &&
      (slash == std::string::npos || colon > slash)) {
    name = image.substr(0, colon);
    tag = image.substr(colon + 1);
  }
  LOG(INFO) << "Pulling image " << name << ":" << tag;
  util::HttpResponse response = Call(
      "POST",
      absl::StrCat("/images/create?fromImage=", util::UrlEncode(name),
                   "&tag=", util::UrlEncode(tag)),
      "", kPullTimeout);
  CheckStatus(response, "pull " + image);
  // Failures after the stream started are reported as progress messages.
  for (absl::string_view line : absl::StrSplit(response.body, '\n')) {
    nlohmann::json progress =
        nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (progress.is_object() && progress.count("error")) {
      const nlohmann::json& error = progress["error"];
      throw api_error(response.status,
                      absl::StrCat("pull ", image, ": ",
                                   error.is_string() ? error.get<std::string>()
                                                     : error.dump()));
    }
  }
}

std::string DockerEngine::Create(const ContainerSpec& spec) {
  util::HttpResponse response = Call("POST", "/containers/create",
                                     CreateRequest(spec).dump(),
                                     request_timeout_);
  CheckStatus(response, "create container from " + spec.image);
  nlohmann::json body = ParseBody(response, "create container");
  if (!body.count("Id") || !body["Id"].is_string()) {
    throw api_error(response.status, "create container: no Id in response");
  }
  std::string id = body["Id"];
  VLOG(1) << "Created container " << id;
  return id;
}

void DockerEngine::Start(const std::string& id) {
  CheckStatus(Call("POST", "/containers/" + id + "/start", "",
                   request_timeout_),
              "start " + id);
}

absl::optional<int> DockerEngine::Wait(const std::string& id,
                                       std::chrono::milliseconds timeout) {
  std::string path =
      absl::StrCat(kApiVersion, "/containers/", id, "/wait");
  path += "?condition=not-running";
  util::HttpResponse response;
  try {
    response = client_.Post(path, "", timeout);
  } catch (const util::http_timeout& e) {
    VLOG(1) << "Container " << id << " still running: " << e.what();
    return absl::nullopt;
  } catch (const util::http_error& e) {
    throw api_error(0, "wait " + id + ": " + e.what());
  }
  CheckStatus(response, "wait " + id);
  nlohmann::json body = ParseBody(response, "wait " + id);
  if (body.count("Error") && body["Error"].is_object() &&
      body["Error"].count("Message")) {
    LOG(WARNING) << "Waiting for " << id << ": " << body["Error"]["Message"];
  }
  if (!body.count("StatusCode") || !body["StatusCode"].is_number_integer()) {
    throw api_error(response.status, "wait " + id + ": no StatusCode");
  }
  return body["StatusCode"].get<int>();
}

void DockerEngine::Stop(const std::string& id, std::chrono::seconds grace) {
  CheckStatus(Call("POST",
                   absl::StrCat("/containers/", id, "/stop?t=", grace.count()),
                   "", request_timeout_ + grace),
              "stop " + id);
}

void DockerEngine::Kill(const std::string& id) {
  CheckStatus(Call("POST", "/containers/" + id + "/kill", "",
                   request_timeout_),
              "kill " + id);
}

std::string DockerEngine::Logs(const std::string& id) {
  util::HttpResponse response =
      Call("GET", "/containers/" + id + "/logs?stdout=1&stderr=1", "",
           request_timeout_);
  CheckStatus(response, "logs " + id);
  return DemultiplexLogs(response.body);
}

absl::optional<int64_t> DockerEngine::MaxMemoryUsageBytes(
    const std::string& id) {
  util::HttpResponse response =
      Call("GET", "/containers/" + id + "/stats?stream=false", "",
           request_timeout_);
  CheckStatus(response, "stats " + id);
  nlohmann::json body = ParseBody(response, "stats " + id);
  if (!body.count("memory_stats") || !body["memory_stats"].is_object()) {
    return absl::nullopt;
  }
  const nlohmann::json& memory = body["memory_stats"];
  // cgroup v2 hosts only report the current usage.
  for (const char* key : {"max_usage", "usage"}) {
    if (memory.count(key) && memory[key].is_number() &&
        memory[key].get<int64_t>() > 0) {
      return memory[key].get<int64_t>();
    }
  }
  return absl::nullopt;
}

ContainerState DockerEngine::Inspect(const std::string& id) {
  util::HttpResponse response =
      Call("GET", "/containers/" + id + "/json", "", request_timeout_);
  CheckStatus(response, "inspect " + id);
  nlohmann::json body = ParseBody(response, "inspect " + id);
  ContainerState state;
  if (body.count("State") && body["State"].is_object()) {
    const nlohmann::json& s = body["State"];
    state.running = s.value("Running", false);
    state.status = s.value("Status", "");
    state.exit_code = s.value("ExitCode", 0);
  }
  return state;
}

void DockerEngine::Remove(const std::string& id, bool force) {
  CheckStatus(Call("DELETE",
                   absl::StrCat("/containers/", id, "?force=", force ? 1 : 0),
                   "", request_timeout_),
              "remove " + id);
}

std::vector<ContainerSummary> DockerEngine::List(const std::string& label) {
  nlohmann::json filters;
  filters["label"] = nlohmann::json::array({label});
  util::HttpResponse response =
      Call("GET", "/containers/json?all=1&filters=" +
                      util::UrlEncode(filters.dump()),
           "", request_timeout_);
  CheckStatus(response, "list containers");
  nlohmann::json body = ParseBody(response, "list containers");
  std::vector<ContainerSummary> containers;
  if (!body.is_array()) return containers;
  for (const nlohmann::json& c : body) {
    ContainerSummary summary;
    summary.id = c.value("Id", "");
    summary.created = c.value("Created", static_cast<int64_t>(0));
    summary.state = c.value("State", "");
    if (!summary.id.empty()) containers.push_back(summary);
  }
  return containers;
}

nlohmann::json CreateRequest(const ContainerSpec& spec) {
  nlohmann::json host_config = {
      {"Memory", spec.memory_bytes},
      {"MemorySwap", spec.memory_swap_bytes},
      {"NanoCpus", spec.nano_cpus},
      {"PidsLimit", spec.pids_limit},
      {"NetworkMode", spec.network_mode},
      {"ReadonlyRootfs", spec.readonly_rootfs},
      {"CapDrop", spec.cap_drop},
      {"SecurityOpt", spec.security_opt},
      {"Tmpfs", spec.tmpfs},
  };
  return {
      {"Image", spec.image},
      {"Cmd", spec.command},
      {"Labels", spec.labels},
      {"NetworkDisabled", spec.network_mode == "none"},
      {"AttachStdout", false},
      {"AttachStderr", false},
      {"Tty", false},
      {"HostConfig", host_config},
  };
}

std::string DemultiplexLogs(const std::string& raw) {
  std::string merged;
  size_t pos = 0;
  while (pos < raw.size()) {
    if (raw.size() - pos < kFrameHeaderSize) return raw;
    unsigned char stream = raw[pos];
    if (stream > 2 || raw[pos + 1] || raw[pos + 2] || raw[pos + 3]) return raw;
    uint32_t size = 0;
    for (size_t i = 4; i < kFrameHeaderSize; i++) {
      size = (size << 8) | static_cast<unsigned char>(raw[pos + i]);
    }
    pos += kFrameHeaderSize;
    size_t available = std::min<size_t>(size, raw.size() - pos);
    merged.append(raw, pos, available);
    pos += available;
  }
  return merged;
}

}  // namespace backend
