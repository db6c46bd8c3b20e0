#include <chrono>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "gflags/gflags.h"
#include "glog/logging.h"
#include "nlohmann/json.hpp"
#include "sandbox/container_sandbox.hpp"
#include "sandbox/sandbox_builder.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(preset, "production",
              "resource limits preset: development, production, testing or "
              "data_processing");
DEFINE_string(limits_json, "",
              "resource limits as JSON, overrides --preset");
DEFINE_string(code_file, "", "file with the code to run, stdin if empty");
DEFINE_int32(sweep_stale_seconds, 0,
             "remove managed containers older than this before running "
             "(Docker only, 0 to disable)");

namespace {

sandbox::ResourceLimits Limits() {
  if (FLAGS_limits_json.empty()) {
    return sandbox::ResourceLimits::Preset(FLAGS_preset);
  }
  nlohmann::json json = nlohmann::json::parse(FLAGS_limits_json, nullptr,
                                              false);
  if (json.is_discarded()) {
    throw std::invalid_argument("--limits_json is not valid JSON");
  }
  return sandbox::ResourceLimits::FromJson(json);
}

std::string Code() {
  if (!FLAGS_code_file.empty()) return util::File::Read(FLAGS_code_file);
  return std::string(std::istreambuf_iterator<char>(std::cin),
                     std::istreambuf_iterator<char>());
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Runs untrusted code in an isolated sandbox");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  sandbox::ResourceLimits limits;
  sandbox::SandboxOptions options;
  try {
    limits = Limits();
    options = sandbox::SandboxOptions::FromFlags();
  } catch (const std::invalid_argument& e) {
    LOG(ERROR) << e.what();
    return 2;
  }

  std::unique_ptr<sandbox::Sandbox> box;
  try {
    box = sandbox::SandboxBuilder::Create(limits, options);
  } catch (const sandbox::sandbox_error& e) {
    LOG(ERROR) << e.what();
    return 1;
  }

  if (FLAGS_sweep_stale_seconds > 0) {
    auto* containers = dynamic_cast<sandbox::ContainerSandbox*>(box.get());
    try {
      if (containers != nullptr) {
        containers->RemoveStale(
            std::chrono::seconds(FLAGS_sweep_stale_seconds));
      }
    } catch (const sandbox::sandbox_error& e) {
      LOG(WARNING) << e.what();
    }
  }

  std::string code;
  try {
    code = Code();
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Cannot read " << FLAGS_code_file << ": " << e.what();
    return 2;
  }

  try {
    sandbox::ExecutionResult result = box->Execute(code);
    std::cout << result.ToJson().dump(2) << std::endl;
    return result.Succeeded() ? 0 : 1;
  } catch (const sandbox::sandbox_error& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}
