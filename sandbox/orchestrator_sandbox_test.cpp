#include "sandbox/orchestrator_sandbox.hpp"
#include "absl/strings/str_split.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::_;
using ::testing::DoAll;
using ::testing::HasSubstr;
using ::testing::MatchesRegex;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::StartsWith;
using ::testing::Throw;
using sandbox::ExecutionResult;
using sandbox::NetworkMode;
using sandbox::OrchestratorSandbox;
using sandbox::ResourceLimits;

class MockOrchestrator : public backend::Orchestrator {
 public:
  MOCK_METHOD1(ReadNamespace, void(const std::string&));
  MOCK_METHOD2(CreateJob, void(const std::string&, const nlohmann::json&));
  MOCK_METHOD2(ReadJobStatus,
               backend::JobStatus(const std::string&, const std::string&));
  MOCK_METHOD2(ListPodNames, std::vector<std::string>(const std::string&,
                                                      const std::string&));
  MOCK_METHOD2(ReadPodLog,
               std::string(const std::string&, const std::string&));
  MOCK_METHOD2(DeleteJob, void(const std::string&, const std::string&));
};

backend::JobStatus Active() {
  backend::JobStatus status;
  status.active = 1;
  return status;
}

backend::JobStatus Succeeded() {
  backend::JobStatus status;
  status.succeeded = 1;
  return status;
}

backend::JobStatus Failed(const std::string& reason) {
  backend::JobStatus status;
  status.failed = 1;
  status.failure_reason = reason;
  return status;
}

class OrchestratorSandboxTest : public ::testing::Test {
 protected:
  OrchestratorSandboxTest()
      : orchestrator_(std::make_shared<NiceMock<MockOrchestrator>>()) {
    settings_.ns = "sandbox";
    settings_.poll_interval = std::chrono::milliseconds(10);
    ON_CALL(*orchestrator_, ListPodNames(_, _))
        .WillByDefault(Return(std::vector<std::string>({"pod-1"})));
  }

  std::unique_ptr<OrchestratorSandbox> MakeSandbox(
      ResourceLimits limits = ResourceLimits()) {
    return std::unique_ptr<OrchestratorSandbox>(
        new OrchestratorSandbox(limits, orchestrator_, settings_, nullptr));
  }

  std::shared_ptr<NiceMock<MockOrchestrator>> orchestrator_;
  sandbox::JobSettings settings_;
};

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, MissingNamespace) {
  EXPECT_CALL(*orchestrator_, ReadNamespace("sandbox"))
      .WillOnce(Throw(backend::not_found("namespaces \"sandbox\" not found")));
  try {
    MakeSandbox();
    FAIL() << "construction should fail";
  } catch (const sandbox::sandbox_error& e) {
    EXPECT_STREQ(e.what(), "Namespace 'sandbox' does not exist");
  }
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, ClusterUnreachable) {
  EXPECT_CALL(*orchestrator_, ReadNamespace(_))
      .WillOnce(Throw(backend::api_error(0, "connection refused")));
  try {
    MakeSandbox();
    FAIL() << "construction should fail";
  } catch (const sandbox::sandbox_error& e) {
    EXPECT_THAT(e.what(), StartsWith("Kubernetes not available"));
  }
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, HelloWorld) {
  auto box = MakeSandbox();
  nlohmann::json manifest;
  EXPECT_CALL(*orchestrator_, CreateJob("sandbox", _))
      .WillOnce(SaveArg<1>(&manifest));
  EXPECT_CALL(*orchestrator_, ReadJobStatus("sandbox", _))
      .WillOnce(Return(Active()))
      .WillOnce(Return(Succeeded()));
  EXPECT_CALL(*orchestrator_, ReadPodLog("sandbox", "pod-1"))
      .WillOnce(Return("Hello, World!\n"));
  EXPECT_CALL(*orchestrator_, DeleteJob("sandbox", _));
  ExecutionResult result = box->Execute("print('Hello, World!')");
  EXPECT_TRUE(result.Succeeded());
  EXPECT_EQ(result.Stdout(), "Hello, World!\n");
  EXPECT_EQ(result.Stderr(), "");
  EXPECT_FALSE(result.MemoryUsedMb());
  EXPECT_GT(result.ExecutionTime(), 0);
  std::string name = manifest["metadata"]["name"];
  EXPECT_THAT(name, StartsWith("code-exec-"));
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, PodSelectorUsesJobName) {
  auto box = MakeSandbox();
  nlohmann::json manifest;
  std::string selector;
  std::string deleted;
  EXPECT_CALL(*orchestrator_, CreateJob(_, _)).WillOnce(SaveArg<1>(&manifest));
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillOnce(Return(Succeeded()));
  EXPECT_CALL(*orchestrator_, ListPodNames(_, _))
      .WillOnce(DoAll(SaveArg<1>(&selector),
                      Return(std::vector<std::string>({"pod-1"}))));
  EXPECT_CALL(*orchestrator_, DeleteJob(_, _)).WillOnce(SaveArg<1>(&deleted));
  box->Execute("print(1)");
  std::string name = manifest["metadata"]["name"];
  EXPECT_EQ(selector, "job-name=" + name);
  EXPECT_EQ(deleted, name);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, FailedJob) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillOnce(Return(Failed("BackoffLimitExceeded")));
  EXPECT_CALL(*orchestrator_, ReadPodLog(_, _))
      .WillOnce(Return("ValueError: Test error\n"));
  EXPECT_CALL(*orchestrator_, DeleteJob(_, _));
  ExecutionResult result = box->Execute("raise ValueError('Test error')");
  EXPECT_FALSE(result.Succeeded());
  EXPECT_FALSE(result.TimedOut());
  EXPECT_EQ(result.ExitCode(), 1);
  EXPECT_EQ(result.Stdout(), "");
  EXPECT_THAT(result.Stderr(), HasSubstr("ValueError"));
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, ClientSideTimeout) {
  auto box = MakeSandbox(ResourceLimits::Builder().TimeoutSeconds(1).Build());
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillRepeatedly(Return(Active()));
  EXPECT_CALL(*orchestrator_, ListPodNames(_, _)).Times(0);
  EXPECT_CALL(*orchestrator_, ReadPodLog(_, _)).Times(0);
  EXPECT_CALL(*orchestrator_, DeleteJob(_, _));
  ExecutionResult result = box->Execute("import time; time.sleep(10)");
  EXPECT_TRUE(result.TimedOut());
  EXPECT_EQ(result.ExitCode(), 124);
  EXPECT_GE(result.ExecutionTime(), 1.0);
  EXPECT_LT(result.ExecutionTime(), 2.0);
  EXPECT_EQ(result.Stderr(), "Execution timed out after 1s");
  EXPECT_EQ(*result.ErrorMessage(), "Timeout after 1s");
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, DeadlineExceeded) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillOnce(Return(Failed("DeadlineExceeded")));
  EXPECT_CALL(*orchestrator_, ReadPodLog(_, _)).Times(0);
  EXPECT_CALL(*orchestrator_, DeleteJob(_, _));
  EXPECT_TRUE(box->Execute("while True: pass").TimedOut());
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, JobVanished) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillOnce(Return(Active()))
      .WillOnce(Throw(backend::not_found("jobs.batch not found")));
  ExecutionResult result = box->Execute("print(1)");
  EXPECT_FALSE(result.Succeeded());
  EXPECT_EQ(result.ExitCode(), 1);
  EXPECT_THAT(*result.ErrorMessage(), HasSubstr("disappeared"));
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, StatusFailureCleansUp) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillOnce(Throw(backend::api_error(403, "forbidden")));
  EXPECT_CALL(*orchestrator_, DeleteJob(_, _));
  EXPECT_THROW(box->Execute("print(1)"), sandbox::sandbox_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, UnexpectedStatusErrorCleansUp) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillOnce(Throw(std::runtime_error("type_error: active is a string")));
  EXPECT_CALL(*orchestrator_, DeleteJob("sandbox", StartsWith("code-exec-")));
  try {
    box->Execute("print(1)");
    FAIL() << "Execute should fail";
  } catch (const sandbox::sandbox_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("type_error"));
  }
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, UnexpectedLogErrorCleansUp) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillOnce(Return(Succeeded()));
  EXPECT_CALL(*orchestrator_, ListPodNames(_, _))
      .WillOnce(Throw(std::runtime_error("bad pod list")));
  EXPECT_CALL(*orchestrator_, DeleteJob(_, _));
  ExecutionResult result = box->Execute("print(1)");
  EXPECT_TRUE(result.Succeeded());
  EXPECT_EQ(result.Stderr(), "Error retrieving logs: bad pod list");
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, FreshJobPerExecution) {
  auto box = MakeSandbox();
  std::vector<std::string> created;
  std::vector<std::string> deleted;
  EXPECT_CALL(*orchestrator_, CreateJob(_, _))
      .Times(2)
      .WillRepeatedly(::testing::Invoke(
          [&created](const std::string&, const nlohmann::json& manifest) {
            created.push_back(manifest["metadata"]["name"].get<std::string>());
          }));
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillRepeatedly(Return(Succeeded()));
  EXPECT_CALL(*orchestrator_, DeleteJob(_, _))
      .Times(2)
      .WillRepeatedly(::testing::Invoke(
          [&deleted](const std::string&, const std::string& name) {
            deleted.push_back(name);
          }));
  box->Execute("print(1)");
  box->Execute("print(1)");
  ASSERT_EQ(created.size(), 2u);
  EXPECT_NE(created[0], created[1]);
  EXPECT_EQ(deleted, created);
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, CreateFailure) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, CreateJob(_, _))
      .WillOnce(Throw(backend::api_error(422, "invalid manifest")));
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _)).Times(0);
  try {
    box->Execute("print(1)");
    FAIL() << "Execute should fail";
  } catch (const sandbox::sandbox_error& e) {
    EXPECT_THAT(e.what(), StartsWith("Failed to create Kubernetes job"));
  }
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, NoPodFound) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillOnce(Return(Succeeded()));
  EXPECT_CALL(*orchestrator_, ListPodNames(_, _))
      .WillOnce(Return(std::vector<std::string>()));
  ExecutionResult result = box->Execute("print(1)");
  EXPECT_EQ(result.Stdout(), "");
  EXPECT_EQ(result.Stderr(), "Error: No pod found for job");
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, LogFailure) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillOnce(Return(Succeeded()));
  EXPECT_CALL(*orchestrator_, ReadPodLog(_, _))
      .WillOnce(Throw(backend::api_error(500, "container not ready")));
  ExecutionResult result = box->Execute("print(1)");
  EXPECT_TRUE(result.Succeeded());
  EXPECT_THAT(result.Stderr(), StartsWith("Error retrieving logs: "));
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, DeleteFailureIsSwallowed) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, ReadJobStatus(_, _))
      .WillOnce(Return(Succeeded()));
  EXPECT_CALL(*orchestrator_, ReadPodLog(_, _)).WillOnce(Return("1\n"));
  EXPECT_CALL(*orchestrator_, DeleteJob(_, _))
      .WillOnce(Throw(backend::api_error(500, "etcd timeout")));
  EXPECT_EQ(box->Execute("print(1)").Stdout(), "1\n");
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, EmptyCodeSkipsCluster) {
  auto box = MakeSandbox();
  EXPECT_CALL(*orchestrator_, CreateJob(_, _)).Times(0);
  ExecutionResult result = box->Execute("");
  EXPECT_EQ(result.ExitCode(), 1);
  EXPECT_EQ(*result.ErrorMessage(), "Empty code provided");
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, Manifest) {
  ResourceLimits limits = ResourceLimits::Builder()
                              .TimeoutSeconds(45)
                              .MemoryLimitMb(768)
                              .CpuQuota(1.5)
                              .DiskQuotaMb(256)
                              .Build();
  auto box = MakeSandbox(limits);
  nlohmann::json job = box->BuildJobManifest("code-exec-1", "print(1)");
  EXPECT_EQ(job["apiVersion"], "batch/v1");
  EXPECT_EQ(job["kind"], "Job");
  EXPECT_EQ(job["metadata"]["name"], "code-exec-1");
  EXPECT_EQ(job["metadata"]["labels"]["app"], "code-execution");
  EXPECT_EQ(job["spec"]["backoffLimit"], 0);
  EXPECT_EQ(job["spec"]["ttlSecondsAfterFinished"], 300);
  EXPECT_EQ(job["spec"]["activeDeadlineSeconds"], 45);
  EXPECT_EQ(job["spec"]["template"]["metadata"]["labels"]["codebox.network"],
            "none");

  const nlohmann::json& pod = job["spec"]["template"]["spec"];
  EXPECT_EQ(pod["restartPolicy"], "Never");
  EXPECT_EQ(pod["automountServiceAccountToken"], false);
  EXPECT_EQ(pod["securityContext"]["runAsUser"], 1000);
  ASSERT_EQ(pod["containers"].size(), 1u);
  const nlohmann::json& container = pod["containers"][0];
  EXPECT_EQ(container["image"], "python:3.12-slim");
  EXPECT_EQ(container["command"],
            nlohmann::json::array({"python", "-c", "print(1)"}));
  EXPECT_EQ(container["resources"]["limits"]["cpu"], "1500m");
  EXPECT_EQ(container["resources"]["limits"]["memory"], "768Mi");
  EXPECT_EQ(container["resources"]["requests"],
            container["resources"]["limits"]);
  const nlohmann::json& security = container["securityContext"];
  EXPECT_EQ(security["allowPrivilegeEscalation"], false);
  EXPECT_EQ(security["readOnlyRootFilesystem"], true);
  EXPECT_EQ(security["capabilities"]["drop"], nlohmann::json::array({"ALL"}));
  ASSERT_EQ(pod["volumes"].size(), 2u);
  EXPECT_EQ(pod["volumes"][0]["emptyDir"]["medium"], "Memory");
  EXPECT_EQ(pod["volumes"][0]["emptyDir"]["sizeLimit"], "256Mi");
  EXPECT_EQ(container["volumeMounts"][1]["mountPath"], "/var/tmp");
}

// NOLINTNEXTLINE
TEST_F(OrchestratorSandboxTest, NetworkLabel) {
  auto box = MakeSandbox(ResourceLimits::Development());
  nlohmann::json job = box->BuildJobManifest("j", "x");
  EXPECT_EQ(job["spec"]["template"]["metadata"]["labels"]["codebox.network"],
            "unrestricted");
  ResourceLimits allowlist = ResourceLimits::Builder()
                                 .Network(NetworkMode::ALLOWLIST)
                                 .AllowedDomains({"pypi.org"})
                                 .Build();
  job = MakeSandbox(allowlist)->BuildJobManifest("j", "x");
  EXPECT_EQ(job["spec"]["template"]["metadata"]["labels"]["codebox.network"],
            "none");
}

// NOLINTNEXTLINE
TEST(JobNameTest, Format) {
  std::string a = OrchestratorSandbox::JobName("print(1)");
  std::string b = OrchestratorSandbox::JobName("print(1)");
  EXPECT_THAT(a, MatchesRegex("code-exec-[0-9]+-[0-9a-f]{8}-[0-9a-f]{8}"));
  EXPECT_LE(a.size(), 63u);
  std::vector<std::string> a_parts = absl::StrSplit(a, '-');
  std::vector<std::string> b_parts = absl::StrSplit(b, '-');
  ASSERT_EQ(a_parts.size(), 5u);
  ASSERT_EQ(b_parts.size(), 5u);
  EXPECT_EQ(a_parts[3], b_parts[3]);
  std::vector<std::string> other_parts =
      absl::StrSplit(OrchestratorSandbox::JobName("print(2)"), '-');
  ASSERT_EQ(other_parts.size(), 5u);
  EXPECT_NE(a_parts[3], other_parts[3]);
}

}  // namespace
