#include "util/subprocess.hpp"
#include <signal.h>
#include <chrono>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

// NOLINTNEXTLINE
TEST(Subprocess, CollectsOutput) {
  util::SubprocessResult result =
      util::Subprocess::Run({"sh", "-c", "echo out; echo err >&2; exit 3"});
  EXPECT_EQ(result.status_code, 3);
  EXPECT_EQ(result.signal, 0);
  EXPECT_FALSE(result.killed);
  EXPECT_EQ(result.output, "out\n");
  EXPECT_EQ(result.error, "err\n");
}

// NOLINTNEXTLINE
TEST(Subprocess, FeedsInput) {
  util::SubprocessResult result = util::Subprocess::Run({"cat"}, "some input");
  EXPECT_EQ(result.status_code, 0);
  EXPECT_EQ(result.output, "some input");
}

// NOLINTNEXTLINE
TEST(Subprocess, LargeInput) {
  std::string input(1 << 20, 'a');
  util::SubprocessResult result = util::Subprocess::Run({"wc", "-c"}, input);
  EXPECT_EQ(result.status_code, 0);
  EXPECT_THAT(result.output, HasSubstr("1048576"));
}

// NOLINTNEXTLINE
TEST(Subprocess, MissingExecutable) {
  EXPECT_THROW(util::Subprocess::Run({"codebox-no-such-command"}),  // NOLINT
               util::subprocess_error);
}

// NOLINTNEXTLINE
TEST(Subprocess, NotExecutable) {
  EXPECT_THROW(util::Subprocess::Run({"/etc/passwd"}),  // NOLINT
               util::subprocess_error);
}

// NOLINTNEXTLINE
TEST(Subprocess, Timeout) {
  auto start = std::chrono::steady_clock::now();
  util::SubprocessResult result = util::Subprocess::Run(
      {"sleep", "10"}, "", std::chrono::milliseconds(200));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(result.killed);
  EXPECT_EQ(result.signal, SIGKILL);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

// NOLINTNEXTLINE
TEST(Subprocess, Signal) {
  util::SubprocessResult result =
      util::Subprocess::Run({"sh", "-c", "kill -TERM $$"});
  EXPECT_EQ(result.signal, SIGTERM);
  EXPECT_FALSE(result.killed);
}

}  // namespace
