#include "util/file.hpp"
#include <sys/stat.h>
#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/codebox_testdir";

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

// NOLINTNEXTLINE
TEST(File, WriteThenRead) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "a/b/c.txt");
  util::File::Write(path, "hello\n");
  EXPECT_EQ(readFile(path), "hello\n");
  EXPECT_EQ(util::File::Read(path), "hello\n");
}

// NOLINTNEXTLINE
TEST(File, WriteReplaces) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "f");
  util::File::Write(path, "first contents");
  util::File::Write(path, "2nd");
  EXPECT_EQ(util::File::Read(path), "2nd");
}

// NOLINTNEXTLINE
TEST(File, ReadMissing) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THROW(util::File::Read(tmp.Path() + "/missing"),  // NOLINT
               util::file_not_found);
}

// NOLINTNEXTLINE
TEST(File, ReadLargeFile) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "big");
  std::string contents(3 * util::kChunkSize + 17, 'x');
  util::File::Write(path, contents);
  EXPECT_EQ(util::File::Read(path), contents);
}

// NOLINTNEXTLINE
TEST(File, MakeExecutable) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "script");
  util::File::Write(path, "#!/bin/sh\n");
  util::File::MakeExecutable(path);
  struct stat st {};
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_TRUE(st.st_mode & S_IXUSR);
}

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("/a", "b"), "/a/b");
  EXPECT_EQ(util::File::JoinPath("/a", "/b"), "/b");
}

// NOLINTNEXTLINE
TEST(File, BaseDir) {
  EXPECT_EQ(util::File::BaseDir("/a/b"), "/a");
  EXPECT_EQ(util::File::BaseDir("/a"), "/");
  EXPECT_EQ(util::File::BaseDir("a"), ".");
}

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    EXPECT_THAT(path, StartsWith(test_tmpdir + "/"));
    util::File::Write(path + "/file", "data");
    EXPECT_TRUE(util::File::Exists(path));
  }
  EXPECT_FALSE(util::File::Exists(path));
}

}  // namespace
