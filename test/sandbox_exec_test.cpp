#include <unistd.h>
#include <gtest/gtest.h>
#include <codebox/paths.h>

#include "sandbox_exec.h"

// sandbox-exec missing: the helper exits before it reads its options
class SandboxSpawnTest : public ::testing::Test {
 protected:
  fs::path saved_data_dir_, empty_dir_;
  void SetUp() override {
    saved_data_dir_ = internal::kDataDir;
    empty_dir_ = kBoxRoot / ("no-helper-" + std::to_string(getpid()));
    fs::create_directories(empty_dir_);
    internal::kDataDir = empty_dir_;
  }
  void TearDown() override {
    internal::kDataDir = saved_data_dir_;
    std::error_code ec;
    fs::remove_all(empty_dir_, ec);
  }
};

TEST_F(SandboxSpawnTest, MissingHelperFailsWithoutSignal) {
  SandboxOptions opt;
  opt.boxdir = empty_dir_;
  // larger than a pipe buffer, so the write is still pending when the helper exits
  opt.command = {"/bin/true", std::string(1 << 18, 'x')};
  SandboxProcess proc;
  EXPECT_FALSE(SandboxSpawn(opt, proc));
  EXPECT_EQ(proc.pid, -1);
  EXPECT_EQ(proc.result_fd, -1);
  EXPECT_EQ(proc.stdout_fd, -1);
}
