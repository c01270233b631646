#include "runner/bounded_runner.hpp"
#include <dirent.h>
#include <signal.h>
#include <sys/stat.h>
#include <fstream>
#include <memory>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/kata_runner_testdir";

// Runs the source with the shell, as the real wrapper does with python.
const char* kWrapper = "#!/bin/sh\nexec /bin/sh \"$1\"\n";

// A zombie does not count as alive.
bool isAlive(int pid) {
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  if (!stat) return false;
  std::string content((std::istreambuf_iterator<char>(stat)),
                      std::istreambuf_iterator<char>());
  size_t paren = content.rfind(')');
  return paren == std::string::npos || paren + 2 >= content.size() ||
         content[paren + 2] != 'Z';
}

bool waitDead(int pid) {
  for (int i = 0; i < 300 && isAlive(pid); i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return !isAlive(pid);
}

size_t countEntries(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (!dir) return 0;
  size_t count = 0;
  while (dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") count++;
  }
  closedir(dir);
  return count;
}

std::string imageOf(const runner::ExecutionResult& result) {
  KJ_IF_MAYBE(image, result.image) { return *image; }
  ADD_FAILURE() << "No image in the result";
  return "";
}

class BoundedRunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::make_unique<util::TempDir>(test_tmpdir + "/bounded");
    config_.temp_directory = dir_->Path() + "/tmp";
    util::File::MakeDirs(config_.temp_directory);
    config_.interpreter = "/bin/sh";
    config_.wrapper = dir_->Path() + "/wrapper.sh";
    util::File::WriteAll(config_.wrapper, std::string(kWrapper));
    config_.timeout_millis = 3000;
    config_.kill_grace_millis = 200;
  }

  runner::ExecutionResult Run(const std::string& source,
                              std::vector<runner::Asset> assets = {}) {
    runner::ExecutionRequest request;
    request.source_code = source;
    request.assets = std::move(assets);
    runner::BoundedRunner bounded(config_);
    return bounded.Execute(request);
  }

  int ReadPid() {
    return std::stoi(util::File::ReadAll(PidFile()));
  }
  std::string PidFile() const { return dir_->Path() + "/pid"; }
  size_t Workspaces() const { return countEntries(config_.temp_directory); }

  std::unique_ptr<util::TempDir> dir_;
  runner::Config config_;
};

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, Image) {
  runner::ExecutionResult result = Run("echo IMAGE:aGVsbG8=");
  EXPECT_EQ(imageOf(result), "aGVsbG8=");
  EXPECT_EQ(result.error, "");
  EXPECT_EQ(Workspaces(), 0);
}

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, Logs) {
  runner::ExecutionResult result =
      Run("echo INFO:loaded; echo plain\necho noise >&2\nexit 3");
  EXPECT_TRUE(result.image == nullptr);
  EXPECT_EQ(result.logs, "loaded\nplain\nnoise");
  EXPECT_EQ(result.error, "");
}

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, ExecError) {
  runner::ExecutionResult result =
      Run("echo INFO:start\necho 'EXEC_ERROR:ImportError: cv2' >&2");
  EXPECT_THAT(result.error,
              HasSubstr("Only `import cv2` and `import numpy as np`"));
  EXPECT_EQ(result.logs, "start");
  EXPECT_TRUE(result.image == nullptr);
  EXPECT_EQ(Workspaces(), 0);
}

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, Timeout) {
  config_.timeout_millis = 1000;
  runner::ExecutionResult result =
      Run("echo $$ > " + PidFile() + "\necho IMAGE:partial\nexec sleep 30");
  EXPECT_EQ(result.error,
            "\xE2\x8F\xB1 Execution timed out after 1 seconds. Check for "
            "infinite loops.");
  EXPECT_EQ(result.logs, "");
  EXPECT_TRUE(result.image == nullptr);
  EXPECT_FALSE(isAlive(ReadPid()));
  EXPECT_EQ(Workspaces(), 0);
}

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, TimeoutKillsBackgroundPrograms) {
  config_.timeout_millis = 500;
  runner::ExecutionResult result =
      Run("trap '' TERM\nsleep 30 &\necho $! > " + PidFile() + "\nwait");
  EXPECT_THAT(result.error, StartsWith("\xE2\x8F\xB1 Execution timed out"));
  EXPECT_TRUE(waitDead(ReadPid()));
}

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, Assets) {
  runner::ExecutionResult result =
      Run("ls; cat evil.txt", {{"../../evil.txt", "payload\n"}, {"", "x"}});
  EXPECT_EQ(result.logs, "evil.txt\nkata.py\npayload");
  EXPECT_FALSE(util::File::Exists(dir_->Path() + "/evil.txt"));
  EXPECT_EQ(Workspaces(), 0);
}

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, RunsInWorkspace) {
  config_.source_name = "main.py";
  runner::ExecutionResult result = Run("pwd; ls");
  EXPECT_THAT(result.logs, StartsWith(config_.temp_directory + "/kata_run_"));
  EXPECT_THAT(result.logs, ::testing::EndsWith("\nmain.py"));
}

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, LaunchFailure) {
  config_.interpreter = "/no/such/interpreter";
  runner::ExecutionResult result = Run("echo IMAGE:x");
  EXPECT_THAT(result.error, StartsWith("Execution failed: exec:"));
  EXPECT_TRUE(result.image == nullptr);
  EXPECT_EQ(Workspaces(), 0);
}

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, WorkspaceFailure) {
  util::File::WriteAll(dir_->Path() + "/file", std::string("not a dir"));
  config_.temp_directory = dir_->Path() + "/file/tmp";
  runner::ExecutionResult result = Run("echo IMAGE:x");
  EXPECT_THAT(result.error, StartsWith("Execution failed: "));
  EXPECT_TRUE(result.image == nullptr);
}

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, InterpreterNotFound) {
  config_.interpreter = "surely-not-an-interpreter";
  runner::ExecutionResult result = Run("echo IMAGE:x");
  EXPECT_THAT(result.error, StartsWith("Execution failed: "));
  EXPECT_THAT(result.error, HasSubstr("surely-not-an-interpreter"));
}

// NOLINTNEXTLINE
TEST_F(BoundedRunnerTest, Concurrent) {
  const int kRuns = 4;
  std::vector<runner::ExecutionResult> results(kRuns);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRuns; i++) {
    threads.emplace_back([this, i, &results]() {
      results[i] = Run("sleep 0.3; echo IMAGE:" + std::to_string(i));
    });
  }
  for (auto& thread : threads) thread.join();
  for (int i = 0; i < kRuns; i++) {
    EXPECT_EQ(imageOf(results[i]), std::to_string(i));
  }
  EXPECT_EQ(Workspaces(), 0);
}

// NOLINTNEXTLINE
TEST(BoundedRunner, TimeoutMessage) {
  EXPECT_EQ(runner::BoundedRunner::TimeoutMessage(10000),
            "\xE2\x8F\xB1 Execution timed out after 10 seconds. Check for "
            "infinite loops.");
  EXPECT_EQ(runner::BoundedRunner::TimeoutMessage(1500),
            "\xE2\x8F\xB1 Execution timed out after 1.5 seconds. Check for "
            "infinite loops.");
}

}  // namespace
