#include "runner/cli.hpp"
#include <sstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/kata_runner_testdir";

// NOLINTNEXTLINE
TEST(Cli, LoadRequest) {
  util::TempDir dir(test_tmpdir + "/cli");
  util::File::WriteAll(dir.Path() + "/kata.py", std::string("import cv2\n"));
  util::File::WriteAll(dir.Path() + "/in/photo.png", std::string("png"));
  runner::ExecutionRequest request = runner::LoadRequest(
      dir.Path() + "/kata.py", {dir.Path() + "/in/photo.png"}, true);
  EXPECT_EQ(request.source_code, "import cv2\n");
  EXPECT_TRUE(request.run_foreground);
  ASSERT_EQ(request.assets.size(), 1);
  EXPECT_EQ(request.assets[0].name, dir.Path() + "/in/photo.png");
  EXPECT_EQ(request.assets[0].data, "png");
}

// NOLINTNEXTLINE
TEST(Cli, LoadRequestMissingSource) {
  EXPECT_THROW(runner::LoadRequest("/no/such/kata.py", {}, false),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST(Cli, PrintResult) {
  runner::ExecutionResult result;
  result.logs = "a\nb";
  result.image = std::string("aGk=");
  std::ostringstream out;
  runner::PrintResult(result, "", &out);
  EXPECT_EQ(out.str(), "a\nb\nIMAGE:aGk=\n");
}

// NOLINTNEXTLINE
TEST(Cli, PrintResultImageToFile) {
  util::TempDir dir(test_tmpdir + "/cli");
  runner::ExecutionResult result;
  result.image = std::string("aGk=");
  std::ostringstream out;
  runner::PrintResult(result, dir.Path() + "/image.b64", &out);
  EXPECT_EQ(out.str(), "");
  EXPECT_EQ(util::File::ReadAll(dir.Path() + "/image.b64"), "aGk=");
}

}  // namespace
