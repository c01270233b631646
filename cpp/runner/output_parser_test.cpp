#include "runner/output_parser.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

std::string imageOf(const runner::ExecutionResult& result) {
  KJ_IF_MAYBE(image, result.image) { return *image; }
  ADD_FAILURE() << "No image in the result";
  return "";
}

/*
 * SplitLines
 */

// NOLINTNEXTLINE
TEST(OutputParser, SplitLines) {
  EXPECT_THAT(runner::SplitLines("a\nb\nc\n"), ElementsAre("a", "b", "c"));
}

// NOLINTNEXTLINE
TEST(OutputParser, SplitLinesEmpty) {
  EXPECT_THAT(runner::SplitLines(""), IsEmpty());
  EXPECT_THAT(runner::SplitLines(" \n\t\r\n"), IsEmpty());
}

// NOLINTNEXTLINE
TEST(OutputParser, SplitLinesTrims) {
  EXPECT_THAT(runner::SplitLines("\n\n  a\n b \n\n"), ElementsAre("a", " b"));
}

// NOLINTNEXTLINE
TEST(OutputParser, SplitLinesKeepsBlankLines) {
  EXPECT_THAT(runner::SplitLines("a\n\nb"), ElementsAre("a", "", "b"));
}

// NOLINTNEXTLINE
TEST(OutputParser, SplitLinesCRLF) {
  EXPECT_THAT(runner::SplitLines("a\r\nb\r\n"), ElementsAre("a", "b"));
}

// NOLINTNEXTLINE
TEST(OutputParser, SplitLinesLoneCR) {
  EXPECT_THAT(runner::SplitLines("50%\rIMAGE:abc"),
              ElementsAre("50%", "IMAGE:abc"));
  EXPECT_THAT(runner::SplitLines("a\r\r\nb"), ElementsAre("a", "", "b"));
}

// NOLINTNEXTLINE
TEST(OutputParser, ImageAfterProgressLine) {
  runner::ExecutionResult result = runner::ParseOutput("50%\rIMAGE:abc", "");
  EXPECT_EQ(imageOf(result), "abc");
  EXPECT_EQ(result.logs, "50%");
}

/*
 * ParseOutput
 */

// NOLINTNEXTLINE
TEST(OutputParser, Image) {
  runner::ExecutionResult result = runner::ParseOutput("IMAGE:aGVsbG8=\n", "");
  EXPECT_EQ(imageOf(result), "aGVsbG8=");
  EXPECT_EQ(result.logs, "");
  EXPECT_EQ(result.error, "");
}

// NOLINTNEXTLINE
TEST(OutputParser, NoImage) {
  runner::ExecutionResult result = runner::ParseOutput("hello\n", "");
  EXPECT_TRUE(result.image == nullptr);
  EXPECT_EQ(result.logs, "hello");
}

// NOLINTNEXTLINE
TEST(OutputParser, LastImageWins) {
  runner::ExecutionResult result =
      runner::ParseOutput("IMAGE:first\nIMAGE:second\n", "");
  EXPECT_EQ(imageOf(result), "second");
}

// NOLINTNEXTLINE
TEST(OutputParser, Logs) {
  runner::ExecutionResult result = runner::ParseOutput(
      "INFO:shape (10, 10)\nplain line\nIMAGE:xyz\nINFO:done\n",
      "a warning\n");
  EXPECT_EQ(imageOf(result), "xyz");
  EXPECT_EQ(result.logs, "shape (10, 10)\nplain line\ndone\na warning");
  EXPECT_EQ(result.error, "");
}

// NOLINTNEXTLINE
TEST(OutputParser, ExecError) {
  runner::ExecutionResult result = runner::ParseOutput(
      "INFO:before\n", "Traceback\nEXEC_ERROR:ImportError: cv2\n");
  EXPECT_THAT(result.error,
              HasSubstr("Only `import cv2` and `import numpy as np`"));
  EXPECT_EQ(result.logs, "before\nTraceback");
  EXPECT_TRUE(result.image == nullptr);
}

// NOLINTNEXTLINE
TEST(OutputParser, LastExecErrorWins) {
  runner::ExecutionResult result = runner::ParseOutput(
      "", "EXEC_ERROR:NameError: x\nEXEC_ERROR:TypeError: y\n");
  EXPECT_EQ(result.error, "\xF0\x9F\x94\xA7 Type error: TypeError: y");
}

// NOLINTNEXTLINE
TEST(OutputParser, ErrorDropsImage) {
  runner::ExecutionResult result = runner::ParseOutput(
      "IMAGE:abc\nINFO:saved\n", "EXEC_ERROR:NameError: name 'x'\n");
  EXPECT_TRUE(result.image == nullptr);
  EXPECT_FALSE(result.error.empty());
  EXPECT_EQ(result.logs, "saved");
}

// NOLINTNEXTLINE
TEST(OutputParser, TagsOnlyAtLineStart) {
  runner::ExecutionResult result =
      runner::ParseOutput(" IMAGE:no\nsay INFO:x\n", "oops EXEC_ERROR:z\n");
  EXPECT_TRUE(result.image == nullptr);
  EXPECT_EQ(result.logs, "IMAGE:no\nsay INFO:x\noops EXEC_ERROR:z");
  EXPECT_EQ(result.error, "");
}

// NOLINTNEXTLINE
TEST(OutputParser, EmptyImage) {
  runner::ExecutionResult result = runner::ParseOutput("IMAGE:", "");
  EXPECT_EQ(imageOf(result), "");
}

}  // namespace
