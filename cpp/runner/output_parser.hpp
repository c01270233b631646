#ifndef RUNNER_OUTPUT_PARSER_HPP
#define RUNNER_OUTPUT_PARSER_HPP

#include <string>
#include <vector>

#include "runner/request.hpp"

namespace runner {

// Tags of the line protocol spoken by the wrapper.
static const constexpr char* kImageTag = "IMAGE:";
static const constexpr char* kInfoTag = "INFO:";
static const constexpr char* kErrorTag = "EXEC_ERROR:";

// Strips leading and trailing whitespace, then splits at line endings ("\n" or
// "\r\n"). An empty or blank text has no lines.
std::vector<std::string> SplitLines(const std::string& text);

// Builds the result of a completed run from the captured streams.
//  - stdout: the payload of the last IMAGE: line becomes the image, INFO:
//    lines and untagged lines go to the logs.
//  - stderr: the last EXEC_ERROR: line becomes the (translated) error, the
//    other lines go to the logs after the stdout ones.
ExecutionResult ParseOutput(const std::string& stdout_text,
                            const std::string& stderr_text);

}  // namespace runner

#endif
