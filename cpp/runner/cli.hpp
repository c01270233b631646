#ifndef RUNNER_CLI_HPP
#define RUNNER_CLI_HPP

#include <ostream>
#include <string>
#include <vector>

#include "runner/request.hpp"

namespace runner {

// Builds a request from a script on disk and the files to upload with it.
// The assets keep the name they have on disk.
ExecutionRequest LoadRequest(const std::string& source_path,
                             const std::vector<std::string>& asset_paths,
                             bool run_foreground);

// Prints the logs of the result to out. The image goes to image_path if it is
// not empty, otherwise it is printed as an IMAGE: line. The error is left to
// the caller.
void PrintResult(const ExecutionResult& result, const std::string& image_path,
                 std::ostream* out);

}  // namespace runner

#endif
