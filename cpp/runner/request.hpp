#ifndef RUNNER_REQUEST_HPP
#define RUNNER_REQUEST_HPP

#include <kj/common.h>
#include <string>
#include <vector>

namespace runner {

// A file uploaded together with the source code.
struct Asset {
  std::string name;
  std::string data;
};

struct ExecutionRequest {
  std::string source_code;
  // Requested by the caller, routing is decided by the Dispatcher.
  bool run_foreground = false;
  std::vector<Asset> assets;
};

// A result with an error never has an image. Logs may be present in both
// cases.
struct ExecutionResult {
  kj::Maybe<std::string> image;
  std::string logs;
  std::string error;
};

struct StopResult {
  bool stopped = false;
  std::string message;
};

}  // namespace runner

#endif
