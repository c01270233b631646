#ifndef RUNNER_BOUNDED_RUNNER_HPP
#define RUNNER_BOUNDED_RUNNER_HPP

#include <string>

#include "runner/config.hpp"
#include "runner/runner.hpp"

namespace runner {

// Runs the source through the wrapper in a fresh workspace, with a time
// limit, and rebuilds the result from the captured output. The workspace is
// removed before Execute returns.
class BoundedRunner : public Runner {
 public:
  explicit BoundedRunner(Config config) : config_(std::move(config)) {}

  ExecutionResult Execute(const ExecutionRequest& request) override;

  static std::string TimeoutMessage(int64_t timeout_millis);

 private:
  ExecutionResult Run(const ExecutionRequest& request);

  const Config config_;
};

}  // namespace runner

#endif
