#ifndef RUNNER_FOREGROUND_RUNNER_HPP
#define RUNNER_FOREGROUND_RUNNER_HPP

#include "runner/config.hpp"
#include "runner/process_registry.hpp"
#include "runner/runner.hpp"

namespace runner {

// Starts the source directly with the interpreter, without wrapper, time limit
// or output capture, and returns as soon as it is running. The previous
// foreground program, if any, is stopped first.
class ForegroundRunner : public Runner {
 public:
  ForegroundRunner(Config config, ProcessRegistry* registry)
      : config_(std::move(config)), registry_(*registry) {}

  ExecutionResult Execute(const ExecutionRequest& request) override;

 private:
  ExecutionResult Launch(const ExecutionRequest& request);

  const Config config_;
  ProcessRegistry& registry_;
};

}  // namespace runner

#endif
