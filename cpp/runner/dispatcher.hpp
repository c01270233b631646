#ifndef RUNNER_DISPATCHER_HPP
#define RUNNER_DISPATCHER_HPP

#include <string>

#include "runner/process_registry.hpp"
#include "runner/runner.hpp"

namespace runner {

// Entry point of the callers: picks the runner for each request and stops the
// foreground program on demand.
class Dispatcher {
 public:
  Dispatcher(Runner* bounded, Runner* foreground, ProcessRegistry* registry)
      : bounded_(*bounded), foreground_(*foreground), registry_(*registry) {}

  // Sources that open a camera need the desktop, so they go to the foreground
  // runner whatever the request asks. Everything else is bounded.
  ExecutionResult Execute(const ExecutionRequest& request);

  StopResult Stop() { return registry_.Stop(); }

  // True if the source mentions the live capture API.
  static bool NeedsForeground(const std::string& source_code);

 private:
  Runner& bounded_;
  Runner& foreground_;
  ProcessRegistry& registry_;
};

}  // namespace runner

#endif
