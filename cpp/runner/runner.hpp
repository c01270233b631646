#ifndef RUNNER_RUNNER_HPP
#define RUNNER_RUNNER_HPP

#include "runner/request.hpp"

namespace runner {

// Common interface of the execution paths. Implementations must be safe to
// call from multiple threads at once.
class Runner {
 public:
  virtual ~Runner() = default;

  // Never throws: every failure is reported in the error of the result.
  virtual ExecutionResult Execute(const ExecutionRequest& request) = 0;
};

}  // namespace runner

#endif
