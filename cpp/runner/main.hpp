#ifndef RUNNER_MAIN_HPP
#define RUNNER_MAIN_HPP
#include <kj/main.h>

namespace runner {

// Runs a single script from the command line, without a server.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run(kj::StringPtr source);
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace runner
#endif
