#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include <kj/async.h>

#include "capnp/runner.capnp.h"
#include "runner/dispatcher.hpp"

namespace server {

// Implementation of the Runner interface. Every call runs on a thread of its
// own, so that a long execution does not hold back the event loop.
class Server : public capnproto::Runner::Server {
 public:
  explicit Server(runner::Dispatcher* dispatcher) : dispatcher_(*dispatcher) {}

  kj::Promise<void> execute(ExecuteContext context) override;
  kj::Promise<void> stop(StopContext context) override;

 private:
  runner::Dispatcher& dispatcher_;
};

}  // namespace server

#endif
