#include "server/server.hpp"

#include <thread>

#include <kj/debug.h>

#include "server/convert.hpp"
#include "util/log_manager.hpp"

namespace server {

namespace {
// Runs func on a new thread and resolves the returned promise, on the calling
// thread's event loop, with its result.
template <typename T, typename Func>
kj::Promise<T> RunOnThread(Func func) {
  auto paf = kj::newPromiseAndCrossThreadFulfiller<T>();
  std::thread([func = std::move(func),
               fulfiller = std::move(paf.fulfiller)]() mutable {
    util::ThreadLogger logger;
    KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                         [&]() { fulfiller->fulfill(func()); })) {
      fulfiller->reject(kj::mv(*exc));
    }
  }).detach();
  return kj::mv(paf.promise);
}
}  // namespace

kj::Promise<void> Server::execute(ExecuteContext context) {
  runner::ExecutionRequest request =
      FromCapnp(context.getParams().getRequest());
  KJ_LOG(INFO, "Execute request", request.source_code.size(),
         request.assets.size());
  return RunOnThread<runner::ExecutionResult>(
             [this, request = std::move(request)]() {
               return dispatcher_.Execute(request);
             })
      .then([context](runner::ExecutionResult result) mutable {
        ToCapnp(result, context.getResults().initResult());
      });
}

kj::Promise<void> Server::stop(StopContext context) {
  KJ_LOG(INFO, "Stop request");
  return RunOnThread<runner::StopResult>([this]() { return dispatcher_.Stop(); })
      .then([context](runner::StopResult result) mutable {
        ToCapnp(result, context.getResults().initResult());
      });
}

}  // namespace server
