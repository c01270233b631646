#ifndef SERVER_CONVERT_HPP
#define SERVER_CONVERT_HPP

#include "capnp/runner.capnp.h"
#include "runner/request.hpp"

namespace server {

// Conversions between the runner types and their capnproto messages.

runner::ExecutionRequest FromCapnp(capnproto::ExecutionRequest::Reader reader);
void ToCapnp(const runner::ExecutionRequest& request,
             capnproto::ExecutionRequest::Builder builder);

runner::ExecutionResult FromCapnp(capnproto::ExecutionResult::Reader reader);
void ToCapnp(const runner::ExecutionResult& result,
             capnproto::ExecutionResult::Builder builder);

runner::StopResult FromCapnp(capnproto::StopResult::Reader reader);
void ToCapnp(const runner::StopResult& result,
             capnproto::StopResult::Builder builder);

}  // namespace server

#endif
