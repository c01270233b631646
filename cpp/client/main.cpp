#include "client/main.hpp"

#include <capnp/ez-rpc.h>
#include <kj/debug.h>
#include <iostream>

#include "capnp/runner.capnp.h"
#include "runner/cli.hpp"
#include "server/convert.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace client {

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context);
  if (Flags::stop) return Stop();
  if (source_.empty()) return "You need to specify a script!";

  runner::ExecutionRequest request =
      runner::LoadRequest(source_, Flags::assets, Flags::run_foreground);
  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto stub = client.getMain<capnproto::Runner>();
  auto req = stub.executeRequest();
  server::ToCapnp(request, req.initRequest());
  KJ_LOG(INFO, "Sending script", source_, request.assets.size());
  auto response = req.send().wait(client.getWaitScope());
  runner::ExecutionResult result = server::FromCapnp(response.getResult());
  runner::PrintResult(result, Flags::image_output, &std::cout);
  if (!result.error.empty()) {
    context.exitError(result.error);
  }
  return true;
}

kj::MainBuilder::Validity Main::Stop() {
  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto stub = client.getMain<capnproto::Runner>();
  auto response = stub.stopRequest().send().wait(client.getWaitScope());
  runner::StopResult result = server::FromCapnp(response.getResult());
  std::cout << result.message << std::endl;
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, util::version,
                         "Sends a script to a running server")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Log informational messages")
      .addOptionWithArg({'s', "server"}, util::setString(&Flags::server),
                        "<ADDRESS>", "Address to connect to")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port to connect to")
      .addOptionWithArg({'a', "asset"}, util::appendString(&Flags::assets),
                        "<FILE>", "File to copy next to the script, repeatable")
      .addOptionWithArg({'o', "image-out"},
                        util::setString(&Flags::image_output), "<FILE>",
                        "Where to write the base64 image instead of stdout")
      .addOption({'f', "foreground"}, util::setBool(&Flags::run_foreground),
                 "Ask for a desktop run")
      .addOption({'S', "stop"}, util::setBool(&Flags::stop),
                 "Stop the desktop program running on the server")
      .expectOptionalArg("<SOURCE>", util::setString(&source_))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace client
