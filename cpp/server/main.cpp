#include "server/main.hpp"

#include <capnp/ez-rpc.h>
#include <kj/debug.h>

#include "runner/bounded_runner.hpp"
#include "runner/config.hpp"
#include "runner/dispatcher.hpp"
#include "runner/foreground_runner.hpp"
#include "runner/process_registry.hpp"
#include "server/server.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace server {
kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context);
  runner::Config config = runner::Config::FromFlags();
  runner::ProcessRegistry registry(config.stop_grace_millis);
  runner::BoundedRunner bounded(config);
  runner::ForegroundRunner foreground(config, &registry);
  runner::Dispatcher dispatcher(&bounded, &foreground, &registry);

  capnp::EzRpcServer server(kj::heap<server::Server>(&dispatcher),
                            Flags::listen_address, Flags::port);
  uint32_t port = server.getPort().wait(server.getWaitScope());
  KJ_LOG(INFO, "Listening", Flags::listen_address, port, config.wrapper);
  kj::NEVER_DONE.wait(server.getWaitScope());
  KJ_UNREACHABLE;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, util::version,
                         "Serves the runner to the web frontend over RPC")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Log informational messages")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(&Flags::temp_directory), "<DIR>",
                        "Path where the workspaces should be created")
      .addOptionWithArg({'i', "interpreter"},
                        util::setString(&Flags::interpreter), "<PROGRAM>",
                        "Interpreter that runs the scripts")
      .addOptionWithArg({'w', "wrapper"}, util::setString(&Flags::wrapper),
                        "<PATH>", "Entry-point wrapper of time limited runs")
      .addOptionWithArg({"source-name"}, util::setString(&Flags::source_name),
                        "<NAME>", "Name of the script inside the workspace")
      .addOptionWithArg({'t', "timeout"}, util::setInt(&Flags::timeout_millis),
                        "<MILLIS>", "Time limit of a run")
      .addOptionWithArg({"kill-grace"},
                        util::setInt(&Flags::timeout_grace_millis), "<MILLIS>",
                        "Time between SIGTERM and SIGKILL on timeout")
      .addOptionWithArg({"stop-grace"},
                        util::setInt(&Flags::stop_grace_millis), "<MILLIS>",
                        "Time between SIGTERM and SIGKILL when stopping a "
                        "desktop program")
      .addOptionWithArg({"foreground-args"},
                        util::setString(&Flags::foreground_args), "<ARGS>",
                        "Space separated interpreter arguments for desktop "
                        "programs")
      .addOptionWithArg({'l', "address"},
                        util::setString(&Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port to listen on")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace server
