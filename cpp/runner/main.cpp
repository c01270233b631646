#include "runner/main.hpp"

#include <chrono>
#include <iostream>
#include <thread>

#include <kj/debug.h>

#include "runner/bounded_runner.hpp"
#include "runner/cli.hpp"
#include "runner/config.hpp"
#include "runner/dispatcher.hpp"
#include "runner/foreground_runner.hpp"
#include "runner/process_registry.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace runner {
namespace {
const constexpr auto kPollInterval = std::chrono::milliseconds(100);
}  // namespace

kj::MainBuilder::Validity Main::Run(kj::StringPtr source) {
  util::LogManager log_manager(&context);
  Config config = Config::FromFlags();
  ProcessRegistry registry(config.stop_grace_millis);
  BoundedRunner bounded(config);
  ForegroundRunner foreground(config, &registry);
  Dispatcher dispatcher(&bounded, &foreground, &registry);

  ExecutionRequest request =
      LoadRequest(source.cStr(), Flags::assets, Flags::run_foreground);
  ExecutionResult result = dispatcher.Execute(request);
  PrintResult(result, Flags::image_output, &std::cout);

  // A desktop program keeps running after Execute returns.
  while (registry.Current()) {
    std::this_thread::sleep_for(kPollInterval);
  }
  if (!result.error.empty()) {
    context.exitError(result.error);
  }
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, util::version,
                         "Runs a script once and prints what it produced")
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
      .addOptionWithArg({'a', "asset"}, util::appendString(&Flags::assets),
                        "<FILE>", "File to copy next to the script, repeatable")
      .addOptionWithArg({'o', "image-out"},
                        util::setString(&Flags::image_output), "<FILE>",
                        "Where to write the base64 image instead of stdout")
      .addOption({'f', "foreground"}, util::setBool(&Flags::run_foreground),
                 "Ask for a desktop run")
      .expectArg("<SOURCE>", KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace runner
