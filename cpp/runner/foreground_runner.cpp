#include "runner/foreground_runner.hpp"

#include <kj/debug.h>
#include <kj/exception.h>

#include "runner/workspace.hpp"
#include "util/file.hpp"

namespace runner {

namespace {
const constexpr char* kWorkspacePrefix = "kata_live_";
const constexpr char* kFailurePrefix = "Failed to launch: ";
const constexpr char* kLaunchedMessage =
    "Running on your desktop \xE2\x80\x94 an OpenCV window should appear.\n"
    "Press 'q' in the OpenCV window to quit.";

ExecutionResult Failure(const std::string& description) {
  ExecutionResult result;
  result.error = kFailurePrefix + description;
  return result;
}
}  // namespace

ExecutionResult ForegroundRunner::Execute(const ExecutionRequest& request) {
  ExecutionResult result;
  KJ_IF_MAYBE(exc,
              kj::runCatchingExceptions([&]() { result = Launch(request); })) {
    KJ_LOG(WARNING, "Launch failed", exc->getDescription());
    return Failure(exc->getDescription().cStr());
  }
  return result;
}

ExecutionResult ForegroundRunner::Launch(const ExecutionRequest& request) {
  StopResult previous = registry_.Stop();
  if (previous.stopped) {
    KJ_LOG(INFO, "Stopped the previous foreground program");
  }

  // Removed right away if anything below fails, otherwise owned by the
  // session until the program exits.
  util::TempDir workspace(config_.temp_directory, kWorkspacePrefix);
  std::string source_path =
      Materialize(workspace.Path(), config_.source_name, request);

  sandbox::ExecutionOptions options(workspace.Path(),
                                    config_.InterpreterPath());
  std::vector<std::string> args = config_.foreground_args;
  args.push_back(source_path);
  options.SetArgs(args);

  std::unique_ptr<sandbox::Sandbox> sandbox = sandbox::Sandbox::Create();
  KJ_ASSERT(sandbox, "No sandbox available");
  std::string error_msg;
  std::unique_ptr<sandbox::Process> process =
      sandbox->Launch(options, &error_msg);
  if (!process) {
    KJ_LOG(WARNING, "Failed to start the foreground program", error_msg);
    return Failure(error_msg);
  }
  KJ_LOG(INFO, "Foreground program started", process->Pid(), workspace.Path());

  auto session = std::make_shared<ForegroundSession>(std::move(process),
                                                     std::move(workspace));
  registry_.Install(std::move(session));

  ExecutionResult result;
  result.logs = kLaunchedMessage;
  return result;
}

}  // namespace runner
