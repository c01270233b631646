#include "runner/bounded_runner.hpp"

#include <memory>
#include <sstream>

#include <kj/debug.h>
#include <kj/exception.h>

#include "runner/output_parser.hpp"
#include "runner/workspace.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace runner {

namespace {
const constexpr char* kWorkspacePrefix = "kata_run_";
const constexpr char* kOutputPrefix = "kata_out_";
const constexpr char* kFailurePrefix = "Execution failed: ";

ExecutionResult Failure(const std::string& description) {
  ExecutionResult result;
  result.error = kFailurePrefix + description;
  return result;
}
}  // namespace

std::string BoundedRunner::TimeoutMessage(int64_t timeout_millis) {
  std::ostringstream message;
  message << "\xE2\x8F\xB1 Execution timed out after ";
  if (timeout_millis % 1000 == 0) {
    message << timeout_millis / 1000;
  } else {
    message << timeout_millis / 1000.0;
  }
  message << " seconds. Check for infinite loops.";
  return message.str();
}

ExecutionResult BoundedRunner::Execute(const ExecutionRequest& request) {
  ExecutionResult result;
  KJ_IF_MAYBE(exc,
              kj::runCatchingExceptions([&]() { result = Run(request); })) {
    KJ_LOG(WARNING, "Execution failed", exc->getDescription());
    return Failure(exc->getDescription().cStr());
  }
  return result;
}

ExecutionResult BoundedRunner::Run(const ExecutionRequest& request) {
  // The captured output lives outside the workspace, so the program cannot
  // tamper with it.
  util::TempDir workspace(config_.temp_directory, kWorkspacePrefix);
  util::TempDir output_dir(config_.temp_directory, kOutputPrefix);
  std::string source_path =
      Materialize(workspace.Path(), config_.source_name, request);

  sandbox::ExecutionOptions options(workspace.Path(),
                                    config_.InterpreterPath());
  options.SetArgs(std::vector<std::string>{config_.wrapper, source_path});
  options.wall_limit_millis = config_.timeout_millis;
  options.kill_grace_millis = config_.kill_grace_millis;
  options.stdout_file = util::File::JoinPath(output_dir.Path(), "stdout");
  options.stderr_file = util::File::JoinPath(output_dir.Path(), "stderr");

  std::unique_ptr<sandbox::Sandbox> sandbox = sandbox::Sandbox::Create();
  KJ_ASSERT(sandbox, "No sandbox available");
  sandbox::ExecutionInfo info;
  std::string error_msg;
  KJ_LOG(INFO, "Running", workspace.Path(), request.assets.size());
  if (!sandbox->Execute(options, &info, &error_msg)) {
    KJ_LOG(WARNING, "Failed to start the program", error_msg);
    return Failure(error_msg);
  }
  KJ_LOG(INFO, "Program finished", workspace.Path(), info.wall_time_millis,
         info.status_code, info.signal);

  if (info.killed) {
    KJ_LOG(INFO, "Time limit exceeded", workspace.Path());
    ExecutionResult result;
    result.error = TimeoutMessage(config_.timeout_millis);
    return result;
  }
  return ParseOutput(util::File::ReadAll(options.stdout_file),
                     util::File::ReadAll(options.stderr_file));
}

}  // namespace runner
