#ifndef RUNNER_PROCESS_REGISTRY_HPP
#define RUNNER_PROCESS_REGISTRY_HPP

#include <memory>
#include <mutex>
#include <string>

#include "runner/request.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace runner {

// A program started by the foreground runner, together with the workspace it
// runs in. The workspace is removed when the last reference to the session
// goes away, which is after the program exited.
class ForegroundSession {
 public:
  ForegroundSession(std::unique_ptr<sandbox::Process> process,
                    util::TempDir workspace)
      : process_(std::move(process)), workspace_(std::move(workspace)) {}

  int Pid() const { return process_->Pid(); }
  const std::string& Workspace() const { return workspace_.Path(); }
  bool Running() const { return process_->Running(); }

  // Blocks until the program exits. Only the watcher calls this.
  sandbox::ExecutionInfo Wait();

  // Asks the program to exit, killing it after grace_millis. Returns false if
  // it had already exited.
  bool Terminate(int64_t grace_millis) {
    return process_->Terminate(grace_millis);
  }

 private:
  std::unique_ptr<sandbox::Process> process_;
  util::TempDir workspace_;
};

// Holds the foreground session, if any. There is at most one at any time, and
// every change of the slot happens under a single mutex.
class ProcessRegistry {
 public:
  explicit ProcessRegistry(int64_t stop_grace_millis = 3000);
  ~ProcessRegistry();

  // Puts session in the slot and returns the one it replaces, if any.
  std::shared_ptr<ForegroundSession> Replace(
      std::shared_ptr<ForegroundSession> session);

  // Empties the slot if it still holds session. Returns true if it did.
  bool ClearIf(const ForegroundSession* session);

  // Empties the slot and returns what it held.
  std::shared_ptr<ForegroundSession> Take();

  // Takes the current session and stops it: SIGTERM first, SIGKILL if it is
  // still alive after the grace period. Safe to call when nothing is running.
  StopResult Stop();

  // Starts a detached thread that waits for the session to exit, then empties
  // the slot if it still holds the session. The thread may outlive the
  // registry.
  void Watch(std::shared_ptr<ForegroundSession> session);

  // Registers a freshly launched session and watches it. A session that a
  // concurrent launch registered in the meantime is stopped, so only session
  // survives.
  void Install(std::shared_ptr<ForegroundSession> session);

  std::shared_ptr<const ForegroundSession> Current() const;

 private:
  struct State {
    std::mutex mutex;
    std::shared_ptr<ForegroundSession> active;
  };

  static bool ClearIf(State* state, const ForegroundSession* session);

  const int64_t stop_grace_millis_;
  std::shared_ptr<State> state_;
};

}  // namespace runner

#endif
