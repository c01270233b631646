#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// A child created by Unix. The child leads its own process group, so the
// signals sent by Terminate also reach the programs it started.
class UnixProcess : public Process {
 public:
  explicit UnixProcess(int pid)
      : pid_(pid), start_(std::chrono::steady_clock::now()) {}

  int Pid() const override { return pid_; }
  void Wait(ExecutionInfo* info) override;
  bool Terminate(int64_t grace_millis) override;
  bool Running() const override;

  // Waits for the termination of the child, stopping it if it exceeds the
  // provided wall time limit. Must not be mixed with Wait.
  void WaitWithLimit(int64_t wall_limit_millis, int64_t kill_grace_millis,
                     ExecutionInfo* info);

 private:
  // Records the exit status. Must be called with mutex_ held.
  void OnExit(int child_status, ExecutionInfo* info);
  int64_t ElapsedMillis() const;

  const int pid_;
  const std::chrono::steady_clock::time_point start_;
  mutable std::mutex mutex_;
  std::condition_variable exited_cv_;
  bool exited_ = false;
};

// Sandbox for UNIX-like systems: fork, then exec in the requested directory.
class Unix : public Sandbox {
 public:
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;
  std::unique_ptr<Process> LaunchInternal(const ExecutionOptions& options,
                                          std::string* error_msg) override;

  // Creates the child and returns once exec has succeeded or failed.
  std::unique_ptr<UnixProcess> Start(const ExecutionOptions& options,
                                     std::string* error_msg);

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. It must only use
  // async-signal-safe functions, as other threads may hold locks at fork time.
  [[noreturn]] void Child();

  // Reads the outcome of exec from the child. Returns false and sets error_msg
  // if the child could not be started.
  bool WaitForExec(std::string* error_msg);

  int pipe_fds_[2] = {};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> args_;
};

}  // namespace sandbox
#endif
