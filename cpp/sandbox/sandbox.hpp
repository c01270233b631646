#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values. A zero wall limit means no limit.
  int64_t wall_limit_millis = 0;
  // Time between SIGTERM and SIGKILL when the wall limit is exceeded. Zero
  // means the program is killed right away.
  int64_t kill_grace_millis = 0;

  // Empty means /dev/null for stdin, and inherited stdout and stderr.
  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;
  std::vector<std::string> args;

  // Required values
  std::string root;
  std::string executable;
  ExecutionOptions(std::string root_, std::string executable_)
      : root(std::move(root_)), executable(std::move(executable_)) {}
  template <typename T>
  void SetArgs(const T& a_) {
    args.assign(a_.begin(), a_.end());
  }
  void SetArgs(const std::initializer_list<const char*>& a_) {
    args.assign(a_.begin(), a_.end());
  }
};

// Results of the execution.
struct ExecutionInfo {
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the program was stopped because it exceeded the wall limit.
  bool killed = false;
  std::string message;
};

// A program started by Sandbox::Launch. Wait and Terminate may be called from
// different threads.
class Process {
 public:
  virtual ~Process() = default;

  virtual int Pid() const = 0;

  // Blocks until the program exits, then collects its exit status. Must be
  // called exactly once.
  virtual void Wait(ExecutionInfo* info) = 0;

  // Sends SIGTERM to the process group of the program and, if it did not exit
  // after grace_millis, SIGKILL. Relies on a concurrent Wait to notice the
  // exit. Returns false if the program had already exited.
  virtual bool Terminate(int64_t grace_millis) = 0;

  // Returns true if Wait has not yet collected the exit status.
  virtual bool Running() const = 0;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create and Score static functions. Create should return a pointer to a newly
// allocated instance of the given implementation, while Score should return a
// value that defines how "good" that sandbox is: negative if the sandbox
// should not/cannot be used in the current configuration, positive otherwise
// (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command and waits for its termination, enforcing the
  // wall limit. Returns true if the program was started, and sets fields in
  // info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) {
    return ExecuteInternal(options, info, error_msg);
  }

  // Starts the specified command without waiting for it. The wall limit is
  // ignored. Returns nullptr and sets error_msg if the program could not be
  // started.
  std::unique_ptr<Process> Launch(const ExecutionOptions& options,
                                  std::string* error_msg) {
    return LaunchInternal(options, error_msg);
  }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 protected:
  virtual bool ExecuteInternal(const ExecutionOptions& options,
                               ExecutionInfo* info, std::string* error_msg) = 0;
  virtual std::unique_ptr<Process> LaunchInternal(
      const ExecutionOptions& options, std::string* error_msg) = 0;

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
