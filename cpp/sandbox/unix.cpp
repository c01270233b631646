#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <kj/debug.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

const constexpr auto kPollInterval = std::chrono::milliseconds(10);
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  std::unique_ptr<UnixProcess> process = Start(options, error_msg);
  if (!process) return false;
  process->WaitWithLimit(options.wall_limit_millis, options.kill_grace_millis,
                         info);
  return true;
}

std::unique_ptr<Process> Unix::LaunchInternal(const ExecutionOptions& options,
                                              std::string* error_msg) {
  return Start(options, error_msg);
}

std::unique_ptr<UnixProcess> Unix::Start(const ExecutionOptions& options,
                                         std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return nullptr;
  if (!DoFork(error_msg)) return nullptr;
  if (!WaitForExec(error_msg)) return nullptr;
  return std::make_unique<UnixProcess>(child_pid_);
}

bool Unix::Setup(std::string* error_msg) {
  // Prepare args here, the child must not allocate memory.
  arg_storage_.clear();
  args_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  for (std::vector<char>& arg : arg_storage_) args_.push_back(arg.data());
  args_.push_back(nullptr);

  char buf[kStrErrorBufSize] = {};
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole group can be signalled at once.
  if (setsid() == -1) die("setsid", errno);

  // Signal mask and ignored signals survive exec.
  sigset_t mask;
  sigemptyset(&mask);
  if (sigprocmask(SIG_SETMASK, &mask, nullptr) == -1) die("sigprocmask", errno);
  signal(SIGPIPE, SIG_DFL);

  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  stdin_fd = open(options_->stdin_file.empty() ? "/dev/null"
                                               : options_->stdin_file.c_str(),
                  O_RDONLY);
  if (stdin_fd == -1) die("open", errno);
  if (!options_->stdout_file.empty()) {
    stdout_fd = creat(options_->stdout_file.c_str(), S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("creat", errno);
  }
  if (!options_->stderr_file.empty()) {
    stderr_fd = creat(options_->stderr_file.c_str(), S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("creat", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
    close(field##_fd);                          \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  int count = 0;
  do {
    execv(options_->executable.c_str(), args_.data());
    usleep(100);
    // We try at most 16 times to avoid livelocks (which should not be possible,
    // but better safe than sorry).
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::WaitForExec(std::string* error_msg) {
  close(pipe_fds_[1]);
  int error_len = 0;
  ssize_t num_read = 0;
  KJ_SYSCALL(num_read = read(pipe_fds_[0], &error_len, sizeof(error_len)));
  if (num_read == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    KJ_SYSCALL(read(pipe_fds_[0], error, error_len), "Failed to read from fd");
    close(pipe_fds_[0]);
    *error_msg = error;
    // The child exits right after reporting the error.
    int child_status = 0;
    KJ_SYSCALL(waitpid(child_pid_, &child_status, 0));
    return false;
  }
  close(pipe_fds_[0]);
  return true;
}

int64_t UnixProcess::ElapsedMillis() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start_)
      .count();
}

bool UnixProcess::Running() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return !exited_;
}

void UnixProcess::Wait(ExecutionInfo* info) {
  // Wait without reaping, so that the pid cannot be recycled while Terminate
  // may still signal it.
  siginfo_t siginfo{};
  KJ_SYSCALL(waitid(P_PID, pid_, &siginfo, WEXITED | WNOWAIT));
  std::lock_guard<std::mutex> lck(mutex_);
  int child_status = 0;
  KJ_SYSCALL(waitpid(pid_, &child_status, 0));
  OnExit(child_status, info);
}

bool UnixProcess::Terminate(int64_t grace_millis) {
  std::unique_lock<std::mutex> lck(mutex_);
  if (exited_) return false;
  if (kill(-pid_, SIGTERM) == -1) {
    KJ_LOG(WARNING, "kill", pid_, strerror(errno));
  }
  if (!exited_cv_.wait_for(lck, std::chrono::milliseconds(grace_millis),
                           [this]() { return exited_; })) {
    KJ_LOG(WARNING, "Process did not stop, killing it", pid_);
    if (kill(-pid_, SIGKILL) == -1) {
      KJ_LOG(WARNING, "kill", pid_, strerror(errno));
    }
  }
  return true;
}

void UnixProcess::WaitWithLimit(int64_t wall_limit_millis,
                                int64_t kill_grace_millis,
                                ExecutionInfo* info) {
  std::lock_guard<std::mutex> lck(mutex_);
  int child_status = 0;
  auto poll = [this, &child_status]() {
    int ret = 0;
    KJ_SYSCALL(ret = waitpid(pid_, &child_status, WNOHANG));
    return ret == pid_;
  };
  auto poll_until = [this, &poll](int64_t deadline_millis) {
    while (deadline_millis == 0 || ElapsedMillis() < deadline_millis) {
      if (poll()) return true;
      std::this_thread::sleep_for(kPollInterval);
    }
    return false;
  };

  if (!poll_until(wall_limit_millis)) {
    info->killed = true;
    bool has_exited = false;
    if (kill_grace_millis > 0) {
      kill(-pid_, SIGTERM);
      has_exited = poll_until(wall_limit_millis + kill_grace_millis);
    }
    // Also reaches the programs the child left behind in its group.
    kill(-pid_, SIGKILL);
    if (!has_exited) {
      KJ_SYSCALL(waitpid(pid_, &child_status, 0));
    }
  }
  OnExit(child_status, info);
}

void UnixProcess::OnExit(int child_status, ExecutionInfo* info) {
  exited_ = true;
  exited_cv_.notify_all();
  info->wall_time_millis = ElapsedMillis();
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  if (info->signal != 0) {
    info->message = strsignal(info->signal);
  } else if (info->status_code != 0) {
    info->message = "Non-zero return code";
  }
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
