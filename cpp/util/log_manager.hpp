#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <atomic>
#include <ostream>
#include "backward.hpp"

namespace util {

// Formats kj log messages and prints a stack trace for the exceptions that
// reach the top-level callback. Installed for the whole lifetime of a
// subcommand.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext* context);
  ~LogManager();
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  friend class ThreadLogger;
  void PrintStackTrace();

  static std::atomic<LogManager*> current_;

  std::ostream& out;
  backward::SignalHandling sh;  // Override kj's signal handling.
};

// kj exception callbacks are per thread: every thread the process starts
// installs one of these to send its log messages to the LogManager of the
// process. Without a LogManager the messages go to kj's default callback.
class ThreadLogger : public kj::ExceptionCallback {
 public:
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
};
}  // namespace util

#endif
