#ifndef RUNNER_CONFIG_HPP
#define RUNNER_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace runner {

// Settings shared by the runners. FromFlags takes a snapshot of the command
// line flags, tests build their own.
struct Config {
  // Where the scratch workspaces are created.
  std::string temp_directory = "/tmp";
  // Program that runs the source. Looked up in PATH if it has no slash.
  std::string interpreter = "python3";
  // Entry-point wrapper of the bounded runner, as an absolute path.
  std::string wrapper;
  // Name of the source file inside the workspace.
  std::string source_name = "kata.py";

  int64_t timeout_millis = 10000;
  int64_t kill_grace_millis = 500;
  int64_t stop_grace_millis = 3000;

  // Interpreter arguments placed before the source by the foreground runner.
  std::vector<std::string> foreground_args = {"-u"};

  static Config FromFlags();

  // Resolves the interpreter to the path of an executable. Throws if it cannot
  // be found.
  std::string InterpreterPath() const;
};

}  // namespace runner

#endif
