#include "runner/config.hpp"

#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstring>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace runner {

namespace {
// The children run inside their workspace, so relative paths have to be
// resolved against the directory we were started from.
std::string Absolute(const std::string& path) {
  if (path.empty() || path[0] == '/') return path;
  char cwd[PATH_MAX] = {};
  KJ_ASSERT(getcwd(cwd, PATH_MAX) != nullptr, "getcwd", strerror(errno));
  return util::File::JoinPath(cwd, path);
}
}  // namespace

Config Config::FromFlags() {
  Config config;
  config.temp_directory = Absolute(Flags::temp_directory);
  config.interpreter = Flags::interpreter;
  if (config.interpreter.find('/') != std::string::npos) {
    config.interpreter = Absolute(config.interpreter);
  }
  config.wrapper = Absolute(Flags::wrapper);
  config.source_name = Flags::source_name;
  KJ_REQUIRE(config.source_name == util::File::BaseName(config.source_name) &&
                 !config.source_name.empty(),
             "Invalid source name", config.source_name);
  config.timeout_millis = Flags::timeout_millis;
  config.kill_grace_millis = Flags::timeout_grace_millis;
  config.stop_grace_millis = Flags::stop_grace_millis;
  KJ_REQUIRE(config.timeout_millis > 0, "The timeout must be positive");
  KJ_REQUIRE(config.kill_grace_millis >= 0 && config.stop_grace_millis >= 0,
             "Grace periods cannot be negative");
  config.foreground_args = util::split(Flags::foreground_args, ' ');
  return config;
}

std::string Config::InterpreterPath() const {
  if (interpreter.find('/') != std::string::npos) return interpreter;
  std::string path = util::which(interpreter);
  KJ_REQUIRE(!path.empty(), "Interpreter not found in PATH", interpreter);
  return path;
}

}  // namespace runner
