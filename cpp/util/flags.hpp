#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>
#include <vector>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;

  // Execution flags
  static std::string temp_directory;
  static std::string interpreter;
  static std::string wrapper;
  static std::string source_name;
  static int32_t timeout_millis;
  static int32_t timeout_grace_millis;
  static int32_t stop_grace_millis;
  static std::string foreground_args;

  // Flags of the run and client commands
  static std::vector<std::string> assets;
  static std::string image_output;
  static bool run_foreground;
  static bool stop;

  // Server and client flags
  static std::string listen_address;
  static int32_t port;

  // Client-only flags
  static std::string server;
};

#endif
