#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

// Raw values of the command line options. They are only written while the
// command line is parsed; everything else reads the frozen executor::Config.
struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;
  static std::string interpreter;
  static int64_t timeout_millis;
  static int64_t drain_grace_millis;
  static std::string workspace_directory;
  static std::string workspace_extension;
  static bool override_builtins;
  static std::string disabled_builtins;
  static std::string disabled_flag;
  static std::string separator;
  static int64_t max_output_bytes;

  // Server-only flags
  static std::string listen_address;
  static int64_t port;
  static std::string static_directory;
  static int64_t max_request_bytes;
};

#endif
