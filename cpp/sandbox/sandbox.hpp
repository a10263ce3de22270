#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <kj/async.h>
#include <kj/common.h>

namespace sandbox {

// What to run.
struct Command {
  std::string executable;
  std::vector<std::string> args;  // Not including argv[0].

  // Each output stream keeps at most this many bytes. Further output is read
  // and discarded.
  size_t max_output_bytes = 1024 * 1024;

  // How long to keep reading the output streams after the process has exited
  // before giving up on them.
  int64_t drain_grace_millis = 500;
};

// Results of the execution.
struct ExecutionResult {
  // Absent if the process did not exit normally.
  kj::Maybe<int> exit_code;
  int32_t signal = 0;
  // True if the process was killed because of cancellation.
  bool killed = false;
  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  int64_t wall_time_millis = 0;
};

// Sandbox interface. Run spawns the command and resolves once it has
// terminated and its output has been collected. When `cancel` resolves the
// process is killed; there is no other way to stop it. Destroying the
// returned promise also kills the process.
// If the process cannot be started Run throws (or rejects) with a
// description that starts with "spawn ". A process that starts and then fails
// is a successful run.
class Sandbox {
 public:
  virtual kj::Promise<ExecutionResult> Run(const Command& command,
                                           kj::Promise<void> cancel) = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

}  // namespace sandbox

#endif
