#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <cstdint>
#include <string>

#include <kj/async.h>
#include <kj/timer.h>

#include "sandbox/restrictions.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Everything an execution depends on. Built once at startup and never
// modified afterwards.
struct Config {
  std::string interpreter;
  sandbox::CapabilityRestrictions restrictions;
  std::string workspace_directory;
  std::string workspace_extension = ".قتام";
  int64_t timeout_millis = 1000;
  int64_t drain_grace_millis = 500;
  size_t max_output_bytes = 1024 * 1024;

  // Builds the configuration from the parsed command line. The interpreter
  // must already be resolved to a path. Throws on invalid restriction
  // settings.
  static Config FromFlags();
};

// Runs one piece of source text: writes it to a workspace file, runs the
// interpreter on it under the timeout and removes the file once the
// interpreter is gone.
class Executor {
 public:
  Executor(const Config& config, sandbox::Sandbox* sandbox, kj::Timer* timer)
      : config_(config), sandbox_(*sandbox), timer_(*timer) {}

  // Rejects with std::system_error converted to kj::Exception if the
  // workspace file cannot be written, and with a "spawn " exception if the
  // interpreter cannot be started. A program that fails or is killed is a
  // successful execution.
  kj::Promise<sandbox::ExecutionResult> Execute(const std::string& code);

  const Config& GetConfig() const { return config_; }

 private:
  const Config& config_;
  sandbox::Sandbox& sandbox_;
  kj::Timer& timer_;
};

}  // namespace executor

#endif
