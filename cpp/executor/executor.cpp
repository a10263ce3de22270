#include "executor/executor.hpp"

#include <kj/debug.h>

#include "sandbox/workspace.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace executor {

Config Config::FromFlags() {
  std::vector<std::string> builtins =
      sandbox::CapabilityRestrictions::DefaultBuiltins();
  if (Flags::override_builtins) {
    builtins = util::split(Flags::disabled_builtins, ',');
  }
  std::string flag = Flags::disabled_flag.empty()
                         ? sandbox::CapabilityRestrictions::kDefaultFlag
                         : Flags::disabled_flag;
  std::string separator = Flags::separator.empty()
                              ? sandbox::CapabilityRestrictions::kDefaultSeparator
                              : Flags::separator;
  Config config{
      Flags::interpreter,
      sandbox::CapabilityRestrictions(std::move(builtins), std::move(flag),
                                      std::move(separator)),
      Flags::workspace_directory,
      Flags::workspace_extension,
      Flags::timeout_millis,
      Flags::drain_grace_millis,
      static_cast<size_t>(Flags::max_output_bytes)};
  return config;
}

kj::Promise<sandbox::ExecutionResult> Executor::Execute(
    const std::string& code) {
  return kj::evalNow([this, &code]() {
    auto workspace = kj::heap<sandbox::Workspace>(
        config_.workspace_directory, config_.workspace_extension, code);

    sandbox::Command command;
    command.executable = config_.interpreter;
    command.args.push_back(workspace->Path());
    std::string restrictions = config_.restrictions.ToArgument();
    if (!restrictions.empty()) command.args.push_back(restrictions);
    command.max_output_bytes = config_.max_output_bytes;
    command.drain_grace_millis = config_.drain_grace_millis;

    auto timeout = timer_.afterDelay(config_.timeout_millis * kj::MILLISECONDS);
    // The workspace is attached after the run, so on cancellation it is
    // destroyed only after the child has been killed and reaped.
    sandbox::Workspace& ws = *workspace;
    return sandbox_.Run(command, kj::mv(timeout))
        .then([&ws](sandbox::ExecutionResult result) {
          ws.Release();
          KJ_IF_MAYBE(exit_code, result.exit_code) {
            KJ_LOG(INFO, "Executed", ws.Path().c_str(), *exit_code,
                   result.wall_time_millis, result.stdout_truncated,
                   result.stderr_truncated);
          } else {
            KJ_LOG(INFO, "Executed", ws.Path().c_str(), "signal",
                   result.signal, result.killed, result.wall_time_millis,
                   result.stdout_truncated, result.stderr_truncated);
          }
          return result;
        })
        .attach(kj::mv(workspace));
  });
}

}  // namespace executor
