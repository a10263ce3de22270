#include "executor/options.hpp"

#include <cstdlib>
#include <stdexcept>
#include <system_error>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace executor {

namespace {
const constexpr int64_t kMaxMillis = 24 * 3600 * 1000;
const constexpr int64_t kMaxBytes = int64_t(1) << 30;

std::string DefaultWorkspaceDirectory() {
  const char* tmpdir = getenv("TMPDIR");
  std::string base = tmpdir != nullptr && *tmpdir != '\0' ? tmpdir : "/tmp";
  return util::File::JoinPath(base, "execbox");
}
}  // namespace

kj::MainBuilder& AddExecutionOptions(kj::MainBuilder& builder) {  // NOLINT
  return builder
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log every request and execution")
      .addOptionWithArg({'i', "interpreter"},
                        util::setString(Flags::interpreter), "<PATH>",
                        "Interpreter to run the code with (required)")
      .addOptionWithArg({'t', "timeout"},
                        util::setInt(Flags::timeout_millis, 1, kMaxMillis),
                        "<MS>", "Wall time limit of an execution")
      .addOptionWithArg({'W', "workspace-dir"},
                        util::setString(Flags::workspace_directory), "<DIR>",
                        "Where the code is written while it runs")
      .addOptionWithArg({"workspace-ext"},
                        util::setString(Flags::workspace_extension), "<EXT>",
                        "Extension of the files the code is written to")
      .addOptionWithArg({"disabled-builtins"},
                        util::setString(Flags::disabled_builtins,
                                        Flags::override_builtins),
                        "<LIST>",
                        "Comma separated built-ins to disable, replacing the "
                        "default list. Empty disables nothing")
      .addOptionWithArg({"disabled-flag"},
                        util::setString(Flags::disabled_flag), "<FLAG>",
                        "Interpreter option that receives the disabled "
                        "built-ins")
      .addOptionWithArg({"separator"}, util::setString(Flags::separator),
                        "<SEP>", "Separator between disabled built-ins")
      .addOptionWithArg({"max-output"},
                        util::setInt(Flags::max_output_bytes, 0, kMaxBytes),
                        "<BYTES>", "Output kept from each stream")
      .addOptionWithArg({"drain-grace"},
                        util::setInt(Flags::drain_grace_millis, 0, kMaxMillis),
                        "<MS>",
                        "How long to wait for the output after the process "
                        "exits");
}

kj::MainBuilder::Validity LoadConfig(kj::Maybe<Config>* config) {
  if (Flags::interpreter.empty()) return kj::str("no interpreter given");
  std::string interpreter;
  try {
    interpreter = util::which(Flags::interpreter);
  } catch (const std::runtime_error& e) {
    return kj::str(e.what());
  }
  if (interpreter.empty()) {
    return kj::str("interpreter not found: ", Flags::interpreter.c_str());
  }
  Flags::interpreter = interpreter;

  if (Flags::workspace_directory.empty()) {
    Flags::workspace_directory = DefaultWorkspaceDirectory();
  }
  try {
    util::File::MakeDirs(Flags::workspace_directory);
  } catch (const std::system_error& e) {
    return kj::str(e.what());
  }

  auto error = kj::runCatchingExceptions([config]() {
    *config = Config::FromFlags();
  });
  KJ_IF_MAYBE(exception, error) {
    return kj::str(exception->getDescription());
  }
  KJ_IF_MAYBE(c, *config) {
    KJ_LOG(INFO, "Configuration", c->interpreter.c_str(),
           c->workspace_directory.c_str(), c->timeout_millis,
           c->restrictions.ToArgument().c_str());
  }
  return true;
}

}  // namespace executor
