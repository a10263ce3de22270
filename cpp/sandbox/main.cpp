#include "sandbox/main.hpp"

#include <unistd.h>
#include <system_error>

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/debug.h>
#include <kj/io.h>

#include "executor/executor.hpp"
#include "executor/options.hpp"
#include "sandbox/unix.hpp"
#include "server/protocol.hpp"
#include "util/file.hpp"
#include "util/log_manager.hpp"
#include "util/version.hpp"

namespace sandbox {
kj::MainBuilder::Validity Main::SetFile(kj::StringPtr file) {
  source_file = file.cStr();
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context);
  kj::Maybe<executor::Config> maybe_config;
  auto validity = executor::LoadConfig(&maybe_config);
  if (validity.getError() != nullptr) return validity;
  const executor::Config& config = KJ_ASSERT_NONNULL(maybe_config);

  std::string code;
  try {
    code = util::File::Read(source_file);
  } catch (const std::system_error& e) {
    return kj::str(e.what());
  }

  kj::UnixEventPort::captureChildExit();
  auto io = kj::setupAsyncIo();
  kj::Timer& timer = io.provider->getTimer();
  Unix sandbox(io.lowLevelProvider.get(), &io.unixEventPort, &timer);
  executor::Executor executor(config, &sandbox, &timer);

  auto promise = executor.Execute(code);
  auto error = kj::runCatchingExceptions([&]() {
    kj::String json = server::EncodeResult(promise.wait(io.waitScope));
    kj::FdOutputStream out(STDOUT_FILENO);
    out.write(json.begin(), json.size());
    out.write("\n", 1);
  });
  KJ_IF_MAYBE(exception, error) {
    return kj::str(exception->getDescription());
  }
  return true;
}

kj::MainFunc Main::getMain() {
  kj::MainBuilder builder(context, "Execbox Run (" EXECBOX_VERSION ")",
                          "Runs a file in the sandbox and prints the result "
                          "as JSON");
  return executor::AddExecutionOptions(builder)
      .expectArg("<FILE>", KJ_BIND_METHOD(*this, SetFile))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace sandbox
