#include "server/main.hpp"

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/compat/http.h>
#include <kj/debug.h>

#include "executor/executor.hpp"
#include "executor/options.hpp"
#include "sandbox/unix.hpp"
#include "server/service.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace server {
kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context);
  kj::Maybe<executor::Config> maybe_config;
  auto validity = executor::LoadConfig(&maybe_config);
  if (validity.getError() != nullptr) return validity;
  const executor::Config& config = KJ_ASSERT_NONNULL(maybe_config);

  // Must happen before the event loop exists.
  kj::UnixEventPort::captureChildExit();
  auto io = kj::setupAsyncIo();
  kj::Timer& timer = io.provider->getTimer();
  sandbox::Unix sandbox(io.lowLevelProvider.get(), &io.unixEventPort, &timer);
  executor::Executor executor(config, &sandbox, &timer);

  kj::HttpHeaderTable table;
  Service service(&executor, &table, Flags::static_directory,
                  Flags::max_request_bytes);
  kj::HttpServer http(timer, table, service);

  auto address = io.provider->getNetwork()
                     .parseAddress(Flags::listen_address, Flags::port)
                     .wait(io.waitScope);
  auto listener = address->listen();
  context.warning(kj::str("Listening on http://", Flags::listen_address.c_str(),
                          ":", listener->getPort()));
  KJ_LOG(INFO, "Listening", address->toString(), listener->getPort());
  http.listenHttp(*listener).wait(io.waitScope);
  return true;
}

kj::MainFunc Main::getMain() {
  kj::MainBuilder builder(context, "Execbox Server (" EXECBOX_VERSION ")",
                          "Runs code posted to /execute in the sandbox");
  return executor::AddExecutionOptions(builder)
      .addOptionWithArg({'l', "address"},
                        util::setString(Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::port, 0, 65535),
                        "<PORT>", "Port to listen on")
      .addOptionWithArg({'s', "static-dir"},
                        util::setString(Flags::static_directory), "<DIR>",
                        "Serve the files in this directory")
      .addOptionWithArg({"max-request"},
                        util::setInt(Flags::max_request_bytes, 1, 1 << 30),
                        "<BYTES>", "Largest accepted request body")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace server
