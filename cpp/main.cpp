#include "sandbox/main.hpp"
#include "server/main.hpp"
#include "util/version.hpp"

class ExecboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit ExecboxMain(kj::ProcessContext& context)
      : context(context), sm(&context), rm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Execbox (" EXECBOX_VERSION ")",
                           "Runs untrusted code in a sandboxed interpreter")
        .addSubCommand("server", KJ_BIND_METHOD(sm, getMain),
                       "serve POST /execute over HTTP")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run a single file and print the result")
        .build();
  }

 private:
  kj::ProcessContext& context;
  server::Main sm;
  sandbox::Main rm;
};

KJ_MAIN(ExecboxMain);
