#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/timer.h>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs commands as children of the current process, driven by the kj event
// loop of the calling thread. kj::UnixEventPort::captureChildExit() must be
// called before the event loop is set up.
//
// The child gets its own process group, stdin from /dev/null, an empty
// environment and default signal handling. Cancellation sends SIGKILL to the
// whole process group. Both output streams are read while the child runs, so
// a child that writes a lot cannot block on a full pipe.
class Unix : public Sandbox {
 public:
  Unix(kj::LowLevelAsyncIoProvider* io, kj::UnixEventPort* event_port,
       kj::Timer* timer)
      : io_(*io), event_port_(*event_port), timer_(*timer) {}

  kj::Promise<ExecutionResult> Run(const Command& command,
                                   kj::Promise<void> cancel) override;

 private:
  kj::LowLevelAsyncIoProvider& io_;
  kj::UnixEventPort& event_port_;
  kj::Timer& timer_;
};

}  // namespace sandbox

#endif
