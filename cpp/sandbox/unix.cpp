#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

#include <kj/debug.h>

#include "util/misc.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kReadBufSize = 16 * 1024;

kj::Exception SpawnError(const std::string& what, int err) {
  char buf[kStrErrorBufSize] = {};
  return kj::Exception(
      kj::Exception::Type::FAILED, __FILE__, __LINE__,
      kj::str("spawn ", what.c_str(), ": ",
              mystrerror(err, buf, kStrErrorBufSize)));  // NOLINT
}

#define SPAWN_CHECK(call, what)                                    \
  do {                                                             \
    int ret = (call);                                              \
    if (ret != 0) kj::throwFatalException(SpawnError(what, ret));  \
  } while (0)

struct Pipe {
  kj::AutoCloseFd read;
  kj::AutoCloseFd write;
};

Pipe MakePipe() {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {  // NOLINT
    kj::throwFatalException(SpawnError("pipe2", errno));
  }
  return {kj::AutoCloseFd(fds[0]), kj::AutoCloseFd(fds[1])};
}

// Owns the child until it is reaped. kj clears pid_ when it reaps the child
// for the exit promise; if that promise goes away first, the destructor kills
// the child and reaps it. The child leads its own process group, whose id
// stays valid for as long as any descendant is still in it.
class ChildProcess {
 public:
  explicit ChildProcess(pid_t pid) : pid_(pid), group_(pid) {}
  ~ChildProcess() {
    KJ_IF_MAYBE(pid, pid_) {
      Kill();
      int status = 0;
      while (waitpid(*pid, &status, 0) == -1 && errno == EINTR) {
      }
    }
  }
  KJ_DISALLOW_COPY(ChildProcess);

  void Kill() {
    KJ_IF_MAYBE(pid, pid_) {
      if (kill(-*pid, SIGKILL) == -1 && errno != ESRCH) {
        char buf[kStrErrorBufSize] = {};
        KJ_LOG(ERROR, "kill", *pid, mystrerror(errno, buf, kStrErrorBufSize));
      }
      killed_ = true;
    }
  }

  // Kills what is left of the process group, also after the child has been
  // reaped. An empty group is not an error.
  void KillGroup() {
    if (kill(-group_, SIGKILL) == -1 && errno != ESRCH) {
      char buf[kStrErrorBufSize] = {};
      KJ_LOG(ERROR, "kill", -group_, mystrerror(errno, buf, kStrErrorBufSize));
    }
  }

  kj::Maybe<pid_t>& Pid() { return pid_; }
  bool Killed() const { return killed_; }

 private:
  kj::Maybe<pid_t> pid_;
  pid_t group_;
  bool killed_ = false;
};

// Reads a stream until EOF, keeping at most limit bytes.
class OutputCollector {
 public:
  OutputCollector(kj::Own<kj::AsyncInputStream> stream, size_t limit)
      : stream_(kj::mv(stream)), limit_(limit) {}
  KJ_DISALLOW_COPY(OutputCollector);

  kj::Promise<void> Drain() {
    return stream_->tryRead(buffer_, 1, kReadBufSize)
        .then([this](size_t amount) -> kj::Promise<void> {
          if (amount == 0) return kj::READY_NOW;
          size_t keep = std::min(amount, limit_ - data_.size());
          data_.append(buffer_, keep);
          if (keep < amount) truncated_ = true;
          return Drain();
        });
  }

  // Returns what was read so far, as valid UTF-8.
  std::string Take() { return util::toValidUtf8(data_); }
  bool Truncated() const { return truncated_; }

 private:
  kj::Own<kj::AsyncInputStream> stream_;
  size_t limit_;
  std::string data_;
  bool truncated_ = false;
  char buffer_[kReadBufSize];
};

}  // namespace

namespace sandbox {

kj::Promise<ExecutionResult> Unix::Run(const Command& command,
                                       kj::Promise<void> cancel) {
  Pipe out = MakePipe();
  Pipe err = MakePipe();

  posix_spawn_file_actions_t actions;
  SPAWN_CHECK(posix_spawn_file_actions_init(&actions), "file actions");
  KJ_DEFER(posix_spawn_file_actions_destroy(&actions));
  SPAWN_CHECK(posix_spawn_file_actions_addopen(&actions, STDIN_FILENO,
                                               "/dev/null", O_RDONLY, 0),
              "stdin");
  SPAWN_CHECK(posix_spawn_file_actions_adddup2(&actions, out.write.get(),
                                               STDOUT_FILENO),
              "stdout");
  SPAWN_CHECK(posix_spawn_file_actions_adddup2(&actions, err.write.get(),
                                               STDERR_FILENO),
              "stderr");

  // The event loop blocks SIGCHLD and ignores SIGPIPE; the child should do
  // neither.
  posix_spawnattr_t attr;
  SPAWN_CHECK(posix_spawnattr_init(&attr), "attributes");
  KJ_DEFER(posix_spawnattr_destroy(&attr));
  sigset_t mask;
  sigemptyset(&mask);
  SPAWN_CHECK(posix_spawnattr_setsigmask(&attr, &mask), "signal mask");
  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGPIPE);
  sigaddset(&defaults, SIGCHLD);
  SPAWN_CHECK(posix_spawnattr_setsigdefault(&attr, &defaults),
              "signal defaults");
  SPAWN_CHECK(posix_spawnattr_setpgroup(&attr, 0), "process group");
  SPAWN_CHECK(posix_spawnattr_setflags(
                  &attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK |
                             POSIX_SPAWN_SETSIGDEF),
              "flags");

  std::vector<std::vector<char>> args;
  auto add_arg = [&args](const std::string& s) {
    std::vector<char> arg(s.size() + 1);
    std::copy(s.begin(), s.end(), arg.begin());
    arg.back() = '\0';
    args.push_back(std::move(arg));
  };
  add_arg(command.executable);
  for (const std::string& arg : command.args) add_arg(arg);
  std::vector<char*> args_list(args.size() + 1);
  for (size_t i = 0; i < args.size(); i++) args_list[i] = args[i].data();
  args_list.back() = nullptr;
  char* environment[] = {nullptr};

  pid_t pid = 0;
  SPAWN_CHECK(posix_spawn(&pid, command.executable.c_str(), &actions, &attr,
                          args_list.data(), environment),
              command.executable);
  auto child = kj::heap<ChildProcess>(pid);
  KJ_LOG(INFO, "Spawned", command.executable.c_str(), pid);

  // Only the child may keep the write ends open, or we never see EOF.
  out.write = nullptr;
  err.write = nullptr;
  const kj::uint flags = kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
                     kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC;
  auto stdout_collector = kj::heap<OutputCollector>(
      io_.wrapInputFd(out.read.release(), flags), command.max_output_bytes);
  auto stderr_collector = kj::heap<OutputCollector>(
      io_.wrapInputFd(err.read.release(), flags), command.max_output_bytes);

  auto drains = kj::heapArrayBuilder<kj::Promise<void>>(2);
  drains.add(stdout_collector->Drain());
  drains.add(stderr_collector->Drain());
  auto drained = kj::joinPromises(drains.finish()).eagerlyEvaluate(nullptr);

  ChildProcess& process = *child;
  auto cancelled = cancel.fork();
  auto killer = cancelled.addBranch().then([&process]() -> kj::Promise<int> {
    process.Kill();
    return kj::NEVER_DONE;
  });
  auto cancelled_after_exit = cancelled.addBranch();

  auto start = timer_.now();
  int64_t grace = command.drain_grace_millis;
  OutputCollector& stdout_ref = *stdout_collector;
  OutputCollector& stderr_ref = *stderr_collector;
  return event_port_.onChildExit(process.Pid())
      .exclusiveJoin(kj::mv(killer))
      .then([this, &process, &stdout_ref, &stderr_ref, start, grace,
             drained = kj::mv(drained),
             cancelled_after_exit =
                 kj::mv(cancelled_after_exit)](int status) mutable {
        ExecutionResult result;
        result.wall_time_millis = (timer_.now() - start) / kj::MILLISECONDS;
        if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
        if (WIFSIGNALED(status)) result.signal = WTERMSIG(status);
        result.killed = process.Killed() && result.signal == SIGKILL;
        // The streams normally hit EOF right after the exit, unless a
        // descendant inherited them. Such descendants are killed when the
        // grace period ends or the run is cancelled, whichever comes first.
        auto give_up = timer_.afterDelay(grace * kj::MILLISECONDS)
                           .then([&process]() {
                             KJ_LOG(WARNING,
                                    "Output still open after exit, killing "
                                    "the process group");
                             process.KillGroup();
                           });
        auto cancel_descendants =
            cancelled_after_exit.then([&process]() -> kj::Promise<void> {
              process.KillGroup();
              return kj::NEVER_DONE;
            });
        return drained.exclusiveJoin(kj::mv(give_up))
            .exclusiveJoin(kj::mv(cancel_descendants))
            .then([&stdout_ref, &stderr_ref,
                   result = kj::mv(result)]() mutable {
              result.stdout_data = stdout_ref.Take();
              result.stderr_data = stderr_ref.Take();
              result.stdout_truncated = stdout_ref.Truncated();
              result.stderr_truncated = stderr_ref.Truncated();
              return kj::mv(result);
            });
      })
      .attach(kj::mv(stdout_collector), kj::mv(stderr_collector),
              kj::mv(child));
}

}  // namespace sandbox
