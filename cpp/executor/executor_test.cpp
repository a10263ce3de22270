#include "executor/executor.hpp"
#include <dirent.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/unix.hpp"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/execbox_testdir";

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StartsWith;

std::vector<std::string> listDir(const std::string& path) {
  std::vector<std::string> names;
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return names;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") names.push_back(name);
  }
  closedir(dir);
  return names;
}

class ExecutorTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() { kj::UnixEventPort::captureChildExit(); }

  ExecutorTest() {
    config_.interpreter = FAKE_INTERPRETER;
    config_.workspace_directory = tmpdir_.Path();
    config_.timeout_millis = 5000;
  }

  sandbox::ExecutionResult Execute(const std::string& code) {
    executor::Executor executor(config_, &sandbox_, &timer_);
    return executor.Execute(code).wait(io_.waitScope);
  }

  // Runs code that is expected to fail and returns the error description.
  std::string ExecuteError(const std::string& code) {
    executor::Executor executor(config_, &sandbox_, &timer_);
    auto promise = executor.Execute(code);
    auto error =
        kj::runCatchingExceptions([&]() { promise.wait(io_.waitScope); });
    KJ_IF_MAYBE(exc, error) {
      return exc->getDescription().cStr();
    }
    ADD_FAILURE() << "execution did not fail";
    return "";
  }

  kj::AsyncIoContext io_ = kj::setupAsyncIo();
  kj::Timer& timer_ = io_.provider->getTimer();
  sandbox::Unix sandbox_{io_.lowLevelProvider.get(), &io_.unixEventPort,
                         &timer_};
  util::TempDir tmpdir_{test_tmpdir};
  executor::Config config_;
};

int ExitCode(const sandbox::ExecutionResult& result) {
  KJ_IF_MAYBE(code, result.exit_code) { return *code; }
  ADD_FAILURE() << "no exit code";
  return -1;
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, QuickExit) {
  auto result = Execute("out مرحبا\n");
  EXPECT_EQ(ExitCode(result), 0);
  EXPECT_EQ(result.stdout_data, "مرحبا\n");
  EXPECT_EQ(result.stderr_data, "");
  EXPECT_THAT(listDir(tmpdir_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, PassesWorkspaceAndRestrictions) {
  auto result = Execute("args\n");
  std::string expected = std::string(FAKE_INTERPRETER) + "\n" +
                         tmpdir_.Path() + "/exec-";
  EXPECT_THAT(result.stdout_data, StartsWith(expected));
  EXPECT_THAT(result.stdout_data,
              HasSubstr(".قتام\n" + config_.restrictions.ToArgument() + "\n"));
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, NoRestrictionArgumentWhenNothingIsDisabled) {
  config_.restrictions =
      sandbox::CapabilityRestrictions(std::vector<std::string>());
  auto result = Execute("args\n");
  EXPECT_THAT(result.stdout_data, HasSubstr(".قتام\n"));
  EXPECT_THAT(result.stdout_data, ::testing::EndsWith(".قتام\n"));
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, NonZeroExit) {
  auto result = Execute("err failed\nexit 3\n");
  EXPECT_EQ(ExitCode(result), 3);
  EXPECT_EQ(result.stderr_data, "failed\n");
  EXPECT_THAT(listDir(tmpdir_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, InfiniteLoopIsKilledAtTimeout) {
  config_.timeout_millis = 200;
  auto start = timer_.now();
  auto result = Execute("out before\nloop\n");
  auto elapsed = (timer_.now() - start) / kj::MILLISECONDS;
  EXPECT_TRUE(result.exit_code == nullptr);
  EXPECT_TRUE(result.killed);
  EXPECT_EQ(result.stdout_data, "before\n");
  EXPECT_GE(elapsed, 200);
  EXPECT_LT(elapsed, 2000);
  EXPECT_THAT(listDir(tmpdir_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, SpawnFailureRemovesWorkspace) {
  config_.interpreter = tmpdir_.Path() + "/missing-interpreter";
  EXPECT_THAT(ExecuteError("out hello\n"), StartsWith("spawn "));
  EXPECT_THAT(listDir(tmpdir_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, WriteFailureDoesNotSpawn) {
  config_.workspace_directory = tmpdir_.Path() + "/missing";
  EXPECT_THAT(ExecuteError("out hello\n"), HasSubstr("Create "));
  EXPECT_THAT(listDir(tmpdir_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, CancellationRemovesWorkspace) {
  executor::Executor executor(config_, &sandbox_, &timer_);
  {
    auto promise = executor.Execute("loop\n");
    timer_.afterDelay(100 * kj::MILLISECONDS).wait(io_.waitScope);
    EXPECT_EQ(listDir(tmpdir_.Path()).size(), 1u);
  }
  EXPECT_THAT(listDir(tmpdir_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, ConcurrentExecutionsAreIsolated) {
  const size_t kExecutions = 16;
  executor::Executor executor(config_, &sandbox_, &timer_);
  auto promises =
      kj::heapArrayBuilder<kj::Promise<sandbox::ExecutionResult>>(kExecutions);
  for (size_t i = 0; i < kExecutions; i++) {
    std::string id = std::to_string(i);
    promises.add(executor.Execute("sleep 20\nout stdout " + id +
                                  "\nerr stderr " + id + "\nexit " + id +
                                  "\n"));
  }
  auto results = kj::joinPromises(promises.finish()).wait(io_.waitScope);
  ASSERT_EQ(results.size(), kExecutions);
  for (size_t i = 0; i < kExecutions; i++) {
    std::string id = std::to_string(i);
    EXPECT_EQ(ExitCode(results[i]), static_cast<int>(i));
    EXPECT_EQ(results[i].stdout_data, "stdout " + id + "\n");
    EXPECT_EQ(results[i].stderr_data, "stderr " + id + "\n");
  }
  EXPECT_THAT(listDir(tmpdir_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, EveryDisabledBuiltinIsRefused) {
  for (const std::string& name :
       sandbox::CapabilityRestrictions::DefaultBuiltins()) {
    auto result = Execute("call " + name + "\nout unreachable\n");
    EXPECT_EQ(ExitCode(result), 1) << name;
    EXPECT_EQ(result.stderr_data, "disallowed: " + name + "\n");
    EXPECT_EQ(result.stdout_data, "");
  }
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, AllowedBuiltinRuns) {
  auto result = Execute("call اطبع\n");
  EXPECT_EQ(ExitCode(result), 0);
  EXPECT_EQ(result.stdout_data, "called اطبع\n");
}

}  // namespace
