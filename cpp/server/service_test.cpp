#include "server/service.hpp"
#include <dirent.h>
#include <fstream>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/unix.hpp"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/execbox_testdir";

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

struct Reply {
  kj::uint status = 0;
  std::string content_type;
  std::string location;
  std::string body;
};

class ServiceTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() { kj::UnixEventPort::captureChildExit(); }

  ServiceTest() {
    config_.interpreter = FAKE_INTERPRETER;
    config_.workspace_directory = workspace_.Path();
    config_.timeout_millis = 300;
  }

  Reply Send(kj::HttpMethod method, kj::StringPtr url,
             const std::string& body = "") {
    auto client = kj::newHttpClient(service_);
    kj::HttpHeaders headers(table_);
    kj::Maybe<uint64_t> length;
    if (method == kj::HttpMethod::POST) length = body.size();
    auto request = client->request(method, url, headers, length);
    auto body_stream = kj::mv(request.body);
    auto write = body_stream->write(body.data(), body.size())
                     .then([&body_stream]() { body_stream = nullptr; })
                     .eagerlyEvaluate(nullptr);
    auto response = request.response.wait(io_.waitScope);
    Reply reply;
    reply.status = response.statusCode;
    auto content_type = response.headers->get(kj::HttpHeaderId::CONTENT_TYPE);
    KJ_IF_MAYBE(type, content_type) { reply.content_type = type->cStr(); }
    response.headers->forEach([&reply](kj::StringPtr name,
                                       kj::StringPtr value) {
      if (name == "Location") reply.location = value.cStr();
    });
    reply.body = response.body->readAllText().wait(io_.waitScope).cStr();
    return reply;
  }

  Reply Execute(const std::string& body) {
    return Send(kj::HttpMethod::POST, "/execute", body);
  }

  kj::AsyncIoContext io_ = kj::setupAsyncIo();
  kj::Timer& timer_ = io_.provider->getTimer();
  sandbox::Unix sandbox_{io_.lowLevelProvider.get(), &io_.unixEventPort,
                         &timer_};
  util::TempDir workspace_{test_tmpdir};
  util::TempDir site_{test_tmpdir};
  executor::Config config_;
  executor::Executor executor_{config_, &sandbox_, &timer_};
  kj::HttpHeaderTable table_;
  server::Service service_{&executor_, &table_, site_.Path(), 256};
};

// NOLINTNEXTLINE
TEST_F(ServiceTest, QuickExit) {
  auto reply = Execute(R"({"code": "out hello\nerr warn\n"})");
  EXPECT_EQ(reply.status, 200u);
  EXPECT_EQ(reply.content_type, "application/json");
  EXPECT_EQ(reply.body,
            R"({"exitCode":0,"stdout":"hello\n","stderr":"warn\n"})");
  EXPECT_THAT(listDir(workspace_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, NonZeroExit) {
  auto reply = Execute(R"({"code": "exit 7\n"})");
  EXPECT_EQ(reply.status, 200u);
  EXPECT_EQ(reply.body, R"({"exitCode":7,"stdout":"","stderr":""})");
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, InfiniteLoop) {
  auto start = timer_.now();
  auto reply = Execute(R"({"code": "out started\nloop\n"})");
  auto elapsed = (timer_.now() - start) / kj::MILLISECONDS;
  EXPECT_EQ(reply.status, 200u);
  EXPECT_EQ(reply.body,
            R"({"exitCode":null,"stdout":"started\n","stderr":""})");
  EXPECT_LT(elapsed, 2000);
  EXPECT_THAT(listDir(workspace_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, DisabledBuiltin) {
  auto reply = Execute(R"({"code": "call البيئة\n"})");
  EXPECT_EQ(reply.status, 200u);
  EXPECT_EQ(reply.body,
            R"({"exitCode":1,"stdout":"","stderr":"disallowed: البيئة\n"})");
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, InvalidShapes) {
  for (const char* body :
       {"", "nope", "[]", "{}", R"({"code": 1})", R"({"code": null})",
        R"({"code": "out x", "extra": true})", R"({"Code": "out x"})",
        R"({"code": "out x", "code": "out y"})"}) {
    auto reply = Execute(body);
    EXPECT_EQ(reply.status, 400u) << body;
    EXPECT_EQ(reply.body, "Invalid request");
    EXPECT_THAT(reply.content_type, StartsWith("text/plain"));
  }
  EXPECT_THAT(listDir(workspace_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, RequestTooLarge) {
  auto reply = Execute(R"({"code": ")" + std::string(1000, 'x') + R"("})");
  EXPECT_EQ(reply.status, 413u);
  EXPECT_THAT(listDir(workspace_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, SpawnFailure) {
  config_.interpreter = workspace_.Path() + "/missing";
  auto reply = Execute(R"({"code": "out x\n"})");
  EXPECT_EQ(reply.status, 500u);
  EXPECT_THAT(reply.body, StartsWith("spawn "));
  EXPECT_THAT(listDir(workspace_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, WriteFailure) {
  config_.workspace_directory = workspace_.Path() + "/missing";
  auto reply = Execute(R"({"code": "out x\n"})");
  EXPECT_EQ(reply.status, 500u);
  EXPECT_THAT(listDir(workspace_.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, WrongMethod) {
  auto reply = Send(kj::HttpMethod::GET, "/execute");
  EXPECT_EQ(reply.status, 405u);
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, StaticFiles) {
  std::ofstream(site_.Path() + "/index.html") << "<html></html>";
  std::ofstream(site_.Path() + "/app.js") << "run();";

  auto index = Send(kj::HttpMethod::GET, "/");
  EXPECT_EQ(index.status, 200u);
  EXPECT_EQ(index.body, "<html></html>");
  EXPECT_THAT(index.content_type, StartsWith("text/html"));

  auto script = Send(kj::HttpMethod::GET, "/app.js?v=1");
  EXPECT_EQ(script.status, 200u);
  EXPECT_EQ(script.body, "run();");

  EXPECT_EQ(Send(kj::HttpMethod::GET, "/missing.css").status, 404u);
  EXPECT_EQ(Send(kj::HttpMethod::GET, "/../index.html").status, 404u);
  EXPECT_EQ(Send(kj::HttpMethod::POST, "/index.html").status, 404u);
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, DirectoryWithoutSlashRedirects) {
  util::File::MakeDirs(site_.Path() + "/docs");
  std::ofstream(site_.Path() + "/docs/index.html") << "docs";

  auto redirect = Send(kj::HttpMethod::GET, "/docs?lang=ar");
  EXPECT_EQ(redirect.status, 301u);
  EXPECT_EQ(redirect.location, "/docs/?lang=ar");

  auto index = Send(kj::HttpMethod::GET, "/docs/");
  EXPECT_EQ(index.status, 200u);
  EXPECT_EQ(index.body, "docs");
}

// NOLINTNEXTLINE
TEST_F(ServiceTest, ConcurrentRequests) {
  auto client = kj::newHttpClient(service_);
  kj::HttpHeaders headers(table_);
  const int kRequests = 8;
  auto responses = kj::heapArrayBuilder<kj::Promise<kj::String>>(kRequests);
  for (int i = 0; i < kRequests; i++) {
    kj::String body = kj::str(R"({"code": "sleep 50\nout )", i, R"(\n"})");
    auto request = client->request(kj::HttpMethod::POST, "/execute", headers,
                                   static_cast<uint64_t>(body.size()));
    auto stream = kj::mv(request.body);
    auto write = stream->write(body.begin(), body.size());
    responses.add(write.attach(kj::mv(stream), kj::mv(body))
                      .then([response = kj::mv(request.response)]() mutable {
                        return kj::mv(response);
                      })
                      .then([](kj::HttpClient::Response&& response) {
                        auto text = response.body->readAllText();
                        return text.attach(kj::mv(response.body));
                      }));
  }
  auto bodies = kj::joinPromises(responses.finish()).wait(io_.waitScope);
  for (int i = 0; i < kRequests; i++) {
    EXPECT_EQ(std::string(bodies[i].cStr()),
              R"({"exitCode":0,"stdout":")" + std::to_string(i) +
                  R"(\n","stderr":""})");
  }
  EXPECT_THAT(listDir(workspace_.Path()), IsEmpty());
}

}  // namespace
