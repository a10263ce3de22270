#include "server/service.hpp"

#include <kj/debug.h>

#include "server/protocol.hpp"
#include "server/static_files.hpp"
#include "util/file.hpp"

namespace server {

namespace {
const constexpr char* kExecutePath = "/execute";
const constexpr char* kTextPlain = "text/plain; charset=utf-8";
const constexpr char* kApplicationJson = "application/json";
const constexpr size_t kReadBufSize = 16 * 1024;

kj::StringPtr StatusText(kj::uint status) {
  switch (status) {
    case 200:
      return "OK";
    case 301:
      return "Moved Permanently";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    default:
      return "Internal Server Error";
  }
}

std::string PathOf(kj::StringPtr url) {
  std::string path(url.begin(), url.size());
  return path.substr(0, path.find_first_of("?#"));
}

// Reads a request body, giving up as soon as it is larger than limit.
class BodyReader {
 public:
  BodyReader(kj::AsyncInputStream& stream, size_t limit)
      : stream_(stream), limit_(limit) {}
  KJ_DISALLOW_COPY(BodyReader);

  // Resolves to false if the body is too large.
  kj::Promise<bool> Read() {
    return stream_.tryRead(buffer_, 1, kReadBufSize)
        .then([this](size_t amount) -> kj::Promise<bool> {
          if (amount == 0) return true;
          if (data_.size() + amount > limit_) return false;
          data_.append(buffer_, amount);
          return Read();
        });
  }

  kj::StringPtr Data() const {
    return kj::StringPtr(data_.c_str(), data_.size());
  }

 private:
  kj::AsyncInputStream& stream_;
  size_t limit_;
  std::string data_;
  char buffer_[kReadBufSize];
};
}  // namespace

kj::Promise<void> Service::request(kj::HttpMethod method, kj::StringPtr url,
                                   const kj::HttpHeaders& /*headers*/,
                                   kj::AsyncInputStream& requestBody,
                                   Response& response) {
  KJ_LOG(INFO, "Request", method, url);
  std::string path = PathOf(url);
  if (path == kExecutePath) {
    if (method != kj::HttpMethod::POST) {
      return Reply(response, 405, kTextPlain, kj::str("Use POST"));
    }
    return Execute(requestBody, response);
  }
  if (!static_directory_.empty() &&
      (method == kj::HttpMethod::GET || method == kj::HttpMethod::HEAD)) {
    return ServeStatic(url, response);
  }
  return Reply(response, 404, kTextPlain, kj::str("Not found"));
}

kj::Promise<void> Service::Execute(kj::AsyncInputStream& body,
                                   Response& response) {
  auto expected_length = body.tryGetLength();
  KJ_IF_MAYBE(length, expected_length) {
    if (*length > max_request_bytes_) {
      return Reply(response, 413, kTextPlain, kj::str("Request too large"));
    }
  }
  auto reader = kj::heap<BodyReader>(body, max_request_bytes_);
  BodyReader& reader_ref = *reader;
  return reader_ref.Read()
      .then([this, &response,
             &reader_ref](bool complete) -> kj::Promise<void> {
        if (!complete) {
          return Reply(response, 413, kTextPlain,
                       kj::str("Request too large"));
        }
        auto parsed = ParseExecuteRequest(reader_ref.Data());
        KJ_IF_MAYBE(code, parsed) {
          return executor_.Execute(*code).then(
              [this, &response](sandbox::ExecutionResult result) {
                return Reply(response, 200, kApplicationJson,
                             EncodeResult(result));
              },
              [this, &response](kj::Exception&& exception) {
                KJ_LOG(ERROR, "Execution failed", exception.getDescription());
                return Reply(response, 500, kTextPlain,
                             kj::str(exception.getDescription()));
              });
        }
        return Reply(response, 400, kTextPlain, kj::str("Invalid request"));
      })
      .attach(kj::mv(reader));
}

kj::Promise<void> Service::ServeStatic(kj::StringPtr url, Response& response) {
  auto resolved = ResolveStaticPath(static_directory_, url);
  KJ_IF_MAYBE(path, resolved) {
    if (util::File::IsDirectory(*path)) {
      // "/docs" names a directory: send the browser to "/docs/" so that
      // relative links in its index resolve inside it.
      std::string url_path = PathOf(url);
      std::string location =
          url_path + "/" + std::string(url.begin() + url_path.size());
      return Reply(response, 301, kTextPlain, kj::str("Moved"),
                   location.c_str());
    }
    if (util::File::Exists(*path)) {
      // Static files are small and are read synchronously, blocking the
      // event loop for the duration of the read.
      std::string content = util::File::Read(*path);
      return Reply(response, 200, ContentTypeFor(*path),
                   kj::heapString(content.data(), content.size()));
    }
  }
  return Reply(response, 404, kTextPlain, kj::str("Not found"));
}

kj::Promise<void> Service::Reply(Response& response, kj::uint status,
                                 kj::StringPtr content_type, kj::String body,
                                 kj::StringPtr location) {
  KJ_LOG(INFO, "Response", status, body.size());
  kj::HttpHeaders headers(table_);
  headers.set(kj::HttpHeaderId::CONTENT_TYPE, content_type);
  if (status == 405) headers.add("Allow", "POST");
  kj::String location_value = kj::heapString(location);
  if (location_value.size() > 0) headers.add("Location", location_value);
  auto stream = response.send(status, StatusText(status), headers, body.size());
  auto promise = stream->write(body.begin(), body.size());
  return promise.attach(kj::mv(stream), kj::mv(body), kj::mv(location_value));
}

}  // namespace server
