#ifndef SERVER_SERVICE_HPP
#define SERVER_SERVICE_HPP

#include <string>

#include <kj/compat/http.h>

#include "executor/executor.hpp"

namespace server {

// The HTTP front end. POST /execute runs the "code" member of a JSON body
// and answers with the JSON encoded result. Any other GET or HEAD request is
// served from static_directory, if one is set.
class Service : public kj::HttpService {
 public:
  Service(executor::Executor* executor, const kj::HttpHeaderTable* table,
          std::string static_directory, size_t max_request_bytes)
      : executor_(*executor),
        table_(*table),
        static_directory_(std::move(static_directory)),
        max_request_bytes_(max_request_bytes) {}

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers,
                            kj::AsyncInputStream& requestBody,
                            Response& response) override;

 private:
  kj::Promise<void> Execute(kj::AsyncInputStream& body, Response& response);
  kj::Promise<void> ServeStatic(kj::StringPtr url, Response& response);

  // Sends a complete response and logs it.
  kj::Promise<void> Reply(Response& response, kj::uint status,
                          kj::StringPtr content_type, kj::String body,
                          kj::StringPtr location = nullptr);

  executor::Executor& executor_;
  const kj::HttpHeaderTable& table_;
  std::string static_directory_;
  size_t max_request_bytes_;
};

}  // namespace server

#endif
