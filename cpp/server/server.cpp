#include "server/server.hpp"

#include <kj/debug.h>

#include "executor/report.hpp"
#include "server/protocol.hpp"
#include "util/version.hpp"
#include "util/worker_thread.hpp"

namespace server {

namespace {
kj::StringPtr StatusText(uint32_t status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 422:
      return "Unprocessable Entity";
    default:
      return "Internal Server Error";
  }
}
}  // namespace

kj::Promise<void> Server::request(kj::HttpMethod method, kj::StringPtr url,
                                  const kj::HttpHeaders& /*headers*/,
                                  kj::AsyncInputStream& request_body,
                                  Response& response) {
  std::string path(url.cStr());
  path = path.substr(0, path.find('?'));
  KJ_LOG(INFO, "HTTP request", method, path);

  if (path == "/") {
    if (method != kj::HttpMethod::GET) {
      return Send(response, 405, ErrorBody("Method Not Allowed"), "GET");
    }
    return Root(response);
  }
  if (path == "/api/v1/execute") {
    if (method != kj::HttpMethod::POST) {
      return Send(response, 405, ErrorBody("Method Not Allowed"), "POST");
    }
    return Execute(request_body, response);
  }
  if (path == "/health") {
    if (method != kj::HttpMethod::GET) {
      return Send(response, 405, ErrorBody("Method Not Allowed"), "GET");
    }
    return Health(response);
  }
  return Send(response, 404, ErrorBody("Not Found"));
}

kj::Promise<void> Server::Root(Response& response) {
  return Send(response, 200,
              {{"message", "Python Execution Agent API"},
               {"version", util::version}});
}

kj::Promise<void> Server::Execute(kj::AsyncInputStream& request_body,
                                  Response& response) {
  return request_body.readAllText().then(
      [this, &response](kj::String text) -> kj::Promise<void> {
        executor::ExecutionRequest request;
        ProtocolError error;
        if (!ParseExecuteRequest(std::string(text.begin(), text.size()),
                                 &request, &error)) {
          KJ_LOG(INFO, "Rejected execution request", error.status);
          return Send(response, error.status, error.body);
        }
        KJ_LOG(INFO, "Received execution request", request.timeout_seconds);
        return service_.Execute(kj::mv(request))
            .then(
                [this, &response](executor::ExecutionResponse result) {
                  return Send(response, 200,
                              executor::ResponseToJson(result));
                },
                [this, &response](kj::Exception exc) {
                  KJ_LOG(ERROR, "Error in execute endpoint",
                         exc.getDescription());
                  return Send(response, 500,
                              ErrorBody(std::string("Failed to execute code: ") +
                                        exc.getDescription().cStr()));
                });
      });
}

kj::Promise<void> Server::Health(Response& response) {
  return util::RunInThread<nlohmann::json>(io_, [this]() {
           return health_.Check();
         }).then([this, &response](nlohmann::json report) {
    return Send(response, 200, report);
  });
}

kj::Promise<void> Server::Send(Response& response, uint32_t status,
                               const nlohmann::json& body,
                               kj::StringPtr allow) {
  std::string dumped = executor::Dump(body);
  kj::String text = kj::heapString(dumped.data(), dumped.size());
  kj::HttpHeaders headers(table_);
  headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
  headers.add("Access-Control-Allow-Origin", "*");
  if (allow.size() != 0) headers.add("Allow", allow);
  auto stream = response.send(status, StatusText(status), headers,
                              uint64_t(text.size()));
  auto promise = stream->write(text.begin(), text.size());
  return promise.attach(kj::mv(stream), kj::mv(text));
}

}  // namespace server
