#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include <cstdint>
#include <string>

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <nlohmann/json.hpp>

#include "executor/execution_service.hpp"
#include "server/health.hpp"

namespace server {

// The HTTP front end of the engine:
//   GET  /                 name and version
//   POST /api/v1/execute   runs a program
//   GET  /health           diagnostics
class Server : public kj::HttpService {
 public:
  Server(executor::ExecutionService* service, const HealthChecker* health,
         kj::LowLevelAsyncIoProvider& io, const kj::HttpHeaderTable& table)
      : service_(*service), health_(*health), io_(io), table_(table) {}

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers,
                            kj::AsyncInputStream& request_body,
                            Response& response) override;

 private:
  kj::Promise<void> Root(Response& response);
  kj::Promise<void> Execute(kj::AsyncInputStream& request_body,
                            Response& response);
  kj::Promise<void> Health(Response& response);
  kj::Promise<void> Send(Response& response, uint32_t status,
                         const nlohmann::json& body,
                         kj::StringPtr allow = "");

  executor::ExecutionService& service_;
  const HealthChecker& health_;
  kj::LowLevelAsyncIoProvider& io_;
  const kj::HttpHeaderTable& table_;
};

}  // namespace server

#endif
