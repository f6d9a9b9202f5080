#ifndef SERVER_PROTOCOL_HPP
#define SERVER_PROTOCOL_HPP

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "executor/execution_service.hpp"

namespace server {

// Why a request body was rejected: the HTTP status and the JSON body to
// answer with.
struct ProtocolError {
  uint32_t status = 0;
  nlohmann::json body;
};

// Parses the body of POST /api/v1/execute. Returns false and fills error if
// the body is not valid JSON (400) or does not describe a valid request (422).
bool ParseExecuteRequest(const std::string& body,
                         executor::ExecutionRequest* request,
                         ProtocolError* error);

// {"detail": detail}
nlohmann::json ErrorBody(const std::string& detail);

}  // namespace server

#endif
