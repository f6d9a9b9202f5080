#include "server/protocol.hpp"

#include <algorithm>

#include "executor/report.hpp"

namespace server {

namespace {
// Validation errors are reported in the same shape FastAPI uses.
void Reject(ProtocolError* error, nlohmann::json loc, const std::string& msg,
            const std::string& type) {
  nlohmann::json entry = {{"loc", std::move(loc)}, {"msg", msg}, {"type", type}};
  error->status = 422;
  error->body = {{"detail", nlohmann::json::array({entry})}};
}

void RejectField(ProtocolError* error, const std::string& field,
                 const std::string& msg, const std::string& type) {
  Reject(error, nlohmann::json::array({"body", field}), msg, type);
}
}  // namespace

bool ParseExecuteRequest(const std::string& body,
                         executor::ExecutionRequest* request,
                         ProtocolError* error) {
  nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded()) {
    error->status = 400;
    error->body = ErrorBody("Request body is not valid JSON");
    return false;
  }
  if (!parsed.is_object()) {
    Reject(error, nlohmann::json::array({"body"}),
           "Input should be a valid dictionary", "model_attributes_type");
    return false;
  }

  auto code = parsed.find("code");
  if (code == parsed.end()) {
    RejectField(error, "code", "Field required", "missing");
    return false;
  }
  if (!code->is_string()) {
    RejectField(error, "code", "Input should be a valid string",
                "string_type");
    return false;
  }
  std::string text = code->get<std::string>();
  if (text.empty()) {
    RejectField(error, "code", "String should have at least 1 character",
                "string_too_short");
    return false;
  }

  int64_t timeout = executor::kDefaultTimeout;
  auto value = parsed.find("timeout");
  if (value != parsed.end() && !value->is_null()) {
    if (!value->is_number_integer()) {
      RejectField(error, "timeout", "Input should be a valid integer",
                  "int_type");
      return false;
    }
    if (value->is_number_unsigned()) {
      timeout = std::min<uint64_t>(value->get<uint64_t>(),
                                   executor::kMaxTimeout + 1);
    } else {
      timeout = value->get<int64_t>();
    }
    if (timeout < executor::kMinTimeout) {
      RejectField(error, "timeout",
                  "Input should be greater than or equal to 1",
                  "greater_than_equal");
      return false;
    }
    if (timeout > executor::kMaxTimeout) {
      RejectField(error, "timeout", "Input should be less than or equal to 30",
                  "less_than_equal");
      return false;
    }
  }

  request->code = std::move(text);
  request->timeout_seconds = static_cast<int32_t>(timeout);
  return true;
}

nlohmann::json ErrorBody(const std::string& detail) {
  return {{"detail", detail}};
}

}  // namespace server
