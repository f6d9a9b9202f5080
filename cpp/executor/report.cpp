#include "executor/report.hpp"

#include <algorithm>

namespace executor {

int32_t ClampTimeout(int64_t timeout) {
  return static_cast<int32_t>(
      std::max<int64_t>(kMinTimeout, std::min<int64_t>(kMaxTimeout, timeout)));
}

nlohmann::json ResponseToJson(const ExecutionResponse& response) {
  nlohmann::json out = {
      {"status", StatusName(response.status)},
      {"stdout", response.stdout_data},
      {"stderr", response.stderr_data},
      {"execution_time", response.execution_time_seconds},
      {"return_code", nullptr},
  };
  KJ_IF_MAYBE(code, response.return_code) { out["return_code"] = *code; }
  return out;
}

std::string Dump(const nlohmann::json& body) {
  return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace executor
