#ifndef EXECUTOR_REPORT_HPP
#define EXECUTOR_REPORT_HPP

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "executor/execution_service.hpp"

namespace executor {

// Accepted wall limits, in seconds.
static const constexpr int32_t kDefaultTimeout = 5;
static const constexpr int32_t kMinTimeout = 1;
static const constexpr int32_t kMaxTimeout = 30;

// Clamps a timeout to the accepted range.
int32_t ClampTimeout(int64_t timeout);

// {"status", "stdout", "stderr", "execution_time", "return_code"}, with a
// null return_code when the program has none.
nlohmann::json ResponseToJson(const ExecutionResponse& response);

// Serializes; invalid UTF-8 in program output is replaced.
std::string Dump(const nlohmann::json& body);

}  // namespace executor

#endif
