#ifndef SERVER_HEALTH_HPP
#define SERVER_HEALTH_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "executor/execution_service.hpp"

namespace server {

// Checks that the engine can run programs: the interpreter exists, a child
// process can be started through the runner, a sandbox can be created and
// the temporary filesystem has space left. Blocks while the probe runs.
class HealthChecker {
 public:
  static const constexpr char* kDefaultProbe =
      "import platform; print(platform.python_version())";
  static const constexpr double kMinFreeGb = 0.1;
  static const constexpr int64_t kProbeMillis = 2000;

  HealthChecker(executor::ExecutionConfig config,
                executor::ExecutionService::RunnerFactory factory,
                std::string probe = kDefaultProbe)
      : config_(std::move(config)),
        factory_(std::move(factory)),
        probe_(std::move(probe)) {}

  // {"status": "healthy"|"unhealthy", "timestamp": ..., "checks": {...}}
  nlohmann::json Check() const;

 private:
  nlohmann::json CheckInterpreter(bool* healthy) const;
  nlohmann::json CheckSubprocess(bool* healthy) const;
  nlohmann::json CheckTempDirectory(bool* healthy) const;
  nlohmann::json CheckDiskSpace(bool* healthy) const;

  const executor::ExecutionConfig config_;
  executor::ExecutionService::RunnerFactory factory_;
  std::string probe_;
};

}  // namespace server

#endif
