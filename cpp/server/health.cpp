#include "server/health.hpp"

#include <cmath>
#include <cstdio>

#include <kj/debug.h>

#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace server {

constexpr const char* HealthChecker::kDefaultProbe;
constexpr double HealthChecker::kMinFreeGb;
constexpr int64_t HealthChecker::kProbeMillis;

namespace {
std::string Trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

nlohmann::json Error(const std::string& error, bool* healthy) {
  *healthy = false;
  return {{"status", "error"}, {"error", error}};
}
}  // namespace

nlohmann::json HealthChecker::Check() const {
  bool healthy = true;
  nlohmann::json checks = {
      {"interpreter", CheckInterpreter(&healthy)},
      {"subprocess_creation", CheckSubprocess(&healthy)},
      {"temp_directory", CheckTempDirectory(&healthy)},
      {"disk_space", CheckDiskSpace(&healthy)},
  };
  if (!healthy) KJ_LOG(WARNING, "Health check failed", checks.dump());
  return {{"status", healthy ? "healthy" : "unhealthy"},
          {"timestamp", util::IsoTimestamp()},
          {"checks", checks}};
}

nlohmann::json HealthChecker::CheckInterpreter(bool* healthy) const {
  std::string path;
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                       [&]() { path = util::which(config_.interpreter); })) {
    return Error(exc->getDescription().cStr(), healthy);
  }
  if (path.empty()) {
    return Error("Interpreter not found: " + config_.interpreter, healthy);
  }
  return {{"status", "ok"}, {"path", path}};
}

nlohmann::json HealthChecker::CheckSubprocess(bool* healthy) const {
  std::unique_ptr<sandbox::ProcessRunner> runner = factory_();
  if (!runner) return Error("No process runner available", healthy);
  sandbox::ExecutionOptions options;
  options.interpreter = config_.interpreter;
  options.code = probe_;
  options.wall_limit_millis = kProbeMillis;
  options.memory_limit_mb = config_.max_memory_mb;
  options.cpu_limit_seconds = config_.max_cpu_seconds;
  options.max_files = config_.max_files;
  options.max_output_bytes = 4096;
  options.environment = sandbox::BuildEnvironment(config_.temp_root);
  sandbox::RawResult raw = runner->Run(options);
  if (raw.timed_out) return Error("Subprocess creation timeout", healthy);
  KJ_IF_MAYBE(code, raw.exit_code) {
    if (*code != 0) {
      return Error(
          "Subprocess returned non-zero code: " + std::to_string(*code),
          healthy);
    }
    return {{"status", "ok"},
            {"message", "Can create and execute subprocesses"},
            {"version", Trim(raw.stdout_data)}};
  }
  return Error("Cannot create subprocesses: " + raw.stderr_data, healthy);
}

nlohmann::json HealthChecker::CheckTempDirectory(bool* healthy) const {
  sandbox::Sandbox box("health_check", config_.temp_root);
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() { box.Create(); })) {
    return Error(std::string("Cannot create temporary directories: ") +
                     exc->getDescription().cStr(),
                 healthy);
  }
  std::string path = box.Path();
  box.Cleanup();
  if (util::File::Exists(path)) {
    return Error("Temporary directory was not removed", healthy);
  }
  return {{"status", "ok"}, {"message", "Can create temporary directories"}};
}

nlohmann::json HealthChecker::CheckDiskSpace(bool* healthy) const {
  int64_t free_bytes = util::File::FreeSpace(config_.temp_root);
  if (free_bytes < 0) {
    return {{"status", "warning"},
            {"error", "Could not check disk space: " + config_.temp_root}};
  }
  double free_gb = free_bytes / (1024.0 * 1024.0 * 1024.0);
  char message[128] = {};
  snprintf(message, sizeof(message),
           "Available disk space in temp directory: %.2f GB", free_gb);
  bool enough = free_gb >= kMinFreeGb;
  if (!enough) *healthy = false;
  return {{"status", enough ? "ok" : "warning"},
          {"free_space_gb", std::round(free_gb * 100) / 100},
          {"message", message}};
}

}  // namespace server
