#include "sandbox/process_runner.hpp"

#include <chrono>

#include <kj/debug.h>

namespace sandbox {

namespace {
const char* const kSafePath = "/usr/local/bin:/usr/bin:/bin";
const char* const kForwarded[] = {"PYTHONPATH", "PYTHONHOME"};
}  // namespace

std::vector<std::string> BuildEnvironment(const std::string& work_dir,
                                          const EnvLookup& lookup) {
  std::vector<std::string> env = {
      std::string("PATH=") + kSafePath,
      "HOME=" + work_dir,
      "TMPDIR=" + work_dir,
      "TMP=" + work_dir,
      "TEMP=" + work_dir,
      "PYTHONUNBUFFERED=1",
      "PYTHONDONTWRITEBYTECODE=1",
  };
  for (const char* name : kForwarded) {
    const char* value = lookup(name);
    if (value != nullptr) env.push_back(std::string(name) + "=" + value);
  }
  return env;
}

std::string FormatSeconds(int64_t millis) {
  std::string out = std::to_string(millis / 1000);
  int64_t frac = millis % 1000;
  if (frac == 0) return out;
  std::string digits = std::to_string(frac);
  digits = std::string(3 - digits.size(), '0') + digits;
  while (digits.back() == '0') digits.pop_back();
  return out + "." + digits;
}

std::unique_ptr<ProcessRunner> ProcessRunner::Create() {
  static const create_t* best = []() -> const create_t* {
    const create_t* chosen = nullptr;
    int best_score = -1;
    for (const auto& runner : *Runners_()) {
      int score = runner.second();
      if (score > best_score) {
        best_score = score;
        chosen = &runner.first;
      }
    }
    return chosen;
  }();
  if (best == nullptr) return nullptr;
  return std::unique_ptr<ProcessRunner>((*best)());
}

RawResult ProcessRunner::Run(const ExecutionOptions& options) {
  auto start = std::chrono::steady_clock::now();
  RawResult result;
  std::string error_msg;
  bool started = false;
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() {
                started = RunInternal(options, &result, &error_msg);
              })) {
    KJ_LOG(ERROR, "Process supervision failed", exc->getDescription());
    Abort();
    error_msg = exc->getDescription().cStr();
    started = false;
  }
  if (started) return result;
  KJ_LOG(WARNING, "Process not started", error_msg);
  result = RawResult();
  result.stderr_data = "Process execution failed: " + error_msg;
  result.elapsed_seconds = std::chrono::duration<double>(
                               std::chrono::steady_clock::now() - start)
                               .count();
  return result;
}

ProcessRunner::store_t* ProcessRunner::Runners_() {
  static store_t runners;
  return &runners;
}

void ProcessRunner::Register_(create_t create, score_t score) {
  Runners_()->emplace_back(std::move(create), std::move(score));
}

}  // namespace sandbox
