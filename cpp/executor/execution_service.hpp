#ifndef EXECUTOR_EXECUTION_SERVICE_HPP
#define EXECUTOR_EXECUTION_SERVICE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <kj/async-io.h>
#include <kj/async.h>
#include <kj/common.h>

#include "executor/admission_pool.hpp"
#include "sandbox/process_runner.hpp"

namespace executor {

// Process-wide settings of the engine. Never modified once the service is
// built.
struct ExecutionConfig {
  std::string interpreter = "python3";
  uint32_t max_memory_mb = 128;
  uint32_t max_cpu_seconds = 10;
  uint32_t max_concurrent_executions = 10;
  bool filesystem_isolation = true;
  std::string temp_root = DefaultTempRoot();
  uint32_t max_files = 64;
  uint32_t max_output_kb = 10240;

  // $TMPDIR, or /tmp when it is not set.
  static std::string DefaultTempRoot();
  // Builds the configuration from the command-line flags.
  static ExecutionConfig FromFlags();
};

struct ExecutionRequest {
  std::string code;
  int32_t timeout_seconds = 5;
};

enum class ExecutionStatus { kSuccess, kError, kTimeout, kFailed };

// "success", "error", "timeout" or "failed".
const char* StatusName(ExecutionStatus status);

struct ExecutionResponse {
  ExecutionStatus status = ExecutionStatus::kFailed;
  std::string stdout_data;
  std::string stderr_data;
  double execution_time_seconds = 0;
  // Present exactly when status is kSuccess or kError.
  kj::Maybe<int32_t> return_code;
};

class ExecutionService : private kj::TaskSet::ErrorHandler {
 public:
  using RunnerFactory =
      std::function<std::unique_ptr<sandbox::ProcessRunner>()>;

  // Throws a kj::Exception if config has a zero concurrency, memory or CPU
  // limit. io must belong to the calling thread's event loop, which is the
  // only thread Execute and Drain may be called from. factory is called
  // from worker threads.
  ExecutionService(ExecutionConfig config, kj::LowLevelAsyncIoProvider& io,
                   RunnerFactory factory = &sandbox::ProcessRunner::Create);
  KJ_DISALLOW_COPY(ExecutionService);

  // Waits for a free slot, then runs the request on a worker thread. The
  // promise always resolves with a response: internal faults become
  // kFailed responses. Dropping the promise does not stop an execution that
  // was already admitted; one still waiting for a slot is skipped.
  kj::Promise<ExecutionResponse> Execute(ExecutionRequest request);

  // Resolves once no execution is running or waiting.
  kj::Promise<void> Drain() { return pool_.Idle(); }

  const ExecutionConfig& Config() const { return config_; }
  size_t Running() const { return pool_.Running(); }
  size_t Waiting() const { return pool_.Waiting(); }

  // Maps what the runner returned to the public outcome.
  static ExecutionResponse Classify(sandbox::RawResult raw, double elapsed);
  // The response for an execution the engine itself could not complete.
  static ExecutionResponse Failure(const std::string& description);
  // 8 random lowercase hex digits.
  static std::string NewExecutionId();

 private:
  // Everything an execution does once admitted. Runs on a worker thread.
  ExecutionResponse RunAdmitted(const ExecutionRequest& request,
                                const std::string& execution_id) const;

  void taskFailed(kj::Exception&& exception) override;

  const ExecutionConfig config_;
  kj::LowLevelAsyncIoProvider& io_;
  RunnerFactory factory_;
  AdmissionPool pool_;
  kj::TaskSet tasks_;
};

}  // namespace executor

#endif
