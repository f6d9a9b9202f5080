#include "executor/execution_service.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>

#include <kj/debug.h>

#include "sandbox/sandbox.hpp"
#include "util/flags.hpp"
#include "util/worker_thread.hpp"

namespace executor {

namespace {
ExecutionConfig Validated(ExecutionConfig config) {
  KJ_REQUIRE(config.max_concurrent_executions > 0,
             "max_concurrent_executions must be positive");
  KJ_REQUIRE(config.max_memory_mb > 0, "max_memory_mb must be positive");
  KJ_REQUIRE(config.max_cpu_seconds > 0, "max_cpu_seconds must be positive");
  KJ_REQUIRE(!config.interpreter.empty(), "No interpreter configured");
  return config;
}
}  // namespace

std::string ExecutionConfig::DefaultTempRoot() {
  const char* tmpdir = getenv("TMPDIR");
  if (tmpdir != nullptr && tmpdir[0] != '\0') return tmpdir;
  return "/tmp";
}

ExecutionConfig ExecutionConfig::FromFlags() {
  ExecutionConfig config;
  config.interpreter = Flags::interpreter;
  config.max_memory_mb = Flags::max_memory_mb;
  config.max_cpu_seconds = Flags::max_cpu_seconds;
  config.max_concurrent_executions = Flags::max_concurrent;
  config.filesystem_isolation = !Flags::no_isolation;
  if (!Flags::temp_directory.empty()) config.temp_root = Flags::temp_directory;
  config.max_files = Flags::max_files;
  config.max_output_kb = Flags::max_output_kb;
  return config;
}

const char* StatusName(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::kSuccess:
      return "success";
    case ExecutionStatus::kError:
      return "error";
    case ExecutionStatus::kTimeout:
      return "timeout";
    case ExecutionStatus::kFailed:
      return "failed";
  }
  KJ_UNREACHABLE;
}

ExecutionService::ExecutionService(ExecutionConfig config,
                                   kj::LowLevelAsyncIoProvider& io,
                                   RunnerFactory factory)
    : config_(Validated(std::move(config))),
      io_(io),
      factory_(std::move(factory)),
      pool_(config_.max_concurrent_executions),
      tasks_(*this) {}

kj::Promise<ExecutionResponse> ExecutionService::Execute(
    ExecutionRequest request) {
  std::string id = NewExecutionId();
  KJ_LOG(INFO, "Execution queued", id, pool_.Running(), pool_.Waiting());
  auto pf = kj::newPromiseAndFulfiller<ExecutionResponse>();
  kj::PromiseFulfiller<ExecutionResponse>* caller = pf.fulfiller.get();
  tasks_.add(
      pool_.Acquire()
          .then([this, id, caller, request = std::move(request)](
                    AdmissionPool::Permit permit) mutable
                -> kj::Promise<ExecutionResponse> {
            if (!caller->isWaiting()) {
              KJ_LOG(INFO, "Execution abandoned before admission", id);
              return Failure("execution abandoned");
            }
            auto work = util::RunInThread<ExecutionResponse>(
                io_, [this, id, request]() { return RunAdmitted(request, id); });
            return work.attach(kj::mv(permit));
          })
          .then([](ExecutionResponse response) { return response; },
                [id](kj::Exception exc) {
                  KJ_LOG(ERROR, "Execution service error", id,
                         exc.getDescription());
                  return Failure(exc.getDescription().cStr());
                })
          .then([fulfiller = kj::mv(pf.fulfiller)](
                    ExecutionResponse response) mutable {
            fulfiller->fulfill(kj::mv(response));
          }));
  return kj::mv(pf.promise);
}

void ExecutionService::taskFailed(kj::Exception&& exception) {
  KJ_LOG(ERROR, "Execution task failed", exception.getDescription());
}

ExecutionResponse ExecutionService::RunAdmitted(
    const ExecutionRequest& request, const std::string& execution_id) const {
  KJ_LOG(INFO, "Execution started", execution_id, request.timeout_seconds);
  sandbox::Sandbox box(execution_id, config_.temp_root);

  sandbox::ExecutionOptions options;
  options.interpreter = config_.interpreter;
  options.code = request.code;
  options.wall_limit_millis = int64_t(request.timeout_seconds) * 1000;
  options.memory_limit_mb = config_.max_memory_mb;
  options.cpu_limit_seconds = config_.max_cpu_seconds;
  options.max_files = config_.max_files;
  options.max_output_bytes = int64_t(config_.max_output_kb) * 1024;
  std::string work_dir = config_.temp_root;
  if (config_.filesystem_isolation) {
    options.root = box.Create();
    work_dir = options.root;
  }
  options.environment = sandbox::BuildEnvironment(work_dir);

  std::unique_ptr<sandbox::ProcessRunner> runner = factory_();
  KJ_REQUIRE(runner != nullptr, "No process runner available");
  auto start = std::chrono::steady_clock::now();
  sandbox::RawResult raw = runner->Run(options);
  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();
  box.Cleanup();

  ExecutionResponse response = Classify(std::move(raw), elapsed);
  KJ_LOG(INFO, "Execution finished", execution_id,
         StatusName(response.status), elapsed);
  return response;
}

ExecutionResponse ExecutionService::Classify(sandbox::RawResult raw,
                                             double elapsed) {
  ExecutionResponse response;
  response.stdout_data = std::move(raw.stdout_data);
  response.stderr_data = std::move(raw.stderr_data);
  response.execution_time_seconds = elapsed;
  if (raw.timed_out) {
    response.status = ExecutionStatus::kTimeout;
    return response;
  }
  KJ_IF_MAYBE(code, raw.exit_code) {
    response.return_code = *code;
    response.status =
        *code == 0 ? ExecutionStatus::kSuccess : ExecutionStatus::kError;
  } else {
    response.status = ExecutionStatus::kFailed;
  }
  return response;
}

ExecutionResponse ExecutionService::Failure(const std::string& description) {
  ExecutionResponse response;
  response.status = ExecutionStatus::kFailed;
  response.stderr_data = "Execution service error: " + description;
  return response;
}

std::string ExecutionService::NewExecutionId() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dist;
  char buf[9] = {};
  snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(dist(rng)));
  return buf;
}

}  // namespace executor
