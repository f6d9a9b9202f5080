#include "executor/execution_service.hpp"
#include <dirent.h>
#include <unistd.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <climits>
#include <mutex>
#include <thread>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <kj/async-io.h>
#include <kj/debug.h>

#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::MatchesRegex;
using ::testing::StartsWith;

using executor::ExecutionConfig;
using executor::ExecutionRequest;
using executor::ExecutionResponse;
using executor::ExecutionService;
using executor::ExecutionStatus;

const std::string test_tmpdir = "/tmp/exec_agent_testdir/executions";

ExecutionConfig ShellConfig(const std::string& name) {
  std::string root = test_tmpdir + "/" + name;
  util::File::RemoveTreeBestEffort(root);
  util::File::MakeDirs(root);
  ExecutionConfig config;
  config.interpreter = "/bin/sh";
  config.temp_root = root;
  return config;
}

ExecutionRequest Request(const std::string& code, int32_t timeout = 5) {
  ExecutionRequest request;
  request.code = code;
  request.timeout_seconds = timeout;
  return request;
}

size_t CountEntries(const std::string& path) {
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return 0;
  size_t count = 0;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name != "." && name != "..") count++;
  }
  closedir(dir);
  return count;
}

bool HasReturnCode(const ExecutionResponse& response, int32_t expected) {
  KJ_IF_MAYBE(code, response.return_code) { return *code == expected; }
  return false;
}

// Pretends to run for a while and records how many runs overlap.
class SleepyRunner : public sandbox::ProcessRunner {
 public:
  struct Stats {
    std::mutex mutex;
    int running = 0;
    int max_running = 0;
    std::vector<std::chrono::steady_clock::time_point> starts;
    std::vector<std::chrono::steady_clock::time_point> ends;
  };
  explicit SleepyRunner(Stats* stats) : stats_(stats) {}

 protected:
  bool RunInternal(const sandbox::ExecutionOptions& options,
                   sandbox::RawResult* result,
                   std::string* /*error_msg*/) override {
    {
      std::lock_guard<std::mutex> lck(stats_->mutex);
      stats_->running++;
      stats_->max_running = std::max(stats_->max_running, stats_->running);
      stats_->starts.push_back(std::chrono::steady_clock::now());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    {
      std::lock_guard<std::mutex> lck(stats_->mutex);
      stats_->running--;
      stats_->ends.push_back(std::chrono::steady_clock::now());
    }
    result->stdout_data = options.code;
    result->exit_code = 0;
    return true;
  }

 private:
  Stats* stats_;
};

/*
 * Classify
 */

// NOLINTNEXTLINE
TEST(ExecutionService, ClassifySuccess) {
  sandbox::RawResult raw;
  raw.stdout_data = "2\n";
  raw.exit_code = 0;
  ExecutionResponse response = ExecutionService::Classify(raw, 0.25);
  EXPECT_EQ(response.status, ExecutionStatus::kSuccess);
  EXPECT_EQ(response.stdout_data, "2\n");
  EXPECT_DOUBLE_EQ(response.execution_time_seconds, 0.25);
  EXPECT_TRUE(HasReturnCode(response, 0));
}

// NOLINTNEXTLINE
TEST(ExecutionService, ClassifyError) {
  sandbox::RawResult raw;
  raw.exit_code = -9;
  ExecutionResponse response = ExecutionService::Classify(raw, 1);
  EXPECT_EQ(response.status, ExecutionStatus::kError);
  EXPECT_TRUE(HasReturnCode(response, -9));
}

// NOLINTNEXTLINE
TEST(ExecutionService, ClassifyTimeout) {
  sandbox::RawResult raw;
  raw.timed_out = true;
  raw.stderr_data = "Execution timed out after 2 seconds";
  ExecutionResponse response = ExecutionService::Classify(raw, 2.01);
  EXPECT_EQ(response.status, ExecutionStatus::kTimeout);
  EXPECT_TRUE(response.return_code == nullptr);
}

// NOLINTNEXTLINE
TEST(ExecutionService, ClassifyNoExitCode) {
  sandbox::RawResult raw;
  raw.stderr_data = "Process execution failed: exec: Permission denied";
  ExecutionResponse response = ExecutionService::Classify(raw, 0.01);
  EXPECT_EQ(response.status, ExecutionStatus::kFailed);
  EXPECT_TRUE(response.return_code == nullptr);
}

// NOLINTNEXTLINE
TEST(ExecutionService, StatusNames) {
  EXPECT_STREQ(executor::StatusName(ExecutionStatus::kSuccess), "success");
  EXPECT_STREQ(executor::StatusName(ExecutionStatus::kError), "error");
  EXPECT_STREQ(executor::StatusName(ExecutionStatus::kTimeout), "timeout");
  EXPECT_STREQ(executor::StatusName(ExecutionStatus::kFailed), "failed");
}

// NOLINTNEXTLINE
TEST(ExecutionService, ExecutionId) {
  std::string first = ExecutionService::NewExecutionId();
  EXPECT_THAT(first, MatchesRegex("[0-9a-f]{8}"));
  EXPECT_NE(first, ExecutionService::NewExecutionId());
}

/*
 * Construction
 */

// NOLINTNEXTLINE
TEST(ExecutionService, RejectsZeroLimits) {
  auto io = kj::setupAsyncIo();
  ExecutionConfig no_slots;
  no_slots.max_concurrent_executions = 0;
  EXPECT_THROW(ExecutionService(no_slots, *io.lowLevelProvider),  // NOLINT
               kj::Exception);
  ExecutionConfig no_memory;
  no_memory.max_memory_mb = 0;
  EXPECT_THROW(ExecutionService(no_memory, *io.lowLevelProvider),  // NOLINT
               kj::Exception);
  ExecutionConfig no_cpu;
  no_cpu.max_cpu_seconds = 0;
  EXPECT_THROW(ExecutionService(no_cpu, *io.lowLevelProvider),  // NOLINT
               kj::Exception);
}

/*
 * Execute
 */

// NOLINTNEXTLINE
TEST(ExecutionService, Success) {
  auto io = kj::setupAsyncIo();
  ExecutionService service(ShellConfig("success"), *io.lowLevelProvider);
  ExecutionResponse response =
      service.Execute(Request("echo $((1+1))")).wait(io.waitScope);
  EXPECT_EQ(response.status, ExecutionStatus::kSuccess);
  EXPECT_EQ(response.stdout_data, "2\n");
  EXPECT_TRUE(HasReturnCode(response, 0));
  EXPECT_GT(response.execution_time_seconds, 0);
}

// NOLINTNEXTLINE
TEST(ExecutionService, Error) {
  auto io = kj::setupAsyncIo();
  ExecutionService service(ShellConfig("error"), *io.lowLevelProvider);
  ExecutionResponse response =
      service.Execute(Request("echo 'division by zero' >&2; exit 3"))
          .wait(io.waitScope);
  EXPECT_EQ(response.status, ExecutionStatus::kError);
  EXPECT_EQ(response.stderr_data, "division by zero\n");
  EXPECT_TRUE(HasReturnCode(response, 3));
}

// NOLINTNEXTLINE
TEST(ExecutionService, Timeout) {
  auto io = kj::setupAsyncIo();
  ExecutionService service(ShellConfig("timeout"), *io.lowLevelProvider);
  ExecutionResponse response =
      service.Execute(Request("sleep 10", 1)).wait(io.waitScope);
  EXPECT_EQ(response.status, ExecutionStatus::kTimeout);
  EXPECT_GE(response.execution_time_seconds, 1);
  EXPECT_LT(response.execution_time_seconds, 5);
  EXPECT_TRUE(response.return_code == nullptr);
  EXPECT_EQ(response.stdout_data, "");
  EXPECT_EQ(response.stderr_data, "Execution timed out after 1 seconds");
}

// NOLINTNEXTLINE
TEST(ExecutionService, PrivateFileIsRemoved) {
  auto io = kj::setupAsyncIo();
  ExecutionConfig config = ShellConfig("files");
  ExecutionService service(config, *io.lowLevelProvider);
  ExecutionResponse response =
      service
          .Execute(Request("echo 'Hello, World!' > test.txt; cat test.txt; "
                           "pwd >&2"))
          .wait(io.waitScope);
  EXPECT_EQ(response.status, ExecutionStatus::kSuccess);
  EXPECT_EQ(response.stdout_data, "Hello, World!\n");
  std::string workdir = response.stderr_data.substr(
      0, response.stderr_data.size() - 1);
  EXPECT_THAT(workdir, StartsWith(config.temp_root + "/"));
  EXPECT_FALSE(util::File::Exists(workdir));
  EXPECT_EQ(CountEntries(config.temp_root), 0u);
}

// NOLINTNEXTLINE
TEST(ExecutionService, NoDirectoriesLeftBehind) {
  auto io = kj::setupAsyncIo();
  ExecutionConfig config = ShellConfig("leftovers");
  ExecutionService service(config, *io.lowLevelProvider);
  auto promises = kj::heapArrayBuilder<kj::Promise<ExecutionResponse>>(4);
  promises.add(service.Execute(Request("touch a; echo ok")));
  promises.add(service.Execute(Request("mkdir -p x/y; touch x/y/z; exit 1")));
  promises.add(service.Execute(Request("touch b; sleep 5", 1)));
  promises.add(service.Execute(Request("kill -KILL $$")));
  auto responses = kj::joinPromises(promises.finish()).wait(io.waitScope);
  EXPECT_EQ(responses[0].status, ExecutionStatus::kSuccess);
  EXPECT_EQ(responses[1].status, ExecutionStatus::kError);
  EXPECT_EQ(responses[2].status, ExecutionStatus::kTimeout);
  EXPECT_EQ(responses[3].status, ExecutionStatus::kError);
  EXPECT_TRUE(HasReturnCode(responses[3], -9));
  EXPECT_EQ(CountEntries(config.temp_root), 0u);
}

// NOLINTNEXTLINE
TEST(ExecutionService, NoIsolation) {
  auto io = kj::setupAsyncIo();
  ExecutionConfig config = ShellConfig("noisolation");
  config.filesystem_isolation = false;
  ExecutionService service(config, *io.lowLevelProvider);
  ExecutionResponse response =
      service.Execute(Request("pwd; echo $HOME")).wait(io.waitScope);
  char cwd[PATH_MAX] = {};
  ASSERT_NE(getcwd(cwd, sizeof(cwd)), nullptr);
  EXPECT_EQ(response.status, ExecutionStatus::kSuccess);
  EXPECT_EQ(response.stdout_data,
            std::string(cwd) + "\n" + config.temp_root + "\n");
}

// NOLINTNEXTLINE
TEST(ExecutionService, SandboxCreationFails) {
  auto io = kj::setupAsyncIo();
  ExecutionConfig config = ShellConfig("unused");
  config.temp_root = "/nope/nope/nope";
  ExecutionService service(config, *io.lowLevelProvider);
  ExecutionResponse response =
      service.Execute(Request("echo hi")).wait(io.waitScope);
  EXPECT_EQ(response.status, ExecutionStatus::kFailed);
  EXPECT_THAT(response.stderr_data, StartsWith("Execution service error: "));
  EXPECT_THAT(response.stderr_data, HasSubstr("mkdtemp"));
  EXPECT_EQ(response.execution_time_seconds, 0);
  EXPECT_TRUE(response.return_code == nullptr);
  EXPECT_EQ(service.Running(), 0u);
}

// NOLINTNEXTLINE
TEST(ExecutionService, MissingInterpreter) {
  auto io = kj::setupAsyncIo();
  ExecutionConfig config = ShellConfig("nointerpreter");
  config.interpreter = "no-such-interpreter-here";
  ExecutionService service(config, *io.lowLevelProvider);
  ExecutionResponse response =
      service.Execute(Request("echo hi")).wait(io.waitScope);
  EXPECT_EQ(response.status, ExecutionStatus::kFailed);
  EXPECT_THAT(response.stderr_data, StartsWith("Process execution failed: "));
  EXPECT_EQ(CountEntries(config.temp_root), 0u);
}

// NOLINTNEXTLINE
TEST(ExecutionService, NoRunner) {
  auto io = kj::setupAsyncIo();
  ExecutionService service(
      ShellConfig("norunner"), *io.lowLevelProvider,
      []() { return std::unique_ptr<sandbox::ProcessRunner>(); });
  ExecutionResponse response =
      service.Execute(Request("echo hi")).wait(io.waitScope);
  EXPECT_EQ(response.status, ExecutionStatus::kFailed);
  EXPECT_THAT(response.stderr_data, HasSubstr("No process runner available"));
}

// NOLINTNEXTLINE
TEST(ExecutionService, ConcurrencyBound) {
  auto io = kj::setupAsyncIo();
  ExecutionConfig config = ShellConfig("concurrency");
  config.max_concurrent_executions = 2;
  SleepyRunner::Stats stats;
  ExecutionService service(config, *io.lowLevelProvider, [&stats]() {
    return std::unique_ptr<sandbox::ProcessRunner>(new SleepyRunner(&stats));
  });
  auto promises = kj::heapArrayBuilder<kj::Promise<ExecutionResponse>>(3);
  for (int i = 0; i < 3; i++) {
    promises.add(service.Execute(Request(std::to_string(i))));
  }
  auto responses = kj::joinPromises(promises.finish()).wait(io.waitScope);
  for (const auto& response : responses) {
    EXPECT_EQ(response.status, ExecutionStatus::kSuccess);
  }
  EXPECT_EQ(stats.max_running, 2);
  ASSERT_EQ(stats.starts.size(), 3u);
  ASSERT_EQ(stats.ends.size(), 3u);
  std::sort(stats.starts.begin(), stats.starts.end());
  std::sort(stats.ends.begin(), stats.ends.end());
  EXPECT_GE(stats.starts[2], stats.ends[0]);
  EXPECT_EQ(service.Running(), 0u);
}

// NOLINTNEXTLINE
TEST(ExecutionService, DrainWaitsForRunning) {
  auto io = kj::setupAsyncIo();
  ExecutionService service(ShellConfig("drain"), *io.lowLevelProvider);
  bool done = false;
  auto promise = service.Execute(Request("sleep 0.2; echo done"))
                     .then([&done](ExecutionResponse response) {
                       done = response.status == ExecutionStatus::kSuccess;
                     })
                     .eagerlyEvaluate(nullptr);
  service.Drain().wait(io.waitScope);
  EXPECT_EQ(service.Running(), 0u);
  EXPECT_EQ(service.Waiting(), 0u);
  promise.wait(io.waitScope);
  EXPECT_TRUE(done);
}

// NOLINTNEXTLINE
TEST(ExecutionService, AdmittedExecutionOutlivesCaller) {
  auto io = kj::setupAsyncIo();
  ExecutionConfig config = ShellConfig("dropped");
  config.max_concurrent_executions = 1;
  SleepyRunner::Stats stats;
  ExecutionService service(config, *io.lowLevelProvider, [&stats]() {
    return std::unique_ptr<sandbox::ProcessRunner>(new SleepyRunner(&stats));
  });
  {
    auto admitted = service.Execute(Request("first"));
    io.waitScope.poll();
    auto queued = service.Execute(Request("second"));
  }
  service.Drain().wait(io.waitScope);
  std::lock_guard<std::mutex> lck(stats.mutex);
  EXPECT_EQ(stats.starts.size(), 1u);
  EXPECT_EQ(stats.ends.size(), 1u);
}

/*
 * Python scenarios
 */

class PythonExecution : public ::testing::Test {
 protected:
  void SetUp() override {
    if (util::which("python3").empty()) GTEST_SKIP() << "python3 not found";
  }

  ExecutionResponse Run(const std::string& code, int32_t timeout = 5) {
    auto io = kj::setupAsyncIo();
    ExecutionConfig config = ShellConfig("python");
    config.interpreter = "python3";
    ExecutionService service(config, *io.lowLevelProvider);
    return service.Execute(Request(code, timeout)).wait(io.waitScope);
  }
};

// NOLINTNEXTLINE
TEST_F(PythonExecution, Print) {
  ExecutionResponse response = Run("print(1+1)");
  EXPECT_EQ(response.status, ExecutionStatus::kSuccess);
  EXPECT_THAT(response.stdout_data, HasSubstr("2"));
  EXPECT_TRUE(HasReturnCode(response, 0));
}

// NOLINTNEXTLINE
TEST_F(PythonExecution, SyntaxError) {
  ExecutionResponse response = Run("print(");
  EXPECT_EQ(response.status, ExecutionStatus::kError);
  EXPECT_THAT(response.stderr_data, HasSubstr("SyntaxError"));
}

// NOLINTNEXTLINE
TEST_F(PythonExecution, ZeroDivision) {
  ExecutionResponse response = Run("print(1/0)");
  EXPECT_EQ(response.status, ExecutionStatus::kError);
  EXPECT_THAT(response.stderr_data, HasSubstr("ZeroDivisionError"));
}

// NOLINTNEXTLINE
TEST_F(PythonExecution, MemoryCeiling) {
  ExecutionResponse response = Run("x = bytearray(512 * 1024 * 1024)");
  EXPECT_EQ(response.status, ExecutionStatus::kError);
  EXPECT_THAT(response.stderr_data, HasSubstr("MemoryError"));
}

// NOLINTNEXTLINE
TEST_F(PythonExecution, Sleep) {
  ExecutionResponse response = Run("import time\ntime.sleep(10)", 2);
  EXPECT_EQ(response.status, ExecutionStatus::kTimeout);
  EXPECT_GE(response.execution_time_seconds, 2);
  EXPECT_TRUE(response.return_code == nullptr);
}

// NOLINTNEXTLINE
TEST_F(PythonExecution, FileRoundTrip) {
  ExecutionResponse response = Run(
      "with open('test.txt', 'w') as f:\n"
      "    f.write('Hello, World!')\n"
      "with open('test.txt') as f:\n"
      "    print(f.read())\n");
  EXPECT_EQ(response.status, ExecutionStatus::kSuccess);
  EXPECT_THAT(response.stdout_data, HasSubstr("Hello, World!"));
  EXPECT_EQ(CountEntries(test_tmpdir + "/python"), 0u);
}

}  // namespace
