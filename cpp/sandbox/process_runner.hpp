#ifndef SANDBOX_PROCESS_RUNNER_HPP
#define SANDBOX_PROCESS_RUNNER_HPP

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <kj/common.h>

namespace sandbox {

// Settings to run a program with an interpreter.
struct ExecutionOptions {
  // Required values
  std::string interpreter;  // Name looked up in PATH, or a path.
  std::string code;         // Passed to the interpreter after "-c".

  // Optional values
  std::string root;  // Working directory. Empty means the current one.
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_mb = 0;
  int64_t cpu_limit_seconds = 0;
  int32_t max_files = 0;
  int64_t max_output_bytes = 0;  // Per stream.
  std::vector<std::string> environment;  // KEY=VALUE entries.
};

// Results of the execution.
struct RawResult {
  std::string stdout_data;
  std::string stderr_data;
  // Missing if the program never ran to an exit status.
  kj::Maybe<int32_t> exit_code;
  int32_t signal = 0;
  double elapsed_seconds = 0;
  bool timed_out = false;
};

using EnvLookup = std::function<const char*(const char*)>;

// Builds the environment of a program that runs in work_dir. Only a fixed set
// of variables is passed, so that nothing else leaks from the caller.
std::vector<std::string> BuildEnvironment(const std::string& work_dir,
                                          const EnvLookup& lookup = getenv);

// Formats a duration in seconds the way it is shown to users: "5" or "2.5".
std::string FormatSeconds(int64_t millis);

// Process runner interface. Implementations need to register themselves by
// creating a global object of type ProcessRunner::Register<RunnerImpl> and
// should define the Create and Score static functions. Create should return a
// pointer to a newly allocated instance of the given implementation, while
// Score should return a value that defines how "good" that runner is:
// negative if it should not/cannot be used in the current configuration,
// positive otherwise (a bigger value means a better runner).
// Registering a runner is not thread-safe and should be done before any
// threads are created.
class ProcessRunner {
 public:
  using create_t = std::function<ProcessRunner*()>;
  using score_t = std::function<int()>;
  // Returns nullptr if no usable runner is registered.
  static std::unique_ptr<ProcessRunner> Create();

  // Runs the program and waits for it, enforcing the wall limit. Never
  // throws: if the program could not be started or supervised, the result
  // has no exit code and stderr_data describes the failure.
  // An instance runs one program at a time.
  RawResult Run(const ExecutionOptions& options);

  // Constructor and destructors
  virtual ~ProcessRunner() = default;
  ProcessRunner() = default;
  ProcessRunner(const ProcessRunner&) = delete;
  ProcessRunner(ProcessRunner&&) = delete;
  ProcessRunner& operator=(const ProcessRunner&) = delete;
  ProcessRunner& operator=(ProcessRunner&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { ProcessRunner::Register_(&T::Create, &T::Score); }
  };

 protected:
  // Returns true if the program was started, and sets fields in result.
  // Otherwise, returns false and sets error_msg.
  virtual bool RunInternal(const ExecutionOptions& options, RawResult* result,
                           std::string* error_msg) = 0;

  // Called when RunInternal threw: stops whatever it left running.
  virtual void Abort() {}

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Runners_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
