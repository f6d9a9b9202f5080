#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <sys/resource.h>
#include <sys/types.h>
#include <chrono>
#include <string>
#include <vector>

#include <kj/io.h>

#include "sandbox/process_runner.hpp"

namespace sandbox {

// Runs the interpreter as a child process leading its own process group,
// with resource limits applied before exec. The whole group is terminated
// when the wall limit expires.
class Unix : public ProcessRunner {
 public:
  static ProcessRunner* Create() { return new Unix(); }
  static int Score() { return 2; }

  // Time given to the process group to exit after SIGTERM.
  static const constexpr int64_t kGraceMillis = 1000;

 protected:
  Unix() = default;
  bool RunInternal(const ExecutionOptions& options, RawResult* result,
                   std::string* error_msg) override;
  void Abort() override;

 private:
  bool Setup(std::string* error_msg);
  bool DoFork(std::string* error_msg);
  [[noreturn]] void Child();
  // Reads the launch reports of the child. Returns false if exec failed.
  bool WaitForExec(std::string* error_msg);
  // Collects the output until the child exits or the wall limit expires.
  void Collect(RawResult* result);
  void Terminate();

  bool HasExited();
  void Reap();
  void KillGroup(int sig);
  double Elapsed() const;

  const ExecutionOptions* options_ = nullptr;
  std::string executable_;
  std::vector<std::string> args_;
  std::vector<std::string> env_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
  rlim_t files_limit_ = 0;

  kj::AutoCloseFd stdout_read_;
  kj::AutoCloseFd stdout_write_;
  kj::AutoCloseFd stderr_read_;
  kj::AutoCloseFd stderr_write_;
  kj::AutoCloseFd status_read_;
  kj::AutoCloseFd status_write_;

  pid_t child_pid_ = 0;
  bool reaped_ = false;
  int child_status_ = 0;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace sandbox

#endif
