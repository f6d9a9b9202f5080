#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <kj/debug.h>

#include "util/which.hpp"

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string ErrorString(int err) {
  char buf[256] = {};
  return mystrerror(err, buf, sizeof(buf));
}

// What the child writes to the launch channel before exec. Warnings are
// reported for limits that could not be applied; a fatal report means the
// child gave up and exited.
struct LaunchReport {
  int32_t fatal;
  int32_t step;
  int32_t error;
};

enum LaunchStep : int32_t {
  kSetpgid,
  kSignals,
  kStdin,
  kStdout,
  kStderr,
  kChdir,
  kLimitAs,
  kLimitCpu,
  kLimitNofile,
  kLimitCore,
  kExec,
  kNumSteps
};

const char* const kStepNames[kNumSteps] = {
    "setpgid",         "sigprocmask",   "redir stdin",
    "redir stdout",    "redir stderr",  "chdir",
    "setrlimit AS",    "setrlimit CPU", "setrlimit NOFILE",
    "setrlimit CORE",  "exec"};

const char* StepName(int32_t step) {
  if (step < 0 || step >= kNumSteps) return "launch";
  return kStepNames[step];
}

// Signals whose disposition the server may have changed.
const int kResetSignals[] = {SIGPIPE, SIGTERM, SIGINT,  SIGQUIT,
                             SIGHUP,  SIGXCPU, SIGXFSZ, SIGCHLD};

const char* const kTruncatedMarker = "\n[output truncated]\n";

struct Stream {
  kj::AutoCloseFd* fd;
  std::string* data;
  bool truncated;
};

enum class ReadOutcome { kData, kEmpty, kClosed };

// Reads once from a non-blocking pipe. Data past cap bytes is dropped.
ReadOutcome ReadOnce(Stream* stream, int64_t cap) {
  char buf[64 * 1024];
  while (true) {
    ssize_t n = read(stream->fd->get(), buf, sizeof(buf));
    if (n == 0) return ReadOutcome::kClosed;
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return ReadOutcome::kEmpty;
      KJ_FAIL_SYSCALL("read", errno);
    }
    if (stream->truncated) return ReadOutcome::kData;
    size_t len = n;
    if (cap > 0 && stream->data->size() + len > static_cast<size_t>(cap)) {
      len = cap - stream->data->size();
      stream->data->append(buf, len);
      stream->data->append(kTruncatedMarker);
      stream->truncated = true;
    } else {
      stream->data->append(buf, len);
    }
    return ReadOutcome::kData;
  }
}

void MakePipe(kj::AutoCloseFd* read_end, kj::AutoCloseFd* write_end) {
  int fds[2];
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC));
  *read_end = kj::AutoCloseFd(fds[0]);
  *write_end = kj::AutoCloseFd(fds[1]);
}
}  // namespace

namespace sandbox {

constexpr int64_t Unix::kGraceMillis;

bool Unix::RunInternal(const ExecutionOptions& options, RawResult* result,
                       std::string* error_msg) {
  options_ = &options;
  child_pid_ = 0;
  reaped_ = false;
  child_status_ = 0;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!WaitForExec(error_msg)) return false;
  Collect(result);
  return true;
}

void Unix::Abort() {
  if (child_pid_ <= 0 || reaped_) return;
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions([this]() { Terminate(); })) {
    KJ_LOG(ERROR, "Cannot terminate child", child_pid_, exc->getDescription());
  }
}

bool Unix::Setup(std::string* error_msg) {
  if (options_->code.find('\0') != std::string::npos) {
    *error_msg = "program text contains a NUL byte";
    return false;
  }
  executable_ = util::which(options_->interpreter);
  if (executable_.empty()) {
    *error_msg = "interpreter not found: " + options_->interpreter;
    return false;
  }

  args_ = {options_->interpreter, "-c", options_->code};
  argv_.clear();
  for (std::string& arg : args_) argv_.push_back(&arg[0]);
  argv_.push_back(nullptr);
  env_ = options_->environment;
  envp_.clear();
  for (std::string& var : env_) envp_.push_back(&var[0]);
  envp_.push_back(nullptr);

  files_limit_ = 0;
  if (options_->max_files > 0) {
    struct rlimit current {};
    KJ_SYSCALL(getrlimit(RLIMIT_NOFILE, &current));
    files_limit_ = options_->max_files;
    if (current.rlim_max != RLIM_INFINITY) {
      files_limit_ = std::min(files_limit_, current.rlim_max);
    }
  }

  MakePipe(&stdout_read_, &stdout_write_);
  MakePipe(&stderr_read_, &stderr_write_);
  MakePipe(&status_read_, &status_write_);
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  start_ = std::chrono::steady_clock::now();
  pid_t fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: " + ErrorString(errno);
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;
  // Also done by the child: whoever comes first creates the group.
  if (setpgid(child_pid_, child_pid_) == -1 && errno != EACCES &&
      errno != ESRCH) {
    KJ_LOG(WARNING, "setpgid failed", child_pid_, ErrorString(errno));
  }
  stdout_write_ = nullptr;
  stderr_write_ = nullptr;
  status_write_ = nullptr;
  return true;
}

// Only async-signal-safe calls from here to exec: other threads may hold
// locks the child would need.
void Unix::Child() {
  int report_fd = status_write_.get();
  auto report = [report_fd](bool fatal, LaunchStep step, int err) {
    LaunchReport r{fatal ? 1 : 0, step, err};
    ssize_t written = write(report_fd, &r, sizeof(r));
    (void)written;
    if (fatal) _exit(127);
  };

  if (setpgid(0, 0) == -1) report(true, kSetpgid, errno);

  sigset_t empty;
  sigemptyset(&empty);
  if (sigprocmask(SIG_SETMASK, &empty, nullptr) == -1) {
    report(true, kSignals, errno);
  }
  for (int sig : kResetSignals) signal(sig, SIG_DFL);

  int null_fd = open("/dev/null", O_RDONLY);
  if (null_fd == -1) report(true, kStdin, errno);
  if (null_fd != STDIN_FILENO) {
    if (dup2(null_fd, STDIN_FILENO) == -1) report(true, kStdin, errno);
    close(null_fd);
  }
  if (dup2(stdout_write_.get(), STDOUT_FILENO) == -1) {
    report(true, kStdout, errno);
  }
  if (dup2(stderr_write_.get(), STDERR_FILENO) == -1) {
    report(true, kStderr, errno);
  }

  if (!options_->root.empty() && chdir(options_->root.c_str()) == -1) {
    report(true, kChdir, errno);
  }

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value, step)              \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        report(false, step, errno);             \
      }                                         \
    }                                           \
  }
  SET_RLIM(AS, options_->memory_limit_mb * 1024 * 1024, kLimitAs);
  SET_RLIM(CPU, options_->cpu_limit_seconds, kLimitCpu);
  SET_RLIM(NOFILE, files_limit_, kLimitNofile);
#undef SET_RLIM
  rlim.rlim_cur = 0;
  rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) report(false, kLimitCore, errno);

  execve(executable_.c_str(), argv_.data(), envp_.data());
  report(true, kExec, errno);
  _exit(127);
}

bool Unix::WaitForExec(std::string* error_msg) {
  LaunchReport report{};
  while (true) {
    ssize_t n = 0;
    KJ_SYSCALL(n = read(status_read_.get(), &report, sizeof(report)));
    if (n == 0) break;
    KJ_ASSERT(n == sizeof(report), "Short launch report", n);
    if (!report.fatal) {
      KJ_LOG(WARNING, "Resource limit not applied", StepName(report.step),
             ErrorString(report.error));
      continue;
    }
    *error_msg = std::string(StepName(report.step)) + ": " +
                 ErrorString(report.error);
    status_read_ = nullptr;
    Reap();
    return false;
  }
  status_read_ = nullptr;
  return true;
}

void Unix::Collect(RawResult* result) {
  const int64_t cap = options_->max_output_bytes;
  const int64_t wall = options_->wall_limit_millis;
  Stream streams[] = {{&stdout_read_, &result->stdout_data, false},
                      {&stderr_read_, &result->stderr_data, false}};
  for (Stream& stream : streams) {
    int flags = 0;
    KJ_SYSCALL(flags = fcntl(stream.fd->get(), F_GETFL));
    KJ_SYSCALL(fcntl(stream.fd->get(), F_SETFL, flags | O_NONBLOCK));
  }
  auto deadline = start_ + std::chrono::milliseconds(wall);

  while (!HasExited()) {
    auto now = std::chrono::steady_clock::now();
    if (wall != 0 && now >= deadline) {
      stdout_read_ = nullptr;
      stderr_read_ = nullptr;
      Terminate();
      result->timed_out = true;
      result->elapsed_seconds = Elapsed();
      result->stdout_data.clear();
      result->stderr_data =
          "Execution timed out after " + FormatSeconds(wall) + " seconds";
      return;
    }
    int64_t wait_millis = 10;
    if (wall != 0) {
      auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
              .count();
      wait_millis = std::max<int64_t>(1, std::min<int64_t>(wait_millis,
                                                           remaining));
    }

    struct pollfd fds[2] = {};
    Stream* polled[2] = {};
    nfds_t nfds = 0;
    for (Stream& stream : streams) {
      if (stream.fd->get() < 0) continue;
      fds[nfds].fd = stream.fd->get();
      fds[nfds].events = POLLIN;
      polled[nfds++] = &stream;
    }
    if (poll(fds, nfds, wait_millis) == -1) {
      if (errno == EINTR) continue;
      KJ_FAIL_SYSCALL("poll", errno);
    }
    for (nfds_t i = 0; i < nfds; i++) {
      if (fds[i].revents == 0) continue;
      if (ReadOnce(polled[i], cap) == ReadOutcome::kClosed) {
        *polled[i]->fd = nullptr;
      }
    }
  }
  result->elapsed_seconds = Elapsed();

  // The leader is still a zombie, so its group id cannot be reused yet.
  KillGroup(SIGKILL);
  for (Stream& stream : streams) {
    if (stream.fd->get() < 0) continue;
    while (ReadOnce(&stream, cap) == ReadOutcome::kData) {
    }
    *stream.fd = nullptr;
  }
  Reap();

  if (WIFEXITED(child_status_)) {
    result->exit_code = WEXITSTATUS(child_status_);
  } else if (WIFSIGNALED(child_status_)) {
    result->signal = WTERMSIG(child_status_);
    result->exit_code = -result->signal;
    std::string& err = result->stderr_data;
    if (!err.empty() && err.back() != '\n') err += '\n';
    err += "Terminated by signal: ";
    err += strsignal(result->signal);
  }
}

void Unix::Terminate() {
  KillGroup(SIGTERM);
  auto give_up =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(kGraceMillis);
  while (!HasExited() && std::chrono::steady_clock::now() < give_up) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  KillGroup(SIGKILL);
  Reap();
}

bool Unix::HasExited() {
  siginfo_t info;
  memset(&info, 0, sizeof(info));
  KJ_SYSCALL(
      waitid(P_PID, child_pid_, &info, WEXITED | WNOHANG | WNOWAIT),
      child_pid_);
  return info.si_pid == child_pid_;
}

void Unix::Reap() {
  KJ_SYSCALL(waitpid(child_pid_, &child_status_, 0), child_pid_);
  reaped_ = true;
}

void Unix::KillGroup(int sig) {
  if (killpg(child_pid_, sig) == -1 && errno != ESRCH) {
    KJ_LOG(WARNING, "killpg failed", child_pid_, sig, ErrorString(errno));
  }
}

double Unix::Elapsed() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start_)
      .count();
}

namespace {
ProcessRunner::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
