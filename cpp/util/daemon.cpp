#include "util/daemon.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <fstream>

#include <kj/debug.h>

namespace util {

void daemonize(const std::string& scope, std::string pidfile) {
  if (pidfile.empty()) pidfile = "/tmp/exec-agent-" + scope + ".pid";

  pid_t pid;
  KJ_SYSCALL(pid = fork());
  if (pid != 0) _Exit(0);
  KJ_SYSCALL(setsid());
  KJ_SYSCALL(pid = fork());
  if (pid != 0) _Exit(0);

  umask(022);
  KJ_SYSCALL(chdir("/"));

  int null_fd;
  KJ_SYSCALL(null_fd = open("/dev/null", O_RDWR | O_CLOEXEC));
  KJ_SYSCALL(dup2(null_fd, STDIN_FILENO));
  KJ_SYSCALL(dup2(null_fd, STDOUT_FILENO));
  KJ_SYSCALL(dup2(null_fd, STDERR_FILENO));
  if (null_fd > STDERR_FILENO) close(null_fd);

  std::ofstream out(pidfile);
  KJ_REQUIRE(out.good(), "Cannot write the pidfile", pidfile);
  out << getpid() << std::endl;
}

}  // namespace util
