#include "util/worker_thread.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace util {
namespace detail {

void MakeNotificationPipe(kj::AutoCloseFd* read_end,
                          kj::AutoCloseFd* write_end) {
  int fds[2];
  // Runner threads fork at any time: set O_CLOEXEC atomically.
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC));
  *read_end = kj::AutoCloseFd(fds[0]);
  *write_end = kj::AutoCloseFd(fds[1]);
}

}  // namespace detail
}  // namespace util
