#ifndef UTIL_WORKER_THREAD_HPP
#define UTIL_WORKER_THREAD_HPP

#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/function.h>
#include <kj/io.h>
#include <kj/thread.h>

namespace util {
namespace detail {
template <typename T>
struct WorkerThreadState {
  kj::Maybe<T> result;
  kj::Maybe<kj::Exception> error;
  kj::Own<kj::Thread> thread;
};

// Creates a close-on-exec pipe, throwing on failure.
void MakeNotificationPipe(kj::AutoCloseFd* read_end,
                          kj::AutoCloseFd* write_end);
}  // namespace detail

// Runs f on a dedicated thread and returns a promise, owned by the calling
// thread's event loop, that resolves to its result (or is rejected with the
// exception f threw). The worker closes a pipe watched by the event loop when
// it is done, so the loop keeps serving other events in the meantime.
// Dropping the promise joins the thread, blocking until f returns.
template <typename T>
kj::Promise<T> RunInThread(kj::LowLevelAsyncIoProvider& io,
                           kj::Function<T()> f) {
  kj::AutoCloseFd read_end;
  kj::AutoCloseFd write_end;
  detail::MakeNotificationPipe(&read_end, &write_end);

  kj::Own<kj::AsyncInputStream> in = io.wrapInputFd(
      read_end.release(), kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP);
  auto state = kj::heap<detail::WorkerThreadState<T>>();
  detail::WorkerThreadState<T>* raw = state.get();
  int notify_fd = write_end.release();
  state->thread = kj::heap<kj::Thread>(
      [raw, notify_fd, f = kj::mv(f)]() mutable {
        kj::AutoCloseFd notify(notify_fd);
        KJ_IF_MAYBE(exc,
                    kj::runCatchingExceptions([&]() { raw->result = f(); })) {
          raw->error = kj::mv(*exc);
        }
      });

  auto promise = in->readAllBytes();
  return promise.attach(kj::mv(in))
      .then([state = kj::mv(state)](kj::Array<kj::byte>&&) mutable -> T {
        state->thread = nullptr;
        KJ_IF_MAYBE(exc, state->error) {
          kj::throwFatalException(kj::mv(*exc));
        }
        KJ_IF_MAYBE(result, state->result) { return kj::mv(*result); }
        KJ_FAIL_ASSERT("Worker thread finished without a result");
      });
}

}  // namespace util
#endif
