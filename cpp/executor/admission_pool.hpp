#ifndef EXECUTOR_ADMISSION_POOL_HPP
#define EXECUTOR_ADMISSION_POOL_HPP

#include <cstddef>
#include <queue>

#include <kj/async.h>
#include <kj/common.h>

namespace executor {

// A fixed number of permits handed out in FIFO order. The pool and its
// permits belong to one event loop and must only be used from its thread.
class AdmissionPool {
 public:
  // Holding a Permit counts as one running execution; destroying it gives
  // the slot to the oldest waiter.
  class Permit {
   public:
    Permit() = default;
    Permit(Permit&& other) noexcept : pool_(other.pool_) {
      other.pool_ = nullptr;
    }
    Permit& operator=(Permit&& other) noexcept;
    ~Permit() { Release(); }
    KJ_DISALLOW_COPY(Permit);

    bool Held() const { return pool_ != nullptr; }

   private:
    friend class AdmissionPool;
    explicit Permit(AdmissionPool* pool) : pool_(pool) {}
    void Release();
    AdmissionPool* pool_ = nullptr;
  };

  explicit AdmissionPool(size_t size);
  KJ_DISALLOW_COPY(AdmissionPool);

  // Resolves once a permit is available. Dropping the promise before that
  // gives up the place in the queue.
  kj::Promise<Permit> Acquire();

  // Resolves when no permit is held and nobody is waiting.
  kj::Promise<void> Idle();

  size_t Size() const { return size_; }
  size_t Running() const { return running_; }
  size_t Waiting() const { return waiting_.size(); }

 private:
  void OnDone();

  const size_t size_;
  size_t running_ = 0;
  std::queue<kj::Own<kj::PromiseFulfiller<Permit>>> waiting_;
  std::queue<kj::Own<kj::PromiseFulfiller<void>>> idle_waiters_;
};

}  // namespace executor

#endif
