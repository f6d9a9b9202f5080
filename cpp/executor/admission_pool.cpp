#include "executor/admission_pool.hpp"

#include <kj/debug.h>

namespace executor {

AdmissionPool::Permit& AdmissionPool::Permit::operator=(
    Permit&& other) noexcept {
  if (this != &other) {
    Release();
    pool_ = other.pool_;
    other.pool_ = nullptr;
  }
  return *this;
}

void AdmissionPool::Permit::Release() {
  if (pool_ == nullptr) return;
  AdmissionPool* pool = pool_;
  pool_ = nullptr;
  pool->running_--;
  pool->OnDone();
}

AdmissionPool::AdmissionPool(size_t size) : size_(size) {
  KJ_REQUIRE(size > 0, "The admission pool needs at least one permit");
}

kj::Promise<AdmissionPool::Permit> AdmissionPool::Acquire() {
  auto pf = kj::newPromiseAndFulfiller<Permit>();
  waiting_.push(kj::mv(pf.fulfiller));
  OnDone();
  return kj::mv(pf.promise);
}

kj::Promise<void> AdmissionPool::Idle() {
  if (running_ == 0 && waiting_.empty()) return kj::READY_NOW;
  auto pf = kj::newPromiseAndFulfiller<void>();
  idle_waiters_.push(kj::mv(pf.fulfiller));
  return kj::mv(pf.promise);
}

void AdmissionPool::OnDone() {
  while (!waiting_.empty() && running_ < size_) {
    kj::Own<kj::PromiseFulfiller<Permit>> next = kj::mv(waiting_.front());
    waiting_.pop();
    // The caller went away while queued.
    if (!next->isWaiting()) continue;
    running_++;
    next->fulfill(Permit(this));
  }
  // Waiters that gave up are only noticed when they reach the front.
  while (!waiting_.empty() && !waiting_.front()->isWaiting()) waiting_.pop();
  if (running_ == 0 && waiting_.empty()) {
    while (!idle_waiters_.empty()) {
      idle_waiters_.front()->fulfill();
      idle_waiters_.pop();
    }
  }
}

}  // namespace executor
