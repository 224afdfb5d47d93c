#include "brainforge/util/semaphore.hpp"

#include "brainforge/core/asio_awaitable.hpp"

#include <algorithm>
#include <utility>

namespace brainforge {

SemaphorePermit::~SemaphorePermit() { release(); }

auto SemaphorePermit::operator=(SemaphorePermit &&other) noexcept
    -> SemaphorePermit & {
  if (this != &other) {
    release();
    owner_ = std::exchange(other.owner_, nullptr);
  }
  return *this;
}

auto SemaphorePermit::release() noexcept -> void {
  if (auto *owner = std::exchange(owner_, nullptr)) {
    owner->release();
  }
}

Semaphore::Semaphore(std::size_t max_permits)
    : max_(std::max<std::size_t>(1, max_permits)) {}

auto Semaphore::try_acquire() -> bool {
  std::lock_guard lock(mu_);
  if (in_use_ < max_ && waiters_.empty()) {
    ++in_use_;
    return true;
  }
  return false;
}

auto Semaphore::acquire() -> task<Result<void>> {
  auto executor = co_await boost::asio::this_coro::executor;
  std::shared_ptr<Waiter> waiter;
  {
    std::lock_guard lock(mu_);
    if (in_use_ < max_ && waiters_.empty()) {
      ++in_use_;
      co_return ok();
    }
    waiter = std::make_shared<Waiter>(executor, 1);
    waiters_.push_back(waiter);
  }

  auto [ec] = co_await waiter->async_receive(use_nothrow);
  if (!ec) {
    co_return ok();
  }

  bool handed_over = false;
  {
    std::lock_guard lock(mu_);
    auto it = std::ranges::find(waiters_, waiter);
    if (it != waiters_.end()) {
      waiters_.erase(it);
    } else {
      handed_over = true;
    }
  }
  // A slot sent to us after the wait was aborted passes on to the next one.
  if (handed_over) {
    release();
  }
  co_return fail(Error::Cancelled);
}

auto Semaphore::release() -> void {
  std::shared_ptr<Waiter> next;
  {
    std::lock_guard lock(mu_);
    if (waiters_.empty()) {
      if (in_use_ > 0) {
        --in_use_;
      }
      return;
    }
    next = std::move(waiters_.front());
    waiters_.pop_front();
  }
  (void)next->try_send(boost::system::error_code{});
}

auto Semaphore::scoped() -> task<Result<SemaphorePermit>> {
  if (auto r = co_await acquire(); !r) {
    co_return fail(r.error());
  }
  co_return SemaphorePermit{this};
}

auto Semaphore::available() const -> std::size_t {
  std::lock_guard lock(mu_);
  return max_ - in_use_;
}

auto Semaphore::waiting() const -> std::size_t {
  std::lock_guard lock(mu_);
  return waiters_.size();
}

} // namespace brainforge
