#pragma once

#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace brainforge {

class Semaphore;

/// Move-only slot handle, releases on destruction.
class SemaphorePermit {
public:
  SemaphorePermit() = default;
  explicit SemaphorePermit(Semaphore *owner) noexcept : owner_(owner) {}
  ~SemaphorePermit();

  SemaphorePermit(SemaphorePermit &&other) noexcept
      : owner_(std::exchange(other.owner_, nullptr)) {}
  auto operator=(SemaphorePermit &&other) noexcept -> SemaphorePermit &;

  SemaphorePermit(const SemaphorePermit &) = delete;
  auto operator=(const SemaphorePermit &) -> SemaphorePermit & = delete;

  [[nodiscard]] auto owns_slot() const noexcept -> bool {
    return owner_ != nullptr;
  }

  auto release() noexcept -> void;

private:
  Semaphore *owner_{nullptr};
};

/// Counting semaphore for coroutines. Waiters are served strictly FIFO: a
/// released slot goes to the oldest waiter before the count drops.
class Semaphore {
public:
  explicit Semaphore(std::size_t max_permits);

  Semaphore(const Semaphore &) = delete;
  auto operator=(const Semaphore &) -> Semaphore & = delete;

  /// Suspends until a slot is free. Cancelled if the wait is aborted, in which
  /// case no slot is held.
  [[nodiscard]] auto acquire() -> task<Result<void>>;
  [[nodiscard]] auto try_acquire() -> bool;
  auto release() -> void;

  [[nodiscard]] auto scoped() -> task<Result<SemaphorePermit>>;

  [[nodiscard]] auto max_permits() const noexcept -> std::size_t {
    return max_;
  }
  [[nodiscard]] auto available() const -> std::size_t;
  [[nodiscard]] auto waiting() const -> std::size_t;

private:
  using Waiter = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code)>;

  mutable std::mutex mu_;
  std::size_t max_;
  std::size_t in_use_{0};
  std::deque<std::shared_ptr<Waiter>> waiters_;
};

} // namespace brainforge
