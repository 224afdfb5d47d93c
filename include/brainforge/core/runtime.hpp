#pragma once

#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

namespace brainforge {

using shard_id = unsigned;

inline constexpr shard_id kInvalidShard = std::numeric_limits<shard_id>::max();

/// Thread-per-shard event loops. Work keyed by a string (a run id) always
/// lands on the same shard, which gives each run a single-threaded executor.
class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }

  [[nodiscard]] auto shard_for(std::string_view key) const noexcept
      -> shard_id;

  [[nodiscard]] auto executor_for(shard_id id)
      -> boost::asio::io_context::executor_type;

  [[nodiscard]] auto current_shard() const noexcept -> shard_id;

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    co_spawn(executor_for(target), std::move(coro), detached);
  }

  /// Round-robin launch for work with no natural shard (accept loops,
  /// connections).
  template <typename T> auto spawn_external(task<T> coro) -> void {
    auto target = static_cast<shard_id>(
        external_rr_.fetch_add(1, std::memory_order_relaxed) % num_shards_);
    spawn_on(target, std::move(coro));
  }

  template <typename F> auto post_to(shard_id target, F &&fn) -> void {
    boost::asio::post(executor_for(target), std::forward<F>(fn));
  }

private:
  auto run_shard(shard_id id) -> void;

  std::atomic<bool> running_{false};
  unsigned num_shards_;
  std::vector<std::unique_ptr<boost::asio::io_context>> contexts_;
  std::vector<std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
  std::atomic<std::uint64_t> external_rr_{0};
};

} // namespace brainforge
