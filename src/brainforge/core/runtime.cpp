#include "brainforge/core/runtime.hpp"

#include "brainforge/util/log.hpp"

#include <algorithm>
#include <functional>
#include <ranges>

namespace brainforge {

namespace {
thread_local shard_id t_current_shard = kInvalidShard;
} // namespace

Runtime::Runtime(unsigned num_shards) {
  if (num_shards == 0) {
    num_shards = std::max(1U, std::thread::hardware_concurrency());
  }
  num_shards_ = num_shards;

  contexts_.reserve(num_shards);
  work_guards_.resize(num_shards);
  for ([[maybe_unused]] auto i : std::views::iota(0U, num_shards)) {
    contexts_.emplace_back(std::make_unique<boost::asio::io_context>(1));
  }
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  log::debug("Starting runtime with {} shards", num_shards_);

  threads_.reserve(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    auto &ctx = *contexts_[i];
    ctx.restart();
    work_guards_[i].emplace(boost::asio::make_work_guard(ctx));
    threads_.emplace_back([this, i] { run_shard(i); });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }

  for (auto i : std::views::iota(0U, num_shards_)) {
    if (work_guards_[i].has_value()) {
      work_guards_[i]->reset();
      work_guards_[i].reset();
    }
    contexts_[i]->stop();
  }

  // std::jthread joins on destruction
  threads_.clear();
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::shard_for(std::string_view key) const noexcept -> shard_id {
  return static_cast<shard_id>(std::hash<std::string_view>{}(key) %
                               num_shards_);
}

auto Runtime::executor_for(shard_id id)
    -> boost::asio::io_context::executor_type {
  return contexts_.at(id)->get_executor();
}

auto Runtime::current_shard() const noexcept -> shard_id {
  return t_current_shard;
}

auto Runtime::run_shard(shard_id id) -> void {
  t_current_shard = id;
  auto &ctx = *contexts_[id];
  for (;;) {
    try {
      ctx.run();
      break;
    } catch (const std::exception &e) {
      log::error("Unhandled exception on shard {}: {}", id, e.what());
    }
  }
  t_current_shard = kInvalidShard;
}

} // namespace brainforge
