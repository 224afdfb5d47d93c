#pragma once

#include "brainforge/core/coroutine.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <vector>

namespace brainforge {

/// Run every task concurrently on the caller's executor and collect the
/// results in input order. The first exception (by index) is rethrown once all
/// tasks have finished.
template <typename T>
[[nodiscard]] auto when_all(std::vector<task<T>> tasks)
    -> task<std::vector<T>> {
  using DoneChannel = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code, std::size_t)>;

  struct State {
    std::vector<std::optional<T>> slots;
    std::vector<std::exception_ptr> errors;
  };

  const auto count = tasks.size();
  if (count == 0) {
    co_return std::vector<T>{};
  }

  auto executor = co_await boost::asio::this_coro::executor;
  auto state = std::make_shared<State>();
  state->slots.resize(count);
  state->errors.resize(count);
  auto done = std::make_shared<DoneChannel>(executor, count);

  for (std::size_t i = 0; i < count; ++i) {
    co_spawn(
        executor,
        [state, i, work = std::move(tasks[i])]() mutable -> task<void> {
          state->slots[i].emplace(co_await std::move(work));
        },
        [state, done, i](std::exception_ptr e) {
          state->errors[i] = e;
          done->try_send(boost::system::error_code{}, i);
        });
  }

  for (std::size_t received = 0; received < count; ++received) {
    co_await done->async_receive(use_awaitable);
  }

  for (const auto &e : state->errors) {
    if (e) {
      std::rethrow_exception(e);
    }
  }

  std::vector<T> out;
  out.reserve(count);
  for (auto &slot : state->slots) {
    out.emplace_back(std::move(*slot));
  }
  co_return out;
}

} // namespace brainforge
