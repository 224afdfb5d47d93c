#pragma once

#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <tuple>

namespace brainforge {

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

template <typename T>
[[nodiscard]] inline auto
as_result(std::tuple<boost::system::error_code, T> &&v) -> Result<T> {
  auto [ec, value] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok();
}

/// Suspend the calling coroutine on its own executor. Returns Cancelled if the
/// wait was aborted.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> task<Result<void>> {
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
  timer.expires_after(duration);
  auto [ec] = co_await timer.async_wait(use_nothrow);
  if (ec) {
    co_return fail(Error::Cancelled);
  }
  co_return ok();
}

} // namespace brainforge
