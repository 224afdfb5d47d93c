#pragma once

#include "brainforge/core/asio_awaitable.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace brainforge {

enum class Backoff : std::uint8_t {
  None,
  Linear,
  Exponential,
};
BOOST_DESCRIBE_ENUM(Backoff, None, Linear, Exponential)
BRAINFORGE_DEFINE_ENUM_SERDE(Backoff, Backoff::Exponential)

struct RetryConfig {
  int max_retries{0};
  Backoff backoff{Backoff::Exponential};
  std::chrono::milliseconds initial_delay{1000};
  std::chrono::milliseconds max_delay{30000};
};

/// One failed attempt, reported before the sleep that precedes the next one.
struct RetryFailure {
  int attempt{0};
  std::error_code code;
  std::exception_ptr exception;
  std::string message;
};

using RetryCallback = std::function<void(const RetryFailure &)>;

/// Delay before retrying after the zero-based `attempt` failed.
[[nodiscard]] inline auto retry_delay(const RetryConfig &cfg, int attempt)
    -> std::chrono::milliseconds {
  std::int64_t factor = 1;
  switch (cfg.backoff) {
  case Backoff::None:
    factor = 1;
    break;
  case Backoff::Linear:
    factor = attempt + 1;
    break;
  case Backoff::Exponential:
    factor = std::int64_t{1} << std::clamp(attempt, 0, 30);
    break;
  }
  const auto raw = cfg.initial_delay.count() * factor;
  return std::chrono::milliseconds{std::min(raw, cfg.max_delay.count())};
}

namespace detail {
template <typename T> struct is_result : std::false_type {};
template <typename T> struct is_result<Result<T>> : std::true_type {};

[[nodiscard]] inline auto describe_exception(const std::exception_ptr &e)
    -> std::string {
  try {
    std::rethrow_exception(e);
  } catch (const std::exception &ex) {
    return ex.what();
  }
  return {};
}
} // namespace detail

/// Runs `fn` up to `max_retries + 1` times. `fn` returns task<Result<T>>; an
/// error result or an escaping exception counts as a failed attempt. The final
/// failure is handed back untouched (the Result is returned, the exception is
/// rethrown).
template <typename Fn>
  requires std::invocable<Fn &>
[[nodiscard]] auto execute_with_retry(Fn fn, RetryConfig cfg,
                                      RetryCallback on_retry = {})
    -> std::invoke_result_t<Fn &> {
  using Awaitable = std::invoke_result_t<Fn &>;
  using ResultT = typename Awaitable::value_type;
  static_assert(detail::is_result<ResultT>::value,
                "retried work must return task<Result<T>>");

  const int attempts = std::max(0, cfg.max_retries) + 1;
  for (int attempt = 0;; ++attempt) {
    std::optional<ResultT> outcome;
    std::exception_ptr thrown;
    try {
      outcome.emplace(co_await fn());
    } catch (const std::exception &) {
      thrown = std::current_exception();
    }

    if (outcome && outcome->has_value()) {
      co_return std::move(*outcome);
    }
    if (attempt + 1 >= attempts) {
      if (thrown) {
        std::rethrow_exception(thrown);
      }
      co_return std::move(*outcome);
    }

    if (on_retry) {
      RetryFailure failure{.attempt = attempt + 1};
      if (thrown) {
        failure.exception = thrown;
        failure.message = detail::describe_exception(thrown);
      } else {
        failure.code = outcome->error();
        failure.message = failure.code.message();
      }
      on_retry(failure);
    }

    if (auto slept = co_await async_sleep(retry_delay(cfg, attempt));
        !slept) {
      // The wait was cancelled: stop retrying and surface the last failure.
      if (thrown) {
        std::rethrow_exception(thrown);
      }
      co_return std::move(*outcome);
    }
  }
}

} // namespace brainforge
