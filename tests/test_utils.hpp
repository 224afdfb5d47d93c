#pragma once

#include "brainforge/brain/brain.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/util/id.hpp"
#include "brainforge/util/json.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

namespace brainforge::test {

// Run a coroutine on `io` until it completes and return its result.
// Throws if the coroutine does not complete within `timeout`.
template <typename T>
[[nodiscard]] inline auto
run_on(boost::asio::io_context &io, task<T> coro,
       std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  io.restart();
  auto fut = co_spawn(io, std::move(coro), boost::asio::use_future);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (fut.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
    if (std::chrono::steady_clock::now() > deadline) {
      throw std::runtime_error("run_on timed out");
    }
    if (io.stopped()) {
      io.restart();
    }
    io.run_one_for(std::chrono::milliseconds(10));
  }
  return fut.get();
}

// Run a coroutine synchronously on a fresh io_context and return its result.
template <typename T>
[[nodiscard]] inline auto
run_coro(task<T> coro,
         std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> T {
  boost::asio::io_context io;
  return run_on(io, std::move(coro), timeout);
}

// Process handlers (timers included) on `io` for `duration`.
inline void drive_for(boost::asio::io_context &io,
                      std::chrono::milliseconds duration) {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (std::chrono::steady_clock::now() < deadline) {
    io.restart();
    if (io.run_one_for(std::chrono::milliseconds(5)) == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
}

template <typename Predicate>
[[nodiscard]] inline auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (std::invoke(std::forward<Predicate>(predicate))) {
      return true;
    }
    std::this_thread::sleep_for(interval);
  }
  return std::invoke(std::forward<Predicate>(predicate));
}

[[nodiscard]] inline auto json(std::string_view text) -> JsonValue {
  auto parsed = parse_json(text);
  if (!parsed) {
    throw std::runtime_error("invalid JSON in test");
  }
  return std::move(*parsed);
}

[[nodiscard]] inline auto run_id(std::string_view s) -> RunId {
  return RunId{std::string{s}};
}

// Step that merges `patch` (a JSON object) into the state.
[[nodiscard]] inline auto merge_step(std::string title, JsonValue patch,
                                     std::optional<WaitRequest> wait = {})
    -> StepBlock {
  return StepBlock{
      .title = std::move(title),
      .action = std::make_shared<StepFn>(
          [patch = std::move(patch),
           wait = std::move(wait)](const StepContext &ctx)
              -> task<Result<StepOutput>> {
            JsonValue next = ctx.state;
            for (const auto &[key, value] : patch.get_object()) {
              next.get_object().insert_or_assign(key, value);
            }
            co_return StepOutput{.state = std::move(next), .wait = wait};
          }),
  };
}

// Step that copies the webhook response it resumed with into `key`.
[[nodiscard]] inline auto capture_response_step(std::string title,
                                                std::string key) -> StepBlock {
  return StepBlock{
      .title = std::move(title),
      .action = std::make_shared<StepFn>(
          [key = std::move(key)](const StepContext &ctx)
              -> task<Result<StepOutput>> {
            JsonValue next = ctx.state;
            next[key] = ctx.webhook_response.value_or(JsonValue{});
            co_return StepOutput{.state = std::move(next)};
          }),
  };
}

[[nodiscard]] inline auto wait_for(std::string slug, std::string identifier,
                                   std::optional<std::string> token = {},
                                   std::optional<std::chrono::milliseconds>
                                       timeout = {}) -> WaitRequest {
  return WaitRequest{.wait_for = {WaitFor{.slug = std::move(slug),
                                          .identifier = std::move(identifier),
                                          .token = std::move(token)}},
                     .timeout = timeout};
}

[[nodiscard]] inline auto make_brain(std::string title,
                                     std::vector<Block> blocks)
    -> std::shared_ptr<const Brain> {
  return std::make_shared<const Brain>(Brain{.title = std::move(title),
                                             .description = "test brain",
                                             .blocks = std::move(blocks)});
}

[[nodiscard]] inline auto
make_temp_dir(std::string_view prefix = "brainforge_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  char *path = ::mkdtemp(templ.data());
  return path ? std::string(path) : "";
}

[[nodiscard]] inline auto
make_temp_path(std::string_view prefix = "brainforge_test_") -> std::string {
  std::string templ = std::string("/tmp/") + std::string(prefix) + "XXXXXX";
  int fd = ::mkstemp(templ.data());
  if (fd < 0) {
    return "";
  }
  ::close(fd);
  return templ;
}

} // namespace brainforge::test
