#include "brainforge/brain/event.hpp"
#include "brainforge/brain/run_status.hpp"
#include "brainforge/core/asio_awaitable.hpp"
#include "brainforge/core/when_all.hpp"
#include "brainforge/util/id.hpp"
#include "brainforge/util/retry.hpp"
#include "brainforge/util/semaphore.hpp"
#include "brainforge/util/time.hpp"

#include "test_utils.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>

#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace brainforge;
using namespace std::chrono_literals;
using brainforge::test::run_coro;

// ---------------------------------------------------------------------------
// Retry
// ---------------------------------------------------------------------------

TEST(RetryTest, DelayPerBackoffKind) {
  RetryConfig cfg{.max_retries = 5,
                  .backoff = Backoff::Exponential,
                  .initial_delay = 100ms,
                  .max_delay = 1000ms};
  EXPECT_EQ(retry_delay(cfg, 0), 100ms);
  EXPECT_EQ(retry_delay(cfg, 1), 200ms);
  EXPECT_EQ(retry_delay(cfg, 2), 400ms);
  EXPECT_EQ(retry_delay(cfg, 3), 800ms);
  EXPECT_EQ(retry_delay(cfg, 4), 1000ms);
  EXPECT_EQ(retry_delay(cfg, 40), 1000ms);

  cfg.backoff = Backoff::Linear;
  EXPECT_EQ(retry_delay(cfg, 0), 100ms);
  EXPECT_EQ(retry_delay(cfg, 1), 200ms);
  EXPECT_EQ(retry_delay(cfg, 2), 300ms);
  EXPECT_EQ(retry_delay(cfg, 20), 1000ms);

  cfg.backoff = Backoff::None;
  EXPECT_EQ(retry_delay(cfg, 0), 100ms);
  EXPECT_EQ(retry_delay(cfg, 7), 100ms);
}

TEST(RetryTest, SucceedsAfterTransientFailures) {
  int calls = 0;
  std::vector<int> reported;
  auto result = run_coro(execute_with_retry(
      [&]() -> task<Result<int>> {
        ++calls;
        if (calls < 3) {
          co_return fail(Error::Timeout);
        }
        co_return 42;
      },
      RetryConfig{.max_retries = 5, .initial_delay = 1ms, .max_delay = 2ms},
      [&](const RetryFailure &f) {
        reported.push_back(f.attempt);
        EXPECT_EQ(f.code, Error::Timeout);
      }));
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, 42);
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(reported, (std::vector<int>{1, 2}));
}

TEST(RetryTest, ExhaustionReturnsLastErrorUntouched) {
  int calls = 0;
  auto result = run_coro(execute_with_retry(
      [&]() -> task<Result<int>> {
        ++calls;
        co_return fail(calls == 3 ? Error::ModelFailed : Error::Timeout);
      },
      RetryConfig{.max_retries = 2,
                  .backoff = Backoff::None,
                  .initial_delay = 1ms}));
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error(), Error::ModelFailed);
  EXPECT_EQ(calls, 3);
}

TEST(RetryTest, ZeroRetriesRunsOnce) {
  int calls = 0;
  auto result = run_coro(execute_with_retry(
      [&]() -> task<Result<void>> {
        ++calls;
        co_return fail(Error::StepFailed);
      },
      RetryConfig{.max_retries = 0}));
  EXPECT_FALSE(result);
  EXPECT_EQ(calls, 1);
}

TEST(RetryTest, ExceptionIsRethrownAfterLastAttempt) {
  int calls = 0;
  int retries = 0;
  EXPECT_THROW(
      (void)run_coro(execute_with_retry(
          [&]() -> task<Result<int>> {
            ++calls;
            throw std::runtime_error("boom");
            co_return 0;
          },
          RetryConfig{.max_retries = 1, .initial_delay = 1ms},
          [&](const RetryFailure &f) {
            ++retries;
            EXPECT_TRUE(f.exception);
            EXPECT_EQ(f.message, "boom");
          })),
      std::runtime_error);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(retries, 1);
}

// ---------------------------------------------------------------------------
// Semaphore
// ---------------------------------------------------------------------------

TEST(SemaphoreTest, TryAcquireRespectsLimit) {
  Semaphore sem(2);
  EXPECT_TRUE(sem.try_acquire());
  EXPECT_TRUE(sem.try_acquire());
  EXPECT_FALSE(sem.try_acquire());
  EXPECT_EQ(sem.available(), 0U);
  sem.release();
  EXPECT_EQ(sem.available(), 1U);
  sem.release();
  EXPECT_EQ(sem.available(), 2U);
}

TEST(SemaphoreTest, WaitersAreServedInFifoOrder) {
  Semaphore sem(1);
  std::vector<int> order;

  auto worker = [&](int id) -> task<Result<void>> {
    auto permit = co_await sem.scoped();
    if (!permit) {
      co_return fail(permit.error());
    }
    order.push_back(id);
    (void)co_await async_sleep(2ms);
    co_return ok();
  };

  run_coro([&]() -> task<void> {
    std::vector<task<Result<void>>> jobs;
    for (int i = 0; i < 5; ++i) {
      jobs.push_back(worker(i));
    }
    auto results = co_await when_all(std::move(jobs));
    for (const auto &r : results) {
      EXPECT_TRUE(r);
    }
  }());

  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
  EXPECT_EQ(sem.available(), 1U);
  EXPECT_EQ(sem.waiting(), 0U);
}

TEST(SemaphoreTest, BoundsConcurrency) {
  Semaphore sem(3);
  int active = 0;
  int peak = 0;

  auto worker = [&]() -> task<int> {
    auto permit = co_await sem.scoped();
    EXPECT_TRUE(permit);
    ++active;
    peak = std::max(peak, active);
    (void)co_await async_sleep(3ms);
    --active;
    co_return 0;
  };

  run_coro([&]() -> task<void> {
    std::vector<task<int>> jobs;
    for (int i = 0; i < 10; ++i) {
      jobs.push_back(worker());
    }
    (void)co_await when_all(std::move(jobs));
  }());

  EXPECT_EQ(peak, 3);
  EXPECT_EQ(sem.available(), 3U);
}

TEST(SemaphoreTest, PermitReleasesWhenWorkThrows) {
  Semaphore sem(1);
  auto failing = [&]() -> task<void> {
    auto permit = co_await sem.scoped();
    EXPECT_TRUE(permit);
    throw std::runtime_error("step blew up");
  };
  EXPECT_THROW(run_coro(failing()), std::runtime_error);
  EXPECT_EQ(sem.available(), 1U);
}

TEST(SemaphoreTest, CancelledWaitDoesNotLeakSlot) {
  using namespace boost::asio::experimental::awaitable_operators;
  Semaphore sem(1);
  ASSERT_TRUE(sem.try_acquire());

  auto outcome = run_coro([&]() -> task<std::size_t> {
    auto winner = co_await (sem.acquire() || async_sleep(10ms));
    co_return winner.index();
  }());
  EXPECT_EQ(outcome, 1U);
  EXPECT_EQ(sem.waiting(), 0U);

  sem.release();
  EXPECT_EQ(sem.available(), 1U);
}

// ---------------------------------------------------------------------------
// when_all
// ---------------------------------------------------------------------------

TEST(WhenAllTest, ResultsKeepInputOrder) {
  auto delayed = [](int value, std::chrono::milliseconds d) -> task<int> {
    (void)co_await async_sleep(d);
    co_return value;
  };
  auto results = run_coro([&]() -> task<std::vector<int>> {
    std::vector<task<int>> jobs;
    jobs.push_back(delayed(1, 15ms));
    jobs.push_back(delayed(2, 1ms));
    jobs.push_back(delayed(3, 5ms));
    co_return co_await when_all(std::move(jobs));
  }());
  EXPECT_EQ(results, (std::vector<int>{1, 2, 3}));
}

TEST(WhenAllTest, EmptyInput) {
  auto results = run_coro(when_all(std::vector<task<int>>{}));
  EXPECT_TRUE(results.empty());
}

TEST(WhenAllTest, RethrowsAfterAllFinished) {
  int finished = 0;
  auto ok_job = [&]() -> task<int> {
    (void)co_await async_sleep(5ms);
    ++finished;
    co_return 1;
  };
  auto bad_job = []() -> task<int> {
    throw std::logic_error("bad");
    co_return 0;
  };
  EXPECT_THROW(run_coro([&]() -> task<void> {
                 std::vector<task<int>> jobs;
                 jobs.push_back(ok_job());
                 jobs.push_back(bad_job());
                 (void)co_await when_all(std::move(jobs));
               }()),
               std::logic_error);
  EXPECT_EQ(finished, 1);
}

// ---------------------------------------------------------------------------
// Enums, ids, time
// ---------------------------------------------------------------------------

TEST(EnumSerdeTest, SnakeCaseNames) {
  EXPECT_EQ(util::enum_name_to_snake_case("WebhookResponse"),
            "webhook_response");
  EXPECT_EQ(util::enum_name_to_snake_case("HTTPStatus"), "http_status");
  EXPECT_EQ(to_string_view(EventType::AgentToolResult), "agent_tool_result");
  EXPECT_EQ(to_string_view(RunStatus::Waiting), "waiting");
}

TEST(EnumSerdeTest, ParseFallsBackToDefault) {
  EXPECT_EQ(parse<RunStatus>("cancelled"), RunStatus::Cancelled);
  EXPECT_EQ(parse<RunStatus>("bogus"), RunStatus::Pending);
  EXPECT_FALSE(util::try_parse_enum<EventType>("Start").has_value());
  EXPECT_EQ(util::try_parse_enum<EventType>("step_complete"),
            EventType::StepComplete);
}

TEST(IdTest, GeneratedRunIdsAreUnique) {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    auto id = generate_run_id();
    ASSERT_FALSE(id.empty());
    EXPECT_TRUE(seen.insert(id.str()).second);
  }
}

TEST(IdTest, FormatsAsPlainString) {
  RunId id{"run-123"};
  EXPECT_EQ(std::format("{}", id), "run-123");
  EXPECT_TRUE(id == std::string_view("run-123"));
}

TEST(TimeTest, FormatIso8601) {
  EXPECT_EQ(util::format_iso8601(0), "");
  EXPECT_EQ(util::format_iso8601(1700000000123), "2023-11-14T22:13:20.123Z");
}
