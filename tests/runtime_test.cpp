#include "brainforge/core/runtime.hpp"
#include "brainforge/util/id.hpp"

#include <atomic>
#include <chrono>
#include <set>
#include <thread>

#include "gtest/gtest.h"

using namespace brainforge;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(1);
constexpr auto kTaskTimeout = std::chrono::seconds(1);
constexpr auto kRunningCheckDelay = std::chrono::milliseconds(50);

auto increment_counter(std::atomic<int> *count_ptr) -> spawn_task {
  count_ptr->fetch_add(1);
  co_return;
}

} // namespace

TEST(RuntimeTest, BasicStartStop) {
  Runtime rt(1);
  EXPECT_FALSE(rt.is_running());
  ASSERT_TRUE(rt.start());
  EXPECT_TRUE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, ShardCount) {
  Runtime rt(1);
  EXPECT_EQ(rt.shard_count(), 1);

  Runtime rt4(4);
  EXPECT_EQ(rt4.shard_count(), 4);
}

TEST(RuntimeTest, ZeroShardsDefaultsToHardware) {
  Runtime rt(0);
  EXPECT_GE(rt.shard_count(), 1);
}

TEST(RuntimeTest, StopIsIdempotent) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, CurrentShardReturnsInvalidOutsideContext) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());
  EXPECT_EQ(rt.current_shard(), kInvalidShard);
  rt.stop();
}

TEST(RuntimeTest, MultipleStartStops) {
  Runtime rt(1);

  ASSERT_TRUE(rt.start());
  EXPECT_TRUE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());

  ASSERT_TRUE(rt.start());
  EXPECT_TRUE(rt.is_running());

  std::atomic<int> count = 0;
  rt.spawn_on(0, increment_counter(&count));
  auto deadline = std::chrono::steady_clock::now() + kTaskTimeout;
  while (count.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kPollInterval);
  }
  EXPECT_EQ(count.load(), 1);
  rt.stop();
}

TEST(RuntimeTest, ShardForIsStablePerRun) {
  Runtime rt(4);
  for (int i = 0; i < 32; ++i) {
    auto id = generate_run_id();
    auto shard = rt.shard_for(id.value());
    EXPECT_LT(shard, 4U);
    EXPECT_EQ(rt.shard_for(id.value()), shard);
  }
}

TEST(RuntimeTest, ShardForSpreadsRuns) {
  Runtime rt(4);
  std::set<shard_id> used;
  for (int i = 0; i < 256; ++i) {
    used.insert(rt.shard_for(generate_run_id().value()));
  }
  EXPECT_GT(used.size(), 1U);
}

TEST(RuntimeTest, SpawnOnTargetShard) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());

  std::atomic<uint32_t> observed{kInvalidShard};
  auto on_target = [&]() -> spawn_task {
    observed.store(rt.current_shard(), std::memory_order_relaxed);
    co_return;
  };
  rt.spawn_on(1, on_target());

  auto deadline = std::chrono::steady_clock::now() + kTaskTimeout;
  while (observed.load(std::memory_order_relaxed) == kInvalidShard &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kPollInterval);
  }
  EXPECT_EQ(observed.load(std::memory_order_relaxed), 1U);

  rt.stop();
}

TEST(RuntimeTest, SpawnExternalRunsTask) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start());

  std::atomic<int> count = 0;
  rt.spawn_external(increment_counter(&count));

  auto deadline = std::chrono::steady_clock::now() + kTaskTimeout;
  while (count.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kPollInterval);
  }
  EXPECT_EQ(count.load(), 1);

  rt.stop();
}

TEST(RuntimeTest, SpawnAfterStopIsNoOp) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start());
  rt.stop();

  std::atomic<int> count = 0;
  rt.spawn_external(increment_counter(&count));

  std::this_thread::sleep_for(kRunningCheckDelay);
  EXPECT_EQ(count.load(), 0);
}
