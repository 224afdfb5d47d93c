#include "brainforge/brain/event_codec.hpp"
#include "brainforge/engine/event_log.hpp"
#include "brainforge/storage/memory_store.hpp"

#include "test_utils.hpp"

#include <string>

#include "gtest/gtest.h"

using namespace brainforge;
using namespace brainforge::storage;
using brainforge::test::json;
using brainforge::test::run_coro;
using brainforge::test::run_id;

namespace {

constexpr std::size_t kSmallThreshold = 256;
constexpr auto kSlowBlobRead = std::chrono::milliseconds(20);

auto start_event(const RunId &run) -> Event {
  return Event{.run_id = run,
               .timestamp = 1,
               .body = StartEvent{.title = "brain",
                                  .initial_state = json("{}")}};
}

// A STEP_COMPLETE whose serialized form is well over kSmallThreshold.
auto big_step_event(const RunId &run, int index) -> Event {
  auto value = json("\"" +
                    std::string(1024, static_cast<char>('a' + index % 26)) +
                    "\"");
  return Event{
      .run_id = run,
      .timestamp = 2 + index,
      .body = StepCompleteEvent{
          .step_id = step_id_for(static_cast<std::size_t>(index)),
          .step_title = "big",
          .patch = {PatchOperation{.op = PatchOpKind::Add,
                                   .path = "/blob" + std::to_string(index),
                                   .value = std::move(value)}}}};
}

} // namespace

TEST(EventLogTest, SmallEventsStayInline) {
  MemoryStore store;
  MemoryBlobStore blobs;
  EventLog log(store, blobs, kSmallThreshold);
  auto run = run_id("run-inline");

  auto event = start_event(run);
  ASSERT_TRUE(run_coro(log.append(event)));
  EXPECT_GT(event.event_id, 0);

  auto rows = run_coro(store.load_rows(run));
  ASSERT_TRUE(rows);
  ASSERT_EQ(rows->size(), 1U);
  EXPECT_TRUE((*rows)[0].serialized_event.has_value());
  EXPECT_FALSE((*rows)[0].blob_key.has_value());
  EXPECT_EQ(blobs.size(), 0U);
}

TEST(EventLogTest, LargeEventsOverflowToBlobStore) {
  MemoryStore store;
  MemoryBlobStore blobs;
  EventLog log(store, blobs, kSmallThreshold);
  auto run = run_id("run-overflow");

  auto start = start_event(run);
  auto big = big_step_event(run, 0);
  run_coro([&]() -> task<void> {
    EXPECT_TRUE(co_await log.append(start));
    EXPECT_TRUE(co_await log.append(big));
  }());

  const auto key = event_blob_key(run, big.event_id);
  EXPECT_EQ(key, "events/run-overflow/" + std::to_string(big.event_id) +
                     ".json");
  EXPECT_TRUE(blobs.contains(key));

  auto rows = run_coro(store.load_rows(run));
  ASSERT_TRUE(rows);
  ASSERT_EQ(rows->size(), 2U);
  EXPECT_FALSE((*rows)[1].serialized_event.has_value());
  EXPECT_EQ((*rows)[1].blob_key, key);
  EXPECT_EQ((*rows)[1].event_type, EventType::StepComplete);

  EventLoader loader(store, blobs);
  auto events = run_coro(loader.load_all_events(run));
  ASSERT_TRUE(events) << events.error().message();
  ASSERT_EQ(events->size(), 2U);
  EXPECT_EQ((*events)[1].event_id, big.event_id);
  const auto *step = (*events)[1].as<StepCompleteEvent>();
  ASSERT_NE(step, nullptr);
  EXPECT_EQ(step->patch[0].path, "/blob0");
}

TEST(EventLogTest, ThresholdIsInclusive) {
  MemoryStore store;
  MemoryBlobStore blobs;
  auto run = run_id("run-edge");
  auto event = start_event(run);
  const auto size = serialize_event(event).size();

  EventLog exact(store, blobs, size);
  ASSERT_TRUE(run_coro(exact.append(event)));
  EXPECT_EQ(blobs.size(), 0U);

  EventLog below(store, blobs, size - 1);
  auto again = start_event(run);
  ASSERT_TRUE(run_coro(below.append(again)));
  EXPECT_EQ(blobs.size(), 1U);
}

TEST(EventLoaderTest, HydratesOverflowedEventsConcurrently) {
  MemoryStore store;
  MemoryBlobStore blobs(kSlowBlobRead);
  EventLog log(store, blobs, kSmallThreshold);
  auto run = run_id("run-parallel");

  constexpr int kBigEvents = 6;
  run_coro([&]() -> task<void> {
    auto start = start_event(run);
    EXPECT_TRUE(co_await log.append(start));
    for (int i = 0; i < kBigEvents; ++i) {
      auto big = big_step_event(run, i);
      EXPECT_TRUE(co_await log.append(big));
    }
  }());

  EventLoader loader(store, blobs);
  const auto began = std::chrono::steady_clock::now();
  auto events = run_coro(loader.load_all_events(run));
  const auto elapsed = std::chrono::steady_clock::now() - began;

  ASSERT_TRUE(events) << events.error().message();
  ASSERT_EQ(events->size(), static_cast<std::size_t>(kBigEvents + 1));
  for (int i = 0; i < kBigEvents; ++i) {
    const auto *step = (*events)[static_cast<std::size_t>(i + 1)]
                           .as<StepCompleteEvent>();
    ASSERT_NE(step, nullptr);
    EXPECT_EQ(step->patch[0].path, "/blob" + std::to_string(i));
  }
  EXPECT_GT(blobs.max_concurrent_gets(), 1);
  EXPECT_LT(elapsed, kSlowBlobRead * kBigEvents);
}

TEST(EventLoaderTest, MissingBlobIsFatal) {
  MemoryStore store;
  MemoryBlobStore blobs;
  EventLog log(store, blobs, kSmallThreshold);
  auto run = run_id("run-missing");

  auto big = big_step_event(run, 0);
  run_coro([&]() -> task<void> {
    auto start = start_event(run);
    EXPECT_TRUE(co_await log.append(start));
    EXPECT_TRUE(co_await log.append(big));
    EXPECT_TRUE(co_await blobs.remove(event_blob_key(run, big.event_id)));
  }());

  EventLoader loader(store, blobs);
  auto events = run_coro(loader.load_all_events(run));
  ASSERT_FALSE(events);
  EXPECT_EQ(events.error(), Error::BlobMissing);
  EXPECT_TRUE(is_replay_fatal(events.error()));
}

TEST(EventLoaderTest, PendingBlobKeyIsFatal) {
  MemoryStore store;
  MemoryBlobStore blobs;
  auto run = run_id("run-pending");
  auto start = start_event(run);
  store.put_raw_row(run, EventRow{.event_id = 1,
                                  .event_type = EventType::Start,
                                  .serialized_event = serialize_event(start)});
  store.put_raw_row(run,
                    EventRow{.event_id = 2,
                             .event_type = EventType::StepComplete,
                             .blob_key = std::string(kPendingBlobKey)});

  EventLoader loader(store, blobs);
  auto events = run_coro(loader.load_all_events(run));
  ASSERT_FALSE(events);
  EXPECT_EQ(events.error(), Error::BlobMissing);
}

TEST(EventLoaderTest, CorruptRowIsFatal) {
  MemoryStore store;
  MemoryBlobStore blobs;
  auto run = run_id("run-corrupt");
  store.put_raw_row(run, EventRow{.event_id = 1,
                                  .event_type = EventType::Start,
                                  .serialized_event = "{\"type\":\"nope\"}"});
  EventLoader loader(store, blobs);
  auto events = run_coro(loader.load_all_events(run));
  ASSERT_FALSE(events);
  EXPECT_EQ(events.error(), Error::CorruptEventLog);
}

TEST(EventLoaderTest, LoadEventByType) {
  MemoryStore store;
  MemoryBlobStore blobs;
  EventLog log(store, blobs, kSmallThreshold);
  auto run = run_id("run-by-type");

  run_coro([&]() -> task<void> {
    auto start = start_event(run);
    EXPECT_TRUE(co_await log.append(start));
    for (const char *identifier : {"first", "second"}) {
      Event wait{.run_id = run,
                 .body = WebhookEvent{.wait_for = {WaitFor{
                                          .slug = "hook",
                                          .identifier = identifier}}}};
      EXPECT_TRUE(co_await log.append(wait));
    }
  }());

  EventLoader loader(store, blobs);
  auto first = run_coro(
      loader.load_event_by_type(run, EventType::Webhook, EventOrder::Ascending));
  ASSERT_TRUE(first && first->has_value());
  EXPECT_EQ((*first)->as<WebhookEvent>()->wait_for[0].identifier, "first");

  auto last = run_coro(loader.load_event_by_type(run, EventType::Webhook,
                                                 EventOrder::Descending));
  ASSERT_TRUE(last && last->has_value());
  EXPECT_EQ((*last)->as<WebhookEvent>()->wait_for[0].identifier, "second");

  auto none = run_coro(loader.load_event_by_type(run, EventType::Complete,
                                                 EventOrder::Descending));
  ASSERT_TRUE(none);
  EXPECT_FALSE(none->has_value());
}
