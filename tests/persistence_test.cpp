#include "brainforge/brain/event_codec.hpp"
#include "brainforge/engine/engine.hpp"
#include "brainforge/engine/event_log.hpp"
#include "brainforge/storage/memory_store.hpp"
#include "brainforge/storage/mysql_database.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <cstdlib>
#include <memory>
#include <string>

using namespace brainforge;
using namespace brainforge::test;

namespace {

auto env_or_default(const char *key, std::string fallback) -> std::string {
  if (const char *v = std::getenv(key); v && *v != '\0') {
    return v;
  }
  return fallback;
}

auto load_test_db_config() -> DatabaseConfig {
  DatabaseConfig cfg;
  cfg.host = env_or_default("BRAINFORGE_TEST_MYSQL_HOST", cfg.host);
  cfg.username = env_or_default("BRAINFORGE_TEST_MYSQL_USER", cfg.username);
  cfg.password =
      env_or_default("BRAINFORGE_TEST_MYSQL_PASSWORD", cfg.password);
  cfg.database = env_or_default("BRAINFORGE_TEST_MYSQL_DB", cfg.database);
  cfg.connect_timeout = 2;
  return cfg;
}

} // namespace

class PersistenceTest : public ::testing::Test {
protected:
  void SetUp() override {
    db_ = std::make_unique<storage::MySQLDatabase>(io_.get_executor(),
                                                   load_test_db_config());
    Result<void> opened = fail(Error::DatabaseOpenFailed);
    try {
      opened = run_on(io_, db_->open(), std::chrono::seconds(15));
    } catch (const std::runtime_error &e) {
      GTEST_SKIP() << "MySQL unavailable for persistence tests: " << e.what();
    }
    if (!opened) {
      db_.reset();
      GTEST_SKIP() << "MySQL unavailable for persistence tests: "
                   << opened.error().message();
    }
  }

  void TearDown() override {
    if (db_) {
      run_on(io_, db_->close());
      db_.reset();
    }
  }

  auto start_event(const RunId &run) -> Event {
    return Event{.run_id = run,
                 .timestamp = 1,
                 .body = StartEvent{.title = "persisted",
                                    .initial_state = json(R"({"n":0})")}};
  }

  boost::asio::io_context io_;
  std::unique_ptr<storage::MySQLDatabase> db_;
};

TEST_F(PersistenceTest, EventRowsKeepInsertionOrder) {
  const auto run = generate_run_id();
  const auto body = serialize_event(start_event(run));

  auto first = run_on(io_, db_->insert_event(run, EventType::Start, body,
                                             std::nullopt));
  auto second = run_on(io_, db_->insert_event(run, EventType::StepComplete,
                                              std::nullopt,
                                              std::string(kPendingBlobKey)));
  ASSERT_TRUE(first && second);
  EXPECT_LT(*first, *second);

  const auto key = event_blob_key(run, *second);
  ASSERT_TRUE(run_on(io_, db_->update_blob_key(run, *second, key)));

  auto rows = run_on(io_, db_->load_rows(run));
  ASSERT_TRUE(rows);
  ASSERT_EQ(rows->size(), 2U);
  EXPECT_EQ((*rows)[0].event_type, EventType::Start);
  EXPECT_EQ((*rows)[0].serialized_event, body);
  EXPECT_FALSE((*rows)[0].blob_key.has_value());
  EXPECT_EQ((*rows)[1].blob_key, key);
  EXPECT_FALSE((*rows)[1].serialized_event.has_value());

  auto missing = run_on(io_, db_->update_blob_key(run, *second + 1000, key));
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error(), Error::NotFound);
}

TEST_F(PersistenceTest, LoadRowByTypeHonoursOrder) {
  const auto run = generate_run_id();
  for (const char *payload : {"{\"a\":1}", "{\"a\":2}"}) {
    ASSERT_TRUE(run_on(io_, db_->insert_event(run, EventType::Webhook,
                                              std::string(payload),
                                              std::nullopt)));
  }
  auto oldest = run_on(io_, db_->load_row_by_type(run, EventType::Webhook,
                                                  EventOrder::Ascending));
  auto newest = run_on(io_, db_->load_row_by_type(run, EventType::Webhook,
                                                  EventOrder::Descending));
  ASSERT_TRUE(oldest && oldest->has_value());
  ASSERT_TRUE(newest && newest->has_value());
  EXPECT_EQ((*oldest)->serialized_event, "{\"a\":1}");
  EXPECT_EQ((*newest)->serialized_event, "{\"a\":2}");

  auto none = run_on(io_, db_->load_row_by_type(run, EventType::Complete,
                                                EventOrder::Ascending));
  ASSERT_TRUE(none);
  EXPECT_FALSE(none->has_value());
}

TEST_F(PersistenceTest, SignalsAreConsumedOnceByKind) {
  const auto run = generate_run_id();
  ASSERT_TRUE(run_on(io_, db_->queue_signal(run, make_signal(SignalType::Pause))));
  ASSERT_TRUE(run_on(io_, db_->queue_signal(
                              run, make_signal(SignalType::WebhookResponse,
                                               json(R"({"ok":true})")))));
  ASSERT_TRUE(run_on(io_, db_->queue_signal(run, make_signal(SignalType::Kill))));

  auto control =
      run_on(io_, db_->get_and_consume_signals(run, SignalFilter::Control));
  ASSERT_TRUE(control);
  ASSERT_EQ(control->size(), 2U);
  EXPECT_EQ((*control)[0].type, SignalType::Pause);
  EXPECT_EQ((*control)[1].type, SignalType::Kill);

  auto webhook =
      run_on(io_, db_->get_and_consume_signals(run, SignalFilter::All));
  ASSERT_TRUE(webhook);
  ASSERT_EQ(webhook->size(), 1U);
  EXPECT_EQ((*webhook)[0].type, SignalType::WebhookResponse);
  EXPECT_TRUE(json_equal((*webhook)[0].payload, json(R"({"ok":true})")));

  auto drained =
      run_on(io_, db_->get_and_consume_signals(run, SignalFilter::All));
  ASSERT_TRUE(drained);
  EXPECT_TRUE(drained->empty());
}

TEST_F(PersistenceTest, WaitingRegistrationIsTakenOnce) {
  const auto run = generate_run_id();
  const auto slug = "approval-" + run.str();
  ASSERT_TRUE(run_on(io_, db_->register_waiting(
                              slug, "req-1",
                              storage::WaitingEntry{.run_id = run,
                                                    .token = "t0k3n"})));

  auto found = run_on(io_, db_->find_waiting_run(slug, "req-1"));
  ASSERT_TRUE(found && found->has_value());
  EXPECT_EQ((*found)->run_id, run);
  EXPECT_EQ((*found)->token, "t0k3n");

  auto other = run_on(io_, db_->take_waiting(slug, "req-1", generate_run_id()));
  ASSERT_TRUE(other);
  EXPECT_FALSE(*other);

  auto taken = run_on(io_, db_->take_waiting(slug, "req-1", run));
  auto again = run_on(io_, db_->take_waiting(slug, "req-1", run));
  ASSERT_TRUE(taken && again);
  EXPECT_TRUE(*taken);
  EXPECT_FALSE(*again);

  ASSERT_TRUE(run_on(io_, db_->register_waiting(
                              slug, "req-2",
                              storage::WaitingEntry{.run_id = run})));
  ASSERT_TRUE(run_on(io_, db_->clear_waiting(run)));
  auto cleared = run_on(io_, db_->find_waiting_run(slug, "req-2"));
  ASSERT_TRUE(cleared);
  EXPECT_FALSE(cleared->has_value());
}

TEST_F(PersistenceTest, LaterWaitSupersedesEarlierOnSameKey) {
  const auto first = generate_run_id();
  const auto second = generate_run_id();
  const auto slug = "approval-" + first.str();
  ASSERT_TRUE(run_on(io_, db_->register_waiting(
                              slug, "req-1",
                              storage::WaitingEntry{.run_id = first,
                                                    .token = "t1"})));
  ASSERT_TRUE(run_on(io_, db_->register_waiting(
                              slug, "req-1",
                              storage::WaitingEntry{.run_id = second,
                                                    .token = "t2"})));

  auto found = run_on(io_, db_->find_waiting_run(slug, "req-1"));
  ASSERT_TRUE(found && found->has_value());
  EXPECT_EQ((*found)->run_id, second);
  EXPECT_EQ((*found)->token, "t2");

  ASSERT_TRUE(run_on(io_, db_->clear_waiting(first)));
  auto kept = run_on(io_, db_->find_waiting_run(slug, "req-1"));
  ASSERT_TRUE(kept && kept->has_value());
  EXPECT_EQ((*kept)->run_id, second);
  ASSERT_TRUE(run_on(io_, db_->clear_waiting(second)));
}

TEST_F(PersistenceTest, TakeReleasesEveryKeyOfTheRun) {
  const auto run = generate_run_id();
  const auto slug = "either-" + run.str();
  for (const char *key : {"a", "b"}) {
    ASSERT_TRUE(run_on(io_, db_->register_waiting(
                                slug, key, storage::WaitingEntry{.run_id = run})));
  }
  auto taken = run_on(io_, db_->take_waiting(slug, "a", run));
  ASSERT_TRUE(taken);
  EXPECT_TRUE(*taken);
  auto late = run_on(io_, db_->take_waiting(slug, "b", run));
  ASSERT_TRUE(late);
  EXPECT_FALSE(*late);
}

TEST_F(PersistenceTest, WebhookResponseKeepsItsKey) {
  const auto run = generate_run_id();
  auto signal = make_signal(SignalType::WebhookResponse, json(R"("ok")"));
  signal.webhook = WebhookKey{.slug = "approval", .identifier = "req-9"};
  ASSERT_TRUE(run_on(io_, db_->queue_signal(run, std::move(signal))));
  ASSERT_TRUE(run_on(io_, db_->queue_signal(run, make_signal(SignalType::Kill))));

  auto signals = run_on(io_, db_->get_and_consume_signals(run, SignalFilter::All));
  ASSERT_TRUE(signals);
  ASSERT_EQ(signals->size(), 2U);
  ASSERT_TRUE((*signals)[0].webhook.has_value());
  EXPECT_EQ((*signals)[0].webhook->identifier, "req-9");
  EXPECT_FALSE((*signals)[1].webhook.has_value());
}

TEST_F(PersistenceTest, RunRecordsTimeoutsAndPages) {
  const auto run = generate_run_id();
  storage::RunRecord record{.run_id = run,
                            .brain_title = "persisted",
                            .status = RunStatus::Running,
                            .created_at = 1000,
                            .started_at = 1000};
  ASSERT_TRUE(run_on(io_, db_->upsert_run(record)));
  record.status = RunStatus::Error;
  record.error = "boom";
  record.completed_at = 2000;
  ASSERT_TRUE(run_on(io_, db_->upsert_run(record)));

  auto loaded = run_on(io_, db_->get_run(run));
  ASSERT_TRUE(loaded && loaded->has_value());
  EXPECT_EQ((*loaded)->status, RunStatus::Error);
  EXPECT_EQ((*loaded)->error, "boom");
  EXPECT_EQ((*loaded)->created_at, 1000);
  EXPECT_EQ((*loaded)->completed_at, 2000);

  ASSERT_TRUE(run_on(io_, db_->set_timeout(run, 123456)));
  auto deadline = run_on(io_, db_->get_timeout(run));
  ASSERT_TRUE(deadline && deadline->has_value());
  EXPECT_EQ(**deadline, 123456);
  ASSERT_TRUE(run_on(io_, db_->clear_timeout(run)));
  auto cleared = run_on(io_, db_->get_timeout(run));
  ASSERT_TRUE(cleared);
  EXPECT_FALSE(cleared->has_value());

  const auto draft = "draft-" + run.str();
  const auto kept = "kept-" + run.str();
  ASSERT_TRUE(run_on(io_, db_->register_page(storage::PageRecord{
                              .slug = draft, .run_id = run, .persist = false})));
  ASSERT_TRUE(run_on(io_, db_->register_page(storage::PageRecord{
                              .slug = kept, .run_id = run, .persist = true})));
  auto pages = run_on(io_, db_->non_persistent_pages(run));
  ASSERT_TRUE(pages);
  ASSERT_EQ(pages->size(), 1U);
  EXPECT_EQ((*pages)[0].slug, draft);
  ASSERT_TRUE(run_on(io_, db_->remove_page(draft)));
  pages = run_on(io_, db_->non_persistent_pages(run));
  ASSERT_TRUE(pages);
  EXPECT_TRUE(pages->empty());
}

TEST_F(PersistenceTest, EngineReplaysRunFromMySQL) {
  BrainRegistry brains;
  webhook::WebhookRegistry webhooks;
  storage::MemoryBlobStore blobs;
  ASSERT_TRUE(brains.add(make_brain(
      "persisted", {merge_step("ask", json(R"({"asked":true})"),
                               wait_for("approval", "persist")),
                    capture_response_step("record", "answer")})));

  auto make_engine = [&] {
    return std::make_unique<Engine>(
        brains, webhooks,
        EngineStores{.events = *db_,
                     .signals = *db_,
                     .monitor = *db_,
                     .blobs = blobs},
        EngineOptions{.overflow_threshold = 64},
        [this](std::string_view) -> Executor { return io_.get_executor(); });
  };

  auto engine = make_engine();
  auto id = run_on(io_, engine->start_run("persisted", json(R"({"n":1})")));
  ASSERT_TRUE(id);
  ASSERT_TRUE(run_on(io_, engine->run_until_idle(*id)));
  engine->shutdown();
  engine.reset();
  drive_for(io_, std::chrono::milliseconds(20));

  // A fresh engine sees only what MySQL and the blob store kept.
  engine = make_engine();
  auto waiting = run_on(io_, engine->run_info(*id));
  ASSERT_TRUE(waiting);
  EXPECT_EQ(waiting->record.status, RunStatus::Waiting);

  auto sent = run_on(io_, engine->send_signal(
                               *id, make_signal(SignalType::WebhookResponse,
                                                json(R"("yes")"))));
  ASSERT_TRUE(sent);
  EXPECT_TRUE(sent->valid);
  ASSERT_TRUE(run_on(io_, engine->run_until_idle(*id)));

  auto done = run_on(io_, engine->run_info(*id));
  ASSERT_TRUE(done);
  EXPECT_EQ(done->record.status, RunStatus::Complete);
  EXPECT_TRUE(json_equal(json_field(done->state, "answer"), json(R"("yes")")));
  EXPECT_GT(blobs.size(), 0U);
  engine->shutdown();
  drive_for(io_, std::chrono::milliseconds(20));
}
