#include "brainforge/engine/state_reconstructor.hpp"

#include "test_utils.hpp"

#include <vector>

#include "gtest/gtest.h"

using namespace brainforge;
using brainforge::test::json;

namespace {

auto event(std::int64_t id, EventBody body) -> Event {
  return Event{.event_id = id,
               .run_id = RunId{"run-replay"},
               .timestamp = id,
               .body = std::move(body)};
}

auto start(std::string_view initial) -> EventBody {
  return StartEvent{.title = "brain", .initial_state = json(initial)};
}

auto replace_x(std::string_view value) -> EventBody {
  return StepCompleteEvent{
      .step_id = "step-0",
      .step_title = "set x",
      .patch = {PatchOperation{
          .op = PatchOpKind::Replace, .path = "/x", .value = json(value)}}};
}

auto add_field(std::string path, std::string_view value) -> EventBody {
  return StepCompleteEvent{
      .step_id = "step-1",
      .step_title = "add",
      .patch = {PatchOperation{
          .op = PatchOpKind::Add, .path = std::move(path), .value = json(value)}}};
}

} // namespace

TEST(StateReconstructorTest, StateAtEachEvent) {
  const std::vector<Event> events{
      event(1, start(R"({"x":1})")),
      event(2, StepStartEvent{.step_id = "step-0", .step_title = "set x"}),
      event(3, replace_x("2")),
      event(4, CompleteEvent{.title = "brain"}),
  };

  auto at_start = reconstruct_state_at_event(events, 0);
  ASSERT_TRUE(at_start);
  EXPECT_TRUE(json_equal(*at_start, json(R"({"x":1})")));

  auto before_step = reconstruct_state_at_event(events, 1);
  ASSERT_TRUE(before_step);
  EXPECT_TRUE(json_equal(*before_step, json(R"({"x":1})")));

  auto after_step = reconstruct_state_at_event(events, 2);
  ASSERT_TRUE(after_step);
  EXPECT_TRUE(json_equal(*after_step, json(R"({"x":2})")));

  auto current = reconstruct_current_state(events);
  ASSERT_TRUE(current);
  EXPECT_TRUE(json_equal(*current, json(R"({"x":2})")));
}

TEST(StateReconstructorTest, IndexIsClamped) {
  const std::vector<Event> events{
      event(1, start(R"({"x":1})")),
      event(2, replace_x("5")),
  };
  auto past_end = reconstruct_state_at_event(events, 100);
  ASSERT_TRUE(past_end);
  EXPECT_TRUE(json_equal(*past_end, json(R"({"x":5})")));

  auto negative = reconstruct_state_at_event(events, -3);
  ASSERT_TRUE(negative);
  EXPECT_TRUE(json_equal(*negative, json(R"({"x":1})")));
}

TEST(StateReconstructorTest, EmptyLogIsEmptyObject) {
  auto state = reconstruct_state_at_event({}, 0);
  ASSERT_TRUE(state);
  EXPECT_TRUE(json_equal(*state, json("{}")));

  auto current = reconstruct_current_state({});
  ASSERT_TRUE(current);
  EXPECT_TRUE(json_equal(*current, json("{}")));
}

TEST(StateReconstructorTest, LogWithoutStartIsEmptyObject) {
  const std::vector<Event> events{
      event(1, add_field("/y", "1")),
  };
  auto state = reconstruct_current_state(events);
  ASSERT_TRUE(state);
  EXPECT_TRUE(json_equal(*state, json("{}")));
}

TEST(StateReconstructorTest, NullInitialStateBecomesObject) {
  const std::vector<Event> events{
      event(1, start("null")),
      event(2, add_field("/y", "true")),
  };
  auto state = reconstruct_current_state(events);
  ASSERT_TRUE(state);
  EXPECT_TRUE(json_equal(*state, json(R"({"y":true})")));
}

TEST(StateReconstructorTest, RestartResetsToItsInitialState) {
  const std::vector<Event> events{
      event(1, start(R"({"x":1})")),
      event(2, replace_x("2")),
      event(3, PausedEvent{}),
      event(4, RestartEvent{.title = "brain",
                            .initial_state = json(R"({"x":10})")}),
      event(5, add_field("/z", R"("after")")),
  };
  auto state = reconstruct_current_state(events);
  ASSERT_TRUE(state);
  EXPECT_TRUE(json_equal(*state, json(R"({"x":10,"z":"after"})")));

  auto before_restart = reconstruct_state_at_event(events, 2);
  ASSERT_TRUE(before_restart);
  EXPECT_TRUE(json_equal(*before_restart, json(R"({"x":2})")));
}

TEST(StateReconstructorTest, ReplayIsDeterministic) {
  std::vector<Event> events{event(1, start(R"({"items":[]})"))};
  for (int i = 0; i < 50; ++i) {
    events.push_back(event(i + 2, add_field("/items/-", std::to_string(i))));
  }
  auto first = reconstruct_current_state(events);
  auto second = reconstruct_current_state(events);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(dump_json(*first), dump_json(*second));
  EXPECT_EQ(first->get_object().at("items").get_array().size(), 50U);
}

TEST(StateReconstructorTest, PatchFailureIsReplayFatal) {
  const std::vector<Event> events{
      event(1, start(R"({"x":1})")),
      event(2, StepCompleteEvent{
                   .step_id = "step-0",
                   .step_title = "bad",
                   .patch = {PatchOperation{.op = PatchOpKind::Remove,
                                            .path = "/missing"}}}),
  };
  auto state = reconstruct_current_state(events);
  ASSERT_FALSE(state);
  EXPECT_EQ(state.error(), Error::PatchPathNotFound);
  EXPECT_TRUE(is_replay_fatal(state.error()));

  // Up to the bad step the log still replays.
  auto before = reconstruct_state_at_event(events, 0);
  ASSERT_TRUE(before);
  EXPECT_TRUE(json_equal(*before, json(R"({"x":1})")));
}
