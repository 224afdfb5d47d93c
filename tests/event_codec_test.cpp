#include "brainforge/brain/event_codec.hpp"
#include "brainforge/brain/signal.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace brainforge;
using brainforge::test::json;

namespace {

constexpr std::int64_t kTimestamp = 1700000000000;

auto make_event(EventBody body) -> Event {
  return Event{.event_id = 0,
               .run_id = RunId{"run-codec"},
               .timestamp = kTimestamp,
               .body = std::move(body)};
}

auto round_trip(const Event &event) -> Event {
  auto decoded = deserialize_event(serialize_event(event));
  if (!decoded) {
    throw std::runtime_error("decode failed: " + decoded.error().message());
  }
  return std::move(*decoded);
}

} // namespace

TEST(EventCodecTest, TypeIsSnakeCase) {
  auto encoded = encode_event(make_event(WebhookResponseEvent{
      .response = json(R"({"approved":true})")}));
  EXPECT_EQ(json_string_field(encoded, "type"), "webhook_response");
  EXPECT_EQ(json_string_field(encoded, "run_id"), "run-codec");
  EXPECT_EQ(json_int_field(encoded, "timestamp"), kTimestamp);
  EXPECT_TRUE(json_equal(json_field(encoded, "response"),
                         json(R"({"approved":true})")));
}

TEST(EventCodecTest, StartEventRoundTrip) {
  auto decoded = round_trip(make_event(StartEvent{
      .title = "onboarding",
      .description = "welcome flow",
      .initial_state = json(R"({"user":"ada"})"),
      .parent_step_id = "step-3"}));
  ASSERT_EQ(decoded.type(), EventType::Start);
  const auto *start = decoded.as<StartEvent>();
  ASSERT_NE(start, nullptr);
  EXPECT_EQ(start->title, "onboarding");
  EXPECT_EQ(start->description, "welcome flow");
  EXPECT_EQ(start->parent_step_id, "step-3");
  EXPECT_TRUE(json_equal(start->initial_state, json(R"({"user":"ada"})")));
  EXPECT_EQ(decoded.run_id.str(), "run-codec");
  EXPECT_EQ(decoded.timestamp, kTimestamp);
}

TEST(EventCodecTest, StepCompleteCarriesPatch) {
  JsonPatch patch{PatchOperation{.op = PatchOpKind::Add,
                                 .path = "/count",
                                 .value = json("3")}};
  auto decoded = round_trip(make_event(StepCompleteEvent{
      .step_id = "step-0", .step_title = "count", .patch = patch}));
  const auto *step = decoded.as<StepCompleteEvent>();
  ASSERT_NE(step, nullptr);
  ASSERT_EQ(step->patch.size(), 1U);
  EXPECT_EQ(step->patch[0].op, PatchOpKind::Add);
  EXPECT_EQ(step->patch[0].path, "/count");
  EXPECT_TRUE(json_equal(step->patch[0].value, json("3")));
}

TEST(EventCodecTest, WebhookEventKeepsWaitTargets) {
  auto decoded = round_trip(make_event(WebhookEvent{
      .wait_for = {WaitFor{.slug = "ui-form",
                           .identifier = "form-1",
                           .token = "tok"},
                   WaitFor{.slug = "slack", .identifier = "thread-9"}},
      .timeout_ms = 60000}));
  const auto *webhook = decoded.as<WebhookEvent>();
  ASSERT_NE(webhook, nullptr);
  ASSERT_EQ(webhook->wait_for.size(), 2U);
  EXPECT_EQ(webhook->wait_for[0].slug, "ui-form");
  EXPECT_EQ(webhook->wait_for[0].token, "tok");
  EXPECT_EQ(webhook->wait_for[1].identifier, "thread-9");
  EXPECT_FALSE(webhook->wait_for[1].token.has_value());
  EXPECT_EQ(webhook->timeout_ms, 60000);
}

TEST(EventCodecTest, CancelledEventWithAndWithoutError) {
  auto plain = round_trip(make_event(CancelledEvent{.title = "t"}));
  ASSERT_NE(plain.as<CancelledEvent>(), nullptr);
  EXPECT_FALSE(plain.as<CancelledEvent>()->error.has_value());

  auto timed_out = round_trip(make_event(CancelledEvent{
      .title = "t",
      .error = ErrorInfo{.name = "WebhookTimeoutError",
                         .message = "Webhook response did not arrive in time"}}));
  const auto *cancelled = timed_out.as<CancelledEvent>();
  ASSERT_NE(cancelled, nullptr);
  ASSERT_TRUE(cancelled->error.has_value());
  EXPECT_EQ(cancelled->error->name, "WebhookTimeoutError");
}

TEST(EventCodecTest, AssistantMessageKeepsProviderMetadata) {
  auto decoded = round_trip(make_event(AgentAssistantMessageEvent{
      .step_id = "step-1",
      .iteration = 2,
      .content = "calling a tool",
      .tool_calls = {ToolCall{.id = "tc1",
                              .name = "lookup",
                              .input = json(R"({"q":"x"})")}},
      .provider_metadata = json(R"({"signature":"abc"})")}));
  const auto *msg = decoded.as<AgentAssistantMessageEvent>();
  ASSERT_NE(msg, nullptr);
  EXPECT_EQ(msg->iteration, 2);
  ASSERT_EQ(msg->tool_calls.size(), 1U);
  EXPECT_EQ(msg->tool_calls[0].id, "tc1");
  EXPECT_EQ(msg->tool_calls[0].name, "lookup");
  ASSERT_TRUE(msg->provider_metadata.has_value());
  EXPECT_TRUE(
      json_equal(*msg->provider_metadata, json(R"({"signature":"abc"})")));
}

TEST(EventCodecTest, PayloadlessEvents) {
  EXPECT_EQ(round_trip(make_event(PausedEvent{})).type(), EventType::Paused);
  EXPECT_EQ(round_trip(make_event(ResumedEvent{})).type(), EventType::Resumed);
}

TEST(EventCodecTest, UnknownTypeIsCorrupt) {
  auto decoded =
      deserialize_event(R"({"type":"teleport","run_id":"r","timestamp":1})");
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error(), Error::CorruptEventLog);
}

TEST(EventCodecTest, MissingRequiredFieldIsCorrupt) {
  auto decoded = deserialize_event(R"({"type":"step_start","run_id":"r"})");
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error(), Error::CorruptEventLog);
}

TEST(EventCodecTest, MalformedJsonIsCorrupt) {
  EXPECT_EQ(deserialize_event("{not json").error(), Error::CorruptEventLog);
  EXPECT_EQ(deserialize_event("[1,2]").error(), Error::CorruptEventLog);
}

TEST(EventCodecTest, BadPatchInStepCompleteIsCorrupt) {
  auto decoded = deserialize_event(
      R"({"type":"step_complete","run_id":"r","step_id":"step-0",)"
      R"("step_title":"s","patch":[{"op":"explode","path":"/x"}]})");
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error(), Error::CorruptEventLog);
}

TEST(EventCodecTest, TerminalEvents) {
  EXPECT_TRUE(is_terminal_event(EventType::Complete));
  EXPECT_TRUE(is_terminal_event(EventType::Error));
  EXPECT_TRUE(is_terminal_event(EventType::Cancelled));
  EXPECT_FALSE(is_terminal_event(EventType::Webhook));
  EXPECT_FALSE(is_terminal_event(EventType::Paused));
}

TEST(SignalCodecTest, RoundTrip) {
  auto signal = make_signal(SignalType::WebhookResponse,
                            json(R"({"answer":42})"));
  EXPECT_FALSE(signal.id.empty());
  EXPECT_GT(signal.queued_at, 0);

  auto encoded = signal_to_json(signal);
  EXPECT_EQ(json_string_field(encoded, "type"), "WEBHOOK_RESPONSE");

  auto decoded = signal_from_json(encoded);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(decoded->id, signal.id);
  EXPECT_EQ(decoded->type, SignalType::WebhookResponse);
  EXPECT_EQ(decoded->queued_at, signal.queued_at);
  EXPECT_TRUE(json_equal(decoded->payload, json(R"({"answer":42})")));
  EXPECT_FALSE(decoded->webhook.has_value());

  signal.webhook = WebhookKey{.slug = "approval", .identifier = "req-1"};
  auto keyed = signal_from_json(signal_to_json(signal));
  ASSERT_TRUE(keyed);
  EXPECT_EQ(keyed->webhook, signal.webhook);
}

TEST(SignalCodecTest, RejectsUnknownType) {
  auto decoded = signal_from_json(json(R"({"type":"EXPLODE"})"));
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error(), Error::InvalidArgument);

  EXPECT_EQ(signal_from_json(json(R"({"id":"x"})")).error(), Error::ParseError);
}

TEST(SignalCodecTest, KindsAndFilters) {
  auto kill = make_signal(SignalType::Kill);
  auto response = make_signal(SignalType::WebhookResponse);
  EXPECT_EQ(kill.kind(), SignalKind::Control);
  EXPECT_EQ(response.kind(), SignalKind::Webhook);
  EXPECT_TRUE(kill.matches(SignalFilter::Control));
  EXPECT_FALSE(kill.matches(SignalFilter::Webhook));
  EXPECT_TRUE(response.matches(SignalFilter::Webhook));
  EXPECT_TRUE(response.matches(SignalFilter::All));
}

TEST(SignalCodecTest, NamesAreUpperCase) {
  EXPECT_EQ(signal_type_name(SignalType::UserMessage), "USER_MESSAGE");
  EXPECT_EQ(parse_signal_type("PAUSE"), SignalType::Pause);
  EXPECT_FALSE(parse_signal_type("pause").has_value());
}
