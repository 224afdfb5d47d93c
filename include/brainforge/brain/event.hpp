#pragma once

#include "brainforge/util/enum.hpp"
#include "brainforge/util/id.hpp"
#include "brainforge/util/json.hpp"
#include "brainforge/util/json_patch.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace brainforge {

// Declaration order matches EventBody alternatives.
enum class EventType : std::uint8_t {
  Start,
  Restart,
  StepStart,
  StepComplete,
  StepRetry,
  StepStatus,
  Error,
  Complete,
  Cancelled,
  Paused,
  Resumed,
  Webhook,
  WebhookResponse,
  AgentStart,
  AgentIteration,
  AgentToolCall,
  AgentToolResult,
  AgentAssistantMessage,
  AgentComplete,
  AgentTokenLimit,
  AgentWebhook,
  AgentUserMessage,
};
BOOST_DESCRIBE_ENUM(EventType, Start, Restart, StepStart, StepComplete,
                    StepRetry, StepStatus, Error, Complete, Cancelled, Paused,
                    Resumed, Webhook, WebhookResponse, AgentStart,
                    AgentIteration, AgentToolCall, AgentToolResult,
                    AgentAssistantMessage, AgentComplete, AgentTokenLimit,
                    AgentWebhook, AgentUserMessage)
BRAINFORGE_DEFINE_ENUM_SERDE(EventType, EventType::Start)

struct ErrorInfo {
  std::string name;
  std::string message;
  std::string stack;
};

struct WaitFor {
  std::string slug;
  std::string identifier;
  std::optional<std::string> token;
};

struct StepStatusEntry {
  std::string id;
  std::string title;
  std::string status;
};

struct ToolCall {
  std::string id;
  std::string name;
  JsonValue input;
};

struct StartEvent {
  std::string title;
  std::string description;
  JsonValue initial_state;
  std::optional<std::string> parent_step_id;
};

struct RestartEvent {
  std::string title;
  std::string description;
  JsonValue initial_state;
  std::optional<std::string> parent_step_id;
};

struct StepStartEvent {
  std::string step_id;
  std::string step_title;
};

struct StepCompleteEvent {
  std::string step_id;
  std::string step_title;
  JsonPatch patch;
};

struct StepRetryEvent {
  std::string step_id;
  std::string step_title;
  ErrorInfo error;
  int attempt{0};
};

struct StepStatusEvent {
  std::vector<StepStatusEntry> steps;
};

struct ErrorEvent {
  std::string title;
  ErrorInfo error;
};

struct CompleteEvent {
  std::string title;
};

struct CancelledEvent {
  std::string title;
  std::optional<ErrorInfo> error;
};

struct PausedEvent {};
struct ResumedEvent {};

struct WebhookEvent {
  std::vector<WaitFor> wait_for;
  std::optional<std::int64_t> timeout_ms;
};

struct WebhookResponseEvent {
  JsonValue response;
};

struct AgentStartEvent {
  std::string step_id;
  std::string step_title;
  std::string prompt;
  std::optional<std::string> system;
  std::vector<std::string> tools;
};

struct AgentIterationEvent {
  std::string step_id;
  int iteration{0};
  std::int64_t tokens{0};
  std::int64_t total_tokens{0};
};

struct AgentToolCallEvent {
  std::string step_id;
  int iteration{0};
  std::string tool_call_id;
  std::string tool_name;
  JsonValue input;
};

struct AgentToolResultEvent {
  std::string step_id;
  std::string tool_call_id;
  std::string tool_name;
  JsonValue result;
};

struct AgentAssistantMessageEvent {
  std::string step_id;
  int iteration{0};
  std::string content;
  std::vector<ToolCall> tool_calls;
  std::optional<JsonValue> provider_metadata;
};

struct AgentCompleteEvent {
  std::string step_id;
  std::string terminal_tool;
  JsonValue result;
  int iterations{0};
  std::int64_t total_tokens{0};
};

struct AgentTokenLimitEvent {
  std::string step_id;
  std::int64_t total_tokens{0};
  std::int64_t max_tokens{0};
};

struct AgentWebhookEvent {
  std::string step_id;
  std::string tool_call_id;
  std::string tool_name;
  JsonValue input;
};

struct AgentUserMessageEvent {
  std::string step_id;
  std::string content;
};

using EventBody =
    std::variant<StartEvent, RestartEvent, StepStartEvent, StepCompleteEvent,
                 StepRetryEvent, StepStatusEvent, ErrorEvent, CompleteEvent,
                 CancelledEvent, PausedEvent, ResumedEvent, WebhookEvent,
                 WebhookResponseEvent, AgentStartEvent, AgentIterationEvent,
                 AgentToolCallEvent, AgentToolResultEvent,
                 AgentAssistantMessageEvent, AgentCompleteEvent,
                 AgentTokenLimitEvent, AgentWebhookEvent,
                 AgentUserMessageEvent>;

static_assert(std::variant_size_v<EventBody> ==
              static_cast<std::size_t>(EventType::AgentUserMessage) + 1);

namespace detail {
template <typename T, typename Variant> struct variant_index;
template <typename T, typename... Ts>
struct variant_index<T, std::variant<Ts...>> {
  static constexpr std::size_t value = [] {
    constexpr bool matches[] = {std::is_same_v<T, Ts>...};
    for (std::size_t i = 0; i < sizeof...(Ts); ++i) {
      if (matches[i]) {
        return i;
      }
    }
    return sizeof...(Ts);
  }();
};
} // namespace detail

template <typename Body>
inline constexpr EventType event_type_of = static_cast<EventType>(
    detail::variant_index<Body, EventBody>::value);

struct Event {
  /// Position in the run's log, assigned by the store on append.
  std::int64_t event_id{0};
  RunId run_id;
  std::int64_t timestamp{0};
  EventBody body;

  [[nodiscard]] auto type() const noexcept -> EventType {
    return static_cast<EventType>(body.index());
  }

  template <typename Body> [[nodiscard]] auto as() const -> const Body * {
    return std::get_if<Body>(&body);
  }
};

[[nodiscard]] inline auto is_terminal_event(EventType type) noexcept -> bool {
  return type == EventType::Complete || type == EventType::Error ||
         type == EventType::Cancelled;
}

} // namespace brainforge
