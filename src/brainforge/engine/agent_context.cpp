#include "brainforge/engine/agent_context.hpp"

#include "brainforge/util/log.hpp"
#include "brainforge/util/overloaded.hpp"

#include <variant>

namespace brainforge {

namespace {

// Folds the AGENT_* events of [first, last) into `ctx`.
auto replay_conversation(std::span<const Event> events, std::size_t first,
                         std::size_t last, AgentResumeContext &ctx) -> void {
  for (std::size_t i = first; i < last; ++i) {
    std::visit(
        overloaded{
            [&](const AgentAssistantMessageEvent &e) {
              ctx.messages.push_back(
                  {.role = MessageRole::Assistant,
                   .content = e.content,
                   .tool_calls = e.tool_calls,
                   .provider_metadata = e.provider_metadata});
            },
            [&](const AgentToolResultEvent &e) {
              ctx.messages.push_back({.role = MessageRole::Tool,
                                      .tool_call_id = e.tool_call_id,
                                      .tool_name = e.tool_name,
                                      .result = e.result});
            },
            [&](const AgentUserMessageEvent &e) {
              ctx.messages.push_back(
                  {.role = MessageRole::User, .content = e.content});
            },
            [&](const AgentIterationEvent &e) {
              ctx.iterations = e.iteration;
              ctx.total_tokens = e.total_tokens;
            },
            [](const auto &) {},
        },
        events[i].body);
  }
}

auto context_from_start(const AgentStartEvent &start) -> AgentResumeContext {
  AgentResumeContext ctx{.prompt = start.prompt, .system = start.system};
  ctx.messages.push_back({.role = MessageRole::User, .content = start.prompt});
  return ctx;
}

} // namespace

auto reconstruct_agent_context(std::span<const Event> events,
                               const JsonValue &webhook_response)
    -> Result<std::optional<AgentResumeContext>> {
  std::optional<std::size_t> webhook_at;
  for (std::size_t i = events.size(); i-- > 0;) {
    if (events[i].type() == EventType::AgentWebhook) {
      webhook_at = i;
      break;
    }
  }
  if (!webhook_at) {
    return std::optional<AgentResumeContext>{};
  }

  std::optional<std::size_t> start_at;
  for (std::size_t i = *webhook_at; i-- > 0;) {
    if (events[i].type() == EventType::AgentStart) {
      start_at = i;
      break;
    }
  }
  if (!start_at) {
    log::error("AGENT_START event not found but AGENT_WEBHOOK exists - "
               "invalid event sequence");
    return fail(Error::CorruptEventLog);
  }

  const auto &pending = *events[*webhook_at].as<AgentWebhookEvent>();
  auto ctx = context_from_start(*events[*start_at].as<AgentStartEvent>());
  ctx.pending_tool_call_id = pending.tool_call_id;
  ctx.pending_tool_name = pending.tool_name;
  ctx.webhook_response = webhook_response;
  replay_conversation(events, *start_at + 1, *webhook_at, ctx);

  ctx.messages.push_back({.role = MessageRole::Tool,
                          .tool_call_id = pending.tool_call_id,
                          .tool_name = pending.tool_name,
                          .result = webhook_response});
  return std::optional<AgentResumeContext>{std::move(ctx)};
}

auto reconstruct_agent_progress(std::span<const Event> events,
                                std::string_view step_id)
    -> std::optional<AgentResumeContext> {
  for (std::size_t i = events.size(); i-- > 0;) {
    const auto *start = events[i].as<AgentStartEvent>();
    if (start == nullptr || start->step_id != step_id) {
      continue;
    }
    auto ctx = context_from_start(*start);
    replay_conversation(events, i + 1, events.size(), ctx);
    return ctx;
  }
  return std::nullopt;
}

} // namespace brainforge
