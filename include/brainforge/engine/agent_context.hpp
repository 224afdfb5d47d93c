#pragma once

#include "brainforge/brain/agent.hpp"
#include "brainforge/brain/event.hpp"
#include "brainforge/core/error.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace brainforge {

/// Rebuilds the conversation of an agent suspended on a webhook tool.
/// nullopt when the log holds no AGENT_WEBHOOK. The webhook response becomes
/// the tool message answering the pending call.
[[nodiscard]] auto reconstruct_agent_context(std::span<const Event> events,
                                             const JsonValue &webhook_response)
    -> Result<std::optional<AgentResumeContext>>;

/// Rebuilds the conversation of an agent step that is still in its loop,
/// from its latest AGENT_START to the end of the log. nullopt when the step
/// never started.
[[nodiscard]] auto reconstruct_agent_progress(std::span<const Event> events,
                                              std::string_view step_id)
    -> std::optional<AgentResumeContext>;

} // namespace brainforge
