#pragma once

#include "brainforge/brain/event.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/enum.hpp"
#include "brainforge/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace brainforge {

/// Suspension request: wait until one of `wait_for` is delivered.
struct WaitRequest {
  std::vector<WaitFor> wait_for;
  std::optional<std::chrono::milliseconds> timeout;
};

enum class MessageRole : std::uint8_t { User, Assistant, Tool };
BOOST_DESCRIBE_ENUM(MessageRole, User, Assistant, Tool)
BRAINFORGE_DEFINE_ENUM_SERDE(MessageRole, MessageRole::User)

/// Flattened conversation turn. Assistant turns keep the provider's native
/// metadata so a resumed conversation round-trips through the model unchanged.
struct AgentMessage {
  MessageRole role{MessageRole::User};
  std::string content;
  std::vector<ToolCall> tool_calls;
  std::optional<JsonValue> provider_metadata;
  std::string tool_call_id;
  std::string tool_name;
  JsonValue result;
};

[[nodiscard]] auto agent_message_to_json(const AgentMessage &message)
    -> JsonValue;

enum class ToolKind : std::uint8_t {
  // Result is fed back to the model.
  Regular,
  // Calling it ends the loop; its input becomes the agent result.
  Terminal,
  // Suspends the run until a webhook answers the call.
  Webhook,
};
BOOST_DESCRIBE_ENUM(ToolKind, Regular, Terminal, Webhook)
BRAINFORGE_DEFINE_ENUM_SERDE(ToolKind, ToolKind::Regular)

struct ToolOutcome {
  JsonValue result;
  std::optional<WaitRequest> wait;
};

struct ToolInvocation {
  RunId run_id;
  std::string tool_call_id;
  const JsonValue &input;
  const JsonValue &state;
};

using ToolFn =
    std::move_only_function<task<Result<ToolOutcome>>(const ToolInvocation &)
                                const>;

struct AgentTool {
  std::string name;
  std::string description;
  JsonValue input_schema;
  ToolKind kind{ToolKind::Regular};
  std::shared_ptr<ToolFn> execute;
};

struct ModelRequest {
  std::optional<std::string> system;
  const std::vector<AgentMessage> &messages;
  const std::vector<AgentTool> &tools;
};

struct ModelResponse {
  std::string content;
  std::vector<ToolCall> tool_calls;
  std::int64_t tokens{0};
  std::optional<JsonValue> provider_metadata;
};

class AgentModel {
public:
  virtual ~AgentModel() = default;
  [[nodiscard]] virtual auto generate(const ModelRequest &request)
      -> task<Result<ModelResponse>> = 0;
};

struct AgentConfig {
  std::string prompt;
  std::optional<std::string> system;
  std::vector<AgentTool> tools;
  std::shared_ptr<AgentModel> model;
  int max_iterations{20};
  std::optional<std::int64_t> max_tokens;
};

/// Conversation rebuilt from the log for an agent suspended on a webhook tool.
struct AgentResumeContext {
  std::vector<AgentMessage> messages;
  std::string pending_tool_call_id;
  std::string pending_tool_name;
  std::string prompt;
  std::optional<std::string> system;
  JsonValue webhook_response;
  int iterations{0};
  std::int64_t total_tokens{0};
};

} // namespace brainforge
