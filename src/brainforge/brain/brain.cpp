#include "brainforge/brain/brain.hpp"

#include "brainforge/brain/event_codec.hpp"

namespace brainforge {

auto agent_message_to_json(const AgentMessage &message) -> JsonValue {
  JsonValue out = JsonValue::object_t{};
  out["role"] = std::string(to_string_view(message.role));
  switch (message.role) {
  case MessageRole::User:
    out["content"] = message.content;
    break;
  case MessageRole::Assistant: {
    out["content"] = message.content;
    JsonValue calls = JsonValue::array_t{};
    for (const auto &call : message.tool_calls) {
      calls.get_array().push_back(tool_call_to_json(call));
    }
    out["tool_calls"] = std::move(calls);
    if (message.provider_metadata) {
      out["provider_metadata"] = *message.provider_metadata;
    }
    break;
  }
  case MessageRole::Tool:
    out["tool_call_id"] = message.tool_call_id;
    out["tool_name"] = message.tool_name;
    out["result"] = message.result;
    break;
  }
  return out;
}

auto BrainRegistry::add(std::shared_ptr<const Brain> brain) -> Result<void> {
  if (!brain || brain->title.empty()) {
    return fail(Error::InvalidArgument);
  }
  std::lock_guard lock(mu_);
  auto [it, inserted] = brains_.try_emplace(brain->title, brain);
  if (!inserted) {
    return fail(Error::AlreadyExists);
  }
  return ok();
}

auto BrainRegistry::find(std::string_view title) const
    -> std::shared_ptr<const Brain> {
  std::lock_guard lock(mu_);
  auto it = brains_.find(title);
  return it == brains_.end() ? nullptr : it->second;
}

auto BrainRegistry::list() const -> std::vector<std::shared_ptr<const Brain>> {
  std::lock_guard lock(mu_);
  std::vector<std::shared_ptr<const Brain>> out;
  out.reserve(brains_.size());
  for (const auto &[title, brain] : brains_) {
    out.push_back(brain);
  }
  return out;
}

} // namespace brainforge
