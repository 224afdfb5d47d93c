#include "brainforge/brain/event_codec.hpp"

#include "brainforge/util/overloaded.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace brainforge {

namespace {

auto put_optional(JsonValue &obj, std::string_view key,
                  const std::optional<std::string> &value) -> void {
  if (value) {
    obj[key] = *value;
  }
}

auto strings_to_json(const std::vector<std::string> &items) -> JsonValue {
  JsonValue arr = JsonValue::array_t{};
  for (const auto &item : items) {
    arr.get_array().emplace_back(item);
  }
  return arr;
}

// Pulls typed fields out of a decoded object and remembers whether any
// required one was missing or mistyped.
class FieldReader {
public:
  explicit FieldReader(const JsonValue &obj) : obj_(obj) {}

  [[nodiscard]] auto str(std::string_view key) -> std::string {
    auto v = json_string_field(obj_, key);
    if (!v) {
      ok_ = false;
      return {};
    }
    return std::move(*v);
  }

  [[nodiscard]] auto opt_str(std::string_view key)
      -> std::optional<std::string> {
    return json_string_field(obj_, key);
  }

  [[nodiscard]] auto integer(std::string_view key) -> std::int64_t {
    auto v = json_int_field(obj_, key);
    if (!v) {
      ok_ = false;
      return 0;
    }
    return *v;
  }

  [[nodiscard]] auto opt_integer(std::string_view key)
      -> std::optional<std::int64_t> {
    return json_int_field(obj_, key);
  }

  [[nodiscard]] auto value(std::string_view key) const -> JsonValue {
    return json_field(obj_, key);
  }

  [[nodiscard]] auto array(std::string_view key) -> JsonValue::array_t {
    auto v = json_field(obj_, key);
    if (v.is_null()) {
      return {};
    }
    if (!v.is_array()) {
      ok_ = false;
      return {};
    }
    return v.get_array();
  }

  [[nodiscard]] auto strings(std::string_view key)
      -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto &item : array(key)) {
      if (!item.is_string()) {
        ok_ = false;
        continue;
      }
      out.push_back(item.as<std::string>());
    }
    return out;
  }

  [[nodiscard]] auto ok() const noexcept -> bool { return ok_; }

private:
  const JsonValue &obj_;
  bool ok_{true};
};

auto encode_body(JsonValue &out, const EventBody &body) -> void {
  std::visit(
      overloaded{
          [&](const StartEvent &e) {
            out["title"] = e.title;
            out["description"] = e.description;
            out["initial_state"] = e.initial_state;
            put_optional(out, "parent_step_id", e.parent_step_id);
          },
          [&](const RestartEvent &e) {
            out["title"] = e.title;
            out["description"] = e.description;
            out["initial_state"] = e.initial_state;
            put_optional(out, "parent_step_id", e.parent_step_id);
          },
          [&](const StepStartEvent &e) {
            out["step_id"] = e.step_id;
            out["step_title"] = e.step_title;
          },
          [&](const StepCompleteEvent &e) {
            out["step_id"] = e.step_id;
            out["step_title"] = e.step_title;
            out["patch"] = patch_to_json(e.patch);
          },
          [&](const StepRetryEvent &e) {
            out["step_id"] = e.step_id;
            out["step_title"] = e.step_title;
            out["error"] = error_info_to_json(e.error);
            out["attempt"] = static_cast<std::int64_t>(e.attempt);
          },
          [&](const StepStatusEvent &e) {
            JsonValue steps = JsonValue::array_t{};
            for (const auto &s : e.steps) {
              JsonValue entry = JsonValue::object_t{};
              entry["id"] = s.id;
              entry["title"] = s.title;
              entry["status"] = s.status;
              steps.get_array().push_back(std::move(entry));
            }
            out["steps"] = std::move(steps);
          },
          [&](const ErrorEvent &e) {
            out["title"] = e.title;
            out["error"] = error_info_to_json(e.error);
          },
          [&](const CompleteEvent &e) { out["title"] = e.title; },
          [&](const CancelledEvent &e) {
            out["title"] = e.title;
            if (e.error) {
              out["error"] = error_info_to_json(*e.error);
            }
          },
          [](const PausedEvent &) {},
          [](const ResumedEvent &) {},
          [&](const WebhookEvent &e) {
            JsonValue waits = JsonValue::array_t{};
            for (const auto &w : e.wait_for) {
              JsonValue entry = JsonValue::object_t{};
              entry["slug"] = w.slug;
              entry["identifier"] = w.identifier;
              put_optional(entry, "token", w.token);
              waits.get_array().push_back(std::move(entry));
            }
            out["wait_for"] = std::move(waits);
            if (e.timeout_ms) {
              out["timeout_ms"] = *e.timeout_ms;
            }
          },
          [&](const WebhookResponseEvent &e) { out["response"] = e.response; },
          [&](const AgentStartEvent &e) {
            out["step_id"] = e.step_id;
            out["step_title"] = e.step_title;
            out["prompt"] = e.prompt;
            put_optional(out, "system", e.system);
            out["tools"] = strings_to_json(e.tools);
          },
          [&](const AgentIterationEvent &e) {
            out["step_id"] = e.step_id;
            out["iteration"] = static_cast<std::int64_t>(e.iteration);
            out["tokens"] = e.tokens;
            out["total_tokens"] = e.total_tokens;
          },
          [&](const AgentToolCallEvent &e) {
            out["step_id"] = e.step_id;
            out["iteration"] = static_cast<std::int64_t>(e.iteration);
            out["tool_call_id"] = e.tool_call_id;
            out["tool_name"] = e.tool_name;
            out["input"] = e.input;
          },
          [&](const AgentToolResultEvent &e) {
            out["step_id"] = e.step_id;
            out["tool_call_id"] = e.tool_call_id;
            out["tool_name"] = e.tool_name;
            out["result"] = e.result;
          },
          [&](const AgentAssistantMessageEvent &e) {
            out["step_id"] = e.step_id;
            out["iteration"] = static_cast<std::int64_t>(e.iteration);
            out["content"] = e.content;
            JsonValue calls = JsonValue::array_t{};
            for (const auto &call : e.tool_calls) {
              calls.get_array().push_back(tool_call_to_json(call));
            }
            out["tool_calls"] = std::move(calls);
            if (e.provider_metadata) {
              out["provider_metadata"] = *e.provider_metadata;
            }
          },
          [&](const AgentCompleteEvent &e) {
            out["step_id"] = e.step_id;
            out["terminal_tool"] = e.terminal_tool;
            out["result"] = e.result;
            out["iterations"] = static_cast<std::int64_t>(e.iterations);
            out["total_tokens"] = e.total_tokens;
          },
          [&](const AgentTokenLimitEvent &e) {
            out["step_id"] = e.step_id;
            out["total_tokens"] = e.total_tokens;
            out["max_tokens"] = e.max_tokens;
          },
          [&](const AgentWebhookEvent &e) {
            out["step_id"] = e.step_id;
            out["tool_call_id"] = e.tool_call_id;
            out["tool_name"] = e.tool_name;
            out["input"] = e.input;
          },
          [&](const AgentUserMessageEvent &e) {
            out["step_id"] = e.step_id;
            out["content"] = e.content;
          },
      },
      body);
}

auto decode_body(EventType type, FieldReader &r) -> Result<EventBody> {
  switch (type) {
  case EventType::Start:
    return EventBody{StartEvent{.title = r.str("title"),
                                .description = r.opt_str("description")
                                                   .value_or(""),
                                .initial_state = r.value("initial_state"),
                                .parent_step_id = r.opt_str("parent_step_id")}};
  case EventType::Restart:
    return EventBody{
        RestartEvent{.title = r.str("title"),
                     .description = r.opt_str("description").value_or(""),
                     .initial_state = r.value("initial_state"),
                     .parent_step_id = r.opt_str("parent_step_id")}};
  case EventType::StepStart:
    return EventBody{StepStartEvent{.step_id = r.str("step_id"),
                                    .step_title = r.str("step_title")}};
  case EventType::StepComplete: {
    auto patch = patch_from_json(r.value("patch"));
    if (!patch) {
      return fail(Error::CorruptEventLog);
    }
    return EventBody{StepCompleteEvent{.step_id = r.str("step_id"),
                                       .step_title = r.str("step_title"),
                                       .patch = std::move(*patch)}};
  }
  case EventType::StepRetry:
    return EventBody{StepRetryEvent{
        .step_id = r.str("step_id"),
        .step_title = r.str("step_title"),
        .error = error_info_from_json(r.value("error")),
        .attempt = static_cast<int>(r.integer("attempt"))}};
  case EventType::StepStatus: {
    StepStatusEvent e;
    for (const auto &item : r.array("steps")) {
      FieldReader entry(item);
      e.steps.push_back({.id = entry.str("id"),
                         .title = entry.str("title"),
                         .status = entry.str("status")});
      if (!entry.ok()) {
        return fail(Error::CorruptEventLog);
      }
    }
    return EventBody{std::move(e)};
  }
  case EventType::Error:
    return EventBody{
        ErrorEvent{.title = r.opt_str("title").value_or(""),
                   .error = error_info_from_json(r.value("error"))}};
  case EventType::Complete:
    return EventBody{CompleteEvent{.title = r.opt_str("title").value_or("")}};
  case EventType::Cancelled: {
    CancelledEvent e{.title = r.opt_str("title").value_or("")};
    if (auto err = r.value("error"); err.is_object()) {
      e.error = error_info_from_json(err);
    }
    return EventBody{std::move(e)};
  }
  case EventType::Paused:
    return EventBody{PausedEvent{}};
  case EventType::Resumed:
    return EventBody{ResumedEvent{}};
  case EventType::Webhook: {
    WebhookEvent e{.timeout_ms = r.opt_integer("timeout_ms")};
    for (const auto &item : r.array("wait_for")) {
      FieldReader entry(item);
      e.wait_for.push_back({.slug = entry.str("slug"),
                            .identifier = entry.str("identifier"),
                            .token = entry.opt_str("token")});
      if (!entry.ok()) {
        return fail(Error::CorruptEventLog);
      }
    }
    return EventBody{std::move(e)};
  }
  case EventType::WebhookResponse:
    return EventBody{WebhookResponseEvent{.response = r.value("response")}};
  case EventType::AgentStart:
    return EventBody{AgentStartEvent{.step_id = r.str("step_id"),
                                     .step_title = r.str("step_title"),
                                     .prompt = r.str("prompt"),
                                     .system = r.opt_str("system"),
                                     .tools = r.strings("tools")}};
  case EventType::AgentIteration:
    return EventBody{AgentIterationEvent{
        .step_id = r.str("step_id"),
        .iteration = static_cast<int>(r.integer("iteration")),
        .tokens = r.opt_integer("tokens").value_or(0),
        .total_tokens = r.opt_integer("total_tokens").value_or(0)}};
  case EventType::AgentToolCall:
    return EventBody{AgentToolCallEvent{
        .step_id = r.str("step_id"),
        .iteration = static_cast<int>(r.opt_integer("iteration").value_or(0)),
        .tool_call_id = r.str("tool_call_id"),
        .tool_name = r.str("tool_name"),
        .input = r.value("input")}};
  case EventType::AgentToolResult:
    return EventBody{AgentToolResultEvent{.step_id = r.str("step_id"),
                                          .tool_call_id = r.str("tool_call_id"),
                                          .tool_name = r.str("tool_name"),
                                          .result = r.value("result")}};
  case EventType::AgentAssistantMessage: {
    AgentAssistantMessageEvent e{
        .step_id = r.str("step_id"),
        .iteration = static_cast<int>(r.opt_integer("iteration").value_or(0)),
        .content = r.opt_str("content").value_or("")};
    for (const auto &item : r.array("tool_calls")) {
      FieldReader call(item);
      e.tool_calls.push_back({.id = call.str("id"),
                              .name = call.str("name"),
                              .input = call.value("input")});
      if (!call.ok()) {
        return fail(Error::CorruptEventLog);
      }
    }
    if (auto meta = r.value("provider_metadata"); !meta.is_null()) {
      e.provider_metadata = std::move(meta);
    }
    return EventBody{std::move(e)};
  }
  case EventType::AgentComplete:
    return EventBody{AgentCompleteEvent{
        .step_id = r.str("step_id"),
        .terminal_tool = r.str("terminal_tool"),
        .result = r.value("result"),
        .iterations = static_cast<int>(r.opt_integer("iterations").value_or(0)),
        .total_tokens = r.opt_integer("total_tokens").value_or(0)}};
  case EventType::AgentTokenLimit:
    return EventBody{
        AgentTokenLimitEvent{.step_id = r.str("step_id"),
                             .total_tokens = r.integer("total_tokens"),
                             .max_tokens = r.integer("max_tokens")}};
  case EventType::AgentWebhook:
    return EventBody{AgentWebhookEvent{.step_id = r.str("step_id"),
                                       .tool_call_id = r.str("tool_call_id"),
                                       .tool_name = r.str("tool_name"),
                                       .input = r.value("input")}};
  case EventType::AgentUserMessage:
    return EventBody{AgentUserMessageEvent{.step_id = r.str("step_id"),
                                           .content = r.str("content")}};
  }
  return fail(Error::CorruptEventLog);
}

} // namespace

auto error_info_to_json(const ErrorInfo &info) -> JsonValue {
  JsonValue out = JsonValue::object_t{};
  out["name"] = info.name;
  out["message"] = info.message;
  out["stack"] = info.stack;
  return out;
}

auto error_info_from_json(const JsonValue &json) -> ErrorInfo {
  return {.name = json_string_field(json, "name").value_or("Error"),
          .message = json_string_field(json, "message").value_or(""),
          .stack = json_string_field(json, "stack").value_or("")};
}

auto tool_call_to_json(const ToolCall &call) -> JsonValue {
  JsonValue out = JsonValue::object_t{};
  out["id"] = call.id;
  out["name"] = call.name;
  out["input"] = call.input;
  return out;
}

auto encode_event(const Event &event) -> JsonValue {
  JsonValue out = JsonValue::object_t{};
  out["type"] = std::string(to_string_view(event.type()));
  out["run_id"] = event.run_id.str();
  out["timestamp"] = event.timestamp;
  encode_body(out, event.body);
  return out;
}

auto serialize_event(const Event &event) -> std::string {
  return dump_json(encode_event(event));
}

auto decode_event(const JsonValue &json) -> Result<Event> {
  if (!json.is_object()) {
    return fail(Error::CorruptEventLog);
  }
  auto type_name = json_string_field(json, "type");
  if (!type_name) {
    return fail(Error::CorruptEventLog);
  }
  auto type = util::try_parse_enum<EventType>(*type_name);
  if (!type) {
    return fail(Error::CorruptEventLog);
  }

  FieldReader reader(json);
  auto body = decode_body(*type, reader);
  if (!body) {
    return fail(body.error());
  }
  if (!reader.ok()) {
    return fail(Error::CorruptEventLog);
  }

  return Event{.event_id = 0,
               .run_id = RunId{json_string_field(json, "run_id").value_or("")},
               .timestamp = json_int_field(json, "timestamp").value_or(0),
               .body = std::move(*body)};
}

auto deserialize_event(std::string_view text) -> Result<Event> {
  auto parsed = parse_json(text);
  if (!parsed) {
    return fail(Error::CorruptEventLog);
  }
  return decode_event(*parsed);
}

} // namespace brainforge
