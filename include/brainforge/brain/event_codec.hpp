#pragma once

#include "brainforge/brain/event.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/json.hpp"

#include <string>
#include <string_view>

namespace brainforge {

/// Wire form: `{"type": "<snake_case>", "run_id", "timestamp", ...payload}`.
[[nodiscard]] auto encode_event(const Event &event) -> JsonValue;
[[nodiscard]] auto serialize_event(const Event &event) -> std::string;

/// CorruptEventLog for unknown types or missing required payload fields.
[[nodiscard]] auto decode_event(const JsonValue &json) -> Result<Event>;
[[nodiscard]] auto deserialize_event(std::string_view text) -> Result<Event>;

[[nodiscard]] auto error_info_to_json(const ErrorInfo &info) -> JsonValue;
[[nodiscard]] auto error_info_from_json(const JsonValue &json) -> ErrorInfo;

[[nodiscard]] auto tool_call_to_json(const ToolCall &call) -> JsonValue;

} // namespace brainforge
