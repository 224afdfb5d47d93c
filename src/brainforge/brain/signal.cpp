#include "brainforge/brain/signal.hpp"

#include "brainforge/util/time.hpp"

namespace brainforge {

auto make_signal(SignalType type, JsonValue payload) -> Signal {
  return Signal{.id = generate_signal_id(),
                .type = type,
                .payload = std::move(payload),
                .queued_at = util::now_millis()};
}

auto signal_to_json(const Signal &signal) -> JsonValue {
  JsonValue out = JsonValue::object_t{};
  out["id"] = signal.id.str();
  out["type"] = std::string(signal_type_name(signal.type));
  out["payload"] = signal.payload;
  out["queued_at"] = signal.queued_at;
  if (signal.webhook) {
    JsonValue key = JsonValue::object_t{};
    key["slug"] = signal.webhook->slug;
    key["identifier"] = signal.webhook->identifier;
    out["webhook"] = std::move(key);
  }
  return out;
}

auto signal_from_json(const JsonValue &json) -> Result<Signal> {
  auto type_name = json_string_field(json, "type");
  if (!type_name) {
    return fail(Error::ParseError);
  }
  auto type = parse_signal_type(*type_name);
  if (!type) {
    return fail(Error::InvalidArgument);
  }
  Signal signal{.id = SignalId{json_string_field(json, "id").value_or("")},
                .type = *type,
                .payload = json_field(json, "payload"),
                .queued_at = json_int_field(json, "queued_at").value_or(0)};
  const auto key = json_field(json, "webhook");
  auto slug = json_string_field(key, "slug");
  auto identifier = json_string_field(key, "identifier");
  if (slug && identifier) {
    signal.webhook =
        WebhookKey{.slug = std::move(*slug), .identifier = std::move(*identifier)};
  }
  return signal;
}

} // namespace brainforge
