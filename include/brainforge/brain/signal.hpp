#pragma once

#include "brainforge/core/error.hpp"
#include "brainforge/util/id.hpp"
#include "brainforge/util/json.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace brainforge {

enum class SignalType : std::uint8_t {
  Kill,
  Pause,
  Resume,
  UserMessage,
  WebhookResponse,
};

enum class SignalKind : std::uint8_t { Control, Webhook };

enum class SignalFilter : std::uint8_t { Control, Webhook, All };

inline constexpr std::array<SignalType, 5> kAllSignalTypes = {
    SignalType::Kill, SignalType::Pause, SignalType::Resume,
    SignalType::UserMessage, SignalType::WebhookResponse};

// Signals travel in upper case ("KILL", "WEBHOOK_RESPONSE").
[[nodiscard]] constexpr auto signal_type_name(SignalType type) noexcept
    -> std::string_view {
  switch (type) {
  case SignalType::Kill:
    return "KILL";
  case SignalType::Pause:
    return "PAUSE";
  case SignalType::Resume:
    return "RESUME";
  case SignalType::UserMessage:
    return "USER_MESSAGE";
  case SignalType::WebhookResponse:
    return "WEBHOOK_RESPONSE";
  }
  return "UNKNOWN";
}

[[nodiscard]] constexpr auto parse_signal_type(std::string_view name) noexcept
    -> std::optional<SignalType> {
  for (auto type : kAllSignalTypes) {
    if (signal_type_name(type) == name) {
      return type;
    }
  }
  return std::nullopt;
}

[[nodiscard]] constexpr auto kind_of(SignalType type) noexcept -> SignalKind {
  return type == SignalType::WebhookResponse ? SignalKind::Webhook
                                             : SignalKind::Control;
}

/// The registration a webhook response was claimed from.
struct WebhookKey {
  std::string slug;
  std::string identifier;

  auto operator==(const WebhookKey &) const -> bool = default;
};

struct Signal {
  SignalId id;
  SignalType type{SignalType::Kill};
  JsonValue payload;
  std::int64_t queued_at{0};
  std::optional<WebhookKey> webhook;

  [[nodiscard]] auto kind() const noexcept -> SignalKind {
    return kind_of(type);
  }

  [[nodiscard]] auto matches(SignalFilter filter) const noexcept -> bool {
    switch (filter) {
    case SignalFilter::Control:
      return kind() == SignalKind::Control;
    case SignalFilter::Webhook:
      return kind() == SignalKind::Webhook;
    case SignalFilter::All:
      return true;
    }
    return false;
  }
};

[[nodiscard]] auto make_signal(SignalType type, JsonValue payload = {})
    -> Signal;

/// `{"id", "type", "payload", "queued_at"}`.
[[nodiscard]] auto signal_to_json(const Signal &signal) -> JsonValue;
[[nodiscard]] auto signal_from_json(const JsonValue &json) -> Result<Signal>;

} // namespace brainforge
