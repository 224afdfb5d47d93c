#pragma once

#include "brainforge/brain/state_machine.hpp"
#include "brainforge/util/id.hpp"

#include <optional>
#include <string>

namespace brainforge::webhook {

/// Accepts when neither side has a token or both carry the same one. An empty
/// string counts as absent.
[[nodiscard]] inline auto
validate_webhook_token(const std::optional<std::string> &expected,
                       const std::optional<std::string> &submitted)
    -> SignalValidation {
  const bool has_expected = expected && !expected->empty();
  const bool has_submitted = submitted && !submitted->empty();
  if (!has_expected && !has_submitted) {
    return {.valid = true, .reason = std::nullopt};
  }
  if (has_expected && has_submitted && *expected == *submitted) {
    return {.valid = true, .reason = std::nullopt};
  }
  return {.valid = false, .reason = "Invalid form token"};
}

/// 128 bits from the OS entropy source, hex encoded.
[[nodiscard]] inline auto generate_csrf_token() -> std::string {
  return detail::generate_random_hex(16);
}

} // namespace brainforge::webhook
