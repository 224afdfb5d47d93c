#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <string>

namespace brainforge::util {

using Clock = std::chrono::system_clock;

[[nodiscard]] inline auto to_unix_millis(Clock::time_point tp)
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto now_millis() -> std::int64_t {
  return to_unix_millis(Clock::now());
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis)
    -> Clock::time_point {
  return Clock::time_point{std::chrono::milliseconds{millis}};
}

// YYYY-MM-DDTHH:MM:SS.mmmZ, empty for a zero timestamp.
[[nodiscard]] inline auto format_iso8601(std::int64_t millis) -> std::string {
  if (millis <= 0) {
    return {};
  }
  const auto tp = std::chrono::floor<std::chrono::milliseconds>(
      from_unix_millis(millis));
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", tp);
}

} // namespace brainforge::util
