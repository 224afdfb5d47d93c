#pragma once

#include "brainforge/core/error.hpp"

#include <glaze/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace brainforge {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto is_valid_json(std::string_view input) -> bool {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  return !static_cast<bool>(glz::read<kOpts>(value, input));
}

/// Structural equality. Objects are key-ordered maps, so the serialized form
/// is canonical.
[[nodiscard]] inline auto json_equal(const JsonValue &lhs, const JsonValue &rhs)
    -> bool {
  return dump_json(lhs) == dump_json(rhs);
}

[[nodiscard]] inline auto make_json_object() -> JsonValue {
  return JsonValue::object_t{};
}

[[nodiscard]] inline auto make_json_array() -> JsonValue {
  return JsonValue::array_t{};
}

[[nodiscard]] inline auto json_string_field(const JsonValue &obj,
                                            std::string_view key)
    -> std::optional<std::string> {
  if (!obj.is_object() || !obj.contains(key)) {
    return std::nullopt;
  }
  const auto &field = obj.get_object().find(key)->second;
  if (!field.is_string()) {
    return std::nullopt;
  }
  return field.as<std::string>();
}

[[nodiscard]] inline auto json_int_field(const JsonValue &obj,
                                         std::string_view key)
    -> std::optional<std::int64_t> {
  if (!obj.is_object() || !obj.contains(key)) {
    return std::nullopt;
  }
  const auto &field = obj.get_object().find(key)->second;
  if (!field.is_number()) {
    return std::nullopt;
  }
  return field.as<std::int64_t>();
}

/// Returns the member or null when absent.
[[nodiscard]] inline auto json_field(const JsonValue &obj, std::string_view key)
    -> JsonValue {
  if (!obj.is_object() || !obj.contains(key)) {
    return JsonValue{};
  }
  return obj.get_object().find(key)->second;
}

} // namespace brainforge
