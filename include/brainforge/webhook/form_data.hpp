#pragma once

#include "brainforge/core/error.hpp"
#include "brainforge/util/json.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace brainforge::webhook {

/// Hidden field generated forms carry their CSRF token in.
inline constexpr std::string_view kFormTokenField = "__positronic_token";

struct FormData {
  JsonValue data;
  std::optional<std::string> token;
};

/// Decodes an `application/x-www-form-urlencoded` body. `name[]` keys always
/// become arrays; a key seen twice is folded into an array. The token field
/// is returned separately and never appears in `data`.
[[nodiscard]] auto parse_form_data(std::string_view body) -> Result<FormData>;

} // namespace brainforge::webhook
