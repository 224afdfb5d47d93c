#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace brainforge {

// Transparent hash so maps keyed by std::string accept string_view lookups.
struct StringHash {
  using is_transparent = void;
  using is_avalanching = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(sv);
  }
};

using StringEqual = std::equal_to<>;

} // namespace brainforge
