#pragma once

#include "brainforge/config/system_config.hpp"
#include "brainforge/core/error.hpp"

#include <string_view>

namespace brainforge {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
};

} // namespace brainforge
