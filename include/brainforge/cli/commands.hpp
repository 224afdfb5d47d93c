#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace brainforge::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  bool no_api{false};
  std::optional<int> shards;
};

struct CheckConfigOptions {
  std::string config_file;
  bool json{false};
};

struct StateOptions {
  std::string config_file;
  std::string run_id;
  // Event index to reconstruct at; the last event when unset.
  std::optional<std::int64_t> at;
  bool events{false};
};

[[nodiscard]] auto cmd_serve(const ServeOptions &opts) -> int;
[[nodiscard]] auto cmd_check_config(const CheckConfigOptions &opts) -> int;
[[nodiscard]] auto cmd_state(const StateOptions &opts) -> int;

} // namespace brainforge::cli
