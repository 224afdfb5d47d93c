#include "brainforge/cli/commands.hpp"
#include "brainforge/config/config.hpp"
#include "brainforge/util/json.hpp"
#include "brainforge/util/log.hpp"

#include <print>

namespace brainforge::cli {

auto cmd_check_config(const CheckConfigOptions &opts) -> int {
  log::set_output_stderr();
  auto config_res = ConfigLoader::load_from_file(opts.config_file);

  if (opts.json) {
    auto out = make_json_object();
    out["config_file"] = opts.config_file;
    out["valid"] = config_res.has_value();
    if (config_res) {
      out["storage_backend"] =
          std::string(to_string_view(config_res->storage.backend));
      out["blob_backend"] =
          std::string(to_string_view(config_res->storage.blob_backend));
      out["api_enabled"] = config_res->api.enabled;
    } else {
      out["error"] = config_res.error().message();
    }
    std::println("{}", dump_json(out));
    return config_res ? 0 : 1;
  }

  if (!config_res) {
    std::println(stderr, "Error: {}: {}", opts.config_file,
                 config_res.error().message());
    return 1;
  }
  const auto &cfg = *config_res;
  std::println("{}: OK", opts.config_file);
  std::println("  storage:   {} (blobs: {})", to_string_view(cfg.storage.backend),
               to_string_view(cfg.storage.blob_backend));
  std::println("  overflow:  {} bytes", cfg.storage.overflow_threshold_bytes);
  if (cfg.api.enabled) {
    std::println("  api:       {}:{}", cfg.api.host, cfg.api.port);
  } else {
    std::println("  api:       disabled");
  }
  return 0;
}

} // namespace brainforge::cli
