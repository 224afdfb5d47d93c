#include "brainforge/app/application.hpp"
#include "brainforge/cli/commands.hpp"
#include "brainforge/config/config.hpp"
#include "brainforge/util/log.hpp"
#include "brainforge/util/shutdown.hpp"

#include <print>
#include <string>

namespace brainforge::cli {

auto cmd_serve(const ServeOptions &opts) -> int {
  auto config_res = ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  auto config = std::move(*config_res);

  config.api.enabled = config.api.enabled && !opts.no_api;
  if (opts.log_level) {
    config.engine.log_level = *opts.log_level;
  }
  if (opts.shards) {
    config.engine.shards = *opts.shards;
  }

  const auto log_file = opts.log_file.value_or(config.engine.log_file);
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }
  log::set_level(config.engine.log_level);

  Application app(std::move(config));
  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  setup_signal_handlers();

  const auto &cfg = app.config();
  if (cfg.api.enabled) {
    log::info("brainforge started on {}:{}", cfg.api.host, cfg.api.port);
  } else {
    log::info("brainforge started (engine only)");
  }

  wait_for_shutdown();
  app.stop();
  log::info("brainforge stopped.");
  log::stop();
  return 0;
}

} // namespace brainforge::cli
