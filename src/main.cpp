#include "brainforge/cli/commands.hpp"
#include "brainforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("BRAINFORGE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_config_option(CLI::App *cmd, std::string &target,
                       const std::string &env_config) -> void {
  target = env_config;
  auto *opt = cmd->add_option("-c,--config", target, "System config file")
                  ->check(CLI::ExistingFile);
  if (env_config.empty())
    opt->required();
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  brainforge::log::set_output_stderr();
  brainforge::log::set_level(brainforge::log::Level::Warn);

  CLI::App app{"brainforge", "Event-sourced brain run engine"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  brainforge serve -c brainforge.toml\n"
             "  brainforge state -c brainforge.toml <run-id>\n"
             "\nTip: Set BRAINFORGE_CONFIG=brainforge.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  brainforge::cli::ServeOptions serve_opts;
  auto *serve = app.add_subcommand("serve", "Run the engine and REST API");
  add_config_option(serve, serve_opts.config_file, env_config);
  serve->add_flag("--no-api", serve_opts.no_api, "Disable REST API");
  serve->add_option("--log-file", serve_opts.log_file, "Log file path");
  serve->add_option("--log-level", serve_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  serve->add_option("--shards", serve_opts.shards,
                    "Number of shards (default: auto-detect CPU cores)");
  serve->callback([&serve_opts]() {
    std::exit(brainforge::cli::cmd_serve(serve_opts));
  });

  brainforge::cli::CheckConfigOptions check_opts;
  auto *check =
      app.add_subcommand("check-config", "Validate a system config file");
  add_config_option(check, check_opts.config_file, env_config);
  check->add_flag("--json", check_opts.json, "Output JSON");
  check->callback([&check_opts]() {
    std::exit(brainforge::cli::cmd_check_config(check_opts));
  });

  brainforge::cli::StateOptions state_opts;
  auto *state = app.add_subcommand(
      "state", "Rebuild a run's state from its persisted event log");
  add_config_option(state, state_opts.config_file, env_config);
  state->add_option("run_id", state_opts.run_id, "Brain run ID")->required();
  state->add_option("--at", state_opts.at,
                    "Event index to stop at (default: last event)");
  state->add_flag("--events", state_opts.events,
                  "Print the event log instead of the state");
  state->callback([&state_opts]() {
    std::exit(brainforge::cli::cmd_state(state_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
