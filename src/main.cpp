#include "pulsewire/cli/commands.hpp"
#include "pulsewire/util/log.hpp"

#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("PULSEWIRE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Peer resets surface as write errors, not process death.
  std::signal(SIGPIPE, SIG_IGN);
  // Keep non-serve CLI output clean by default.
  pulsewire::log::set_output_stderr();
  pulsewire::log::set_level(pulsewire::log::Level::Warn);

  CLI::App app{"pulsewire", "Real-time WebSocket pub/sub hub"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  pulsewire serve -c pulsewire.toml\n"
             "  pulsewire serve --port 9000 --simulate\n"
             "  pulsewire listen --subscribe agent:42 --token valid-token\n"
             "\nTip: Set PULSEWIRE_CONFIG=pulsewire.toml to skip -c on "
             "every command.");

  const std::string env_config = default_config();

  pulsewire::cli::ServeOptions serve_opts;
  auto *serve = app.add_subcommand("serve", "Run the pub/sub hub");
  serve_opts.config_file = env_config;
  serve->add_option("-c,--config", serve_opts.config_file,
                    "System config file (defaults apply when omitted)")
      ->check(CLI::ExistingFile);
  serve->add_option("-p,--port", serve_opts.port, "Listen port override");
  serve->add_option("--log-file", serve_opts.log_file, "Log file path");
  serve->add_option("--log-level", serve_opts.log_level,
                    "Log level override: trace|debug|info|warn|error");
  serve->add_option("--shards", serve_opts.shards,
                    "Number of shards (default: auto-detect CPU cores)");
  serve->add_flag("--simulate", serve_opts.simulate,
                  "Publish simulated agent and transaction updates");
  serve->callback(
      [&serve_opts]() { std::exit(pulsewire::cli::cmd_serve(serve_opts)); });

  pulsewire::cli::ListenOptions listen_opts;
  auto *listen =
      app.add_subcommand("listen", "Connect to a hub and print messages");
  listen->footer("\nExamples:\n"
                 "  pulsewire listen --subscribe agent:42\n"
                 "  pulsewire listen --url ws://hub:8080/ws --json");
  listen_opts.config_file = env_config;
  listen
      ->add_option("-c,--config", listen_opts.config_file,
                   "System config file ([client] section)")
      ->check(CLI::ExistingFile);
  listen->add_option("-u,--url", listen_opts.url, "Hub WebSocket URL");
  listen->add_option("-s,--subscribe", listen_opts.topics,
                     "Topic to subscribe to (repeatable)");
  listen->add_option("--client-id", listen_opts.client_id,
                     "Client id (default: generated)");
  listen->add_option("--token", listen_opts.token, "Auth token")
      ->capture_default_str();
  listen->add_option("--log-level", listen_opts.log_level,
                     "Log level override: trace|debug|info|warn|error");
  listen->add_flag("--no-reconnect", listen_opts.no_reconnect,
                   "Exit on the first disconnect");
  listen->add_flag("--json", listen_opts.json, "Print raw frames only");
  listen->callback(
      [&listen_opts]() { std::exit(pulsewire::cli::cmd_listen(listen_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
