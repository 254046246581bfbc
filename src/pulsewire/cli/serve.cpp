#include "pulsewire/app/application.hpp"
#include "pulsewire/cli/commands.hpp"
#include "pulsewire/config/config.hpp"
#include "pulsewire/util/log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdint>
#include <print>
#include <string>

namespace pulsewire::cli {
namespace {

// Blocks the calling thread until SIGINT or SIGTERM arrives.
auto wait_for_stop_signal() -> void {
  boost::asio::io_context io;
  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code &ec, int signo) {
    if (!ec) {
      log::info("Received signal {}, shutting down", signo);
    }
  });
  io.run();
}

auto load_config_or_print(std::string_view path) -> Result<SystemConfig> {
  auto loaded = path.empty() ? ConfigLoader::load_defaults()
                             : ConfigLoader::load_from_file(path);
  return std::move(loaded).or_else(
      [&](std::error_code ec) -> Result<SystemConfig> {
        std::println(stderr, "Error: {}", ec.message());
        return fail(ec);
      });
}

auto apply_overrides(SystemConfig &config, const ServeOptions &opts)
    -> Result<void> {
  if (opts.port.has_value()) {
    config.server.port = static_cast<std::uint16_t>(*opts.port);
  }
  if (opts.shards.has_value()) {
    config.server.shards = *opts.shards;
  }
  if (opts.log_level.has_value()) {
    config.log.level = *opts.log_level;
  }
  if (opts.log_file.has_value()) {
    config.log.file = *opts.log_file;
  }
  return ConfigLoader::validate(config);
}

} // namespace

auto cmd_serve(const ServeOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (auto r = apply_overrides(config, opts); !r) {
    std::println(stderr, "Error: invalid override: {}", r.error().message());
    return 1;
  }

  if (!config.log.file.empty() && !log::set_output_file(config.log.file)) {
    std::println(stderr, "Error: Failed to open log file: {}",
                 config.log.file);
    return 1;
  }
  log::set_level(config.log.level);
  log::start();

  Application app(std::move(config));
  if (auto r = app.start(); !r.has_value()) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  if (opts.simulate) {
    app.start_simulation();
  }
  wait_for_stop_signal();
  app.stop();
  log::info("pulsewire shut down.");
  log::stop();
  return 0;
}

} // namespace pulsewire::cli
