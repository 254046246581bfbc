#include "pulsewire/cli/commands.hpp"
#include "pulsewire/client/reconnect_manager.hpp"
#include "pulsewire/config/config.hpp"
#include "pulsewire/util/id.hpp"
#include "pulsewire/util/log.hpp"
#include "pulsewire/util/url.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <print>
#include <string>

namespace pulsewire::cli {
namespace {

auto print_message(const ReceivedMessage &received, bool json) -> void {
  if (json || !received.message) {
    std::println("{}", received.raw);
    return;
  }
  const auto &message = *received.message;
  std::println("[{}] {} {}", message.topic().value_or("-"),
               message.type_name(), received.raw);
}

} // namespace

auto cmd_listen(const ListenOptions &opts) -> int {
  auto config_res = opts.config_file.empty()
                        ? ConfigLoader::load_defaults()
                        : ConfigLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  auto client = config_res->client;
  if (opts.log_level.has_value()) {
    log::set_level(*opts.log_level);
  }
  if (opts.no_reconnect) {
    client.auto_reconnect = false;
  }

  const auto client_id =
      opts.client_id.value_or(generate_client_id("cli").str());
  auto url = opts.url.value_or(client.url);
  url = append_query_param(std::move(url), "client_id", client_id);
  if (!opts.token.empty()) {
    url = append_query_param(std::move(url), "token", opts.token);
  }
  if (auto parsed = parse_ws_url(url); !parsed) {
    std::println(stderr, "Error: invalid url '{}': {}", url,
                 parsed.error().message());
    return 1;
  }
  client.url = url;

  boost::asio::io_context io;
  ReconnectManager manager(io.get_executor());
  int exit_code = 0;

  ClientCallbacks callbacks;
  callbacks.on_message = [json = opts.json](const ReceivedMessage &received) {
    print_message(received, json);
  };
  callbacks.on_open = [&client_id] {
    std::println(stderr, "Connected as {}", client_id);
  };
  callbacks.on_error = [](std::error_code ec) {
    std::println(stderr, "Connection error: {}", ec.message());
  };
  callbacks.on_close = [&io, &exit_code] {
    std::println(stderr, "Connection closed; giving up.");
    exit_code = 1;
    io.stop();
  };

  for (const auto &topic : opts.topics) {
    manager.subscribe(topic);
  }
  if (!manager.connect(client, std::move(callbacks))) {
    std::println(stderr, "Error: connect refused");
    return 1;
  }

  boost::asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int) {
    if (!ec) {
      manager.close();
      io.stop();
    }
  });

  io.run();
  return exit_code;
}

} // namespace pulsewire::cli
