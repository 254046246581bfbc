#include "pulsewire/config/config.hpp"

#include "pulsewire/core/error.hpp"
#include "pulsewire/util/log.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <glaze/toml.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace pulsewire {
namespace detail {

struct ServerToml {
  std::string host{"0.0.0.0"};
  uint16_t port{8080};
  int shards{0};
  bool reuse_port{false};
  bool tls_enabled{false};
  std::string tls_cert_file;
  std::string tls_key_file;
  std::string ws_path{"/ws"};
};

struct HubToml {
  std::size_t outbound_queue_capacity{256};
  int ping_after_ms{30000};
  int evict_after_ms{60000};
  int sweep_interval_ms{30000};
  std::size_t request_queue_capacity{4096};
  std::size_t max_message_bytes{1024 * 1024};
};

struct AuthToml {
  std::vector<std::string> tokens{"valid-token"};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct ClientToml {
  std::string url{"ws://localhost:8080/ws"};
  int reconnect_interval_ms{5000};
  int max_reconnect_attempts{5};
  int heartbeat_interval_ms{30000};
  int timeout_ms{10000};
  bool auto_reconnect{true};
  std::size_t max_pending_messages{1000};
};

struct SystemToml {
  ServerToml server{};
  HubToml hub{};
  AuthToml auth{};
  LogToml log{};
  ClientToml client{};
};

} // namespace detail
} // namespace pulsewire

namespace glz {
template <> struct meta<pulsewire::detail::ServerToml> {
  using T = pulsewire::detail::ServerToml;
  static constexpr auto value = object(
      "host", &T::host, "port", &T::port, "shards", &T::shards, "reuse_port",
      &T::reuse_port, "tls_enabled", &T::tls_enabled, "tls_cert_file",
      &T::tls_cert_file, "tls_key_file", &T::tls_key_file, "ws_path",
      &T::ws_path);
};

template <> struct meta<pulsewire::detail::HubToml> {
  using T = pulsewire::detail::HubToml;
  static constexpr auto value =
      object("outbound_queue_capacity", &T::outbound_queue_capacity,
             "ping_after_ms", &T::ping_after_ms, "evict_after_ms",
             &T::evict_after_ms, "sweep_interval_ms", &T::sweep_interval_ms,
             "request_queue_capacity", &T::request_queue_capacity,
             "max_message_bytes", &T::max_message_bytes);
};

template <> struct meta<pulsewire::detail::AuthToml> {
  using T = pulsewire::detail::AuthToml;
  static constexpr auto value = object("tokens", &T::tokens);
};

template <> struct meta<pulsewire::detail::LogToml> {
  using T = pulsewire::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<pulsewire::detail::ClientToml> {
  using T = pulsewire::detail::ClientToml;
  static constexpr auto value = object(
      "url", &T::url, "reconnect_interval_ms", &T::reconnect_interval_ms,
      "max_reconnect_attempts", &T::max_reconnect_attempts,
      "heartbeat_interval_ms", &T::heartbeat_interval_ms, "timeout_ms",
      &T::timeout_ms, "auto_reconnect", &T::auto_reconnect,
      "max_pending_messages", &T::max_pending_messages);
};

template <> struct meta<pulsewire::detail::SystemToml> {
  using T = pulsewire::detail::SystemToml;
  static constexpr auto value =
      object("server", &T::server, "hub", &T::hub, "auth", &T::auth, "log",
             &T::log, "client", &T::client);
};
} // namespace glz

namespace pulsewire {
namespace {

// Unknown keys are accepted so a newer file still loads.
constexpr auto kTomlOpts =
    glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};

auto slurp(std::string_view path) -> Result<std::string> {
  std::ifstream file{std::string(path), std::ios::binary};
  if (!file.is_open()) {
    log::error("Config file '{}' not found", path);
    return fail(Error::FileNotFound);
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return ok(std::move(contents).str());
}

auto env_flag(std::string_view v) -> bool {
  return v == "1" || boost::algorithm::iequals(v, "true");
}

auto split_tokens(std::string_view list) -> std::vector<std::string> {
  std::vector<std::string> parts;
  boost::algorithm::split(parts, list, boost::algorithm::is_any_of(","));
  std::vector<std::string> tokens;
  for (auto &part : parts) {
    boost::algorithm::trim(part);
    if (!part.empty()) {
      tokens.push_back(std::move(part));
    }
  }
  return tokens;
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("WS_PORT"); v != nullptr) {
    cfg.server.port = boost::lexical_cast<uint16_t>(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_PORT"); v != nullptr) {
    cfg.server.port = boost::lexical_cast<uint16_t>(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_HOST"); v != nullptr) {
    cfg.server.host = v;
  }
  if (const char *v = std::getenv("PULSEWIRE_SHARDS"); v != nullptr) {
    cfg.server.shards = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_REUSEPORT"); v != nullptr) {
    cfg.server.reuse_port = env_flag(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_TLS_ENABLED"); v != nullptr) {
    cfg.server.tls_enabled = env_flag(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_TLS_CERT_FILE"); v != nullptr) {
    cfg.server.tls_cert_file = v;
  }
  if (const char *v = std::getenv("PULSEWIRE_TLS_KEY_FILE"); v != nullptr) {
    cfg.server.tls_key_file = v;
  }
  if (const char *v = std::getenv("PULSEWIRE_WS_PATH"); v != nullptr) {
    cfg.server.ws_path = v;
  }
  if (const char *v = std::getenv("PULSEWIRE_OUTBOUND_QUEUE_CAPACITY");
      v != nullptr) {
    cfg.hub.outbound_queue_capacity = boost::lexical_cast<std::size_t>(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_PING_AFTER_MS"); v != nullptr) {
    cfg.hub.ping_after_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_EVICT_AFTER_MS"); v != nullptr) {
    cfg.hub.evict_after_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_SWEEP_INTERVAL_MS");
      v != nullptr) {
    cfg.hub.sweep_interval_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_TOKENS"); v != nullptr) {
    cfg.auth.tokens = split_tokens(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("PULSEWIRE_LOG_FILE"); v != nullptr) {
    cfg.log.file = v;
  }
  if (const char *v = std::getenv("PULSEWIRE_CLIENT_URL"); v != nullptr) {
    cfg.client.url = v;
  }
  if (const char *v = std::getenv("PULSEWIRE_CLIENT_RECONNECT_INTERVAL_MS");
      v != nullptr) {
    cfg.client.reconnect_interval_ms = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_CLIENT_MAX_RECONNECT_ATTEMPTS");
      v != nullptr) {
    cfg.client.max_reconnect_attempts = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("PULSEWIRE_CLIENT_AUTO_RECONNECT");
      v != nullptr) {
    cfg.client.auto_reconnect = env_flag(v);
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<SystemConfig> {
  detail::SystemToml raw{};
  if (auto ec = glz::read<kTomlOpts>(raw, toml_text); ec) {
    log::error("TOML parse error: {}", glz::format_error(ec, toml_text));
    return fail(Error::ParseError);
  }

  SystemConfig cfg{};
  cfg.server.host = std::move(raw.server.host);
  cfg.server.port = raw.server.port;
  cfg.server.shards = raw.server.shards;
  cfg.server.reuse_port = raw.server.reuse_port;
  cfg.server.tls_enabled = raw.server.tls_enabled;
  cfg.server.tls_cert_file = std::move(raw.server.tls_cert_file);
  cfg.server.tls_key_file = std::move(raw.server.tls_key_file);
  cfg.server.ws_path = std::move(raw.server.ws_path);

  cfg.hub.outbound_queue_capacity = raw.hub.outbound_queue_capacity;
  cfg.hub.ping_after_ms = raw.hub.ping_after_ms;
  cfg.hub.evict_after_ms = raw.hub.evict_after_ms;
  cfg.hub.sweep_interval_ms = raw.hub.sweep_interval_ms;
  cfg.hub.request_queue_capacity = raw.hub.request_queue_capacity;
  cfg.hub.max_message_bytes = raw.hub.max_message_bytes;

  cfg.auth.tokens = std::move(raw.auth.tokens);

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  cfg.client.url = std::move(raw.client.url);
  cfg.client.reconnect_interval_ms = raw.client.reconnect_interval_ms;
  cfg.client.max_reconnect_attempts = raw.client.max_reconnect_attempts;
  cfg.client.heartbeat_interval_ms = raw.client.heartbeat_interval_ms;
  cfg.client.timeout_ms = raw.client.timeout_ms;
  cfg.client.auto_reconnect = raw.client.auto_reconnect;
  cfg.client.max_pending_messages = raw.client.max_pending_messages;

  apply_env_overrides(cfg);
  if (auto valid = ConfigLoader::validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::validate(const SystemConfig &cfg) -> Result<void> {
  const auto &hub = cfg.hub;
  if (cfg.server.shards < 0 || !cfg.server.ws_path.starts_with('/')) {
    log::error("Invalid [server] section: shards={} ws_path='{}'",
               cfg.server.shards, cfg.server.ws_path);
    return fail(Error::InvalidArgument);
  }
  if (cfg.server.tls_enabled &&
      (cfg.server.tls_cert_file.empty() || cfg.server.tls_key_file.empty())) {
    log::error("TLS enabled without tls_cert_file/tls_key_file");
    return fail(Error::InvalidArgument);
  }
  if (hub.outbound_queue_capacity == 0 || hub.request_queue_capacity == 0 ||
      hub.max_message_bytes == 0 || hub.ping_after_ms <= 0 ||
      hub.sweep_interval_ms <= 0 || hub.evict_after_ms <= hub.ping_after_ms) {
    log::error("Invalid [hub] section: evict_after_ms must exceed "
               "ping_after_ms and all limits must be positive");
    return fail(Error::InvalidArgument);
  }
  if (!log::is_level_name(cfg.log.level)) {
    log::error("Unknown log level '{}'", cfg.log.level);
    return fail(Error::InvalidArgument);
  }
  return validate(cfg.client);
}

auto ConfigLoader::validate(const ClientConfig &client) -> Result<void> {
  if (client.reconnect_interval_ms <= 0 || client.max_reconnect_attempts < 0 ||
      client.heartbeat_interval_ms <= 0 || client.timeout_ms <= 0 ||
      client.max_pending_messages == 0) {
    log::error("Invalid [client] section");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = slurp(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const std::exception &e) {
    log::error("Failed to parse TOML system configuration: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_defaults() -> Result<SystemConfig> {
  return load_from_string("");
}

} // namespace pulsewire
