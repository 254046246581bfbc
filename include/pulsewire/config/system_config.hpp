#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pulsewire {

struct ServerConfig {
  std::string host{"0.0.0.0"};
  uint16_t port{8080};
  int shards{0}; // 0 = auto (hardware_concurrency)
  bool reuse_port{false};
  bool tls_enabled{false};
  std::string tls_cert_file;
  std::string tls_key_file;
  std::string ws_path{"/ws"};

  auto operator==(const ServerConfig &) const -> bool = default;
};

struct HubConfig {
  std::size_t outbound_queue_capacity{256};
  int ping_after_ms{30000};
  int evict_after_ms{60000};
  int sweep_interval_ms{30000};
  std::size_t request_queue_capacity{4096};
  std::size_t max_message_bytes{1024 * 1024};

  auto operator==(const HubConfig &) const -> bool = default;
};

struct AuthConfig {
  std::vector<std::string> tokens{"valid-token"};

  auto operator==(const AuthConfig &) const -> bool = default;
};

struct LogConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct ClientConfig {
  std::string url{"ws://localhost:8080/ws"};
  int reconnect_interval_ms{5000};
  int max_reconnect_attempts{5};
  int heartbeat_interval_ms{30000};
  int timeout_ms{10000};
  bool auto_reconnect{true};
  std::size_t max_pending_messages{1000};

  auto operator==(const ClientConfig &) const -> bool = default;
};

struct SystemConfig {
  ServerConfig server;
  HubConfig hub;
  AuthConfig auth;
  LogConfig log;
  ClientConfig client;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace pulsewire
