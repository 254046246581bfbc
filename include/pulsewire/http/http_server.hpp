#pragma once

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/core/error.hpp"
#include "pulsewire/http/http_types.hpp"
#include "pulsewire/http/websocket.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace pulsewire {
class Runtime;
}

namespace pulsewire::http {

class Router;

/// Receives every upgrade request, accepted or not; the handler decides
/// between IWebSocketConnection::accept() and reject().
using WebSocketHandler = std::move_only_function<spawn_task(
    std::shared_ptr<IWebSocketConnection> connection, HttpRequest request)>;

class HttpServer {
public:
  explicit HttpServer(Runtime &runtime);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  auto operator=(const HttpServer &) -> HttpServer & = delete;

  auto router() -> Router &;
  auto set_websocket_handler(WebSocketHandler handler) -> void;
  [[nodiscard]] auto set_tls_credentials(std::string cert_chain_file,
                                         std::string private_key_file)
      -> Result<void>;

  /// Binds and listens before returning; port 0 picks an ephemeral port,
  /// reported by local_port().
  [[nodiscard]] auto start(std::string_view host, std::uint16_t port,
                           bool reuse_port = false) -> Result<void>;
  auto stop() -> void;

  [[nodiscard]] auto is_running() const -> bool;
  [[nodiscard]] auto local_port() const -> std::uint16_t;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace pulsewire::http
