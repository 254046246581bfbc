#pragma once

#include "pulsewire/client/transport.hpp"

#include <memory>

namespace pulsewire {

/// Beast WebSocket client over plain TCP (`ws://` only).
class WebSocketTransport : public IClientTransport {
public:
  explicit WebSocketTransport(boost::asio::any_io_executor executor);
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport &) = delete;
  auto operator=(const WebSocketTransport &) -> WebSocketTransport & = delete;

  auto connect(std::string_view url, std::chrono::milliseconds timeout)
      -> task<Result<void>> override;
  auto read() -> task<Result<std::string>> override;
  auto write(std::string text) -> task<Result<void>> override;
  auto close() -> task<Result<void>> override;
  [[nodiscard]] auto is_open() const -> bool override;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

[[nodiscard]] auto make_websocket_transport_factory() -> TransportFactory;

} // namespace pulsewire
