#pragma once

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/core/error.hpp"
#include "pulsewire/http/http_types.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pulsewire::http {

enum class WebSocketOpCode : std::uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA
};

struct InboundFrame {
  WebSocketOpCode opcode{WebSocketOpCode::Text};
  std::string payload;
};

/// Server side of one upgraded connection. At most one read() and one
/// write-type operation (write_text, ping, close) may be outstanding at a time.
class IWebSocketConnection {
public:
  virtual ~IWebSocketConnection() = default;

  /// Completes the upgrade handshake.
  virtual auto accept() -> task<Result<void>> = 0;
  /// Answers the pending upgrade request with a plain HTTP error instead.
  virtual auto reject(HttpStatus status, std::string body)
      -> task<Result<void>> = 0;

  /// Next complete data message. Error::ConnectionClosed after a close frame,
  /// Error::MessageTooLarge when the read limit is exceeded.
  virtual auto read() -> task<Result<InboundFrame>> = 0;
  virtual auto write_text(std::shared_ptr<const std::string> text)
      -> task<Result<void>> = 0;
  virtual auto ping() -> task<Result<void>> = 0;
  virtual auto close() -> task<Result<void>> = 0;

  /// Invoked for ping/pong/close control frames seen while reading.
  virtual auto set_control_callback(
      std::function<void(WebSocketOpCode)> callback) -> void = 0;
  virtual auto set_read_limit(std::size_t bytes) -> void = 0;

  [[nodiscard]] virtual auto is_closed() const -> bool = 0;
  [[nodiscard]] virtual auto fd() const -> int = 0;
  /// Thread-safe; posts the socket shutdown onto the connection executor.
  virtual auto force_close() -> void = 0;
  [[nodiscard]] virtual auto get_executor() const
      -> boost::asio::any_io_executor = 0;
};

template <typename NextLayer>
class BasicWebSocketConnection
    : public IWebSocketConnection,
      public std::enable_shared_from_this<BasicWebSocketConnection<NextLayer>> {
public:
  BasicWebSocketConnection(NextLayer next_layer, HttpRequest upgrade_request);
  /// Without an upgrade request the handshake is read from the socket.
  explicit BasicWebSocketConnection(NextLayer next_layer);
  ~BasicWebSocketConnection() override;

  BasicWebSocketConnection(const BasicWebSocketConnection &) = delete;
  auto operator=(const BasicWebSocketConnection &)
      -> BasicWebSocketConnection & = delete;

  auto accept() -> task<Result<void>> override;
  auto reject(HttpStatus status, std::string body)
      -> task<Result<void>> override;
  auto read() -> task<Result<InboundFrame>> override;
  auto write_text(std::shared_ptr<const std::string> text)
      -> task<Result<void>> override;
  auto ping() -> task<Result<void>> override;
  auto close() -> task<Result<void>> override;

  auto set_control_callback(std::function<void(WebSocketOpCode)> callback)
      -> void override;
  auto set_read_limit(std::size_t bytes) -> void override;

  [[nodiscard]] auto is_closed() const -> bool override;
  [[nodiscard]] auto fd() const -> int override;
  auto force_close() -> void override;
  [[nodiscard]] auto get_executor() const
      -> boost::asio::any_io_executor override;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

using WebSocketConnection =
    BasicWebSocketConnection<boost::asio::generic::stream_protocol::socket>;
using TlsWebSocketConnection = BasicWebSocketConnection<
    boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>;

extern template class BasicWebSocketConnection<
    boost::asio::generic::stream_protocol::socket>;
extern template class BasicWebSocketConnection<
    boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>;

} // namespace pulsewire::http
