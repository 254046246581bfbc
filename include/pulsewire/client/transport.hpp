#pragma once

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/core/error.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace pulsewire {

/// One physical client connection. Never reused: a reconnect asks the
/// factory for a fresh transport.
class IClientTransport {
public:
  virtual ~IClientTransport() = default;

  /// Resolve, connect and handshake, all bounded by `timeout`.
  virtual auto connect(std::string_view url, std::chrono::milliseconds timeout)
      -> task<Result<void>> = 0;
  /// Next text frame. Error::ConnectionClosed after a clean close.
  virtual auto read() -> task<Result<std::string>> = 0;
  virtual auto write(std::string text) -> task<Result<void>> = 0;
  virtual auto close() -> task<Result<void>> = 0;
  [[nodiscard]] virtual auto is_open() const -> bool = 0;
};

using TransportFactory = std::function<std::shared_ptr<IClientTransport>(
    boost::asio::any_io_executor executor)>;

} // namespace pulsewire
