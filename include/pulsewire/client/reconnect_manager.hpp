#pragma once

#include "pulsewire/client/transport.hpp"
#include "pulsewire/config/system_config.hpp"
#include "pulsewire/protocol/message.hpp"
#include "pulsewire/util/enum.hpp"
#include "pulsewire/util/json.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace pulsewire {

enum class ClientState : std::uint8_t { Idle, Connecting, Open, Reconnecting };
BOOST_DESCRIBE_ENUM(ClientState, Idle, Connecting, Open, Reconnecting)
PULSEWIRE_ENUM_TO_STRING(ClientState)

/// An inbound frame, decoded as far as it would go.
struct ReceivedMessage {
  std::string raw;
  std::optional<JsonValue> json;
  std::optional<Message> message;
};

struct ClientCallbacks {
  std::function<void(const ReceivedMessage &)> on_message;
  std::function<void()> on_open;
  /// Reconnection gave up (or auto_reconnect is off). Not called for close().
  std::function<void()> on_close;
  std::function<void(std::error_code)> on_error;
};

/// Backoff before reconnect attempt `attempt` (1-based): linear, capped at
/// three intervals.
[[nodiscard]] constexpr auto reconnect_delay(std::chrono::milliseconds interval,
                                             int attempt)
    -> std::chrono::milliseconds {
  const int factor = attempt < 0 ? 0 : (attempt < 3 ? attempt : 3);
  return interval * factor;
}

/// One logical client connection that outlives its physical sockets.
///
/// All state lives on a private strand; public calls post onto it and return
/// immediately. Messages sent while disconnected wait in a bounded queue and
/// are flushed in order once the connection opens. Subscriptions are
/// remembered and re-sent ahead of queued messages after every reconnect.
class ReconnectManager {
public:
  explicit ReconnectManager(boost::asio::any_io_executor executor,
                            TransportFactory factory = {});
  ~ReconnectManager();

  ReconnectManager(const ReconnectManager &) = delete;
  auto operator=(const ReconnectManager &) -> ReconnectManager & = delete;

  /// False (and no effect) while open, while an attempt is in flight, or when
  /// `config` fails ConfigLoader::validate.
  auto connect(ClientConfig config, ClientCallbacks callbacks) -> bool;

  /// Written immediately when open; otherwise queued, `priority` at the front.
  /// A full queue discards its oldest message.
  auto send(std::string text, bool priority = false) -> void;
  auto send(const Message &message, bool priority = false) -> void;

  auto subscribe(std::string topic) -> void;
  auto unsubscribe(std::string topic) -> void;

  /// Cancels timers, closes the socket and forgets queued messages and
  /// subscriptions. Safe in any state; connect() may be called again.
  auto close() -> void;

  [[nodiscard]] auto state() const noexcept -> ClientState;
  [[nodiscard]] auto attempt() const noexcept -> int;
  [[nodiscard]] auto pending_count() const noexcept -> std::size_t;
  [[nodiscard]] auto dropped_count() const noexcept -> std::uint64_t;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace pulsewire
