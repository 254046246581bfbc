#pragma once

#include "pulsewire/config/system_config.hpp"
#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/core/error.hpp"
#include "pulsewire/hub/hub_request.hpp"
#include "pulsewire/hub/session.hpp"
#include "pulsewire/protocol/message.hpp"
#include "pulsewire/util/json.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace pulsewire {

class Runtime;

/// Registry of live sessions and the fan-out point for server events.
///
/// Every registry mutation happens inside one control loop pinned to shard 0.
/// Callers on any thread submit requests through a bounded channel; when the
/// channel is full the request is sent asynchronously instead of dropped, so
/// register and unregister are never lost. Broadcast delivery to each session
/// never blocks: a full session queue drops the new frame.
class Hub {
public:
  /// Client-to-server application traffic, keyed by the sender's client id.
  /// Invoked on the sender's shard, possibly concurrently.
  using MessageHandler =
      std::function<void(const ClientId &client_id, const Message &message)>;

  explicit Hub(Runtime &runtime, HubConfig config = {});
  ~Hub();

  Hub(const Hub &) = delete;
  auto operator=(const Hub &) -> Hub & = delete;

  [[nodiscard]] auto start() -> Result<void>;
  /// Closes every session and stops the loop. Cannot be restarted.
  auto stop() -> void;

  [[nodiscard]] auto is_running() const noexcept -> bool;
  [[nodiscard]] auto session_count() const noexcept -> std::size_t;

  /// New session bound to this hub; call Session::run() to drive it.
  [[nodiscard]] auto
  make_session(std::shared_ptr<http::IWebSocketConnection> connection,
               ClientId client_id) -> std::shared_ptr<Session>;
  [[nodiscard]] auto session_options() const -> SessionOptions;

  auto register_session(std::shared_ptr<Session> session) -> void;
  auto unregister_session(std::shared_ptr<Session> session) -> void;
  auto update_topics(SessionId id, TopicSet topics) -> void;

  /// Delivered to sessions subscribed to the message topic, to sessions with
  /// no subscriptions, or to everyone when the message has no topic.
  [[nodiscard]] auto broadcast(const Message &message) -> Result<void>;
  [[nodiscard]] auto publish_agent_status(std::string agent_id,
                                          std::string status,
                                          std::string details)
      -> Result<void>;
  [[nodiscard]] auto publish_transaction_update(
      std::string tx_id, std::string status, std::string amount,
      std::string blockchain, std::string from_address, std::string to_address)
      -> Result<void>;

  /// Answered from inside the control loop; empty when the hub is stopped.
  [[nodiscard]] auto snapshot() -> task<HubSnapshot>;

  auto set_message_handler(MessageHandler handler) -> void;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

[[nodiscard]] auto to_json(const HubSnapshot &snapshot) -> JsonValue;

} // namespace pulsewire
