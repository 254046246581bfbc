#pragma once

#include "pulsewire/core/error.hpp"
#include "pulsewire/util/enum.hpp"
#include "pulsewire/util/json.hpp"
#include "pulsewire/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace pulsewire {

enum class MessageKind : std::uint8_t {
  AgentStatus,
  TransactionUpdate,
  Heartbeat,
  Ping,
  Pong,
  Subscribe,
  Unsubscribe,
  Application,
};
BOOST_DESCRIBE_ENUM(MessageKind, AgentStatus, TransactionUpdate, Heartbeat,
                    Ping, Pong, Subscribe, Unsubscribe, Application)
PULSEWIRE_ENUM_TO_STRING(MessageKind)

struct AgentStatusPayload {
  std::string agent_id;
  std::string status;
  util::Timestamp last_updated{};
  std::string details;
};

struct TransactionPayload {
  std::string tx_id;
  std::string status;
  util::Timestamp timestamp{};
  std::string amount;
  std::string blockchain;
  std::string from_address;
  std::string to_address;
};

struct HeartbeatPayload {
  util::Timestamp timestamp{};
};

struct PingPayload {};
struct PongPayload {};

struct SubscribePayload {
  std::string topic;
};

struct UnsubscribePayload {
  std::string topic;
};

/// Any other non-empty `type`; the payload is kept as parsed JSON.
struct ApplicationPayload {
  std::string type;
  JsonValue body{};
};

// Alternative order matches MessageKind so that kind() is the index.
using Payload =
    std::variant<AgentStatusPayload, TransactionPayload, HeartbeatPayload,
                 PingPayload, PongPayload, SubscribePayload,
                 UnsubscribePayload, ApplicationPayload>;

static_assert(std::variant_size_v<Payload> ==
              static_cast<std::size_t>(MessageKind::Application) + 1);

/// Immutable protocol envelope. The kind is derived from the payload
/// alternative, so the two can never disagree.
class Message {
public:
  Message(Payload payload, std::optional<std::string> topic,
          util::Timestamp timestamp)
      : payload_(std::move(payload)), topic_(std::move(topic)),
        timestamp_(timestamp) {}

  [[nodiscard]] auto kind() const noexcept -> MessageKind {
    return static_cast<MessageKind>(payload_.index());
  }
  [[nodiscard]] auto payload() const noexcept -> const Payload & {
    return payload_;
  }
  [[nodiscard]] auto topic() const noexcept
      -> const std::optional<std::string> & {
    return topic_;
  }
  [[nodiscard]] auto timestamp() const noexcept -> util::Timestamp {
    return timestamp_;
  }

  /// The wire `type` string ("agent_status", ..., or the application type).
  [[nodiscard]] auto type_name() const -> std::string_view;

  template <typename T> [[nodiscard]] auto as() const -> const T & {
    return std::get<T>(payload_);
  }
  template <typename T> [[nodiscard]] auto get_if() const -> const T * {
    return std::get_if<T>(&payload_);
  }

  [[nodiscard]] static auto agent_status(std::string agent_id,
                                         std::string status,
                                         std::string details) -> Message;
  [[nodiscard]] static auto
  transaction_update(std::string tx_id, std::string status,
                     std::string amount, std::string blockchain,
                     std::string from_address, std::string to_address)
      -> Message;
  [[nodiscard]] static auto heartbeat() -> Message;
  [[nodiscard]] static auto ping() -> Message;
  [[nodiscard]] static auto pong() -> Message;
  [[nodiscard]] static auto subscribe(std::string topic) -> Message;
  [[nodiscard]] static auto unsubscribe(std::string topic) -> Message;
  [[nodiscard]] static auto application(std::string type, JsonValue body,
                                        std::optional<std::string> topic = {})
      -> Message;

private:
  Payload payload_;
  std::optional<std::string> topic_;
  util::Timestamp timestamp_{};
};

/// JSON text of the envelope `{"type","topic"?,"payload","timestamp"?}`.
[[nodiscard]] auto encode_message(const Message &message) -> std::string;

/// Error::ParseError for non-JSON, non-object input or a missing string
/// `type`; Error::ProtocolError for a known type with a malformed payload.
[[nodiscard]] auto decode_message(std::string_view text) -> Result<Message>;

[[nodiscard]] auto decode_message(const JsonValue &json) -> Result<Message>;

} // namespace pulsewire
