#include "pulsewire/protocol/message.hpp"

#include <type_traits>

namespace pulsewire {

namespace {

[[nodiscard]] auto member(const JsonValue &object, std::string_view key)
    -> const JsonValue * {
  if (!object.is_object()) {
    return nullptr;
  }
  const auto &members = object.get_object();
  auto it = members.find(key);
  return it == members.end() ? nullptr : &it->second;
}

[[nodiscard]] auto optional_string(const JsonValue &object,
                                   std::string_view key) -> std::string {
  const auto *value = find_string(object, key);
  return value ? *value : std::string{};
}

// Amounts are strings on the wire, but numeric producers are tolerated.
[[nodiscard]] auto string_or_number(const JsonValue &object,
                                    std::string_view key) -> std::string {
  const auto *value = member(object, key);
  if (value == nullptr) {
    return {};
  }
  if (const auto *text = value->get_if<std::string>()) {
    return *text;
  }
  if (value->is_number()) {
    return dump_json(*value);
  }
  return {};
}

[[nodiscard]] auto optional_instant(const JsonValue &object,
                                    std::string_view key) -> util::Timestamp {
  const auto *text = find_string(object, key);
  if (text == nullptr) {
    return {};
  }
  return util::parse_iso8601(*text).value_or(util::Timestamp{});
}

[[nodiscard]] auto iso_or_null(util::Timestamp tp) -> JsonValue {
  if (tp == util::Timestamp{}) {
    return JsonValue{};
  }
  return JsonValue(util::format_iso8601(tp));
}

[[nodiscard]] auto encode_payload(const Payload &payload) -> JsonValue {
  return std::visit(
      [](const auto &p) -> JsonValue {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, AgentStatusPayload>) {
          return JsonValue{{"agent_id", p.agent_id},
                           {"status", p.status},
                           {"last_updated", iso_or_null(p.last_updated)},
                           {"details", p.details}};
        } else if constexpr (std::is_same_v<T, TransactionPayload>) {
          return JsonValue{{"tx_id", p.tx_id},
                           {"status", p.status},
                           {"timestamp", iso_or_null(p.timestamp)},
                           {"amount", p.amount},
                           {"blockchain", p.blockchain},
                           {"from_address", p.from_address},
                           {"to_address", p.to_address}};
        } else if constexpr (std::is_same_v<T, HeartbeatPayload>) {
          return JsonValue{{"timestamp", iso_or_null(p.timestamp)}};
        } else if constexpr (std::is_same_v<T, SubscribePayload> ||
                             std::is_same_v<T, UnsubscribePayload>) {
          return JsonValue(p.topic);
        } else if constexpr (std::is_same_v<T, ApplicationPayload>) {
          return p.body;
        } else {
          return JsonValue{};
        }
      },
      payload);
}

// The subscribe topic may arrive as the envelope `topic`, as a bare string
// payload, or as `payload.topic`.
[[nodiscard]] auto subscription_topic(const std::optional<std::string> &topic,
                                      const JsonValue *payload)
    -> std::optional<std::string> {
  if (topic && !topic->empty()) {
    return topic;
  }
  if (payload != nullptr) {
    if (const auto *text = payload->get_if<std::string>();
        text != nullptr && !text->empty()) {
      return *text;
    }
    if (const auto *nested = find_string(*payload, "topic");
        nested != nullptr && !nested->empty()) {
      return *nested;
    }
  }
  return std::nullopt;
}

[[nodiscard]] auto resolve_kind(std::string_view type) -> MessageKind {
  return util::enum_from_string<MessageKind>(type).value_or(
      MessageKind::Application);
}

} // namespace

auto Message::type_name() const -> std::string_view {
  if (const auto *app = get_if<ApplicationPayload>()) {
    return app->type;
  }
  return to_string_view(kind());
}

auto Message::agent_status(std::string agent_id, std::string status,
                           std::string details) -> Message {
  auto now = util::Clock::now();
  std::string topic = agent_id;
  return Message{AgentStatusPayload{.agent_id = std::move(agent_id),
                                    .status = std::move(status),
                                    .last_updated = now,
                                    .details = std::move(details)},
                 std::move(topic), now};
}

auto Message::transaction_update(std::string tx_id, std::string status,
                                 std::string amount, std::string blockchain,
                                 std::string from_address,
                                 std::string to_address) -> Message {
  auto now = util::Clock::now();
  std::string topic = tx_id;
  return Message{TransactionPayload{.tx_id = std::move(tx_id),
                                    .status = std::move(status),
                                    .timestamp = now,
                                    .amount = std::move(amount),
                                    .blockchain = std::move(blockchain),
                                    .from_address = std::move(from_address),
                                    .to_address = std::move(to_address)},
                 std::move(topic), now};
}

auto Message::heartbeat() -> Message {
  auto now = util::Clock::now();
  return Message{HeartbeatPayload{.timestamp = now}, std::nullopt, now};
}

auto Message::ping() -> Message {
  return Message{PingPayload{}, std::nullopt, util::Clock::now()};
}

auto Message::pong() -> Message {
  return Message{PongPayload{}, std::nullopt, util::Clock::now()};
}

auto Message::subscribe(std::string topic) -> Message {
  std::string envelope_topic = topic;
  return Message{SubscribePayload{.topic = std::move(topic)},
                 std::move(envelope_topic), util::Clock::now()};
}

auto Message::unsubscribe(std::string topic) -> Message {
  std::string envelope_topic = topic;
  return Message{UnsubscribePayload{.topic = std::move(topic)},
                 std::move(envelope_topic), util::Clock::now()};
}

auto Message::application(std::string type, JsonValue body,
                          std::optional<std::string> topic) -> Message {
  return Message{
      ApplicationPayload{.type = std::move(type), .body = std::move(body)},
      std::move(topic), util::Clock::now()};
}

auto encode_message(const Message &message) -> std::string {
  JsonValue json = {{"type", std::string(message.type_name())}};
  if (message.topic()) {
    json["topic"] = *message.topic();
  }
  if (message.kind() != MessageKind::Ping &&
      message.kind() != MessageKind::Pong) {
    json["payload"] = encode_payload(message.payload());
  }
  if (message.timestamp() != util::Timestamp{}) {
    json["timestamp"] = util::format_iso8601(message.timestamp());
  }
  return dump_json(json);
}

auto decode_message(std::string_view text) -> Result<Message> {
  auto parsed = parse_json(text);
  if (!parsed) {
    return fail(parsed.error());
  }
  return decode_message(*parsed);
}

auto decode_message(const JsonValue &json) -> Result<Message> {
  if (!json.is_object()) {
    return fail(Error::ParseError);
  }
  const auto *type = find_string(json, "type");
  if (type == nullptr || type->empty()) {
    return fail(Error::ParseError);
  }

  std::optional<std::string> topic;
  if (const auto *t = find_string(json, "topic"); t && !t->empty()) {
    topic = *t;
  }
  const auto timestamp = optional_instant(json, "timestamp");
  const auto *payload = member(json, "payload");

  switch (resolve_kind(*type)) {
  case MessageKind::AgentStatus: {
    if (payload == nullptr || !payload->is_object()) {
      return fail(Error::ProtocolError);
    }
    const auto *agent_id = find_string(*payload, "agent_id");
    const auto *status = find_string(*payload, "status");
    if (agent_id == nullptr || agent_id->empty() || status == nullptr) {
      return fail(Error::ProtocolError);
    }
    AgentStatusPayload body{
        .agent_id = *agent_id,
        .status = *status,
        .last_updated = optional_instant(*payload, "last_updated"),
        .details = optional_string(*payload, "details")};
    if (!topic) {
      topic = body.agent_id;
    }
    return Message{std::move(body), std::move(topic), timestamp};
  }
  case MessageKind::TransactionUpdate: {
    if (payload == nullptr || !payload->is_object()) {
      return fail(Error::ProtocolError);
    }
    const auto *tx_id = find_string(*payload, "tx_id");
    const auto *status = find_string(*payload, "status");
    if (tx_id == nullptr || tx_id->empty() || status == nullptr) {
      return fail(Error::ProtocolError);
    }
    TransactionPayload body{
        .tx_id = *tx_id,
        .status = *status,
        .timestamp = optional_instant(*payload, "timestamp"),
        .amount = string_or_number(*payload, "amount"),
        .blockchain = optional_string(*payload, "blockchain"),
        .from_address = optional_string(*payload, "from_address"),
        .to_address = optional_string(*payload, "to_address")};
    if (!topic) {
      topic = body.tx_id;
    }
    return Message{std::move(body), std::move(topic), timestamp};
  }
  case MessageKind::Heartbeat: {
    HeartbeatPayload body{.timestamp = timestamp};
    if (payload != nullptr && !payload->is_null()) {
      if (!payload->is_object()) {
        return fail(Error::ProtocolError);
      }
      if (auto inner = optional_instant(*payload, "timestamp");
          inner != util::Timestamp{}) {
        body.timestamp = inner;
      }
    }
    return Message{body, std::move(topic), timestamp};
  }
  case MessageKind::Ping:
    return Message{PingPayload{}, std::move(topic), timestamp};
  case MessageKind::Pong:
    return Message{PongPayload{}, std::move(topic), timestamp};
  case MessageKind::Subscribe: {
    auto resolved = subscription_topic(topic, payload);
    if (!resolved) {
      return fail(Error::ProtocolError);
    }
    return Message{SubscribePayload{.topic = *resolved}, resolved, timestamp};
  }
  case MessageKind::Unsubscribe: {
    auto resolved = subscription_topic(topic, payload);
    if (!resolved) {
      return fail(Error::ProtocolError);
    }
    return Message{UnsubscribePayload{.topic = *resolved}, resolved,
                   timestamp};
  }
  case MessageKind::Application:
    break;
  }

  return Message{ApplicationPayload{.type = *type,
                                    .body = payload ? *payload : JsonValue{}},
                 std::move(topic), timestamp};
}

} // namespace pulsewire
