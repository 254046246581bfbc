#pragma once

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/http/websocket.hpp"
#include "pulsewire/protocol/message.hpp"
#include "pulsewire/util/enum.hpp"
#include "pulsewire/util/id.hpp"
#include "pulsewire/util/string_map.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/describe/enum.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace pulsewire {

enum class SessionState : std::uint8_t { Connecting, Open, Closing, Closed };
BOOST_DESCRIBE_ENUM(SessionState, Connecting, Open, Closing, Closed)
PULSEWIRE_ENUM_TO_STRING(SessionState)

using TopicSet = StringSet;

/// Encoded once per broadcast and shared by every recipient queue.
struct TextFrame {
  std::shared_ptr<const std::string> text;
};
struct PingFrame {};
using OutboundFrame = std::variant<TextFrame, PingFrame>;

struct SessionOptions {
  std::size_t outbound_capacity{256};
  std::size_t max_message_bytes{1024 * 1024};
  unsigned max_consecutive_decode_failures{16};
};

class Session;

/// What a session reports upward. Implemented by the hub; tests substitute
/// their own recorder.
class SessionSink {
public:
  virtual ~SessionSink() = default;

  virtual auto register_session(std::shared_ptr<Session> session) -> void = 0;
  virtual auto unregister_session(std::shared_ptr<Session> session)
      -> void = 0;
  virtual auto update_topics(SessionId id, TopicSet topics) -> void = 0;
  /// Client-to-server messages the session does not handle itself.
  virtual auto deliver_inbound(const ClientId &client_id,
                               const Message &message) -> void = 0;
};

/// One connected client. The reader side runs inside run(); the writer runs
/// as a sibling coroutine on the same executor and is the only consumer of
/// the outbound queue.
class Session : public std::enable_shared_from_this<Session> {
public:
  Session(std::shared_ptr<http::IWebSocketConnection> connection,
          ClientId client_id, std::shared_ptr<SessionSink> sink,
          SessionOptions options = {});
  ~Session();

  Session(const Session &) = delete;
  auto operator=(const Session &) -> Session & = delete;

  [[nodiscard]] auto id() const noexcept -> SessionId { return id_; }
  [[nodiscard]] auto client_id() const noexcept -> const ClientId & {
    return client_id_;
  }
  [[nodiscard]] auto state() const noexcept -> SessionState {
    return state_.load(std::memory_order_acquire);
  }

  /// Completes the upgrade, registers with the sink and runs the reader until
  /// the connection ends, then tears the session down.
  auto run() -> spawn_task;

  /// Non-blocking. A full queue drops the new frame (drop-newest) and counts
  /// it. Returns false if the frame was dropped or the queue is closed.
  auto enqueue(OutboundFrame frame) -> bool;
  auto enqueue_text(std::shared_ptr<const std::string> text) -> bool {
    return enqueue(TextFrame{std::move(text)});
  }
  auto enqueue_ping() -> bool { return enqueue(PingFrame{}); }

  /// The writer sends a close frame once it observes the closed queue.
  auto close_outbound() -> void;
  /// Idempotent: unregister, close the queue, close the socket.
  auto teardown() -> void;
  /// Close the socket without waiting for the writer.
  auto force_close() -> void;

  auto touch() noexcept -> void;
  [[nodiscard]] auto last_active_ms() const noexcept -> std::int64_t {
    return last_active_ms_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto idle_for(std::int64_t now_ms) const noexcept
      -> std::chrono::milliseconds;

  [[nodiscard]] auto queue_depth() const noexcept -> std::size_t {
    return queued_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return options_.outbound_capacity;
  }

private:
  using OutboundChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::any_io_executor,
      void(boost::system::error_code, OutboundFrame)>;

  auto writer_loop() -> spawn_task;
  auto reader_loop() -> task<void>;
  auto handle_message(const Message &message) -> void;
  auto transition(SessionState from, SessionState to) noexcept -> bool;
  auto record_drop() -> void;

  SessionId id_;
  ClientId client_id_;
  std::shared_ptr<http::IWebSocketConnection> connection_;
  std::shared_ptr<SessionSink> sink_;
  SessionOptions options_;
  OutboundChannel outbound_;
  // Reader-owned; the hub works from copies sent via update_topics.
  TopicSet topics_;

  std::atomic<SessionState> state_{SessionState::Connecting};
  std::atomic<std::int64_t> last_active_ms_;
  std::atomic<std::size_t> queued_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<bool> torn_down_{false};
  std::atomic<bool> registered_{false};
};

} // namespace pulsewire
