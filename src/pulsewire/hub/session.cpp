#include "pulsewire/hub/session.hpp"

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/util/log.hpp"
#include "pulsewire/util/time.hpp"

#include <bit>
#include <utility>

namespace pulsewire {

Session::Session(std::shared_ptr<http::IWebSocketConnection> connection,
                 ClientId client_id, std::shared_ptr<SessionSink> sink,
                 SessionOptions options)
    : id_(next_session_id()), client_id_(std::move(client_id)),
      connection_(std::move(connection)), sink_(std::move(sink)),
      options_(options),
      outbound_(connection_->get_executor(), options.outbound_capacity),
      last_active_ms_(util::steady_now_ms()) {
  connection_->set_read_limit(options_.max_message_bytes);
}

Session::~Session() = default;

auto Session::transition(SessionState from, SessionState to) noexcept -> bool {
  return state_.compare_exchange_strong(from, to, std::memory_order_acq_rel);
}

auto Session::touch() noexcept -> void {
  last_active_ms_.store(util::steady_now_ms(), std::memory_order_release);
}

auto Session::idle_for(std::int64_t now_ms) const noexcept
    -> std::chrono::milliseconds {
  const auto last = last_active_ms();
  return std::chrono::milliseconds{now_ms > last ? now_ms - last : 0};
}

auto Session::record_drop() -> void {
  const auto dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
  if (std::has_single_bit(dropped)) {
    log::warn("Session {} ({}) outbound queue full, dropped {} message(s)",
              id_, client_id_, dropped);
  }
}

auto Session::enqueue(OutboundFrame frame) -> bool {
  const auto current = state();
  if (current == SessionState::Closing || current == SessionState::Closed) {
    return false;
  }
  // Reserve a slot first so queue_depth() never undercounts the writer.
  if (queued_.fetch_add(1, std::memory_order_acq_rel) >=
      options_.outbound_capacity) {
    queued_.fetch_sub(1, std::memory_order_acq_rel);
    record_drop();
    return false;
  }
  if (!outbound_.try_send(boost::system::error_code{}, std::move(frame))) {
    queued_.fetch_sub(1, std::memory_order_acq_rel);
    if (outbound_.is_open()) {
      record_drop();
    }
    return false;
  }
  return true;
}

auto Session::close_outbound() -> void {
  auto current = state();
  while (current != SessionState::Closing && current != SessionState::Closed) {
    if (state_.compare_exchange_weak(current, SessionState::Closing,
                                     std::memory_order_acq_rel)) {
      break;
    }
  }
  outbound_.close();
}

auto Session::force_close() -> void { connection_->force_close(); }

auto Session::teardown() -> void {
  if (torn_down_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  log::debug("Session {} ({}) teardown", id_, client_id_);
  if (registered_.load(std::memory_order_acquire)) {
    sink_->unregister_session(shared_from_this());
  }
  close_outbound();
  connection_->force_close();
}

auto Session::run() -> spawn_task {
  auto self = shared_from_this();

  auto accepted = co_await connection_->accept();
  if (!accepted) {
    log::debug("Session {} ({}) upgrade failed: {}", id_, client_id_,
               accepted.error().message());
    state_.store(SessionState::Closed, std::memory_order_release);
    co_return;
  }
  if (!transition(SessionState::Connecting, SessionState::Open)) {
    connection_->force_close();
    co_return;
  }
  touch();

  connection_->set_control_callback(
      [weak = weak_from_this()](http::WebSocketOpCode) {
        if (auto session = weak.lock()) {
          session->touch();
        }
      });

  registered_.store(true, std::memory_order_release);
  sink_->register_session(self);
  co_spawn(outbound_.get_executor(), writer_loop(), detached);

  co_await reader_loop();
  teardown();
}

auto Session::writer_loop() -> spawn_task {
  auto self = shared_from_this();

  for (;;) {
    auto [ec, frame] = co_await outbound_.async_receive(use_nothrow);
    if (ec) {
      break;
    }
    queued_.fetch_sub(1, std::memory_order_acq_rel);

    Result<void> written;
    if (auto *text = std::get_if<TextFrame>(&frame)) {
      written = co_await connection_->write_text(std::move(text->text));
    } else {
      written = co_await connection_->ping();
    }
    if (!written) {
      log::debug("Session {} ({}) write failed: {}", id_, client_id_,
                 written.error().message());
      teardown();
      break;
    }
  }

  if (!connection_->is_closed()) {
    if (auto closed = co_await connection_->close(); !closed) {
      log::debug("Session {} ({}) close frame failed: {}", id_, client_id_,
                 closed.error().message());
    }
  }
  connection_->force_close();
  queued_.store(0, std::memory_order_release);
  state_.store(SessionState::Closed, std::memory_order_release);
  log::debug("Session {} ({}) writer finished", id_, client_id_);
}

auto Session::reader_loop() -> task<void> {
  unsigned consecutive_failures = 0;

  for (;;) {
    auto frame = co_await connection_->read();
    if (!frame) {
      const auto &ec = frame.error();
      if (ec == make_error_code(Error::MessageTooLarge)) {
        log::warn("Session {} ({}) sent a frame over {} bytes; closing", id_,
                  client_id_, options_.max_message_bytes);
      } else if (ec != make_error_code(Error::ConnectionClosed) &&
                 !is_cancellation(ec)) {
        log::debug("Session {} ({}) read ended: {}", id_, client_id_,
                   ec.message());
      }
      co_return;
    }
    touch();

    auto message = decode_message(frame->payload);
    if (!message) {
      ++consecutive_failures;
      log::warn("Session {} ({}) malformed frame ({}): {}", id_, client_id_,
                consecutive_failures, message.error().message());
      if (consecutive_failures > options_.max_consecutive_decode_failures) {
        log::warn("Session {} ({}) exceeded {} consecutive malformed frames",
                  id_, client_id_, options_.max_consecutive_decode_failures);
        co_return;
      }
      continue;
    }
    consecutive_failures = 0;
    handle_message(*message);
  }
}

auto Session::handle_message(const Message &message) -> void {
  switch (message.kind()) {
  case MessageKind::Subscribe: {
    const auto &topic = message.as<SubscribePayload>().topic;
    if (topics_.insert(topic).second) {
      log::info("Session {} ({}) subscribed to {}", id_, client_id_, topic);
    }
    sink_->update_topics(id_, topics_);
    return;
  }
  case MessageKind::Unsubscribe: {
    const auto &topic = message.as<UnsubscribePayload>().topic;
    if (topics_.erase(topic) > 0) {
      log::info("Session {} ({}) unsubscribed from {}", id_, client_id_,
                topic);
    }
    sink_->update_topics(id_, topics_);
    return;
  }
  case MessageKind::Ping:
    enqueue_text(std::make_shared<const std::string>(
        encode_message(Message::pong())));
    return;
  case MessageKind::Heartbeat:
  case MessageKind::Pong:
    return;
  case MessageKind::AgentStatus:
  case MessageKind::TransactionUpdate:
  case MessageKind::Application:
    sink_->deliver_inbound(client_id_, message);
    return;
  }
}

} // namespace pulsewire
