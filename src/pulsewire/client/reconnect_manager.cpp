#include "pulsewire/client/reconnect_manager.hpp"

#include "pulsewire/client/websocket_transport.hpp"
#include "pulsewire/config/config.hpp"
#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/util/log.hpp"
#include "pulsewire/util/string_map.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <atomic>
#include <bit>
#include <deque>
#include <mutex>
#include <utility>

namespace pulsewire {

namespace {

struct PendingMessage {
  std::string text;
  bool priority{false};
  bool heartbeat{false};
  std::uint64_t seq{0};
};

template <typename F, typename... Args>
auto invoke_callback(std::string_view name, const F &fn, Args &&...args)
    -> void {
  if (!fn) {
    return;
  }
  try {
    fn(std::forward<Args>(args)...);
  } catch (const std::exception &e) {
    log::error("Client {} callback threw: {}", name, e.what());
  }
}

} // namespace

struct ReconnectManager::Impl : std::enable_shared_from_this<Impl> {
  using Strand = boost::asio::strand<boost::asio::any_io_executor>;

  Strand strand;
  TransportFactory factory;
  boost::asio::steady_timer reconnect_timer;
  boost::asio::steady_timer heartbeat_timer;

  // Bumped whenever in-flight work must become a no-op: a new physical
  // attempt, a disconnect, or close().
  std::atomic<std::uint64_t> epoch{0};
  std::atomic<ClientState> state{ClientState::Idle};
  std::atomic<int> attempt{0};
  // Writers of epoch, state and attempt hold this from their check to the
  // transition it permits. The atomics stay readable without it.
  std::mutex lifecycle_mu;
  std::uint64_t session{0}; // lifecycle_mu; bumped by connect() and close()
  std::atomic<std::size_t> pending_size{0};
  std::atomic<std::uint64_t> dropped{0};

  // Strand only.
  ClientConfig config;
  ClientCallbacks callbacks;
  std::shared_ptr<IClientTransport> transport;
  std::deque<PendingMessage> pending;
  StringSet subscriptions;
  std::uint64_t next_seq{0};
  std::uint64_t closes{0};
  bool writing{false};

  Impl(boost::asio::any_io_executor executor, TransportFactory f)
      : strand(boost::asio::make_strand(std::move(executor))),
        factory(f ? std::move(f) : make_websocket_transport_factory()),
        reconnect_timer(strand), heartbeat_timer(strand) {}

  auto publish_pending_size() -> void {
    pending_size.store(pending.size(), std::memory_order_release);
  }

  [[nodiscard]] auto is_open() const -> bool {
    return state.load(std::memory_order_acquire) == ClientState::Open;
  }

  auto drop_oldest() -> void {
    // Prefer discarding bulk messages over queued control messages.
    auto oldest = pending.end();
    for (auto it = pending.begin(); it != pending.end(); ++it) {
      if (it->priority) {
        continue;
      }
      if (oldest == pending.end() || it->seq < oldest->seq) {
        oldest = it;
      }
    }
    if (oldest == pending.end()) {
      oldest = std::ranges::min_element(pending, {}, &PendingMessage::seq);
    }
    pending.erase(oldest);
    const auto count = dropped.fetch_add(1, std::memory_order_relaxed) + 1;
    if (std::has_single_bit(count)) {
      log::warn("Client pending queue full ({}), dropped {} message(s)",
                config.max_pending_messages, count);
    }
  }

  auto enqueue(std::string text, bool at_front, bool heartbeat = false)
      -> void {
    if (!pending.empty() && pending.size() >= config.max_pending_messages) {
      drop_oldest();
    }
    PendingMessage item{.text = std::move(text),
                        .priority = at_front,
                        .heartbeat = heartbeat,
                        .seq = next_seq++};
    if (at_front) {
      pending.push_front(std::move(item));
    } else {
      pending.push_back(std::move(item));
    }
    publish_pending_size();
  }

  auto kick_writer() -> void {
    if (writing || !is_open() || pending.empty() || !transport) {
      return;
    }
    writing = true;
    co_spawn(strand,
             write_loop(shared_from_this(), epoch.load(std::memory_order_acquire),
                        transport),
             detached);
  }

  // `gen` is the epoch the caller moved to under lifecycle_mu.
  auto launch_attempt(std::uint64_t gen) -> void {
    transport = factory(strand);
    log::info("Connecting to {} (attempt {})", config.url,
              attempt.load(std::memory_order_acquire));
    co_spawn(strand, run_connection(shared_from_this(), gen, transport),
             detached);
  }

  auto on_open(std::uint64_t gen) -> bool {
    {
      // close() may have run on another thread since the epoch check.
      std::lock_guard lock(lifecycle_mu);
      if (epoch.load(std::memory_order_acquire) != gen ||
          state.load(std::memory_order_acquire) != ClientState::Connecting) {
        return false;
      }
      state.store(ClientState::Open, std::memory_order_release);
      attempt.store(0, std::memory_order_release);
    }

    const auto &topics = subscriptions.values();
    for (auto it = topics.rbegin(); it != topics.rend(); ++it) {
      pending.push_front(PendingMessage{.text = encode_message(
                                            Message::subscribe(*it)),
                                        .priority = true,
                                        .heartbeat = false,
                                        .seq = next_seq++});
    }
    publish_pending_size();
    log::info("Connected to {}; flushing {} queued message(s)", config.url,
              pending.size());

    co_spawn(strand, heartbeat_loop(shared_from_this(), gen), detached);
    kick_writer();
    invoke_callback("on_open", callbacks.on_open);
    return true;
  }

  auto dispatch_inbound(std::string raw) -> void {
    ReceivedMessage received;
    if (auto json = parse_json(raw)) {
      if (auto message = decode_message(*json)) {
        received.message = std::move(*message);
      } else {
        log::debug("Client received undecodable envelope: {}",
                   message.error().message());
      }
      received.json = std::move(*json);
    } else {
      log::debug("Client received non-JSON frame ({} bytes)", raw.size());
    }
    received.raw = std::move(raw);
    invoke_callback("on_message", callbacks.on_message, received);
  }

  auto release_transport() -> void {
    heartbeat_timer.cancel();
    if (transport) {
      co_spawn(strand, close_transport(std::move(transport)), detached);
      transport.reset();
    }
  }

  auto handle_disconnect(std::uint64_t gen, std::error_code ec) -> void {
    int current = 0;
    bool retry = false;
    {
      std::lock_guard lock(lifecycle_mu);
      const auto previous = state.load(std::memory_order_acquire);
      if (previous != ClientState::Connecting &&
          previous != ClientState::Open) {
        return;
      }
      auto expected = gen;
      if (!epoch.compare_exchange_strong(expected, gen + 1,
                                         std::memory_order_acq_rel)) {
        return;
      }
      current = attempt.load(std::memory_order_acquire);
      retry = config.auto_reconnect && current < config.max_reconnect_attempts;
      if (retry) {
        attempt.store(current + 1, std::memory_order_release);
      }
      state.store(retry ? ClientState::Reconnecting : ClientState::Idle,
                  std::memory_order_release);
    }
    release_transport();

    std::erase_if(pending, [](const PendingMessage &m) { return m.heartbeat; });
    publish_pending_size();

    if (ec == make_error_code(Error::ConnectionClosed)) {
      log::warn("Connection to {} closed", config.url);
    } else {
      log::warn("Connection to {} failed: {}", config.url, ec.message());
      invoke_callback("on_error", callbacks.on_error, ec);
    }

    if (retry) {
      const auto next = current + 1;
      const auto delay = reconnect_delay(
          std::chrono::milliseconds(config.reconnect_interval_ms), next);
      log::info("Reconnecting in {}ms (attempt {}/{})", delay.count(), next,
                config.max_reconnect_attempts);
      co_spawn(strand, reconnect_after(shared_from_this(), gen + 1, delay),
               detached);
      return;
    }

    log::error("Reconnection limit reached or auto_reconnect disabled after "
               "{} attempt(s)",
               current);
    invoke_callback("on_close", callbacks.on_close);
  }

  auto shutdown() -> void {
    ++closes;
    reconnect_timer.cancel();
    release_transport();
    pending.clear();
    subscriptions.clear();
    publish_pending_size();
    log::info("Client connection closed");
  }

  static auto run_connection(std::shared_ptr<Impl> self, std::uint64_t gen,
                             std::shared_ptr<IClientTransport> t)
      -> spawn_task {
    const auto url = self->config.url;
    auto connected = co_await t->connect(
        url, std::chrono::milliseconds(self->config.timeout_ms));
    if (self->epoch.load(std::memory_order_acquire) != gen) {
      if (connected) {
        (void)co_await t->close();
      }
      co_return;
    }
    if (!connected) {
      self->handle_disconnect(gen, connected.error());
      co_return;
    }

    if (!self->on_open(gen)) {
      (void)co_await t->close();
      co_return;
    }

    for (;;) {
      auto frame = co_await t->read();
      if (self->epoch.load(std::memory_order_acquire) != gen) {
        co_return;
      }
      if (!frame) {
        self->handle_disconnect(gen, frame.error());
        co_return;
      }
      self->dispatch_inbound(std::move(*frame));
    }
  }

  static auto write_loop(std::shared_ptr<Impl> self, std::uint64_t gen,
                         std::shared_ptr<IClientTransport> t) -> spawn_task {
    auto &pending = self->pending;
    while (self->epoch.load(std::memory_order_acquire) == gen &&
           !pending.empty()) {
      auto item = std::move(pending.front());
      pending.pop_front();
      self->publish_pending_size();
      const auto closes_at_pop = self->closes;

      auto written = co_await t->write(item.text);
      if (written) {
        continue;
      }
      if (item.heartbeat) {
        log::warn("Heartbeat write failed: {}", written.error().message());
      } else if (self->closes == closes_at_pop) {
        pending.push_front(std::move(item));
        self->publish_pending_size();
      }
      self->writing = false;
      self->handle_disconnect(gen, written.error());
      co_return;
    }
    self->writing = false;
    if (self->epoch.load(std::memory_order_acquire) != gen) {
      self->kick_writer();
    }
  }

  static auto heartbeat_loop(std::shared_ptr<Impl> self, std::uint64_t gen)
      -> spawn_task {
    const auto interval =
        std::chrono::milliseconds(self->config.heartbeat_interval_ms);
    while (self->epoch.load(std::memory_order_acquire) == gen) {
      self->heartbeat_timer.expires_after(interval);
      auto [ec] = co_await self->heartbeat_timer.async_wait(use_nothrow);
      if (ec || self->epoch.load(std::memory_order_acquire) != gen) {
        co_return;
      }
      // At most one heartbeat waits, and only while the queue has room.
      const auto &pending = self->pending;
      if (pending.size() < self->config.max_pending_messages &&
          std::ranges::none_of(pending, &PendingMessage::heartbeat)) {
        self->enqueue(encode_message(Message::heartbeat()), false, true);
      }
      self->kick_writer();
    }
  }

  static auto reconnect_after(std::shared_ptr<Impl> self, std::uint64_t gen,
                              std::chrono::milliseconds delay) -> spawn_task {
    self->reconnect_timer.expires_after(delay);
    auto [ec] = co_await self->reconnect_timer.async_wait(use_nothrow);
    if (ec) {
      co_return;
    }
    std::uint64_t next_gen = 0;
    {
      std::lock_guard lock(self->lifecycle_mu);
      if (self->epoch.load(std::memory_order_acquire) != gen ||
          self->state.load(std::memory_order_acquire) !=
              ClientState::Reconnecting) {
        co_return;
      }
      self->state.store(ClientState::Connecting, std::memory_order_release);
      next_gen = self->epoch.fetch_add(1, std::memory_order_acq_rel) + 1;
    }
    self->launch_attempt(next_gen);
  }

  static auto close_transport(std::shared_ptr<IClientTransport> t)
      -> spawn_task {
    if (auto closed = co_await t->close(); !closed) {
      log::debug("Client transport close failed: {}",
                 closed.error().message());
    }
  }
};

ReconnectManager::ReconnectManager(boost::asio::any_io_executor executor,
                                   TransportFactory factory)
    : impl_(std::make_shared<Impl>(std::move(executor), std::move(factory))) {}

ReconnectManager::~ReconnectManager() { close(); }

auto ReconnectManager::connect(ClientConfig config, ClientCallbacks callbacks)
    -> bool {
  if (auto valid = ConfigLoader::validate(config); !valid) {
    log::error("connect() rejected: invalid client config for {}", config.url);
    return false;
  }
  auto current = ClientState::Idle;
  std::uint64_t token = 0;
  {
    std::lock_guard lock(impl_->lifecycle_mu);
    current = impl_->state.load(std::memory_order_acquire);
    if (current == ClientState::Idle) {
      impl_->state.store(ClientState::Connecting, std::memory_order_release);
      impl_->attempt.store(0, std::memory_order_release);
      token = ++impl_->session;
    }
  }
  if (current != ClientState::Idle) {
    log::info("connect() ignored: connection is {}", to_string_view(current));
    return false;
  }
  boost::asio::post(impl_->strand, [impl = impl_, token,
                                    config = std::move(config),
                                    callbacks = std::move(callbacks)]() mutable {
    std::uint64_t gen = 0;
    {
      // Superseded by close(), and possibly by a newer connect().
      std::lock_guard lock(impl->lifecycle_mu);
      if (impl->session != token ||
          impl->state.load(std::memory_order_acquire) !=
              ClientState::Connecting) {
        return;
      }
      gen = impl->epoch.fetch_add(1, std::memory_order_acq_rel) + 1;
    }
    impl->config = std::move(config);
    impl->callbacks = std::move(callbacks);
    impl->launch_attempt(gen);
  });
  return true;
}

auto ReconnectManager::send(std::string text, bool priority) -> void {
  boost::asio::post(impl_->strand,
                    [impl = impl_, text = std::move(text), priority]() mutable {
                      // While open everything goes out in arrival order.
                      impl->enqueue(std::move(text),
                                    priority && !impl->is_open());
                      impl->kick_writer();
                    });
}

auto ReconnectManager::send(const Message &message, bool priority) -> void {
  send(encode_message(message), priority);
}

auto ReconnectManager::subscribe(std::string topic) -> void {
  boost::asio::post(impl_->strand, [impl = impl_,
                                    topic = std::move(topic)]() mutable {
    if (!impl->subscriptions.insert(topic).second) {
      return;
    }
    log::info("Subscribed to topic {}", topic);
    // Offline subscriptions are sent when the connection opens.
    if (impl->is_open()) {
      impl->enqueue(encode_message(Message::subscribe(std::move(topic))),
                    false);
      impl->kick_writer();
    }
  });
}

auto ReconnectManager::unsubscribe(std::string topic) -> void {
  boost::asio::post(impl_->strand, [impl = impl_,
                                    topic = std::move(topic)]() mutable {
    if (impl->subscriptions.erase(topic) == 0) {
      return;
    }
    log::info("Unsubscribed from topic {}", topic);
    if (impl->is_open()) {
      impl->enqueue(encode_message(Message::unsubscribe(std::move(topic))),
                    false);
      impl->kick_writer();
    }
  });
}

auto ReconnectManager::close() -> void {
  {
    std::lock_guard lock(impl_->lifecycle_mu);
    ++impl_->session;
    impl_->epoch.fetch_add(1, std::memory_order_acq_rel);
    impl_->state.store(ClientState::Idle, std::memory_order_release);
    impl_->attempt.store(0, std::memory_order_release);
  }
  boost::asio::post(impl_->strand, [impl = impl_] { impl->shutdown(); });
}

auto ReconnectManager::state() const noexcept -> ClientState {
  return impl_->state.load(std::memory_order_acquire);
}

auto ReconnectManager::attempt() const noexcept -> int {
  return impl_->attempt.load(std::memory_order_acquire);
}

auto ReconnectManager::pending_count() const noexcept -> std::size_t {
  return impl_->pending_size.load(std::memory_order_acquire);
}

auto ReconnectManager::dropped_count() const noexcept -> std::uint64_t {
  return impl_->dropped.load(std::memory_order_relaxed);
}

} // namespace pulsewire
