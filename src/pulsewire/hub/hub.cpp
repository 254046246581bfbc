#include "pulsewire/hub/hub.hpp"

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/core/runtime.hpp"
#include "pulsewire/util/log.hpp"
#include "pulsewire/util/time.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>

namespace pulsewire {

namespace {

constexpr shard_id kHubShard = 0;
constexpr auto kStopTimeout = std::chrono::seconds(5);

[[nodiscard]] auto topic_matches(const TopicSet &subscribed,
                                 const std::optional<std::string> &topic)
    -> bool {
  return !topic.has_value() || subscribed.empty() ||
         subscribed.contains(*topic);
}

} // namespace

struct Hub::Impl : SessionSink, std::enable_shared_from_this<Hub::Impl> {
  using RequestChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::any_io_executor,
      void(boost::system::error_code, HubRequest)>;

  struct Entry {
    std::shared_ptr<Session> session;
    TopicSet topics;
  };

  Runtime &runtime;
  HubConfig config;
  RequestChannel requests;
  boost::asio::steady_timer sweep_timer;

  alignas(64) std::atomic<bool> running{false};
  std::atomic<bool> started{false};
  std::atomic<bool> stopped{false};
  std::atomic<std::size_t> session_count{0};
  std::atomic<std::size_t> overflow_in_flight{0};

  std::mutex handler_mu;
  std::shared_ptr<const MessageHandler> handler;

  // Control loop only.
  ankerl::unordered_dense::map<SessionId, Entry> registry;
  std::uint64_t broadcasts{0};
  std::uint64_t deliveries{0};
  std::uint64_t evictions{0};

  Impl(Runtime &rt, HubConfig cfg)
      : runtime(rt), config(cfg),
        requests(rt.executor_for(kHubShard), cfg.request_queue_capacity),
        sweep_timer(rt.executor_for(kHubShard)) {}

  auto register_session(std::shared_ptr<Session> session) -> void override {
    submit(RegisterRequest{std::move(session)});
  }

  auto unregister_session(std::shared_ptr<Session> session) -> void override {
    submit(UnregisterRequest{std::move(session)});
  }

  auto update_topics(SessionId id, TopicSet topics) -> void override {
    submit(TopicsRequest{id, std::move(topics)});
  }

  auto deliver_inbound(const ClientId &client_id, const Message &message)
      -> void override {
    std::shared_ptr<const MessageHandler> current;
    {
      std::lock_guard lock(handler_mu);
      current = handler;
    }
    if (!current || !*current) {
      log::debug("No message handler; dropping '{}' from {}",
                 message.type_name(), client_id);
      return;
    }
    try {
      (*current)(client_id, message);
    } catch (const std::exception &e) {
      log::error("Message handler threw for '{}' from {}: {}",
                 message.type_name(), client_id, e.what());
    }
  }

  // Called for requests the loop will never see.
  static auto reject(HubRequest &request) -> void {
    if (auto *reg = std::get_if<RegisterRequest>(&request)) {
      reg->session->close_outbound();
      reg->session->force_close();
    } else if (auto *snap = std::get_if<SnapshotRequest>(&request)) {
      snap->reply->close();
    }
  }

  auto submit(HubRequest request) -> bool {
    if (overflow_in_flight.load(std::memory_order_acquire) == 0 &&
        requests.try_send(boost::system::error_code{}, request)) {
      return true;
    }
    if (!requests.is_open()) {
      reject(request);
      return false;
    }
    overflow_in_flight.fetch_add(1, std::memory_order_acq_rel);
    co_spawn(requests.get_executor(),
             send_overflow(shared_from_this(), std::move(request)), detached);
    return true;
  }

  static auto send_overflow(std::shared_ptr<Impl> self, HubRequest request)
      -> spawn_task {
    auto [ec] = co_await self->requests.async_send(
        boost::system::error_code{}, request, use_nothrow);
    self->overflow_in_flight.fetch_sub(1, std::memory_order_acq_rel);
    if (ec) {
      log::warn("Hub request dropped: {}", ec.message());
      reject(request);
    }
  }

  auto control_loop() -> spawn_task {
    auto self = shared_from_this();
    log::info("Hub control loop started on shard {}", kHubShard);

    for (;;) {
      auto [ec, request] = co_await requests.async_receive(use_nothrow);
      if (ec) {
        break;
      }
      if (std::holds_alternative<ShutdownRequest>(request)) {
        break;
      }
      std::visit([this](auto &r) { handle(r); }, request);
    }

    shutdown();
  }

  auto sweep_loop() -> spawn_task {
    auto self = shared_from_this();
    const auto interval = std::chrono::milliseconds(config.sweep_interval_ms);

    while (running.load(std::memory_order_acquire)) {
      sweep_timer.expires_after(interval);
      auto [ec] = co_await sweep_timer.async_wait(use_nothrow);
      if (ec || !running.load(std::memory_order_acquire)) {
        break;
      }
      sweep();
    }
  }

  auto handle(RegisterRequest &r) -> void {
    const auto id = r.session->id();
    auto [it, inserted] = registry.try_emplace(id, Entry{r.session, {}});
    if (!inserted) {
      return;
    }
    session_count.store(registry.size(), std::memory_order_release);
    log::info("Session {} ({}) registered; {} active", id,
              r.session->client_id(), registry.size());
  }

  auto handle(UnregisterRequest &r) -> void { remove(r.session->id()); }

  auto handle(TopicsRequest &r) -> void {
    if (auto it = registry.find(r.id); it != registry.end()) {
      it->second.topics = std::move(r.topics);
    }
  }

  auto handle(BroadcastRequest &r) -> void {
    ++broadcasts;
    for (auto &[id, entry] : registry) {
      (void)id;
      if (!topic_matches(entry.topics, r.topic)) {
        continue;
      }
      if (entry.session->enqueue_text(r.frame)) {
        ++deliveries;
      }
    }
  }

  auto handle(SnapshotRequest &r) -> void {
    if (!r.reply->try_send(boost::system::error_code{}, make_snapshot())) {
      r.reply->close();
    }
  }

  auto handle(ShutdownRequest &) -> void {}

  auto remove(SessionId id) -> void {
    auto it = registry.find(id);
    if (it == registry.end()) {
      return;
    }
    auto session = std::move(it->second.session);
    registry.erase(it);
    session->close_outbound();
    session_count.store(registry.size(), std::memory_order_release);
    log::info("Session {} ({}) unregistered; {} active", id,
              session->client_id(), registry.size());
  }

  auto sweep() -> void {
    const auto now = util::steady_now_ms();
    const auto ping_after = std::chrono::milliseconds(config.ping_after_ms);
    const auto evict_after = std::chrono::milliseconds(config.evict_after_ms);

    std::vector<std::shared_ptr<Session>> stale;
    for (auto &[id, entry] : registry) {
      (void)id;
      if (entry.session->state() != SessionState::Open) {
        continue;
      }
      const auto idle = entry.session->idle_for(now);
      if (idle > evict_after) {
        stale.push_back(entry.session);
      } else if (idle > ping_after) {
        entry.session->enqueue_ping();
      }
    }

    // Eviction goes through the request stream like any other unregister.
    for (auto &session : stale) {
      log::warn("Session {} ({}) idle for {}ms; evicting", session->id(),
                session->client_id(), session->idle_for(now).count());
      ++evictions;
      session->close_outbound();
      session->force_close();
      submit(UnregisterRequest{session});
    }
  }

  [[nodiscard]] auto make_snapshot() const -> HubSnapshot {
    HubSnapshot snap;
    snap.broadcasts = broadcasts;
    snap.deliveries = deliveries;
    snap.evictions = evictions;
    snap.sessions.reserve(registry.size());

    const auto now = util::steady_now_ms();
    for (const auto &[id, entry] : registry) {
      SessionInfo info;
      info.id = id;
      info.client_id = entry.session->client_id().str();
      info.topics.assign(entry.topics.begin(), entry.topics.end());
      std::ranges::sort(info.topics);
      info.queue_depth = entry.session->queue_depth();
      info.dropped = entry.session->dropped();
      info.idle_ms = entry.session->idle_for(now).count();
      info.state = entry.session->state();
      snap.sessions.push_back(std::move(info));
    }
    std::ranges::sort(snap.sessions, {}, &SessionInfo::id);
    return snap;
  }

  auto shutdown() -> void {
    running.store(false, std::memory_order_release);
    sweep_timer.cancel();
    requests.close();

    // Buffered messages survive close(); fail anything left behind.
    while (requests.try_receive(
        [](boost::system::error_code, HubRequest request) {
          reject(request);
        })) {
    }

    for (auto &[id, entry] : registry) {
      (void)id;
      entry.session->close_outbound();
    }
    log::info("Hub stopped; closed {} session(s)", registry.size());
    registry.clear();
    session_count.store(0, std::memory_order_release);

    stopped.store(true, std::memory_order_release);
    stopped.notify_all();
  }
};

Hub::Hub(Runtime &runtime, HubConfig config)
    : impl_(std::make_shared<Impl>(runtime, config)) {}

Hub::~Hub() { stop(); }

auto Hub::start() -> Result<void> {
  if (impl_->started.exchange(true, std::memory_order_acq_rel)) {
    return impl_->running.load(std::memory_order_acquire)
               ? ok()
               : fail(Error::InvalidState);
  }
  impl_->running.store(true, std::memory_order_release);
  impl_->runtime.spawn_on(kHubShard, impl_->control_loop());
  impl_->runtime.spawn_on(kHubShard, impl_->sweep_loop());
  log::info("Hub started (queue capacity {}, ping after {}ms, evict after "
            "{}ms)",
            impl_->config.outbound_queue_capacity, impl_->config.ping_after_ms,
            impl_->config.evict_after_ms);
  return ok();
}

auto Hub::stop() -> void {
  auto &impl = *impl_;
  if (!impl.started.load(std::memory_order_acquire) ||
      !impl.running.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  impl.submit(ShutdownRequest{});

  // The loop cannot make progress if we are its thread or the runtime is down.
  if (!impl.runtime.is_running() ||
      (impl.runtime.is_current_shard() &&
       impl.runtime.current_shard() == kHubShard)) {
    return;
  }

  const auto deadline = std::chrono::steady_clock::now() + kStopTimeout;
  while (!impl.stopped.load(std::memory_order_acquire)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      log::warn("Hub stop timed out waiting for the control loop");
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

auto Hub::is_running() const noexcept -> bool {
  return impl_->running.load(std::memory_order_acquire);
}

auto Hub::session_count() const noexcept -> std::size_t {
  return impl_->session_count.load(std::memory_order_acquire);
}

auto Hub::session_options() const -> SessionOptions {
  return SessionOptions{
      .outbound_capacity = impl_->config.outbound_queue_capacity,
      .max_message_bytes = impl_->config.max_message_bytes,
  };
}

auto Hub::make_session(std::shared_ptr<http::IWebSocketConnection> connection,
                       ClientId client_id) -> std::shared_ptr<Session> {
  return std::make_shared<Session>(std::move(connection), std::move(client_id),
                                   impl_, session_options());
}

auto Hub::register_session(std::shared_ptr<Session> session) -> void {
  impl_->register_session(std::move(session));
}

auto Hub::unregister_session(std::shared_ptr<Session> session) -> void {
  impl_->unregister_session(std::move(session));
}

auto Hub::update_topics(SessionId id, TopicSet topics) -> void {
  impl_->update_topics(id, std::move(topics));
}

auto Hub::broadcast(const Message &message) -> Result<void> {
  if (!is_running()) {
    return fail(Error::SystemNotRunning);
  }
  auto frame = std::make_shared<const std::string>(encode_message(message));
  if (!impl_->submit(BroadcastRequest{message.topic(), std::move(frame)})) {
    return fail(Error::SystemNotRunning);
  }
  return ok();
}

auto Hub::publish_agent_status(std::string agent_id, std::string status,
                               std::string details) -> Result<void> {
  return broadcast(Message::agent_status(std::move(agent_id),
                                         std::move(status),
                                         std::move(details)));
}

auto Hub::publish_transaction_update(std::string tx_id, std::string status,
                                     std::string amount, std::string blockchain,
                                     std::string from_address,
                                     std::string to_address) -> Result<void> {
  return broadcast(Message::transaction_update(
      std::move(tx_id), std::move(status), std::move(amount),
      std::move(blockchain), std::move(from_address), std::move(to_address)));
}

auto Hub::snapshot() -> task<HubSnapshot> {
  auto impl = impl_;
  if (!impl->running.load(std::memory_order_acquire)) {
    co_return HubSnapshot{};
  }
  auto reply = std::make_shared<SnapshotReply>(
      co_await boost::asio::this_coro::executor, 1);
  if (!impl->submit(SnapshotRequest{reply})) {
    co_return HubSnapshot{};
  }
  auto [ec, snap] = co_await reply->async_receive(use_nothrow);
  if (ec) {
    co_return HubSnapshot{};
  }
  co_return std::move(snap);
}

auto Hub::set_message_handler(MessageHandler handler) -> void {
  auto next = std::make_shared<const MessageHandler>(std::move(handler));
  std::lock_guard lock(impl_->handler_mu);
  impl_->handler = std::move(next);
}

auto to_json(const HubSnapshot &snapshot) -> JsonValue {
  JsonValue sessions = std::vector<JsonValue>{};
  for (const auto &info : snapshot.sessions) {
    JsonValue topics = std::vector<JsonValue>{};
    for (const auto &topic : info.topics) {
      topics.get_array().emplace_back(topic);
    }
    sessions.get_array().emplace_back(JsonValue{
        {"id", static_cast<std::int64_t>(info.id)},
        {"client_id", info.client_id},
        {"topics", std::move(topics)},
        {"queue_depth", static_cast<std::int64_t>(info.queue_depth)},
        {"dropped", static_cast<std::int64_t>(info.dropped)},
        {"idle_ms", info.idle_ms},
        {"state", std::string(to_string_view(info.state))},
    });
  }
  return JsonValue{
      {"session_count", static_cast<std::int64_t>(snapshot.sessions.size())},
      {"broadcasts", static_cast<std::int64_t>(snapshot.broadcasts)},
      {"deliveries", static_cast<std::int64_t>(snapshot.deliveries)},
      {"evictions", static_cast<std::int64_t>(snapshot.evictions)},
      {"sessions", std::move(sessions)},
  };
}

} // namespace pulsewire
