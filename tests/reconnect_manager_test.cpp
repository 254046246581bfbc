#include "pulsewire/client/reconnect_manager.hpp"
#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/core/runtime.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include "test_utils.hpp"
#include "gtest/gtest.h"

using namespace pulsewire;
using namespace pulsewire::test;

namespace {

constexpr auto kWait = std::chrono::seconds(3);

class FakeTransport;

/// Everything the fake transports observed, shared across reconnects.
struct FakeNetwork {
  std::atomic<int> connects{0};
  std::atomic<bool> refuse{false};
  std::atomic<bool> fail_writes{false};
  // Writes wait while set, as behind a slow peer.
  std::atomic<bool> stall_writes{false};

  std::mutex mu;
  std::vector<std::string> written;
  std::shared_ptr<FakeTransport> current;

  auto record(std::string text) -> void {
    std::lock_guard lock(mu);
    written.push_back(std::move(text));
  }
  auto frames() -> std::vector<std::string> {
    std::lock_guard lock(mu);
    return written;
  }
  auto count_heartbeats() -> long {
    return std::ranges::count_if(frames(), [](const std::string &text) {
      auto msg = decode_message(text);
      return msg && msg->kind() == MessageKind::Heartbeat;
    });
  }
  auto count_subscribes(std::string_view topic) -> int {
    int n = 0;
    for (const auto &text : frames()) {
      auto msg = decode_message(text);
      if (msg && msg->kind() == MessageKind::Subscribe &&
          msg->as<SubscribePayload>().topic == topic) {
        ++n;
      }
    }
    return n;
  }
  auto push_inbound(std::string text) -> bool;
  auto drop() -> void;
};

class FakeTransport : public IClientTransport,
                      public std::enable_shared_from_this<FakeTransport> {
public:
  using Inbound = boost::asio::experimental::concurrent_channel<
      boost::asio::any_io_executor,
      void(boost::system::error_code, std::string)>;

  FakeTransport(boost::asio::any_io_executor executor,
                std::shared_ptr<FakeNetwork> network)
      : inbound_(std::move(executor), 64), network_(std::move(network)) {}

  auto connect(std::string_view, std::chrono::milliseconds)
      -> task<Result<void>> override {
    network_->connects.fetch_add(1);
    if (network_->refuse.load()) {
      co_return fail(Error::NotConnected);
    }
    open_.store(true);
    {
      std::lock_guard lock(network_->mu);
      network_->current = shared_from_this();
    }
    co_return ok();
  }

  auto read() -> task<Result<std::string>> override {
    auto [ec, text] = co_await inbound_.async_receive(use_nothrow);
    if (ec) {
      open_.store(false);
      co_return fail(Error::ConnectionClosed);
    }
    co_return ok(std::move(text));
  }

  auto write(std::string text) -> task<Result<void>> override {
    while (network_->stall_writes.load()) {
      co_await async_sleep(std::chrono::milliseconds(2));
    }
    if (!open_.load() || network_->fail_writes.load()) {
      co_return fail(Error::NotConnected);
    }
    network_->record(std::move(text));
    co_return ok();
  }

  auto close() -> task<Result<void>> override {
    drop();
    co_return ok();
  }

  [[nodiscard]] auto is_open() const -> bool override { return open_.load(); }

  auto push(std::string text) -> bool {
    return inbound_.try_send(boost::system::error_code{}, std::move(text));
  }
  auto drop() -> void {
    open_.store(false);
    inbound_.close();
  }

private:
  Inbound inbound_;
  std::shared_ptr<FakeNetwork> network_;
  std::atomic<bool> open_{false};
};

auto FakeNetwork::push_inbound(std::string text) -> bool {
  std::lock_guard lock(mu);
  return current && current->push(std::move(text));
}

auto FakeNetwork::drop() -> void {
  std::lock_guard lock(mu);
  if (current) {
    current->drop();
  }
}

} // namespace

class ReconnectManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    network_ = std::make_shared<FakeNetwork>();
    thread_ = std::thread([this] { io_.run(); });
    manager_ = std::make_unique<ReconnectManager>(
        io_.get_executor(),
        [network = network_](boost::asio::any_io_executor executor) {
          return std::make_shared<FakeTransport>(std::move(executor), network);
        });
  }

  void TearDown() override {
    manager_->close();
    manager_.reset();
    work_.reset();
    io_.stop();
    thread_.join();
  }

  [[nodiscard]] static auto client_config() -> ClientConfig {
    ClientConfig config;
    config.url = "ws://fake/ws";
    config.reconnect_interval_ms = 5;
    config.max_reconnect_attempts = 5;
    config.heartbeat_interval_ms = 60000;
    config.timeout_ms = 1000;
    return config;
  }

  auto callbacks() -> ClientCallbacks {
    return ClientCallbacks{
        .on_message =
            [this](const ReceivedMessage &m) {
              std::lock_guard lock(mu_);
              received_.push_back(m);
            },
        .on_open = [this] { opens_.fetch_add(1); },
        .on_close = [this] { closes_.fetch_add(1); },
        .on_error = [this](std::error_code) { errors_.fetch_add(1); },
    };
  }

  auto received() -> std::vector<ReceivedMessage> {
    std::lock_guard lock(mu_);
    return received_;
  }

  boost::asio::io_context io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_{io_.get_executor()};
  std::thread thread_;
  std::shared_ptr<FakeNetwork> network_;
  std::unique_ptr<ReconnectManager> manager_;

  std::mutex mu_;
  std::vector<ReceivedMessage> received_;
  std::atomic<int> opens_{0};
  std::atomic<int> closes_{0};
  std::atomic<int> errors_{0};
};

TEST(ReconnectDelayTest, LinearBackoffCappedAtThreeIntervals) {
  constexpr auto interval = std::chrono::milliseconds(1000);
  EXPECT_EQ(reconnect_delay(interval, 0).count(), 0);
  EXPECT_EQ(reconnect_delay(interval, 1).count(), 1000);
  EXPECT_EQ(reconnect_delay(interval, 2).count(), 2000);
  EXPECT_EQ(reconnect_delay(interval, 3).count(), 3000);
  EXPECT_EQ(reconnect_delay(interval, 4).count(), 3000);
  EXPECT_EQ(reconnect_delay(interval, 50).count(), 3000);
}

TEST_F(ReconnectManagerTest, OfflineMessagesFlushPriorityFirst) {
  manager_->send("x1");
  manager_->send("x2");
  manager_->send("y", true);
  ASSERT_TRUE(poll_until([&] { return manager_->pending_count() == 3; }, kWait));

  ASSERT_TRUE(manager_->connect(client_config(), callbacks()));
  ASSERT_TRUE(poll_until([&] { return network_->frames().size() == 3; }, kWait));

  EXPECT_EQ(network_->frames(), (std::vector<std::string>{"y", "x1", "x2"}));
  EXPECT_EQ(manager_->state(), ClientState::Open);
  EXPECT_EQ(manager_->pending_count(), 0U);
  EXPECT_EQ(opens_.load(), 1);
}

TEST_F(ReconnectManagerTest, MessagesWhileOpenAreWrittenInOrder) {
  ASSERT_TRUE(manager_->connect(client_config(), callbacks()));
  ASSERT_TRUE(poll_until(
      [&] { return manager_->state() == ClientState::Open; }, kWait));

  manager_->send("a");
  manager_->send("b", true);
  manager_->send(Message::application("chat", JsonValue{{"text", std::string("hi")}}));
  ASSERT_TRUE(poll_until([&] { return network_->frames().size() == 3; }, kWait));

  auto frames = network_->frames();
  EXPECT_EQ(frames[0], "a");
  EXPECT_EQ(frames[1], "b");
  auto chat = decode_message(frames[2]);
  ASSERT_TRUE(chat.has_value());
  EXPECT_EQ(chat->type_name(), "chat");
}

TEST_F(ReconnectManagerTest, GivesUpAfterMaxAttempts) {
  network_->refuse = true;
  ASSERT_TRUE(manager_->connect(client_config(), callbacks()));

  ASSERT_TRUE(poll_until([&] { return closes_.load() == 1; }, kWait));
  EXPECT_EQ(network_->connects.load(), 6);
  EXPECT_EQ(errors_.load(), 6);
  EXPECT_EQ(manager_->state(), ClientState::Idle);
  EXPECT_EQ(opens_.load(), 0);

  sleep_ms(std::chrono::milliseconds(100));
  EXPECT_EQ(network_->connects.load(), 6);
  EXPECT_EQ(closes_.load(), 1);
}

TEST_F(ReconnectManagerTest, NoReconnectWhenDisabled) {
  network_->refuse = true;
  auto config = client_config();
  config.auto_reconnect = false;
  ASSERT_TRUE(manager_->connect(config, callbacks()));

  ASSERT_TRUE(poll_until([&] { return closes_.load() == 1; }, kWait));
  EXPECT_EQ(errors_.load(), 1);
  EXPECT_EQ(network_->connects.load(), 1);
  EXPECT_EQ(manager_->state(), ClientState::Idle);
}

TEST_F(ReconnectManagerTest, CloseCancelsPendingReconnect) {
  network_->refuse = true;
  auto config = client_config();
  config.reconnect_interval_ms = 200;
  ASSERT_TRUE(manager_->connect(config, callbacks()));
  ASSERT_TRUE(poll_until(
      [&] { return manager_->state() == ClientState::Reconnecting; }, kWait));

  manager_->close();
  EXPECT_EQ(manager_->state(), ClientState::Idle);
  sleep_ms(std::chrono::milliseconds(400));

  EXPECT_EQ(network_->connects.load(), 1);
  EXPECT_EQ(manager_->state(), ClientState::Idle);
  EXPECT_EQ(closes_.load(), 0);
}

TEST_F(ReconnectManagerTest, ConnectIsRejectedWhileAttemptInFlight) {
  network_->refuse = true;
  auto config = client_config();
  config.reconnect_interval_ms = 200;
  ASSERT_TRUE(manager_->connect(config, callbacks()));
  EXPECT_FALSE(manager_->connect(config, callbacks()));

  manager_->close();
  network_->refuse = false;
  EXPECT_TRUE(manager_->connect(client_config(), callbacks()));
  EXPECT_TRUE(poll_until(
      [&] { return manager_->state() == ClientState::Open; }, kWait));
}

TEST_F(ReconnectManagerTest, SubscriptionsAreReassertedAfterReconnect) {
  manager_->subscribe("agent:42");
  ASSERT_TRUE(manager_->connect(client_config(), callbacks()));
  ASSERT_TRUE(poll_until(
      [&] { return network_->count_subscribes("agent:42") == 1; }, kWait));

  network_->drop();
  ASSERT_TRUE(poll_until(
      [&] { return network_->count_subscribes("agent:42") == 2; }, kWait));
  EXPECT_EQ(network_->connects.load(), 2);
  EXPECT_EQ(opens_.load(), 2);
  EXPECT_EQ(manager_->attempt(), 0);
  // A clean close from the peer is not an error.
  EXPECT_EQ(errors_.load(), 0);
}

TEST_F(ReconnectManagerTest, UnsubscribedTopicIsNotReasserted) {
  manager_->subscribe("a");
  manager_->subscribe("b");
  ASSERT_TRUE(manager_->connect(client_config(), callbacks()));
  ASSERT_TRUE(poll_until(
      [&] {
        return network_->count_subscribes("a") == 1 &&
               network_->count_subscribes("b") == 1;
      },
      kWait));

  manager_->unsubscribe("a");
  ASSERT_TRUE(poll_until([&] { return network_->frames().size() == 3; }, kWait));
  auto unsub = decode_message(network_->frames().back());
  ASSERT_TRUE(unsub.has_value());
  EXPECT_EQ(unsub->kind(), MessageKind::Unsubscribe);

  network_->drop();
  ASSERT_TRUE(poll_until(
      [&] { return network_->count_subscribes("b") == 2; }, kWait));
  EXPECT_EQ(network_->count_subscribes("a"), 1);
}

TEST_F(ReconnectManagerTest, FullPendingQueueDropsOldest) {
  network_->refuse = true;
  auto config = client_config();
  config.max_pending_messages = 3;
  config.reconnect_interval_ms = 30;
  config.max_reconnect_attempts = 1000;
  ASSERT_TRUE(manager_->connect(config, callbacks()));
  ASSERT_TRUE(poll_until(
      [&] { return manager_->state() == ClientState::Reconnecting; }, kWait));

  for (const auto *text : {"a", "b", "c", "d"}) {
    manager_->send(text);
  }
  ASSERT_TRUE(poll_until([&] { return manager_->dropped_count() == 1; }, kWait));
  EXPECT_EQ(manager_->pending_count(), 3U);

  network_->refuse = false;
  ASSERT_TRUE(poll_until([&] { return network_->frames().size() == 3; }, kWait));
  EXPECT_EQ(network_->frames(), (std::vector<std::string>{"b", "c", "d"}));
}

TEST_F(ReconnectManagerTest, CloseForgetsQueuedMessages) {
  manager_->send("stale");
  manager_->subscribe("agent:1");
  ASSERT_TRUE(poll_until([&] { return manager_->pending_count() == 1; }, kWait));

  manager_->close();
  ASSERT_TRUE(poll_until([&] { return manager_->pending_count() == 0; }, kWait));

  ASSERT_TRUE(manager_->connect(client_config(), callbacks()));
  ASSERT_TRUE(poll_until([&] { return opens_.load() == 1; }, kWait));
  sleep_ms(std::chrono::milliseconds(50));
  EXPECT_TRUE(network_->frames().empty());
}

TEST_F(ReconnectManagerTest, InboundFramesAreDecodedWhenPossible) {
  ASSERT_TRUE(manager_->connect(client_config(), callbacks()));
  ASSERT_TRUE(poll_until(
      [&] { return manager_->state() == ClientState::Open; }, kWait));

  ASSERT_TRUE(network_->push_inbound(
      encode_message(Message::agent_status("agent:42", "active", "ok"))));
  ASSERT_TRUE(network_->push_inbound(R"({"type":"chat","payload":{}})"));
  ASSERT_TRUE(network_->push_inbound("not json"));
  ASSERT_TRUE(poll_until([&] { return received().size() == 3; }, kWait));

  auto got = received();
  ASSERT_TRUE(got[0].message.has_value());
  EXPECT_EQ(got[0].message->kind(), MessageKind::AgentStatus);
  EXPECT_EQ(got[0].message->topic().value_or(""), "agent:42");

  ASSERT_TRUE(got[1].message.has_value());
  EXPECT_EQ(got[1].message->type_name(), "chat");

  EXPECT_FALSE(got[2].json.has_value());
  EXPECT_FALSE(got[2].message.has_value());
  EXPECT_EQ(got[2].raw, "not json");
}

TEST_F(ReconnectManagerTest, HeartbeatsAreSentWhileOpen) {
  auto config = client_config();
  config.heartbeat_interval_ms = 10;
  ASSERT_TRUE(manager_->connect(config, callbacks()));

  ASSERT_TRUE(
      poll_until([&] { return network_->count_heartbeats() >= 2; }, kWait));
}

TEST_F(ReconnectManagerTest, ConnectIsRejectedWhileOpen) {
  ASSERT_TRUE(manager_->connect(client_config(), callbacks()));
  ASSERT_TRUE(poll_until(
      [&] { return manager_->state() == ClientState::Open; }, kWait));

  EXPECT_FALSE(manager_->connect(client_config(), callbacks()));
  sleep_ms(std::chrono::milliseconds(50));
  EXPECT_EQ(network_->connects.load(), 1);
  EXPECT_EQ(manager_->state(), ClientState::Open);
  EXPECT_EQ(opens_.load(), 1);
}

TEST_F(ReconnectManagerTest, InvalidConfigIsRejected) {
  auto no_heartbeat = client_config();
  no_heartbeat.heartbeat_interval_ms = 0;
  auto no_queue = client_config();
  no_queue.max_pending_messages = 0;
  auto no_timeout = client_config();
  no_timeout.timeout_ms = -1;

  for (const auto &config : {no_heartbeat, no_queue, no_timeout}) {
    EXPECT_FALSE(manager_->connect(config, callbacks()));
    EXPECT_EQ(manager_->state(), ClientState::Idle);
  }
  sleep_ms(std::chrono::milliseconds(20));
  EXPECT_EQ(network_->connects.load(), 0);

  EXPECT_TRUE(manager_->connect(client_config(), callbacks()));
  EXPECT_TRUE(poll_until(
      [&] { return manager_->state() == ClientState::Open; }, kWait));
}

TEST_F(ReconnectManagerTest, FailedHeartbeatIsDroppedAndTriggersReconnect) {
  auto config = client_config();
  config.heartbeat_interval_ms = 10;
  config.reconnect_interval_ms = 20;
  config.max_reconnect_attempts = 1000;
  ASSERT_TRUE(manager_->connect(config, callbacks()));
  ASSERT_TRUE(poll_until(
      [&] { return manager_->state() == ClientState::Open; }, kWait));

  network_->refuse = true;
  network_->fail_writes = true;
  ASSERT_TRUE(poll_until([&] { return network_->connects.load() >= 2; }, kWait));
  EXPECT_GE(errors_.load(), 1);
  EXPECT_NE(manager_->state(), ClientState::Open);

  // Neither the failed heartbeat nor later ticks are waiting to be resent.
  sleep_ms(std::chrono::milliseconds(100));
  EXPECT_EQ(manager_->pending_count(), 0U);
  const auto heartbeats = network_->count_heartbeats();

  network_->refuse = false;
  network_->fail_writes = false;
  ASSERT_TRUE(poll_until([&] { return opens_.load() == 2; }, kWait));
  EXPECT_EQ(manager_->pending_count(), 0U);
  EXPECT_TRUE(poll_until(
      [&] { return network_->count_heartbeats() > heartbeats; }, kWait));
}

TEST_F(ReconnectManagerTest, CloseWhileOpenSilencesTimers) {
  auto config = client_config();
  config.heartbeat_interval_ms = 10;
  ASSERT_TRUE(manager_->connect(config, callbacks()));
  ASSERT_TRUE(
      poll_until([&] { return network_->count_heartbeats() >= 1; }, kWait));

  manager_->close();
  EXPECT_EQ(manager_->state(), ClientState::Idle);
  sleep_ms(std::chrono::milliseconds(30));
  const auto frames = network_->frames().size();
  const auto connects = network_->connects.load();

  sleep_ms(std::chrono::milliseconds(150));
  EXPECT_EQ(network_->frames().size(), frames);
  EXPECT_EQ(network_->connects.load(), connects);
  EXPECT_EQ(manager_->state(), ClientState::Idle);
  EXPECT_EQ(manager_->pending_count(), 0U);
  EXPECT_EQ(closes_.load(), 0);
}

TEST_F(ReconnectManagerTest, HeartbeatsStayWithinQueueBound) {
  auto config = client_config();
  config.heartbeat_interval_ms = 5;
  config.max_pending_messages = 5;
  ASSERT_TRUE(manager_->connect(config, callbacks()));
  ASSERT_TRUE(poll_until(
      [&] { return manager_->state() == ClientState::Open; }, kWait));

  network_->stall_writes = true;
  sleep_ms(std::chrono::milliseconds(80));
  EXPECT_LE(manager_->pending_count(), 1U);

  for (const auto *text : {"a", "b", "c", "d"}) {
    manager_->send(text);
  }
  sleep_ms(std::chrono::milliseconds(80));
  EXPECT_LE(manager_->pending_count(), 5U);
  EXPECT_EQ(manager_->dropped_count(), 0U);

  network_->stall_writes = false;
  ASSERT_TRUE(poll_until(
      [&] {
        auto frames = network_->frames();
        return std::ranges::count(frames, std::string("d")) == 1;
      },
      kWait));
  std::vector<std::string> sent;
  for (const auto &text : network_->frames()) {
    if (!decode_message(text)) {
      sent.push_back(text);
    }
  }
  EXPECT_EQ(sent, (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST_F(ReconnectManagerTest, CloseAndConnectRacingADisconnectStillOpen) {
  for (int i = 0; i < 50; ++i) {
    ASSERT_TRUE(manager_->connect(client_config(), callbacks())) << i;
    ASSERT_TRUE(poll_until(
        [&] { return manager_->state() == ClientState::Open; }, kWait))
        << i;

    network_->drop();
    manager_->close();
    ASSERT_TRUE(manager_->connect(client_config(), callbacks())) << i;
    ASSERT_TRUE(poll_until(
        [&] { return manager_->state() == ClientState::Open; }, kWait))
        << i;
    manager_->close();
  }
}
