#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/core/runtime.hpp"
#include "pulsewire/hub/hub.hpp"

#include <benchmark/benchmark.h>

#include <boost/asio/experimental/concurrent_channel.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <latch>
#include <memory>
#include <string>
#include <thread>

namespace pulsewire {
namespace {

struct BroadcastContext {
  std::atomic<std::latch *> completion{nullptr};
};

/// Accepts instantly, never receives, and counts delivered text frames.
class CountingConnection final : public http::IWebSocketConnection {
public:
  CountingConnection(boost::asio::any_io_executor executor,
                     std::shared_ptr<BroadcastContext> ctx)
      : executor_(executor), wake_(executor, 1), ctx_(std::move(ctx)) {}

  auto accept() -> task<Result<void>> override { co_return ok(); }

  auto reject(http::HttpStatus, std::string) -> task<Result<void>> override {
    co_return ok();
  }

  auto read() -> task<Result<http::InboundFrame>> override {
    auto [ec] = co_await wake_.async_receive(use_nothrow);
    co_return fail(Error::ConnectionClosed);
  }

  auto write_text(std::shared_ptr<const std::string>)
      -> task<Result<void>> override {
    auto *latch = ctx_->completion.load(std::memory_order_acquire);
    if (latch != nullptr) {
      latch->count_down();
    }
    co_return ok();
  }

  auto ping() -> task<Result<void>> override { co_return ok(); }

  auto close() -> task<Result<void>> override {
    closed_.store(true, std::memory_order_release);
    co_return ok();
  }

  auto set_control_callback(std::function<void(http::WebSocketOpCode)>)
      -> void override {}
  auto set_read_limit(std::size_t) -> void override {}

  [[nodiscard]] auto is_closed() const -> bool override {
    return closed_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto fd() const -> int override { return -1; }
  auto force_close() -> void override {
    closed_.store(true, std::memory_order_release);
    wake_.close();
  }
  [[nodiscard]] auto get_executor() const
      -> boost::asio::any_io_executor override {
    return executor_;
  }

private:
  boost::asio::any_io_executor executor_;
  boost::asio::experimental::concurrent_channel<
      boost::asio::any_io_executor, void(boost::system::error_code)>
      wake_;
  std::shared_ptr<BroadcastContext> ctx_;
  std::atomic<bool> closed_{false};
};

void BM_HubBroadcastFanout(benchmark::State &state) {
  const auto shards = static_cast<unsigned>(state.range(0));
  const auto total_sessions = static_cast<int>(state.range(1));
  if (shards == 0 || total_sessions <= 0) {
    state.SkipWithError("requires shards > 0 and total_sessions > 0");
    return;
  }

  // Declared before the hub so its threads are joined after the hub is gone.
  Runtime runtime(shards);
  if (auto r = runtime.start(); !r) {
    state.SkipWithError(r.error().message().c_str());
    return;
  }
  Hub hub(runtime);
  if (auto r = hub.start(); !r) {
    state.SkipWithError(r.error().message().c_str());
    return;
  }

  auto context = std::make_shared<BroadcastContext>();
  for (int i = 0; i < total_sessions; ++i) {
    const auto sid = static_cast<shard_id>(i % static_cast<int>(shards));
    auto conn = std::make_shared<CountingConnection>(runtime.executor_for(sid),
                                                     context);
    auto session =
        hub.make_session(std::move(conn), ClientId{std::format("bench-{}", i)});
    runtime.spawn_on(sid, session->run());
  }

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (hub.session_count() != static_cast<std::size_t>(total_sessions)) {
    if (std::chrono::steady_clock::now() > deadline) {
      state.SkipWithError("sessions did not register");
      hub.stop();
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  const auto message =
      Message::agent_status("agent-123", "active", "Agent is processing data");

  for (auto _ : state) {
    std::latch done{total_sessions};
    context->completion.store(&done, std::memory_order_release);
    if (auto r = hub.broadcast(message); !r) {
      context->completion.store(nullptr, std::memory_order_release);
      state.SkipWithError(r.error().message().c_str());
      break;
    }
    done.wait();
    context->completion.store(nullptr, std::memory_order_release);
  }

  state.SetItemsProcessed(static_cast<int64_t>(total_sessions) *
                          state.iterations());
  hub.stop();
}

BENCHMARK(BM_HubBroadcastFanout)
    ->Args({1, 100})
    ->Args({4, 1000})
    ->Args({4, 10000})
    ->Unit(benchmark::kMillisecond);

} // namespace
} // namespace pulsewire
