#pragma once

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/core/error.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace pulsewire {

using shard_id = unsigned;

inline constexpr shard_id kInvalidShard = std::numeric_limits<shard_id>::max();

/// A fixed set of single-threaded io_contexts ("shards"). The hub loop runs
/// on shard 0; each session stays on the shard that accepted its socket.
class Runtime {
public:
  /// Zero means one shard per hardware thread.
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  /// Idempotent. A stopped runtime may be started again.
  [[nodiscard]] auto start() -> Result<void>;
  /// Stops every shard and joins its thread; pending work is abandoned.
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    co_spawn(executor_for(target), std::move(coro), detached);
  }

  /// Round-robin placement for work with no shard affinity.
  template <typename T> auto spawn_external(task<T> coro) -> void {
    spawn_on(next_shard(), std::move(coro));
  }

  template <typename F> auto post_to(shard_id target, F &&fn) -> void {
    boost::asio::post(executor_for(target), std::forward<F>(fn));
  }

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return static_cast<unsigned>(shards_.size());
  }
  [[nodiscard]] auto executor_for(shard_id id)
      -> boost::asio::io_context::executor_type {
    return context_for(id).get_executor();
  }
  [[nodiscard]] auto context_for(shard_id id) -> boost::asio::io_context &;

  /// kInvalidShard unless called from one of this runtime's shard threads.
  [[nodiscard]] auto current_shard() const noexcept -> shard_id;
  [[nodiscard]] auto is_current_shard() const noexcept -> bool;

private:
  struct Shard;

  auto next_shard() noexcept -> shard_id;

  std::vector<std::unique_ptr<Shard>> shards_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> round_robin_{0};
};

/// Suspend the calling coroutine on its own executor.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> spawn_task {
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
  timer.expires_after(duration);
  (void)co_await timer.async_wait(use_nothrow);
}

} // namespace pulsewire
