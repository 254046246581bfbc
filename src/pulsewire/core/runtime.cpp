#include "pulsewire/core/runtime.hpp"

#include "pulsewire/util/log.hpp"

#include <boost/asio/executor_work_guard.hpp>

#include <algorithm>
#include <optional>
#include <thread>

namespace pulsewire {

namespace {
// Which shard of which runtime the calling thread drives, if any.
thread_local const Runtime *tls_runtime = nullptr;
thread_local shard_id tls_shard = kInvalidShard;
} // namespace

struct Runtime::Shard {
  using WorkGuard =
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::io_context io{1};
  std::optional<WorkGuard> work;
  std::jthread thread;
};

Runtime::Runtime(unsigned num_shards) {
  const unsigned count =
      num_shards != 0 ? num_shards
                      : std::max(1U, std::thread::hardware_concurrency());
  shards_.reserve(count);
  for (unsigned i = 0; i < count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }
  log::debug("Starting runtime with {} shard(s)", shards_.size());

  for (shard_id id = 0; id < shard_count(); ++id) {
    auto &shard = *shards_[id];
    shard.io.restart();
    shard.work.emplace(boost::asio::make_work_guard(shard.io));
    shard.thread = std::jthread([this, id, &io = shard.io] {
      tls_runtime = this;
      tls_shard = id;
      io.run();
      tls_runtime = nullptr;
      tls_shard = kInvalidShard;
    });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  for (auto &shard : shards_) {
    shard->work.reset();
    shard->io.stop();
  }
  for (auto &shard : shards_) {
    if (shard->thread.joinable()) {
      shard->thread.join();
    }
  }
  log::debug("Runtime stopped");
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::context_for(shard_id id) -> boost::asio::io_context & {
  assert(id < shards_.size());
  return shards_[id]->io;
}

auto Runtime::current_shard() const noexcept -> shard_id {
  return tls_runtime == this ? tls_shard : kInvalidShard;
}

auto Runtime::is_current_shard() const noexcept -> bool {
  return current_shard() != kInvalidShard;
}

auto Runtime::next_shard() noexcept -> shard_id {
  return static_cast<shard_id>(
      round_robin_.fetch_add(1, std::memory_order_relaxed) % shards_.size());
}

} // namespace pulsewire
