#include "pulsewire/core/runtime.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

#include "test_utils.hpp"
#include "gtest/gtest.h"

using namespace pulsewire;
using pulsewire::test::poll_until;

namespace {

constexpr auto kTaskTimeout = std::chrono::seconds(1);

auto increment_counter(std::atomic<int> *count_ptr) -> spawn_task {
  count_ptr->fetch_add(1);
  co_return;
}

} // namespace

TEST(RuntimeTest, BasicStartStop) {
  Runtime rt(1);
  EXPECT_FALSE(rt.is_running());
  ASSERT_TRUE(rt.start().has_value());
  EXPECT_TRUE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
  rt.stop();
  EXPECT_FALSE(rt.is_running());
}

TEST(RuntimeTest, ZeroShardsDefaultsToHardware) {
  Runtime rt(0);
  EXPECT_GE(rt.shard_count(), 1U);
}

TEST(RuntimeTest, CurrentShardInvalidOutsideContext) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start().has_value());
  EXPECT_EQ(rt.current_shard(), kInvalidShard);
  EXPECT_FALSE(rt.is_current_shard());
  rt.stop();
}

TEST(RuntimeTest, SpawnOnRunsOnTargetShard) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start().has_value());

  std::atomic<shard_id> observed{kInvalidShard};
  auto on_target = [&]() -> spawn_task {
    observed.store(rt.current_shard());
    co_return;
  };
  rt.spawn_on(1, on_target());

  EXPECT_TRUE(poll_until([&] { return observed.load() != kInvalidShard; },
                         kTaskTimeout));
  EXPECT_EQ(observed.load(), 1U);
  rt.stop();
}

TEST(RuntimeTest, SpawnExternalSpreadsAcrossShards) {
  Runtime rt(3);
  ASSERT_TRUE(rt.start().has_value());

  std::mutex mu;
  std::set<shard_id> seen;
  std::atomic<int> done{0};
  auto record = [&]() -> spawn_task {
    {
      std::lock_guard lock(mu);
      seen.insert(rt.current_shard());
    }
    done.fetch_add(1);
    co_return;
  };
  for (int i = 0; i < 3; ++i) {
    rt.spawn_external(record());
  }

  ASSERT_TRUE(poll_until([&] { return done.load() == 3; }, kTaskTimeout));
  std::lock_guard lock(mu);
  EXPECT_EQ(seen.size(), 3U);
  rt.stop();
}

TEST(RuntimeTest, PostToRunsCallback) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start().has_value());

  std::atomic<bool> ran{false};
  rt.post_to(0, [&] { ran.store(true); });
  EXPECT_TRUE(poll_until([&] { return ran.load(); }, kTaskTimeout));
  rt.stop();
}

TEST(RuntimeTest, AsyncSleepResumesOnSameShard) {
  Runtime rt(2);
  ASSERT_TRUE(rt.start().has_value());

  std::atomic<shard_id> after{kInvalidShard};
  auto sleeper = [&]() -> spawn_task {
    co_await async_sleep(std::chrono::milliseconds(20));
    after.store(rt.current_shard());
  };
  rt.spawn_on(1, sleeper());

  EXPECT_TRUE(poll_until([&] { return after.load() != kInvalidShard; },
                         kTaskTimeout));
  EXPECT_EQ(after.load(), 1U);
  rt.stop();
}

TEST(RuntimeTest, RestartAfterStop) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start().has_value());
  rt.stop();
  ASSERT_TRUE(rt.start().has_value());

  std::atomic<int> count{0};
  rt.spawn_external(increment_counter(&count));
  EXPECT_TRUE(poll_until([&] { return count.load() == 1; }, kTaskTimeout));
  rt.stop();
}

TEST(RuntimeTest, SpawnAfterStopIsNoOp) {
  Runtime rt(1);
  ASSERT_TRUE(rt.start().has_value());
  rt.stop();

  std::atomic<int> count{0};
  rt.spawn_external(increment_counter(&count));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(count.load(), 0);
}
