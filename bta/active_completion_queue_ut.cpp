#include "bta/active_completion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>

/**
 * @test Verify that bta::active_completion_queue works as expected.
 */
TEST(active_completion_queue, basic) {
  auto shq = std::make_shared<bta::active_completion_queue>();
  EXPECT_NO_THROW(shq.reset());

  EXPECT_NO_THROW(bta::active_completion_queue());

  {
    bta::active_completion_queue orig;
    bta::active_completion_queue copy(std::move(orig));
    EXPECT_FALSE(orig);
    EXPECT_TRUE(copy);
  }

  {
    bta::active_completion_queue orig;
    EXPECT_TRUE(orig);
    bta::active_completion_queue copy;
    EXPECT_TRUE(copy);

    copy = std::move(orig);
    EXPECT_FALSE(orig);
    EXPECT_TRUE(copy);
  }

  auto cq = std::make_shared<bta::completion_queue<>>();
  std::thread t([cq]() { cq->run(); });
  EXPECT_TRUE(t.joinable());

  {
    bta::active_completion_queue owner(std::move(cq), std::move(t));
    EXPECT_TRUE(owner);
    EXPECT_FALSE(t.joinable());
  }
}

/**
 * @test Verify that timers posted to an active_completion_queue fire in its thread.
 */
TEST(active_completion_queue, runs_timers) {
  using namespace std::chrono_literals;
  bta::active_completion_queue active;
  std::atomic<int> cnt(0);
  std::atomic<bool> other_thread(false);
  auto caller = std::this_thread::get_id();
  active.cq().make_relative_timer(1ms, "active/timer", [&cnt, &other_thread, caller](auto const&, bool ok) {
    other_thread.store(std::this_thread::get_id() != caller);
    cnt += int(ok);
  });
  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_EQ(cnt.load(), 1);
  EXPECT_TRUE(other_thread.load());

  active.stop();
  EXPECT_FALSE(active);
  EXPECT_NO_THROW(active.stop());
}
