#include "bta/detail/base_completion_queue.hpp"

#include <gtest/gtest.h>

#include <future>

namespace {
using namespace std::chrono_literals;
} // anonymous namespace

/**
 * @test Verify that run() returns after shutdown() is called from another thread.
 */
TEST(base_completion_queue, run_shutdown) {
  bta::detail::base_completion_queue queue(10ms);
  EXPECT_EQ(queue.loop_timeout(), 10ms);
  EXPECT_EQ(queue.pending_operations(), 0UL);

  std::promise<void> started;
  auto loop = std::async(std::launch::async, [&queue, &started]() {
    started.set_value();
    queue.run();
  });
  ASSERT_EQ(started.get_future().wait_for(500ms), std::future_status::ready);
  // ... the loop keeps running through several timeouts ...
  EXPECT_EQ(loop.wait_for(5 * queue.loop_timeout()), std::future_status::timeout);

  queue.shutdown();
  ASSERT_EQ(loop.wait_for(500ms), std::future_status::ready);
  loop.get();
}

/**
 * @test Verify that run() returns immediately if the queue was already shutdown.
 */
TEST(base_completion_queue, shutdown_before_run) {
  bta::detail::base_completion_queue queue;
  EXPECT_EQ(queue.loop_timeout(), bta::detail::base_completion_queue::default_loop_timeout);
  queue.shutdown();
  auto loop = std::async(std::launch::async, [&queue]() { queue.run(); });
  ASSERT_EQ(loop.wait_for(500ms), std::future_status::ready);
}
