#include "bta/completion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

namespace bta {
namespace detail {
struct base_completion_queue_test_only {
  static grpc::CompletionQueue* get_raw_queue(base_completion_queue& q) {
    return q.cq();
  }
};
} // namespace detail
} // namespace bta

/**
 * @test Verify that one can create, run, and stop a bta::completion_queue.
 */
TEST(completion_queue, basic) {
  bta::completion_queue<> queue;

  std::atomic<int> cnt(0);
  std::atomic<int> cxl(0);
  auto functor = [&cnt, &cxl](auto const& op, bool ok) {
    if (not ok) {
      ++cxl;
    } else {
      ++cnt;
    }
  };

  using namespace std::chrono_literals;

  auto canceled = queue.make_relative_timer(5ms, "test-canceled", functor);
  canceled->cancel();
  auto timer = queue.make_relative_timer(5ms, "test-timer", functor);
  std::thread t([&queue]() { queue.run(); });

  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQ(cnt.load(), 1);
  ASSERT_EQ(cxl.load(), 1);
  EXPECT_EQ(queue.pending_operations(), 0UL);

  queue.shutdown();
  t.join();
}

/**
 * @test Verify that the timers report their deadline and name.
 */
TEST(completion_queue, timer_fields) {
  using namespace std::chrono_literals;
  bta::completion_queue<> queue(bta::detail::default_grpc_interceptor(), 10ms);
  EXPECT_EQ(queue.loop_timeout(), 10ms);

  auto deadline = std::chrono::system_clock::now() + 5ms;
  std::atomic<int> cnt(0);
  std::string name;
  auto timer = queue.make_deadline_timer(deadline, "timer-fields", [&cnt, &name](auto const& op, bool ok) {
    name = op.name;
    ++cnt;
  });
  EXPECT_EQ(timer->deadline, deadline);
  EXPECT_EQ(queue.pending_operations(), 1UL);

  std::thread t([&queue]() { queue.run(); });
  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQ(cnt.load(), 1);
  EXPECT_EQ(name, "timer-fields");

  queue.shutdown();
  t.join();
}

/**
 * @test Make sure bta::completion_queue handles errors gracefully.
 */
TEST(completion_queue, error) {
  using namespace std::chrono_literals;

  bta::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  // ... manually create timers with tags the queue does not know, that requires going around the API ...
  grpc::CompletionQueue* cq = bta::detail::base_completion_queue_test_only::get_raw_queue(queue);

  std::atomic<int> cnt(0);
  auto op = queue.make_relative_timer(30ms, "alarm-after", [&cnt](auto const& op, bool ok) { ++cnt; });
  // ... also set an earlier alarm with a nullptr tag ...
  grpc::Alarm al1;
  al1.Set(cq, std::chrono::system_clock::now() + 10ms, nullptr);
  // ... and an alarm with a tag the queue does not know about ...
  grpc::Alarm al2;
  al2.Set(cq, std::chrono::system_clock::now() + 20ms, (void*)&cnt);

  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(40ms);
  }
  ASSERT_EQ(cnt.load(), 1);

  queue.shutdown();
  t.join();
}

/**
 * @test Verify that invalid loop timeouts are rejected.
 */
TEST(completion_queue, invalid_loop_timeout) {
  using namespace std::chrono_literals;
  EXPECT_THROW(bta::completion_queue<>(bta::detail::default_grpc_interceptor(), 0ms), std::invalid_argument);
}
