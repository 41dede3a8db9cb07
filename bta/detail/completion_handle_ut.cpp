#include "bta/detail/completion_handle.hpp"

#include <gmock/gmock.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace bta::detail;

/**
 * @test Verify that a completion_handle is resolved exactly once.
 */
TEST(completion_handle, write_once) {
  completion_handle<std::string> handle;
  EXPECT_FALSE(handle.is_resolved());

  EXPECT_TRUE(handle.set_value("first"));
  EXPECT_TRUE(handle.is_resolved());
  EXPECT_FALSE(handle.set_value("second"));
  EXPECT_FALSE(handle.set_error(std::make_exception_ptr(std::runtime_error("late error"))));
  EXPECT_FALSE(handle.cancel());
  EXPECT_FALSE(handle.is_cancelled());

  auto const& r = handle.wait();
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value(), "first");
}

/**
 * @test Verify that errors are stored and classified.
 */
TEST(completion_handle, error) {
  completion_handle<int> handle;
  auto error = bta::make_rpc_error(bta::error_kind::permanent_failure, grpc::StatusCode::NOT_FOUND, "missing");
  EXPECT_TRUE(handle.set_error(error));
  EXPECT_FALSE(handle.set_value(42));

  auto const& r = handle.wait();
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.kind(), bta::error_kind::permanent_failure);
  EXPECT_EQ(r.status_code(), grpc::StatusCode::NOT_FOUND);
  EXPECT_THROW(r.value(), bta::rpc_error);
}

/**
 * @test Verify that listeners attached before and after the resolution are called exactly once.
 */
TEST(completion_handle, listeners) {
  completion_handle<int> handle;
  int before_count = 0;
  int before_value = 0;
  handle.add_listener([&](bta::operation_result<int> const& r) {
    ++before_count;
    before_value = r.value();
  });
  // ... a copy shares the same result ...
  completion_handle<int> copy = handle;
  EXPECT_TRUE(copy.same_state(handle));
  int copy_count = 0;
  copy.add_listener([&](bta::operation_result<int> const&) { ++copy_count; });
  EXPECT_EQ(before_count, 0);

  EXPECT_TRUE(handle.set_value(42));
  EXPECT_EQ(before_count, 1);
  EXPECT_EQ(before_value, 42);
  EXPECT_EQ(copy_count, 1);

  int after_count = 0;
  handle.add_listener([&](bta::operation_result<int> const& r) {
    ++after_count;
    EXPECT_EQ(r.value(), 42);
  });
  EXPECT_EQ(after_count, 1);

  handle.set_value(7);
  EXPECT_EQ(before_count, 1);
  EXPECT_EQ(copy_count, 1);
  EXPECT_EQ(after_count, 1);

  completion_handle<int> other;
  EXPECT_FALSE(other.same_state(handle));
}

/**
 * @test Verify that a listener raising an exception does not prevent the other listeners from running.
 */
TEST(completion_handle, listener_exception) {
  completion_handle<int> handle;
  int count = 0;
  handle.add_listener([](bta::operation_result<int> const&) { throw std::runtime_error("bad listener"); });
  handle.add_listener([](bta::operation_result<int> const&) { throw 42; });
  handle.add_listener([&count](bta::operation_result<int> const&) { ++count; });
  EXPECT_NO_THROW(handle.set_value(1));
  EXPECT_EQ(count, 1);

  // ... also for listeners added after the resolution ...
  EXPECT_NO_THROW(handle.add_listener([](bta::operation_result<int> const&) { throw "bad listener"; }));
}

/**
 * @test Verify that the cancellation hook runs before the listeners observe the cancellation.
 */
TEST(completion_handle, hook_before_listeners) {
  completion_handle<int> handle;
  std::vector<std::string> events;
  handle.on_cancel([&events]() {
    events.push_back("hook");
    throw 7;
  });
  handle.add_listener([&events](bta::operation_result<int> const&) { events.push_back("listener"); });
  EXPECT_NO_THROW(handle.cancel());
  EXPECT_THAT(events, ::testing::ElementsAre("hook", "listener"));
}

/**
 * @test Verify that cancellation resolves the handle and calls the hook only once.
 */
TEST(completion_handle, cancel) {
  completion_handle<int> handle;
  int hook_count = 0;
  handle.on_cancel([&hook_count]() { ++hook_count; });
  bta::error_kind kind = bta::error_kind::permanent_failure;
  handle.add_listener([&kind](bta::operation_result<int> const& r) { kind = r.kind(); });

  EXPECT_TRUE(handle.cancel());
  EXPECT_TRUE(handle.is_resolved());
  EXPECT_TRUE(handle.is_cancelled());
  EXPECT_EQ(hook_count, 1);
  EXPECT_EQ(kind, bta::error_kind::cancelled);
  EXPECT_EQ(handle.wait().status_code(), grpc::StatusCode::CANCELLED);

  EXPECT_FALSE(handle.cancel());
  EXPECT_EQ(hook_count, 1);
  EXPECT_FALSE(handle.set_value(42));
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::cancelled);
}

/**
 * @test Verify how late cancellation hooks are handled.
 */
TEST(completion_handle, late_hook) {
  completion_handle<int> cancelled;
  cancelled.cancel();
  int count = 0;
  cancelled.on_cancel([&count]() { ++count; });
  EXPECT_EQ(count, 1);

  completion_handle<int> resolved;
  resolved.set_value(3);
  resolved.on_cancel([&count]() { ++count; });
  EXPECT_EQ(count, 1);

  // ... once resolved with a value the hook is discarded, cancel() does not call it ...
  completion_handle<int> handle;
  handle.on_cancel([&count]() { ++count; });
  handle.set_value(5);
  handle.cancel();
  EXPECT_EQ(count, 1);
}

/**
 * @test Verify that waiting threads are woken up by the resolution.
 */
TEST(completion_handle, wait_for) {
  completion_handle<int> handle;
  EXPECT_FALSE(handle.wait_for(std::chrono::milliseconds(5)));

  std::thread t([handle]() mutable { handle.set_value(42); });
  EXPECT_EQ(handle.wait().value(), 42);
  EXPECT_TRUE(handle.wait_for(std::chrono::milliseconds(5)));
  t.join();
}

/**
 * @test Verify that concurrent producers resolve the handle only once.
 */
TEST(completion_handle, concurrent_resolution) {
  completion_handle<int> handle;
  std::atomic<int> calls(0);
  handle.add_listener([&calls](bta::operation_result<int> const&) { ++calls; });

  std::atomic<int> winners(0);
  std::vector<std::thread> threads;
  for (int i = 0; i != 8; ++i) {
    threads.emplace_back([handle, i, &winners]() mutable {
      bool won = (i % 2 == 0) ? handle.set_value(i) : handle.cancel();
      if (won) {
        ++winners;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(calls.load(), 1);
}
