#include "bta/detail/future_bridge.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace bta::detail;

/**
 * @test Verify that values and errors reach the caller future.
 */
TEST(future_bridge, to_caller_future) {
  completion_handle<std::string> handle;
  auto f = to_caller_future(handle);
  EXPECT_FALSE(f.is_ready());
  handle.set_value("hello");
  ASSERT_TRUE(f.is_ready());
  EXPECT_EQ(f.get(), "hello");

  completion_handle<int> failed;
  auto error = bta::make_rpc_error(bta::error_kind::retries_exhausted, grpc::StatusCode::UNAVAILABLE, "gave up");
  failed.set_error(error);
  // ... bridging an already resolved handle works too ...
  auto g = to_caller_future(failed);
  ASSERT_TRUE(g.is_ready());
  try {
    g.get();
    FAIL() << "expected an exception";
  } catch (bta::rpc_error const& ex) {
    EXPECT_EQ(ex.kind(), bta::error_kind::retries_exhausted);
    EXPECT_EQ(ex.status_code(), grpc::StatusCode::UNAVAILABLE);
  }
}

/**
 * @test Verify that several caller futures can observe the same handle.
 */
TEST(future_bridge, multiple_futures) {
  completion_handle<int> handle;
  auto f1 = to_caller_future(handle);
  auto f2 = to_caller_future(handle);
  handle.set_value(42);
  auto f3 = to_caller_future(handle);
  EXPECT_EQ(f1.get(), 42);
  EXPECT_EQ(f2.get(), 42);
  EXPECT_EQ(f3.get(), 42);
}

/**
 * @test Verify that cancelling the caller future cancels the handle, and the producer.
 */
TEST(future_bridge, caller_cancel) {
  completion_handle<int> handle;
  int hook = 0;
  handle.on_cancel([&hook]() { ++hook; });
  auto f = to_caller_future(handle);

  EXPECT_TRUE(f.cancel());
  EXPECT_EQ(hook, 1);
  EXPECT_TRUE(handle.is_cancelled());
  EXPECT_FALSE(handle.set_value(42));
  EXPECT_FALSE(f.cancel());
  EXPECT_EQ(hook, 1);
  EXPECT_THROW(f.get(), bta::rpc_error);

  // ... and cancelling the handle directly reaches the future ...
  completion_handle<int> other;
  auto g = to_caller_future(other);
  other.cancel();
  ASSERT_TRUE(g.is_ready());
  EXPECT_THROW(g.get(), bta::rpc_error);
}

/**
 * @test Verify that futures can be converted to completion handles.
 */
TEST(future_bridge, to_completion_handle) {
  bta::promise<int> p;
  auto handle = to_completion_handle(p.get_future());
  EXPECT_FALSE(handle.is_resolved());
  p.set_value(7);
  ASSERT_TRUE(handle.is_resolved());
  EXPECT_EQ(handle.wait().value(), 7);

  bta::promise<int> q;
  auto failed = to_completion_handle(q.get_future());
  auto error = std::make_exception_ptr(std::runtime_error("boom"));
  q.set_exception(error);
  ASSERT_TRUE(failed.is_resolved());
  EXPECT_EQ(failed.wait().error(), error);
  EXPECT_THROW(failed.wait().value(), std::runtime_error);
}

/**
 * @test Verify that cancelling the handle cancels the future it came from.
 */
TEST(future_bridge, handle_cancel) {
  int cancelled = 0;
  bta::promise<int> p([&cancelled]() { ++cancelled; });
  auto handle = to_completion_handle(p.get_future());

  EXPECT_TRUE(handle.cancel());
  EXPECT_EQ(cancelled, 1);
  EXPECT_TRUE(p.is_ready());
  EXPECT_FALSE(p.set_value(3));
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::cancelled);
  EXPECT_FALSE(handle.cancel());
  EXPECT_EQ(cancelled, 1);
}

/**
 * @test Verify that round trips through both bridges preserve the outcome and the cancellation.
 */
TEST(future_bridge, round_trip) {
  completion_handle<int> origin;
  int hook = 0;
  origin.on_cancel([&hook]() { ++hook; });
  auto bridged = to_completion_handle(to_caller_future(origin));
  EXPECT_FALSE(bridged.same_state(origin));

  bridged.cancel();
  EXPECT_EQ(hook, 1);
  EXPECT_TRUE(origin.is_cancelled());

  completion_handle<int> source;
  auto copy = to_completion_handle(to_caller_future(source));
  source.set_value(5);
  EXPECT_EQ(copy.wait().value(), 5);
}

/**
 * @test Verify that transform() converts values and propagates errors and cancellation.
 */
TEST(future_bridge, transform) {
  bta::promise<int> p;
  auto f = transform(p.get_future(), [](int x) { return std::to_string(x); });
  p.set_value(42);
  EXPECT_EQ(f.get(), "42");

  bta::promise<int> q;
  auto g = transform(q.get_future(), [](int x) { return x + 1; });
  q.set_exception(bta::make_rpc_error(bta::error_kind::permanent_failure, grpc::StatusCode::NOT_FOUND, "missing"));
  EXPECT_THROW(g.get(), bta::rpc_error);

  auto h = transform(bta::make_ready_future(1), [](int) -> int { throw std::invalid_argument("bad value"); });
  EXPECT_THROW(h.get(), std::invalid_argument);

  int cancelled = 0;
  bta::promise<int> r([&cancelled]() { ++cancelled; });
  auto k = transform(r.get_future(), [](int x) { return x * 2; });
  EXPECT_TRUE(k.cancel());
  EXPECT_EQ(cancelled, 1);
  EXPECT_THROW(k.get(), bta::rpc_error);
}
