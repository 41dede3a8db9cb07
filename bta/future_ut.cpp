#include "bta/future.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>

/**
 * @test Verify the basic promise / future operations.
 */
TEST(future, value) {
  using namespace std::chrono_literals;
  bta::promise<std::string> p;
  auto f = p.get_future();
  EXPECT_TRUE(f.valid());
  EXPECT_FALSE(f.is_ready());
  EXPECT_EQ(f.wait_for(1ms), std::future_status::timeout);
  EXPECT_THROW(p.get_future(), std::future_error);

  EXPECT_TRUE(p.set_value("hello"));
  EXPECT_FALSE(p.set_value("again"));
  EXPECT_TRUE(f.is_ready());
  EXPECT_EQ(f.wait_for(0ms), std::future_status::ready);
  EXPECT_EQ(f.get(), "hello");
  EXPECT_FALSE(f.valid());
  EXPECT_THROW(f.get(), std::future_error);
}

/**
 * @test Verify that exceptions are propagated to the caller.
 */
TEST(future, exception) {
  bta::promise<int> p;
  auto f = p.get_future();
  EXPECT_TRUE(p.set_exception(std::make_exception_ptr(std::runtime_error("boom"))));
  EXPECT_FALSE(p.set_value(42));
  EXPECT_THROW(f.get(), std::runtime_error);
}

/**
 * @test Verify that get() blocks until the value is set from another thread.
 */
TEST(future, blocking_get) {
  bta::promise<int> p;
  auto f = p.get_future();
  std::thread t([&p]() { p.set_value(7); });
  EXPECT_EQ(f.get(), 7);
  t.join();
}

/**
 * @test Verify that continuations are called with the ready future.
 */
TEST(future, then) {
  bta::promise<int> p;
  bool called = false;
  auto f = p.get_future().then([&called](bta::future<int> g) {
    called = true;
    return std::to_string(g.get() * 2);
  });
  EXPECT_FALSE(called);
  EXPECT_FALSE(f.is_ready());

  p.set_value(21);
  EXPECT_TRUE(called);
  ASSERT_TRUE(f.is_ready());
  EXPECT_EQ(f.get(), "42");

  // ... a continuation attached to a ready future runs immediately ...
  auto ready = bta::make_ready_future(3).then([](bta::future<int> g) { return g.get() + 1; });
  ASSERT_TRUE(ready.is_ready());
  EXPECT_EQ(ready.get(), 4);
}

/**
 * @test Verify that exceptions flow through continuations.
 */
TEST(future, then_exception) {
  bta::promise<int> p;
  auto f = p.get_future().then([](bta::future<int> g) { return g.get() + 1; });
  p.set_exception(std::make_exception_ptr(std::runtime_error("boom")));
  EXPECT_THROW(f.get(), std::runtime_error);

  auto g = bta::make_ready_future(1).then([](bta::future<int>) -> int { throw std::logic_error("bad continuation"); });
  EXPECT_THROW(g.get(), std::logic_error);
}

/**
 * @test Verify that cancellation satisfies the future and reaches the producer.
 */
TEST(future, cancel) {
  int cancelled = 0;
  bta::promise<int> p([&cancelled]() { ++cancelled; });
  auto f = p.get_future();

  EXPECT_TRUE(f.cancel());
  EXPECT_EQ(cancelled, 1);
  EXPECT_FALSE(f.cancel());
  EXPECT_EQ(cancelled, 1);
  EXPECT_FALSE(p.set_value(42));
  EXPECT_TRUE(p.is_ready());

  try {
    f.get();
    FAIL() << "expected an exception";
  } catch (bta::rpc_error const& ex) {
    EXPECT_EQ(ex.kind(), bta::error_kind::cancelled);
    EXPECT_EQ(ex.status_code(), grpc::StatusCode::CANCELLED);
  }

  // ... cancelling a satisfied future has no effect ...
  bta::promise<int> q([&cancelled]() { ++cancelled; });
  auto g = q.get_future();
  q.set_value(3);
  EXPECT_FALSE(g.cancel());
  EXPECT_EQ(cancelled, 1);
  EXPECT_EQ(g.get(), 3);
}

/**
 * @test Verify that cancelling a derived future cancels the source.
 */
TEST(future, cancel_chain) {
  int cancelled = 0;
  bta::promise<int> p([&cancelled]() { ++cancelled; });
  auto f = p.get_future().then([](bta::future<int> g) { return g.get() * 2; });

  EXPECT_TRUE(f.cancel());
  EXPECT_EQ(cancelled, 1);
  EXPECT_TRUE(p.is_ready());
  EXPECT_THROW(f.get(), bta::rpc_error);
}
