#include "bta/log.hpp"

#include <gmock/gmock.h>

#include <thread>

namespace {
using captured_logs = std::vector<std::pair<bta::severity, std::string>>;

/// Create a sink that appends to @a logs.
std::shared_ptr<bta::log_sink> capture_to(captured_logs& logs) {
  return bta::make_log_sink([&logs](bta::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}
} // anonymous namespace

/**
 * @test Verify that BTA_LOG_I() and the supporting classes work in the normal case.
 */
TEST(log, basic) {
  bta::log lg;
  // ... without sinks this is basically a compilation test ...
  ASSERT_NO_THROW(BTA_LOG_I(error, lg) << "foo" << 4 << 2);
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(BTA_LOG_I(error, lg) << "attempt " << 3 << " failed");
  ASSERT_EQ(logs.size(), 1UL);
  EXPECT_EQ(logs[0].first, bta::severity::error);
  EXPECT_THAT(logs[0].second, StartsWith("[error] attempt 3 failed"));
  EXPECT_THAT(logs[0].second, HasSubstr("log_ut.cpp"));
}

/**
 * @test Verify that messages below the run-time minimum severity are discarded without evaluating the expression.
 */
TEST(log, run_time_disable) {
  bta::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(bta::severity::warning);
  ASSERT_NO_THROW(BTA_LOG_I(info, lg) << "testing " << f());
  EXPECT_EQ(logs.size(), 0UL);
  EXPECT_EQ(cnt, 0);

  ASSERT_NO_THROW(BTA_LOG_I(warning, lg) << "testing " << f());
  EXPECT_EQ(logs.size(), 1UL);
  EXPECT_EQ(cnt, 1);
}

/**
 * @test Verify that levels disabled at compile-time are never formatted.
 */
TEST(log, compile_time_disable) {
  bta::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  // ... enabled at run-time, but BTA_MIN_SEVERITY is info by default ...
  lg.min_severity(bta::severity::trace);
  ASSERT_NO_THROW(BTA_LOG_I(debug, lg) << "testing " << f());
  EXPECT_EQ(logs.size(), 0UL);
  EXPECT_EQ(cnt, 0);
}

/**
 * @test Verify that the BTA_LOG() macro and the supporting singleton work as expected.
 */
TEST(log, instance_basic) {
  bta::log& lg = bta::log::instance();
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(BTA_LOG(info) << "testing 123 " << 42);
  ASSERT_NO_THROW(lg.clear_sinks());
  ASSERT_EQ(logs.size(), 1UL);
  EXPECT_EQ(logs[0].first, bta::severity::info);
  EXPECT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));
}

/**
 * @test Verify that every sink receives a copy of the message.
 */
TEST(log, multiple_sinks) {
  bta::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lg.add_sink(bta::make_log_sink([&logs](bta::severity sev, std::string&& msg) {
    logs.emplace_back(sev, std::string("(2) ") + msg);
  }));

  using namespace ::testing;
  ASSERT_NO_THROW(BTA_LOG_I(error, lg) << "testing 123");
  ASSERT_EQ(logs.size(), 2UL);
  EXPECT_THAT(logs[0].second, StartsWith("[error] testing 123"));
  EXPECT_THAT(logs[1].second, StartsWith("(2) [error] testing 123"));
}

/**
 * @test Verify that concurrent writers do not lose messages.
 */
TEST(log, concurrent_writers) {
  bta::log lg;
  std::mutex mu;
  int count = 0;
  lg.add_sink(bta::make_log_sink([&mu, &count](bta::severity, std::string&&) {
    std::lock_guard<std::mutex> lock(mu);
    ++count;
  }));

  auto writer = [&lg]() {
    for (int i = 0; i != 100; ++i) {
      BTA_LOG_I(info, lg) << "message " << i;
    }
  };
  std::thread t1(writer);
  std::thread t2(writer);
  t1.join();
  t2.join();
  EXPECT_EQ(count, 200);
}

/**
 * @test Complete code coverage for the bta::logger<true> class.
 */
TEST(log, logger_disabled) {
  bta::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  bta::logger<true> logger(bta::severity::error, __func__, __FILE__, __LINE__, lg);

  ASSERT_EQ((bool)logger, false);
  ASSERT_NO_THROW(logger.get() << "testing " << 123 << std::string(" ") << 42);
  ASSERT_TRUE((std::is_same<decltype(logger.get()), bta::detail::null_stream&>::value));
  ASSERT_NO_THROW(logger.write_to(lg));
  ASSERT_EQ(logs.size(), 0U);
}
