#include "bta/log_sink.hpp"

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>

/**
 * @test Verify that the bta::make_log_sink works as expected.
 */
TEST(log_sink, basic) {
  std::string value;
  bta::severity sev;
  auto ls = bta::make_log_sink([&value, &sev](bta::severity s, std::string&& m) {
    value = m;
    sev = s;
  });

  ls->log(bta::severity::info, std::string("testing 1 2 3"));
  ASSERT_EQ(sev, bta::severity::info);
  ASSERT_EQ(value, "testing 1 2 3");
}

/**
 * @test Verify that bta::make_stderr_log_sink() writes one line per message.
 */
TEST(log_sink, stderr_sink) {
  std::ostringstream captured;
  auto* saved = std::clog.rdbuf(captured.rdbuf());
  auto ls = bta::make_stderr_log_sink();
  ls->log(bta::severity::warning, std::string("first"));
  ls->log(bta::severity::error, std::string("second"));
  std::clog.rdbuf(saved);

  ASSERT_EQ(captured.str(), "first\nsecond\n");
}
