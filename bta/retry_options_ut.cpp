#include "bta/retry_options.hpp"
#include <bta/status_code.hpp>

#include <gmock/gmock.h>

/**
 * @test Verify the default values of bta::retry_options.
 */
TEST(retry_options, defaults) {
  bta::retry_options options;
  EXPECT_EQ(options.initial_delay().count(), 5);
  EXPECT_EQ(options.max_delay().count(), 60000);
  EXPECT_DOUBLE_EQ(options.multiplier(), 2.0);
  EXPECT_EQ(options.max_attempts(), 10);
  EXPECT_DOUBLE_EQ(options.jitter_fraction(), 0.2);
  EXPECT_FALSE(options.has_deadline());
  EXPECT_EQ(options.attempt_timeout().count(), 0);
  EXPECT_TRUE(options.retries_enabled());

  auto const& codes = options.retryable_codes();
  EXPECT_EQ(codes.size(), 4UL);
  EXPECT_EQ(codes.count(grpc::StatusCode::UNAVAILABLE), 1UL);
  EXPECT_EQ(codes.count(grpc::StatusCode::DEADLINE_EXCEEDED), 1UL);
  EXPECT_EQ(codes.count(grpc::StatusCode::RESOURCE_EXHAUSTED), 1UL);
  EXPECT_EQ(codes.count(grpc::StatusCode::ABORTED), 1UL);
}

/**
 * @test Verify that invalid parameters are rejected when the options are created.
 */
TEST(retry_options, validation) {
  using namespace std::chrono_literals;
  EXPECT_THROW(bta::retry_options(1s, 500ms, 2.0, 5), std::invalid_argument);
  EXPECT_THROW(bta::retry_options(-1ms, 500ms, 2.0, 5), std::invalid_argument);
  EXPECT_THROW(bta::retry_options(10ms, 500ms, 0.5, 5), std::invalid_argument);
  EXPECT_THROW(bta::retry_options(10ms, 500ms, 2.0, 0), std::invalid_argument);
  EXPECT_THROW(bta::retry_options(10ms, 500ms, 2.0, -1), std::invalid_argument);
  EXPECT_NO_THROW(bta::retry_options(10ms, 10ms, 1.0, 1));

  bta::retry_options options;
  EXPECT_THROW(options.with_jitter_fraction(-0.1), std::invalid_argument);
  EXPECT_THROW(options.with_jitter_fraction(1.5), std::invalid_argument);
  EXPECT_THROW(options.with_max_attempts(0), std::invalid_argument);
  EXPECT_THROW(options.with_retryable_codes({grpc::StatusCode::OK}), std::invalid_argument);
  EXPECT_THROW(options.with_attempt_timeout(-5ms), std::invalid_argument);

  try {
    bta::retry_options(10ms, 500ms, 2.0, 0);
  } catch (std::invalid_argument const& ex) {
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("max_attempts"));
  }
}

/**
 * @test Verify that the with_*() functions return modified copies and leave the original unchanged.
 */
TEST(retry_options, modified_copies) {
  using namespace std::chrono_literals;
  bta::retry_options original(100ms, 1s, 2.0, 5);
  auto deadline = std::chrono::system_clock::now() + 10s;

  auto modified = original.with_deadline(deadline)
                      .with_jitter_fraction(0.0)
                      .with_retryable_codes(bta::parse_status_code_list("UNAVAILABLE"))
                      .with_attempt_timeout(2s)
                      .with_max_attempts(3)
                      .with_retries_enabled(false);

  EXPECT_TRUE(modified.has_deadline());
  EXPECT_EQ(modified.deadline(), deadline);
  EXPECT_DOUBLE_EQ(modified.jitter_fraction(), 0.0);
  EXPECT_EQ(modified.retryable_codes(), std::set<grpc::StatusCode>{grpc::StatusCode::UNAVAILABLE});
  EXPECT_EQ(modified.attempt_timeout().count(), 2000);
  EXPECT_EQ(modified.max_attempts(), 3);
  EXPECT_FALSE(modified.retries_enabled());
  EXPECT_EQ(modified.initial_delay().count(), 100);
  EXPECT_EQ(modified.max_delay().count(), 1000);

  EXPECT_FALSE(original.has_deadline());
  EXPECT_DOUBLE_EQ(original.jitter_fraction(), 0.2);
  EXPECT_EQ(original.retryable_codes().size(), 4UL);
  EXPECT_EQ(original.max_attempts(), 5);
  EXPECT_TRUE(original.retries_enabled());
}
