//   Copyright 2017 Carlos O'Ryan
//
//   Licensed under the Apache License, Version 2.0 (the "License");
//   you may not use this file except in compliance with the License.
//   You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
//   Unless required by applicable law or agreed to in writing, software
//   distributed under the License is distributed on an "AS IS" BASIS,
//   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//   See the License for the specific language governing permissions and
//   limitations under the License.

#include <bta/detail/backoff_policy.hpp>

#include <gtest/gtest.h>

namespace {
using namespace std::chrono_literals;
auto const now = std::chrono::system_clock::now();
} // anonymous namespace

/**
 * @test Verify that the delay grows exponentially and is capped.
 */
TEST(backoff_policy, exponential_growth) {
  using bta::detail::compute_backoff;
  bta::retry_options options(100ms, 1000ms, 2.0, 10);

  EXPECT_EQ(compute_backoff(1, options, now, 0.0).delay.count(), 100);
  EXPECT_EQ(compute_backoff(2, options, now, 0.0).delay.count(), 200);
  EXPECT_EQ(compute_backoff(3, options, now, 0.0).delay.count(), 400);
  EXPECT_EQ(compute_backoff(4, options, now, 0.0).delay.count(), 800);
  EXPECT_EQ(compute_backoff(5, options, now, 0.0).delay.count(), 1000);
  EXPECT_EQ(compute_backoff(9, options, now, 0.0).delay.count(), 1000);
  EXPECT_FALSE(compute_backoff(9, options, now, 0.0).is_exhausted);
}

/**
 * @test Verify that the call is exhausted once the maximum number of attempts is reached.
 */
TEST(backoff_policy, exhausted_by_attempts) {
  using bta::detail::compute_backoff;
  bta::retry_options options(100ms, 1000ms, 2.0, 5);

  for (int i = 1; i != 5; ++i) {
    EXPECT_FALSE(compute_backoff(i, options, now, 0.0).is_exhausted) << "i=" << i;
  }
  EXPECT_TRUE(compute_backoff(5, options, now, 0.0).is_exhausted);
  EXPECT_TRUE(compute_backoff(6, options, now, 0.0).is_exhausted);
  EXPECT_THROW(compute_backoff(0, options, now, 0.0), std::invalid_argument);
}

/**
 * @test Verify that the call is exhausted if the next attempt would start after the deadline.
 */
TEST(backoff_policy, exhausted_by_deadline) {
  using bta::detail::compute_backoff;
  auto options = bta::retry_options(100ms, 1000ms, 2.0, 10).with_deadline(now + 350ms);

  EXPECT_EQ(compute_backoff(1, options, now, 0.0).delay.count(), 100);
  EXPECT_EQ(compute_backoff(2, options, now, 0.0).delay.count(), 200);
  // ... 400ms would go past the deadline ...
  EXPECT_TRUE(compute_backoff(3, options, now, 0.0).is_exhausted);
  // ... and so does any delay once the deadline has passed ...
  EXPECT_TRUE(compute_backoff(1, options, now + 400ms, 0.0).is_exhausted);
}

/**
 * @test Verify that disabling retries always gives up.
 */
TEST(backoff_policy, retries_disabled) {
  using bta::detail::compute_backoff;
  auto options = bta::retry_options(100ms, 1000ms, 2.0, 10).with_retries_enabled(false);
  EXPECT_TRUE(compute_backoff(1, options, now, 0.0).is_exhausted);
}

/**
 * @test Verify that the jitter stays within the configured fraction and never exceeds the maximum delay.
 */
TEST(backoff_policy, jitter_bounds) {
  using bta::detail::compute_backoff;
  auto options = bta::retry_options(100ms, 1000ms, 2.0, 10).with_jitter_fraction(0.2);

  EXPECT_EQ(compute_backoff(1, options, now, -1.0).delay.count(), 80);
  EXPECT_EQ(compute_backoff(1, options, now, 1.0).delay.count(), 120);
  EXPECT_EQ(compute_backoff(2, options, now, 0.5).delay.count(), 220);
  // ... the maximum delay is never exceeded, even with positive jitter ...
  EXPECT_EQ(compute_backoff(8, options, now, 1.0).delay.count(), 1000);
  EXPECT_EQ(compute_backoff(8, options, now, -1.0).delay.count(), 800);
  // ... out of range samples are clamped ...
  EXPECT_EQ(compute_backoff(1, options, now, 7.0).delay.count(), 120);

  auto wild = options.with_jitter_fraction(1.0);
  EXPECT_EQ(compute_backoff(1, wild, now, -1.0).delay.count(), 0);
}

/**
 * @test Verify that random jitter samples produce delays in the expected range.
 */
TEST(backoff_policy, jitter_source) {
  using bta::detail::compute_backoff;
  auto options = bta::retry_options(100ms, 1000ms, 2.0, 10).with_jitter_fraction(0.2);
  bta::detail::jitter_source source;
  for (int i = 0; i != 1000; ++i) {
    double sample = source();
    ASSERT_GE(sample, -1.0);
    ASSERT_LE(sample, 1.0);
    auto d = compute_backoff(3, options, now, sample).delay;
    ASSERT_GE(d.count(), 320);
    ASSERT_LE(d.count(), 480);
  }

  auto none = bta::detail::jitter_source::none();
  EXPECT_EQ(none(), 0.0);
}

/**
 * @test Verify that without jitter the delays never decrease and never exceed the maximum.
 */
TEST(backoff_policy, monotonic) {
  using bta::detail::compute_backoff;
  for (double multiplier : {1.0, 1.3, 1.5, 2.0, 3.0}) {
    auto options = bta::retry_options(7ms, 900ms, multiplier, 30).with_jitter_fraction(0.0);
    auto previous = compute_backoff(1, options, now, 0.0).delay;
    for (int k = 2; k != options.max_attempts(); ++k) {
      auto decision = compute_backoff(k, options, now, 0.0);
      ASSERT_FALSE(decision.is_exhausted);
      EXPECT_LE(previous, decision.delay) << "multiplier=" << multiplier << ", k=" << k;
      EXPECT_LE(decision.delay, options.max_delay());
      previous = decision.delay;
    }
  }
}
