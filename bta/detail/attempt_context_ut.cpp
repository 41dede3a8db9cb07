#include "bta/detail/attempt_context.hpp"

#include <gmock/gmock.h>

#include <sstream>

/**
 * @test Verify how the deadline of each attempt is computed.
 */
TEST(attempt_context, attempt_deadline) {
  using namespace std::chrono_literals;
  using bta::detail::attempt_deadline;
  auto const now = std::chrono::system_clock::now();

  bta::retry_options defaults;
  EXPECT_EQ(attempt_deadline(defaults, now), std::chrono::system_clock::time_point::max());

  auto per_attempt = defaults.with_attempt_timeout(2s);
  EXPECT_EQ(attempt_deadline(per_attempt, now), now + 2s);

  auto overall = defaults.with_deadline(now + 500ms);
  EXPECT_EQ(attempt_deadline(overall, now), now + 500ms);

  // ... the earliest one wins ...
  EXPECT_EQ(attempt_deadline(overall.with_attempt_timeout(2s), now), now + 500ms);
  EXPECT_EQ(attempt_deadline(per_attempt.with_deadline(now + 10s), now), now + 2s);
}

/**
 * @test Verify that attempt_context can be streamed.
 */
TEST(attempt_context, stream) {
  using namespace std::chrono_literals;
  bta::detail::attempt_context ctx;
  ctx.attempt_number = 3;
  ctx.submitted_at = std::chrono::system_clock::now();
  EXPECT_FALSE(ctx.has_deadline());
  ctx.metadata.emplace("x-goog-request-params", "name=test");

  std::ostringstream os;
  os << ctx;
  EXPECT_EQ(os.str(), "attempt=3, metadata.size=1");

  ctx.deadline = ctx.submitted_at + 250ms;
  EXPECT_TRUE(ctx.has_deadline());
  os.str("");
  os << ctx;
  EXPECT_THAT(os.str(), ::testing::HasSubstr("deadline=+250ms"));
}
