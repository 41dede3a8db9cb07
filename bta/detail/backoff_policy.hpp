#ifndef bta_detail_backoff_policy_hpp
#define bta_detail_backoff_policy_hpp
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

#include <bta/retry_options.hpp>

#include <chrono>
#include <functional>
#include <iosfwd>
#include <random>

namespace bta {
namespace detail {

/**
 * The result of consulting the backoff policy after a retryable failure.
 */
struct retry_decision {
  /// Try again after @a d.
  static retry_decision retry(std::chrono::milliseconds d) {
    return retry_decision{false, d};
  }
  /// Give up, there are no attempts (or no time) left.
  static retry_decision exhausted() {
    return retry_decision{true, std::chrono::milliseconds(0)};
  }

  bool is_exhausted;
  std::chrono::milliseconds delay;
};

/// Streaming operator, mostly for logging and test failures.
std::ostream& operator<<(std::ostream& os, retry_decision const& x);

/**
 * Compute the delay before the next attempt.
 *
 * The delay grows exponentially: initial_delay * multiplier^(attempts_made - 1), capped at max_delay.  Then the
 * jitter is applied, the result is in [base * (1 - f), base * (1 + f)] where f is the jitter fraction, and it is
 * clamped to [0, max_delay].
 *
 * This is a pure function, it keeps no state and is safe to call concurrently for independent calls.  The random
 * part is provided by the caller (see jitter_source) so it can be made deterministic in tests.
 *
 * @param attempts_made how many attempts have been made (and failed) so far, must be >= 1.
 * @param options the retry configuration.
 * @param now the current time, used to check the deadline.
 * @param jitter a sample in the [-1.0, 1.0] range, 0.0 disables jitter.
 * @returns retry_decision::exhausted() if there are no attempts left, if the delay would go past the deadline, or if
 *     retries are disabled.  Otherwise retry_decision::retry() with the delay.
 */
retry_decision compute_backoff(
    int attempts_made, retry_options const& options, std::chrono::system_clock::time_point now, double jitter);

/**
 * A source of jitter samples for a single call.
 *
 * Each call owns one of these, so calls never share a random number generator.  Tests replace it with a fixed
 * sequence.
 */
class jitter_source {
public:
  /// Create a source seeded from std::random_device.
  jitter_source();

  /// Create a source that returns whatever @a generator returns.
  explicit jitter_source(std::function<double()> generator)
      : generator_(std::move(generator)) {
  }

  /// A source that always returns 0.0, i.e., no jitter.
  static jitter_source none() {
    return jitter_source([]() { return 0.0; });
  }

  /// Return a sample in the [-1.0, 1.0] range.
  double operator()() {
    return generator_();
  }

private:
  std::function<double()> generator_;
};

} // namespace detail
} // namespace bta

#endif // bta_detail_backoff_policy_hpp
