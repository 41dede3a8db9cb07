#ifndef bta_retry_options_hpp
#define bta_retry_options_hpp
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

#include <grpc++/grpc++.h>

#include <chrono>
#include <map>
#include <set>
#include <string>

namespace bta {

/// Headers sent with every attempt of a call.
using call_metadata = std::multimap<std::string, std::string>;

/**
 * Define how a call is retried.
 *
 * An immutable value, captured by each call when it is created.  The constructors validate all the parameters, and
 * the with_*() member functions return modified copies, also validated, so an invalid configuration is detected when
 * it is created and not when a call fails for the first time:
 *
 * @code
 * using namespace std::chrono_literals;
 * auto options = bta::retry_options(100ms, 1s, 2.0, 5)
 *     .with_retryable_codes(bta::parse_status_code_list("UNAVAILABLE"))
 *     .with_jitter_fraction(0.1);
 * @endcode
 */
class retry_options {
public:
  //@{
  /// @name type traits
  using clock = std::chrono::system_clock;
  using duration_type = std::chrono::milliseconds;
  //@}

  //@{
  /// @name default values
  static duration_type constexpr default_initial_delay{5};
  static duration_type constexpr default_max_delay{60000};
  static constexpr double default_multiplier = 2.0;
  static constexpr int default_max_attempts = 10;
  static constexpr double default_jitter_fraction = 0.2;
  //@}

  /// The status codes retried unless the application says otherwise.
  static std::set<grpc::StatusCode> default_retryable_codes();

  /// Create the default options.
  retry_options();

  /**
   * Create options with the given exponential backoff parameters.
   *
   * @param initial_delay the delay after the first failure.
   * @param max_delay the maximum delay between two attempts.
   * @param multiplier how much the delay grows after each failure, must be >= 1.0.
   * @param max_attempts the maximum number of attempts, including the first one.
   * @throws std::invalid_argument if the parameters are inconsistent.
   */
  template <typename initial_duration_type, typename max_duration_type>
  retry_options(
      initial_duration_type initial_delay, max_duration_type max_delay, double multiplier, int max_attempts)
      : retry_options() {
    initial_delay_ = std::chrono::duration_cast<duration_type>(initial_delay);
    max_delay_ = std::chrono::duration_cast<duration_type>(max_delay);
    multiplier_ = multiplier;
    max_attempts_ = max_attempts;
    validate_arguments();
  }

  duration_type initial_delay() const {
    return initial_delay_;
  }
  duration_type max_delay() const {
    return max_delay_;
  }
  double multiplier() const {
    return multiplier_;
  }
  int max_attempts() const {
    return max_attempts_;
  }
  double jitter_fraction() const {
    return jitter_fraction_;
  }
  std::set<grpc::StatusCode> const& retryable_codes() const {
    return retryable_codes_;
  }
  bool retries_enabled() const {
    return retries_enabled_;
  }

  /// The absolute deadline for the call, clock::time_point::max() if there is none.
  clock::time_point deadline() const {
    return deadline_;
  }
  bool has_deadline() const {
    return deadline_ != clock::time_point::max();
  }

  /// The timeout for each attempt, zero if there is none.
  duration_type attempt_timeout() const {
    return attempt_timeout_;
  }

  //@{
  /// @name modified copies
  retry_options with_deadline(clock::time_point deadline) const;
  retry_options with_jitter_fraction(double fraction) const;
  retry_options with_retryable_codes(std::set<grpc::StatusCode> codes) const;
  retry_options with_max_attempts(int max_attempts) const;
  retry_options with_retries_enabled(bool enabled) const;

  template <typename Rep, typename Period>
  retry_options with_attempt_timeout(std::chrono::duration<Rep, Period> timeout) const {
    retry_options tmp(*this);
    tmp.attempt_timeout_ = std::chrono::duration_cast<duration_type>(timeout);
    tmp.validate_arguments();
    return tmp;
  }
  //@}

private:
  void validate_arguments() const;

private:
  duration_type initial_delay_;
  duration_type max_delay_;
  double multiplier_;
  int max_attempts_;
  clock::time_point deadline_;
  double jitter_fraction_;
  std::set<grpc::StatusCode> retryable_codes_;
  duration_type attempt_timeout_;
  bool retries_enabled_;
};

} // namespace bta

#endif // bta_retry_options_hpp
