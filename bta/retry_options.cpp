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
#include "bta/retry_options.hpp"

#include <sstream>
#include <stdexcept>

namespace bta {

retry_options::duration_type constexpr retry_options::default_initial_delay;
retry_options::duration_type constexpr retry_options::default_max_delay;
constexpr double retry_options::default_multiplier;
constexpr int retry_options::default_max_attempts;
constexpr double retry_options::default_jitter_fraction;

std::set<grpc::StatusCode> retry_options::default_retryable_codes() {
  return {
      grpc::StatusCode::UNAVAILABLE,
      grpc::StatusCode::DEADLINE_EXCEEDED,
      grpc::StatusCode::RESOURCE_EXHAUSTED,
      grpc::StatusCode::ABORTED,
  };
}

retry_options::retry_options()
    : initial_delay_(default_initial_delay)
    , max_delay_(default_max_delay)
    , multiplier_(default_multiplier)
    , max_attempts_(default_max_attempts)
    , deadline_(clock::time_point::max())
    , jitter_fraction_(default_jitter_fraction)
    , retryable_codes_(default_retryable_codes())
    , attempt_timeout_(0)
    , retries_enabled_(true) {
}

retry_options retry_options::with_deadline(clock::time_point deadline) const {
  retry_options tmp(*this);
  tmp.deadline_ = deadline;
  return tmp;
}

retry_options retry_options::with_jitter_fraction(double fraction) const {
  retry_options tmp(*this);
  tmp.jitter_fraction_ = fraction;
  tmp.validate_arguments();
  return tmp;
}

retry_options retry_options::with_retryable_codes(std::set<grpc::StatusCode> codes) const {
  retry_options tmp(*this);
  tmp.retryable_codes_ = std::move(codes);
  tmp.validate_arguments();
  return tmp;
}

retry_options retry_options::with_max_attempts(int max_attempts) const {
  retry_options tmp(*this);
  tmp.max_attempts_ = max_attempts;
  tmp.validate_arguments();
  return tmp;
}

retry_options retry_options::with_retries_enabled(bool enabled) const {
  retry_options tmp(*this);
  tmp.retries_enabled_ = enabled;
  return tmp;
}

void retry_options::validate_arguments() const {
  std::ostringstream os;
  if (initial_delay_.count() < 0) {
    os << "retry_options() - initial_delay (" << initial_delay_.count() << "ms) should be >= 0";
  } else if (initial_delay_ > max_delay_) {
    os << "retry_options() - initial_delay (" << initial_delay_.count() << "ms) should be <= max_delay ("
       << max_delay_.count() << "ms)";
  } else if (not(multiplier_ >= 1.0)) {
    os << "retry_options() - multiplier (" << multiplier_ << ") should be >= 1.0";
  } else if (max_attempts_ <= 0) {
    os << "retry_options() - max_attempts (" << max_attempts_ << ") should be > 0";
  } else if (not(jitter_fraction_ >= 0.0 and jitter_fraction_ <= 1.0)) {
    os << "retry_options() - jitter_fraction (" << jitter_fraction_ << ") should be in the [0.0, 1.0] range";
  } else if (retryable_codes_.count(grpc::StatusCode::OK) != 0) {
    os << "retry_options() - retryable_codes should not contain OK";
  } else if (attempt_timeout_.count() < 0) {
    os << "retry_options() - attempt_timeout (" << attempt_timeout_.count() << "ms) should be >= 0";
  } else {
    return;
  }
  throw std::invalid_argument(os.str());
}

} // namespace bta
