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

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace bta {
namespace detail {

std::ostream& operator<<(std::ostream& os, retry_decision const& x) {
  if (x.is_exhausted) {
    return os << "exhausted";
  }
  return os << "retry(" << x.delay.count() << "ms)";
}

retry_decision compute_backoff(
    int attempts_made, retry_options const& options, std::chrono::system_clock::time_point now, double jitter) {
  if (attempts_made <= 0) {
    std::ostringstream os;
    os << "compute_backoff() - attempts_made (" << attempts_made << ") should be > 0";
    throw std::invalid_argument(os.str());
  }
  if (not options.retries_enabled() or attempts_made >= options.max_attempts()) {
    return retry_decision::exhausted();
  }

  // ... compute in floating point, the exponent can get large enough to overflow any integer type, but the cap makes
  // the final value small ...
  double const max_delay = double(options.max_delay().count());
  double base = double(options.initial_delay().count()) * std::pow(options.multiplier(), attempts_made - 1);
  base = std::min(base, max_delay);

  double const sample = std::max(-1.0, std::min(1.0, jitter));
  double delay = base * (1.0 + sample * options.jitter_fraction());
  delay = std::max(0.0, std::min(delay, max_delay));

  auto d = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::llround(delay)));
  if (options.has_deadline() and options.deadline() - now < d) {
    return retry_decision::exhausted();
  }
  return retry_decision::retry(d);
}

jitter_source::jitter_source() {
  // ... std::mt19937_64 is not thread safe, but each jitter_source is used by a single call, whose state is
  // serialized by its own mutex ...
  auto generator = std::make_shared<std::mt19937_64>(std::random_device()());
  generator_ = [generator]() {
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    return dist(*generator);
  };
}

} // namespace detail
} // namespace bta
