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
#include "bta/detail/attempt_context.hpp"

#include <algorithm>
#include <iostream>

namespace bta {
namespace detail {

attempt_context::clock::time_point attempt_deadline(
    retry_options const& options, attempt_context::clock::time_point now) {
  auto deadline = options.deadline();
  if (options.attempt_timeout().count() > 0) {
    deadline = std::min(deadline, now + options.attempt_timeout());
  }
  return deadline;
}

std::ostream& operator<<(std::ostream& os, attempt_context const& x) {
  os << "attempt=" << x.attempt_number;
  if (x.has_deadline()) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(x.deadline - x.submitted_at);
    os << ", deadline=+" << remaining.count() << "ms";
  }
  return os << ", metadata.size=" << x.metadata.size();
}

} // namespace detail
} // namespace bta
