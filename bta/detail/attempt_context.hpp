#ifndef bta_detail_attempt_context_hpp
#define bta_detail_attempt_context_hpp
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
#include <iosfwd>

namespace bta {
namespace detail {

/**
 * Describe one attempt of a retrying call.
 *
 * Attempts are numbered starting at 1.  The number identifies the attempt in the callbacks, so results from an
 * attempt that is no longer current can be recognized and discarded.
 */
struct attempt_context {
  using clock = std::chrono::system_clock;

  int attempt_number = 0;
  clock::time_point submitted_at;
  /// time_point::max() if the attempt has no deadline.
  clock::time_point deadline = clock::time_point::max();
  call_metadata metadata;

  bool has_deadline() const {
    return deadline != clock::time_point::max();
  }
};

/**
 * Compute the deadline for an attempt submitted at @a now.
 *
 * The earliest of the per-attempt timeout and the overall deadline in @a options, time_point::max() if neither is
 * set.
 */
attempt_context::clock::time_point attempt_deadline(
    retry_options const& options, attempt_context::clock::time_point now);

/// Streaming operator, for logging.
std::ostream& operator<<(std::ostream& os, attempt_context const& x);

} // namespace detail
} // namespace bta

#endif // bta_detail_attempt_context_hpp
