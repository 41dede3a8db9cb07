#ifndef bta_detail_outcome_classifier_hpp
#define bta_detail_outcome_classifier_hpp
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

#include <iosfwd>
#include <set>

namespace bta {
namespace detail {

/// The classification of the terminal status of an attempt.
enum class call_outcome {
  success,
  retryable_failure,
  permanent_failure,
  /// A permanent failure caused by the transport breaking the unary contract, e.g., OK without a value.
  internal_consistency_failure,
};

/// Streaming operator, mostly for logging and test failures.
std::ostream& operator<<(std::ostream& os, call_outcome x);

/**
 * Decide what to do with the terminal status of an attempt.
 *
 * The retryable codes are an explicit allow-list, every other error code is permanent.  The classifier is immutable
 * after construction and can be shared between threads.
 */
class outcome_classifier {
public:
  explicit outcome_classifier(std::set<grpc::StatusCode> retryable)
      : retryable_(std::move(retryable)) {
  }

  /// Classify a status code by itself.
  call_outcome classify(grpc::StatusCode code) const;

  /**
   * Classify a status code for a unary call, considering how many values the attempt delivered.
   *
   * An OK status is only a success if exactly one value was received.
   */
  call_outcome classify(grpc::StatusCode code, int messages_received) const;

  std::set<grpc::StatusCode> const& retryable_codes() const {
    return retryable_;
  }

private:
  std::set<grpc::StatusCode> retryable_;
};

} // namespace detail
} // namespace bta

#endif // bta_detail_outcome_classifier_hpp
