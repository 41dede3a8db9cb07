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
#include "bta/detail/outcome_classifier.hpp"

#include <iostream>

namespace bta {
namespace detail {

std::ostream& operator<<(std::ostream& os, call_outcome x) {
  switch (x) {
  case call_outcome::success:
    return os << "success";
  case call_outcome::retryable_failure:
    return os << "retryable_failure";
  case call_outcome::permanent_failure:
    return os << "permanent_failure";
  case call_outcome::internal_consistency_failure:
    return os << "internal_consistency_failure";
  }
  return os << "call_outcome(" << int(x) << ")";
}

call_outcome outcome_classifier::classify(grpc::StatusCode code) const {
  if (code == grpc::StatusCode::OK) {
    return call_outcome::success;
  }
  if (retryable_.count(code) != 0) {
    return call_outcome::retryable_failure;
  }
  return call_outcome::permanent_failure;
}

call_outcome outcome_classifier::classify(grpc::StatusCode code, int messages_received) const {
  auto outcome = classify(code);
  if (outcome == call_outcome::success and messages_received != 1) {
    return call_outcome::internal_consistency_failure;
  }
  return outcome;
}

} // namespace detail
} // namespace bta
