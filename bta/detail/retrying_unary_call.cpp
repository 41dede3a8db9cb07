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
#include "bta/detail/retrying_unary_call.hpp"

#include <iostream>

namespace bta {
namespace detail {

std::ostream& operator<<(std::ostream& os, call_state x) {
  switch (x) {
  case call_state::idle:
    return os << "idle";
  case call_state::attempt_in_flight:
    return os << "attempt_in_flight";
  case call_state::backoff_scheduled:
    return os << "backoff_scheduled";
  case call_state::succeeded:
    return os << "succeeded";
  case call_state::failed:
    return os << "failed";
  }
  return os << "call_state(" << int(x) << ")";
}

} // namespace detail
} // namespace bta
