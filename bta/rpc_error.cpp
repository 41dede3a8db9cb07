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
#include "bta/rpc_error.hpp"
#include <bta/status_code.hpp>

#include <iostream>

namespace {
std::string format_what(bta::error_kind kind, grpc::StatusCode code, std::string const& message) {
  std::ostringstream os;
  os << kind << " [" << bta::status_code_name(code) << "]: " << message;
  return os.str();
}
} // anonymous namespace

namespace bta {

std::ostream& operator<<(std::ostream& os, error_kind x) {
  switch (x) {
  case error_kind::permanent_failure:
    return os << "permanent_failure";
  case error_kind::retries_exhausted:
    return os << "retries_exhausted";
  case error_kind::internal_consistency:
    return os << "internal_consistency";
  case error_kind::cancelled:
    return os << "cancelled";
  }
  return os << "error_kind(" << int(x) << ")";
}

rpc_error::rpc_error(error_kind kind, grpc::StatusCode code, std::string const& message)
    : std::runtime_error(format_what(kind, code, message))
    , kind_(kind)
    , code_(code)
    , message_(message) {
}

} // namespace bta
