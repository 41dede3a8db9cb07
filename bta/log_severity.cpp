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
#include "bta/log_severity.hpp"

#include <iostream>
#include <stdexcept>

namespace {
char const* const severity_names[] = {
    "trace", "debug", "info", "notice", "warning", "error", "critical", "alert", "fatal",
};
} // anonymous namespace

namespace bta {

std::ostream& operator<<(std::ostream& os, severity x) {
  return os << severity_names[int(x)];
}

severity parse_severity(std::string const& name) {
  for (int i = int(severity::LOWEST); i <= int(severity::HIGHEST); ++i) {
    if (name == severity_names[i]) {
      return severity(i);
    }
  }
  throw std::invalid_argument("parse_severity() - unknown severity name <" + name + ">");
}

} // namespace bta
