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
#include "bta/log_sink.hpp"

#include <iostream>
#include <mutex>

namespace bta {

std::shared_ptr<log_sink> make_stderr_log_sink() {
  // ... the completion queue thread and the application threads may log at the same time, serialize the writes so
  // the lines do not get mixed ...
  auto mu = std::make_shared<std::mutex>();
  return make_log_sink([mu](severity, std::string&& msg) {
    std::lock_guard<std::mutex> lock(*mu);
    std::clog << msg << std::endl;
  });
}

} // namespace bta
