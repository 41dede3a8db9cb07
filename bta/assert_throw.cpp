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
#include "bta/assert_throw.hpp"
#include <bta/log.hpp>

#include <sstream>
#include <stdexcept>

namespace bta {

[[noreturn]] void assert_throw_impl(char const* what, char const* function, char const* filename, int lineno) {
  std::ostringstream os;
  os << "assertion failure (" << what << ") was not true in " << function << "@ (" << filename << ":" << lineno << ")";
  BTA_LOG(error) << os.str();
  throw std::logic_error(os.str());
}

} // namespace bta
