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
#include "bta/detail/grpc_errors.hpp"

#include <google/protobuf/text_format.h>
#include <string>

namespace bta {
namespace detail {

std::ostream& operator<<(std::ostream& os, print_to_stream const& x) {
  // Print and ignore errors, on failure we just get an empty string ...
  google::protobuf::TextFormat::Printer printer;
  printer.SetSingleLineMode(true);
  std::string formatted;
  (void)printer.PrintToString(x.msg, &formatted);
  return os << formatted;
}

} // namespace detail
} // namespace bta
