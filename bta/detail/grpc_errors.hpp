/**
 * @file
 *
 * Helper functions to handle errors reported by gRPC++
 */
#ifndef bta_detail_grpc_errors_hpp
#define bta_detail_grpc_errors_hpp
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

#include <bta/detail/append_annotations.hpp>
#include <bta/status_code.hpp>

#include <google/protobuf/message.h>
#include <grpc++/grpc++.h>
#include <sstream>

namespace bta {
namespace detail {

/**
 * Format a gRPC status into a human readable string.
 *
 * @param status the status to format
 * @param a a list of additional annotations to append (using operator<<) after the status.
 */
template <typename... Annotations>
std::string format_grpc_status(grpc::Status const& status, Annotations&&... a) {
  std::ostringstream os;
  os << status_code_name(status.error_code()) << ": " << status.error_message();
  append_annotations(os, std::forward<Annotations>(a)...);
  return os.str();
}

/**
 * Print a protobuf on a std::ostream.
 *
 * Uses google::protobuf::TextFormat to print the message in a single line, which is friendlier to log files:
 *
 * @code
 * bta::admin::CreateTableRequest const& request = ...;
 * BTA_LOG(debug) << "sending " << print_to_stream(request);
 * @endcode
 */
struct print_to_stream {
  explicit print_to_stream(google::protobuf::Message const& m)
      : msg(m) {
  }

  google::protobuf::Message const& msg;
};

/// Streaming operator
std::ostream& operator<<(std::ostream& os, print_to_stream const& x);

} // namespace detail
} // namespace bta

#endif // bta_detail_grpc_errors_hpp
