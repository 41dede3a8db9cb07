#ifndef bta_detail_append_annotations_hpp
#define bta_detail_append_annotations_hpp
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

#include <utility>

namespace bta {
namespace detail {

/**
 * Append an (empty) list of annotations to a stream.
 *
 * @tparam Stream the type of the stream, typically std::ostream.
 */
template <typename Stream>
inline void append_annotations(Stream&) {
}

/**
 * Append a list of annotations to a stream.
 *
 * Used to build error messages (and log lines) from a variable number of values of mixed types, for example the
 * request name, the attempt number, and a protobuf wrapped in print_to_stream.
 *
 * @tparam Stream the type of the stream, typically std::ostream.
 * @tparam H the type of the first annotation in the list.
 * @tparam Tail the type of the remaining annotations in the list.
 */
template <typename Stream, typename H, typename... Tail>
inline void append_annotations(Stream& os, H&& h, Tail&&... t) {
  os << std::forward<H>(h);
  append_annotations(os, std::forward<Tail>(t)...);
}

} // namespace detail
} // namespace bta

#endif // bta_detail_append_annotations_hpp
