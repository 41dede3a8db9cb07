#ifndef bta_detail_null_stream_hpp
#define bta_detail_null_stream_hpp
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

namespace bta {
namespace detail {
/**
 * Implements operator<< for all types, without any effect.
 *
 * The logging macros return an object of this class when the log-line is disabled at compile-time, so the per-attempt
 * trace and debug messages in the retry loop cost nothing in production builds.
 */
struct null_stream {
  /// Generic do-nothing streaming operator
  template <typename T>
  null_stream& operator<<(T const&) {
    return *this;
  }

  /// Do-nothing streaming operator for string literals.
  null_stream& operator<<(char const*) {
    return *this;
  }
};

} // namespace detail
} // namespace bta

#endif // bta_detail_null_stream_hpp
