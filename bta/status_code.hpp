#ifndef bta_status_code_hpp
#define bta_status_code_hpp
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
/**
 * @file
 *
 * Convert between grpc::StatusCode values and their canonical names.
 */

#include <grpc++/grpc++.h>

#include <set>
#include <string>

namespace bta {

/// Return the canonical name of @a code, e.g. "UNAVAILABLE", or "UNKNOWN_STATUS_CODE(<n>)" for unknown values.
std::string status_code_name(grpc::StatusCode code);

/**
 * Parse a canonical status code name.
 *
 * Matching is case insensitive, so "unavailable" and "UNAVAILABLE" are both accepted.
 *
 * @throws std::invalid_argument if @a name is not a canonical status code name.
 */
grpc::StatusCode parse_status_code(std::string const& name);

/**
 * Parse a comma separated list of status code names.
 *
 * This is how the set of retryable codes is configured from data, e.g. "UNAVAILABLE, ABORTED".  Whitespace around
 * the names is ignored, empty elements are an error.
 *
 * @throws std::invalid_argument if any of the elements is not a canonical status code name.
 */
std::set<grpc::StatusCode> parse_status_code_list(std::string const& list);

} // namespace bta

#endif // bta_status_code_hpp
