#ifndef bta_log_severity_hpp
#define bta_log_severity_hpp
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
 * Define the log severity values and some macros associated with them.
 */

#include <iosfwd>
#include <string>

#ifndef BTA_MIN_SEVERITY
/**
 * All log messages below this level are disabled at compile time.
 *
 * The retry loop logs every attempt at debug level, which is too chatty for production.  Those messages are reduced
 * to no-op's that the optimizer can eliminate, unless the library is compiled with a lower BTA_MIN_SEVERITY.
 */
#define BTA_MIN_SEVERITY info
#endif // BTA_MIN_SEVERITY

namespace bta {
/**
 * Define the severity levels for bta logging.
 *
 * These are modelled after the severity level in syslog(1) and many derived tools.
 */
enum class severity {
  /// Entering and leaving functions, individual completion queue events.
  trace,
  /// Per-attempt details, such as submissions and stale callbacks.
  debug,
  /// Normal progress, including retryable failures that the library absorbs.
  info,
  /// Unusual, but expected conditions.
  notice,
  /// Calls that failed permanently or ran out of retries.
  warning,
  /// An error has been detected, such as a transport delivering two values for a unary call.
  error,
  /// The system is in a critical state, such as running out of local resources.
  critical,
  /// The system is at risk of immediate failure.
  alert,
  /// The system is about to crash or terminate.
  fatal,
  /// The highest possible severity level.
  HIGHEST = int(fatal),
  /// The lowest possible severity level.
  LOWEST = int(trace),
  /// The lowest level that is enabled at compile-time.
  LOWEST_ENABLED = int(BTA_MIN_SEVERITY),
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, severity x);

/**
 * Convert a severity name (as printed by operator<<) back to a severity.
 *
 * Applications typically read the desired logging level from a command-line flag or an environment variable.
 *
 * @throws std::invalid_argument if @a name is not a known severity.
 */
severity parse_severity(std::string const& name);

} // namespace bta

#endif // bta_log_severity_hpp
