#ifndef bta_log_hpp
#define bta_log_hpp
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
 * Define macros, types, and functions for logging in bta.
 */
#include <bta/detail/null_stream.hpp>
#include <bta/log_severity.hpp>
#include <bta/log_sink.hpp>

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

/// Concatenate two pre-processor tokens.
#define BTA_PP_CAT(a, b) a##b

/**
 * Create a unique, or mostly-likely unique identifier.
 *
 * BTA_LOG() needs an identifier for the logger, using the line number makes it unlikely to collide with any variable
 * the user may log in the same expression.
 */
#define BTA_LOGGER_IDENTIFIER BTA_PP_CAT(bta_log_, __LINE__)

/**
 * The main entry point for bta logging facilities.
 *
 * Typically this used only in tests, applications should use BTA_LOG().
 */
#define BTA_LOG_I(level, sink)                                                                                         \
  for (auto BTA_LOGGER_IDENTIFIER = bta::logger<bta::level_compile_time_disabled(bta::severity::level)>(               \
           bta::severity::level, __func__, __FILE__, __LINE__, sink);                                                  \
       (bool)BTA_LOGGER_IDENTIFIER; BTA_LOGGER_IDENTIFIER.write_to(sink))                                              \
  BTA_LOGGER_IDENTIFIER.get()

#ifndef BTA_LOG
#define BTA_LOG(level) BTA_LOG_I(level, bta::log::instance())
#endif // BTA_LOG

/**
 * The main namespace for the bta library.
 */
namespace bta {
/**
 * The logging framework core.
 *
 * The retry loop runs in completion queue threads, far away from any object the application could configure, so we
 * use a singleton as the default destination.  Tests create their own instances and use BTA_LOG_I().
 */
class log {
public:
  /// Normally use @c bta::log::instance(), this is useful in testing.
  log()
      : min_severity_(severity::LOWEST)
      , sinks_() {
  }

  /// Return the singleton instance
  static log& instance();

  /// Add a new sink to the core.
  void add_sink(std::shared_ptr<log_sink> sink);

  /// Remove all the current log sinks from the core.
  void clear_sinks();

  /// Write a new log message
  void write(severity sev, std::string&& msg);

  /// Set the minimum severity for the following messages, notice that each sink can implement its own filtering.
  void min_severity(severity sev) {
    std::lock_guard<std::mutex> guard(mu_);
    min_severity_ = sev;
  }

  /// Return the minimum severity for messages.
  severity min_severity() const {
    std::lock_guard<std::mutex> guard(mu_);
    return min_severity_;
  }

private:
  /// A mutex to protect access to the shared state
  mutable std::mutex mu_;
  /// The minimum run-time severity
  severity min_severity_;
  /// The list of sinks
  std::vector<std::shared_ptr<log_sink>> sinks_;

  /// The single instance used in the program ...
  static std::unique_ptr<log> singleton_;
};

/**
 * A compile-time disabled log message container.
 *
 * All streaming operations are no-op's, see @c detail::null_stream.
 *
 * @tparam disabled if true, use a compile-time-disabled logger, which does not log anything.
 */
template <bool disabled>
class logger {
public:
  logger(severity, char const*, char const*, int, log&) {
  }

  explicit operator bool() const {
    return false;
  }

  /// Get the bta::detail::null_stream to consume the iostream expression.
  detail::null_stream& get() {
    return os_;
  }

  void write_to(log&) {
  }

private:
  detail::null_stream os_;
};

/**
 * A simple log message container.
 *
 * This specialization formats the message into a std::ostringstream and then sends it to the configured sinks, if
 * any.
 */
template <>
class logger<false> {
public:
  logger(severity s, char const* func, char const* file, int lineno, log& sink);

  explicit operator bool() const {
    return not closed_;
  }

  /// Get the std::ostream where the message will be formatted.
  std::ostream& get() {
    return os_;
  }

  /// Save the message to the log sink
  void write_to(bta::log& sink);

private:
  std::ostringstream os_;
  severity sev_;
  std::string function_;
  std::string filename_;
  int lineno_;
  bool closed_;
};

/**
 * Determine if a given severity level is disabled at compile-time.
 *
 * @param lvl the severity level to check.
 * @returns true if @a lvl is disabled at compile-time.
 */
bool constexpr level_compile_time_disabled(severity lvl) {
  return lvl < bta::severity::BTA_MIN_SEVERITY;
}
} // namespace bta

#endif // bta_log_hpp
