#ifndef bta_rpc_error_hpp
#define bta_rpc_error_hpp
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

#include <grpc++/grpc++.h>

#include <exception>
#include <iosfwd>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace bta {

/**
 * Classify the failures that a retrying call reports to the application.
 *
 * Retryable failures never appear here, the call absorbs them until it succeeds or gives up.
 */
enum class error_kind {
  /// The server (or the transport) rejected the request with a status that is not retryable.
  permanent_failure,
  /// All the retryable failures were absorbed, but the call ran out of attempts or time.
  retries_exhausted,
  /// The transport broke the unary contract: OK without a value, or more than one value.
  internal_consistency,
  /// The application cancelled the call.
  cancelled,
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, error_kind x);

/**
 * The exception type used to report failed calls.
 *
 * It carries the classification of the failure and the gRPC status code of the last attempt, so applications can
 * tell a call that "gave up" (error_kind::retries_exhausted) from one that was "rejected"
 * (error_kind::permanent_failure).
 */
class rpc_error : public std::runtime_error {
public:
  rpc_error(error_kind kind, grpc::StatusCode code, std::string const& message);

  error_kind kind() const {
    return kind_;
  }

  grpc::StatusCode status_code() const {
    return code_;
  }

  /// The message without the kind and code prefix included in what().
  std::string const& message() const {
    return message_;
  }

private:
  error_kind kind_;
  grpc::StatusCode code_;
  std::string message_;
};

/**
 * Create a std::exception_ptr holding a bta::rpc_error.
 *
 * @param a a list of annotations streamed (using operator<<) to form the message.
 */
template <typename... Annotations>
std::exception_ptr make_rpc_error(error_kind kind, grpc::StatusCode code, Annotations&&... a) {
  std::ostringstream os;
  detail::append_annotations(os, std::forward<Annotations>(a)...);
  return std::make_exception_ptr(rpc_error(kind, code, os.str()));
}

/**
 * The outcome of a call: either a value or an error.
 *
 * Errors are held as std::exception_ptr so any exception can travel through the asynchronous machinery unchanged.
 * When the exception is a bta::rpc_error its kind and status code are also available without rethrowing.
 *
 * @tparam T the type of the value.
 */
template <typename T>
class operation_result {
public:
  using value_type = T;

  static operation_result success(T value) {
    operation_result r;
    r.value_.reset(new T(std::move(value)));
    return r;
  }

  static operation_result failure(std::exception_ptr error) {
    if (not error) {
      throw std::invalid_argument("operation_result::failure() - null exception");
    }
    operation_result r;
    r.error_ = std::move(error);
    try {
      std::rethrow_exception(r.error_);
    } catch (rpc_error const& ex) {
      r.kind_ = ex.kind();
      r.code_ = ex.status_code();
    } catch (...) {
      // ... any other exception is kept as-is in error_, it just does not have a finer classification ...
      r.kind_ = error_kind::permanent_failure;
      r.code_ = grpc::StatusCode::UNKNOWN;
    }
    return r;
  }

  operation_result(operation_result&&) = default;
  operation_result& operator=(operation_result&&) = default;

  bool ok() const {
    return (bool)value_;
  }

  /// Return the value, or rethrow the error if there is no value.
  T const& value() const {
    if (not value_) {
      std::rethrow_exception(error_);
    }
    return *value_;
  }

  std::exception_ptr error() const {
    return error_;
  }

  /// The classification of the error, only meaningful if ok() is false.
  error_kind kind() const {
    return kind_;
  }

  /// The gRPC status code, OK for successful results.
  grpc::StatusCode status_code() const {
    return code_;
  }

private:
  operation_result()
      : value_()
      , error_()
      , kind_(error_kind::permanent_failure)
      , code_(grpc::StatusCode::OK) {
  }

private:
  std::unique_ptr<T> value_;
  std::exception_ptr error_;
  error_kind kind_;
  grpc::StatusCode code_;
};

} // namespace bta

#endif // bta_rpc_error_hpp
