#ifndef bta_detail_retrying_unary_call_hpp
#define bta_detail_retrying_unary_call_hpp
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

#include <bta/assert_throw.hpp>
#include <bta/detail/async_unary_op.hpp>
#include <bta/detail/attempt_context.hpp>
#include <bta/detail/backoff_policy.hpp>
#include <bta/detail/completion_handle.hpp>
#include <bta/detail/deadline_timer.hpp>
#include <bta/detail/grpc_errors.hpp>
#include <bta/detail/outcome_classifier.hpp>
#include <bta/log.hpp>
#include <bta/retry_options.hpp>
#include <bta/rpc_error.hpp>

#include <grpc++/generic/generic_stub.h>
#include <grpc++/grpc++.h>
#include <grpc++/impl/codegen/proto_utils.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace bta {
namespace detail {

/// The states of a retrying_unary_call.
enum class call_state {
  idle,
  attempt_in_flight,
  backoff_scheduled,
  succeeded,
  failed,
};

/// Streaming operator, mostly for logging and test failures.
std::ostream& operator<<(std::ostream& os, call_state x);

/**
 * Make one logical unary RPC, retrying it until it succeeds, fails permanently, or gives up.
 *
 * Each attempt is posted to the completion queue.  When an attempt completes its status is classified (see
 * bta::detail::outcome_classifier):
 *   - A success resolves the completion handle with the value.
 *   - A permanent failure resolves it with a bta::rpc_error of kind error_kind::permanent_failure.
 *   - A retryable failure consults the backoff policy, and either schedules a timer for the next attempt, or resolves
 *     the handle with error_kind::retries_exhausted and the status code of the last attempt.
 *   - An OK status without a value (or with more than one) resolves it with error_kind::internal_consistency.
 *
 * Only one attempt is live at a time.  Callbacks from older attempts (or arriving after the call is resolved) are
 * logged and discarded.  The call can be cancelled at any time through the completion handle, or with cancel(): the
 * handle is resolved with error_kind::cancelled, the pending timer is cancelled, and the RPC in flight is cancelled
 * (best effort).
 *
 * Objects of this class are always held by a std::shared_ptr, each pending operation holds a reference, so the call
 * lives until its last operation completes.  The state is guarded by a mutex, but no lock is held while posting
 * operations to the queue or resolving the handle.
 *
 * @tparam Request the protobuf request message.
 * @tparam Response the protobuf response message.
 * @tparam completion_queue_type the completion queue, typically bta::completion_queue<>.
 */
template <typename Request, typename Response, typename completion_queue_type>
class retrying_unary_call
    : public std::enable_shared_from_this<retrying_unary_call<Request, Response, completion_queue_type>> {
public:
  //@{
  /// @name type traits
  using request_type = Request;
  using response_type = Response;
  using clock = std::chrono::system_clock;
  using clock_function = std::function<clock::time_point()>;
  //@}

  /**
   * Create a new call, it is not started until start() is called.
   *
   * @param queue the completion queue where attempts and timers are posted.
   * @param stub the stub used to make the attempts, can be null if the queue does not use it (e.g. in tests).
   * @param method the full name of the RPC, e.g. "/google.bigtable.admin.v2.BigtableTableAdmin/GetTable".
   * @param request the request, sent unchanged in each attempt.
   * @param options how to retry the call.
   * @param metadata headers sent with each attempt.
   * @param jitter the source of randomness for the backoff delays.
   * @param now_function the function used to read the current time.
   */
  static std::shared_ptr<retrying_unary_call> create(
      std::shared_ptr<completion_queue_type> queue, std::shared_ptr<grpc::GenericStub> stub, std::string method,
      Request request, retry_options options, call_metadata metadata = call_metadata(),
      jitter_source jitter = jitter_source(), clock_function now_function = clock_function(&clock::now)) {
    return std::shared_ptr<retrying_unary_call>(new retrying_unary_call(
        std::move(queue), std::move(stub), std::move(method), std::move(request), std::move(options),
        std::move(metadata), std::move(jitter), std::move(now_function)));
  }

  /**
   * Start the first attempt.
   *
   * @returns the handle resolved when the call completes.
   * @throws std::logic_error if the call was already started.
   */
  completion_handle<Response> start() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      BTA_ASSERT_THROW(not started_);
      started_ = true;
    }
    std::weak_ptr<retrying_unary_call> w = this->shared_from_this();
    handle_.on_cancel([w]() {
      if (auto self = w.lock()) {
        self->on_cancelled();
      }
    });

    bool own_buffer = false;
    auto status = grpc::SerializationTraits<Request>::Serialize(request_, &payload_, &own_buffer);
    if (not status.ok()) {
      BTA_LOG(error) << method_ << " cannot serialize request: " << format_grpc_status(status);
      {
        std::lock_guard<std::mutex> lock(mu_);
        state_ = call_state::failed;
      }
      handle_.set_error(make_rpc_error(
          error_kind::permanent_failure, status.error_code(), "cannot serialize request for ", method_, ": ",
          status.error_message()));
      return handle_;
    }

    BTA_LOG(trace) << method_ << " request=" << print_to_stream(request_);

    attempt_context attempt;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (state_ != call_state::idle or handle_.is_resolved()) {
        // ... cancelled before the first attempt ...
        return handle_;
      }
      attempt = next_attempt();
    }
    post_attempt(std::move(attempt));
    return handle_;
  }

  /**
   * Record a value received by @a attempt.
   *
   * A unary call delivers exactly one value, a second value resolves the call with error_kind::internal_consistency
   * and cancels the attempt.
   */
  void on_message(int attempt, Response value) {
    std::shared_ptr<async_unary_op> op;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (is_stale(attempt)) {
        stale_callback(attempt, "on_message()");
        return;
      }
      if (++messages_received_ == 1) {
        value_.reset(new Response(std::move(value)));
        return;
      }
      state_ = call_state::failed;
      op = std::move(current_op_);
      current_op_.reset();
    }
    BTA_LOG(error) << method_ << " attempt=" << attempt << " received more than one value for a unary call";
    handle_.set_error(make_rpc_error(
        error_kind::internal_consistency, grpc::StatusCode::INTERNAL, "more than one value received for unary call ",
        method_));
    queue_->try_cancel(std::move(op));
  }

  /**
   * Handle the terminal status of @a attempt.
   *
   * @param attempt the attempt number.
   * @param status the status reported by the transport.
   * @param trailing_metadata the trailing metadata reported by the server, only used for logging.
   */
  void on_terminal(int attempt, grpc::Status const& status, call_metadata const& trailing_metadata) {
    std::unique_lock<std::mutex> lock(mu_);
    if (is_stale(attempt)) {
      stale_callback(attempt, "on_terminal()");
      return;
    }
    current_op_.reset();
    last_status_ = status;
    auto code = status.error_code();
    auto outcome = classifier_.classify(code, messages_received_);
    switch (outcome) {
    case call_outcome::success: {
      state_ = call_state::succeeded;
      std::unique_ptr<Response> value = std::move(value_);
      int attempts = attempts_made_;
      lock.unlock();
      BTA_LOG(debug) << method_ << " succeeded after " << attempts << " attempt(s)";
      if (not handle_.set_value(std::move(*value))) {
        // ... cancelled after the value arrived, the cancellation is the result ...
        std::lock_guard<std::mutex> guard(mu_);
        state_ = call_state::failed;
      }
      return;
    }
    case call_outcome::internal_consistency_failure: {
      state_ = call_state::failed;
      lock.unlock();
      BTA_LOG(error) << method_ << " attempt=" << attempt << " completed with OK status but no value";
      handle_.set_error(make_rpc_error(
          error_kind::internal_consistency, grpc::StatusCode::INTERNAL, "no value received for unary call ",
          method_));
      return;
    }
    case call_outcome::permanent_failure: {
      state_ = call_state::failed;
      lock.unlock();
      BTA_LOG(warning) << method_ << " attempt=" << attempt << " failed permanently: " << format_grpc_status(status)
                       << ", trailing_metadata.size=" << trailing_metadata.size();
      handle_.set_error(make_rpc_error(error_kind::permanent_failure, code, status.error_message()));
      return;
    }
    case call_outcome::retryable_failure:
      break;
    }

    auto decision = compute_backoff(attempts_made_, options_, clock_(), jitter_());
    if (decision.is_exhausted) {
      state_ = call_state::failed;
      int attempts = attempts_made_;
      lock.unlock();
      BTA_LOG(warning) << method_ << " giving up after " << attempts
                       << " attempt(s), last error: " << format_grpc_status(status);
      handle_.set_error(make_rpc_error(
          error_kind::retries_exhausted, code, "retries exhausted after ", attempts,
          " attempt(s), last error: ", status.error_message()));
      return;
    }
    state_ = call_state::backoff_scheduled;
    lock.unlock();
    BTA_LOG(info) << method_ << " attempt=" << attempt << " failed with " << format_grpc_status(status)
                  << ", retrying in " << decision.delay.count() << "ms";
    schedule_backoff(attempt, decision.delay);
  }

  /**
   * Cancel the call.
   *
   * Equivalent to cancelling the handle returned by start().
   *
   * @returns true if this call resolved the handle.
   */
  bool cancel() {
    return handle_.cancel();
  }

  call_state state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
  }

  int attempts_made() const {
    std::lock_guard<std::mutex> lock(mu_);
    return attempts_made_;
  }

  /// The status of the last completed attempt.
  grpc::Status last_status() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_status_;
  }

  std::string const& method() const {
    return method_;
  }

private:
  retrying_unary_call(
      std::shared_ptr<completion_queue_type> queue, std::shared_ptr<grpc::GenericStub> stub, std::string method,
      Request request, retry_options options, call_metadata metadata, jitter_source jitter,
      clock_function now_function)
      : queue_(std::move(queue))
      , stub_(std::move(stub))
      , method_(std::move(method))
      , request_(std::move(request))
      , options_(std::move(options))
      , classifier_(options_.retryable_codes())
      , metadata_(std::move(metadata))
      , jitter_(std::move(jitter))
      , clock_(std::move(now_function)) {
    if (not queue_) {
      throw std::invalid_argument("retrying_unary_call() - null completion queue");
    }
    if (not clock_) {
      throw std::invalid_argument("retrying_unary_call() - null clock function");
    }
  }

  /// Return true if a callback for @a attempt should be discarded, must be called with mu_ held.
  bool is_stale(int attempt) const {
    return attempt != current_attempt_ or state_ != call_state::attempt_in_flight or handle_.is_resolved();
  }

  void stale_callback(int attempt, char const* where) const {
    BTA_LOG(debug) << method_ << " discarding " << where << " for attempt=" << attempt
                   << ", current_attempt=" << current_attempt_ << ", state=" << state_;
  }

  /// Prepare the next attempt, must be called with mu_ held.
  attempt_context next_attempt() {
    ++attempts_made_;
    current_attempt_ = attempts_made_;
    messages_received_ = 0;
    value_.reset();
    state_ = call_state::attempt_in_flight;
    submitting_ = true;
    submitter_ = std::this_thread::get_id();

    attempt_context attempt;
    attempt.attempt_number = current_attempt_;
    attempt.submitted_at = clock_();
    attempt.deadline = attempt_deadline(options_, attempt.submitted_at);
    attempt.metadata = metadata_;
    return attempt;
  }

  /**
   * Post an attempt to the completion queue.
   *
   * The attempt was prepared by next_attempt(), which marks it as being submitted.  A concurrent cancellation waits
   * until the attempt is posted, and then cancels it.
   */
  void post_attempt(attempt_context attempt) {
    int const number = attempt.attempt_number;
    BTA_LOG(debug) << method_ << " submitting " << attempt;
    auto self = this->shared_from_this();
    std::string name = method_ + "/attempt=" + std::to_string(number);
    std::shared_ptr<async_unary_op> op;
    try {
      op = queue_->async_rpc(
          stub_.get(), method_, grpc::ByteBuffer(payload_), std::move(attempt), std::move(name),
          [self, number](async_unary_op const& op, bool ok) { self->on_attempt_completed(number, op, ok); });
    } catch (...) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        submitting_ = false;
      }
      submitted_.notify_all();
      throw;
    }

    bool cancel_now = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      submitting_ = false;
      if (current_attempt_ == number and state_ == call_state::attempt_in_flight and not handle_.is_resolved()) {
        current_op_ = op;
      } else {
        // ... the call was cancelled while the attempt was being posted ...
        cancel_now = handle_.is_cancelled() and current_attempt_ == number;
      }
    }
    submitted_.notify_all();
    if (cancel_now) {
      queue_->try_cancel(std::move(op));
    }
  }

  /// Translate the completion of an attempt into on_message() and on_terminal().
  void on_attempt_completed(int attempt, async_unary_op const& op, bool ok) {
    if (not ok) {
      on_terminal(
          attempt, grpc::Status(grpc::StatusCode::CANCELLED, "attempt cancelled by the completion queue"),
          call_metadata());
      return;
    }
    if (op.status.ok() and op.response.Valid()) {
      grpc::ByteBuffer buffer(op.response);
      Response response;
      auto status = grpc::SerializationTraits<Response>::Deserialize(&buffer, &response);
      if (not status.ok()) {
        on_terminal(
            attempt,
            grpc::Status(grpc::StatusCode::INTERNAL, "cannot parse response: " + status.error_message()),
            op.trailing_metadata());
        return;
      }
      on_message(attempt, std::move(response));
    }
    on_terminal(attempt, op.status, op.trailing_metadata());
  }

  /// Arm the timer for the next attempt.
  void schedule_backoff(int attempt, std::chrono::milliseconds delay) {
    auto self = this->shared_from_this();
    auto timer = queue_->make_relative_timer(
        delay, method_ + "/backoff=" + std::to_string(attempt),
        [self, attempt](deadline_timer const&, bool ok) { self->on_backoff_expired(attempt, ok); });

    bool cancel_now = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (state_ == call_state::backoff_scheduled and current_attempt_ == attempt) {
        timer_ = timer;
      } else {
        cancel_now = state_ == call_state::failed and handle_.is_cancelled();
      }
    }
    if (cancel_now) {
      timer->cancel();
    }
  }

  void on_backoff_expired(int attempt, bool ok) {
    attempt_context next;
    {
      std::unique_lock<std::mutex> lock(mu_);
      // ... the handle is resolved before the cancellation hook updates state_, check both ...
      if (state_ != call_state::backoff_scheduled or current_attempt_ != attempt or handle_.is_resolved()) {
        BTA_LOG(debug) << method_ << " discarding backoff timer for attempt=" << attempt << ", state=" << state_;
        return;
      }
      timer_.reset();
      if (not ok) {
        state_ = call_state::failed;
        lock.unlock();
        BTA_LOG(info) << method_ << " backoff timer cancelled after attempt=" << attempt;
        handle_.set_error(make_rpc_error(
            error_kind::cancelled, grpc::StatusCode::CANCELLED, "backoff timer cancelled for ", method_));
        return;
      }
      next = next_attempt();
    }
    post_attempt(std::move(next));
  }

  /// Called (once) when the handle is cancelled.
  void on_cancelled() {
    std::shared_ptr<async_unary_op> op;
    std::shared_ptr<deadline_timer> timer;
    call_state previous;
    {
      std::unique_lock<std::mutex> lock(mu_);
      if (submitter_ != std::this_thread::get_id()) {
        submitted_.wait(lock, [this]() { return not submitting_; });
      }
      previous = state_;
      if (state_ == call_state::succeeded or state_ == call_state::failed) {
        return;
      }
      state_ = call_state::failed;
      op = std::move(current_op_);
      current_op_.reset();
      timer = std::move(timer_);
      timer_.reset();
    }
    BTA_LOG(info) << method_ << " cancelled while " << previous;
    if (timer) {
      timer->cancel();
    }
    if (op) {
      queue_->try_cancel(std::move(op));
    }
  }

private:
  std::shared_ptr<completion_queue_type> queue_;
  std::shared_ptr<grpc::GenericStub> stub_;
  std::string const method_;
  Request const request_;
  retry_options const options_;
  outcome_classifier const classifier_;
  call_metadata const metadata_;
  grpc::ByteBuffer payload_;
  completion_handle<Response> handle_;

  mutable std::mutex mu_;
  jitter_source jitter_;
  clock_function clock_;
  bool started_ = false;
  std::condition_variable submitted_;
  bool submitting_ = false;
  std::thread::id submitter_;
  call_state state_ = call_state::idle;
  int attempts_made_ = 0;
  int current_attempt_ = 0;
  int messages_received_ = 0;
  std::unique_ptr<Response> value_;
  grpc::Status last_status_;
  std::shared_ptr<async_unary_op> current_op_;
  std::shared_ptr<deadline_timer> timer_;
};

} // namespace detail
} // namespace bta

#endif // bta_detail_retrying_unary_call_hpp
