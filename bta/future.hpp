#ifndef bta_future_hpp
#define bta_future_hpp
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
 * The asynchronous result types returned to the application.
 */

#include <bta/rpc_error.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>

namespace bta {
template <typename T>
class future;
template <typename T>
class promise;

namespace detail {
/**
 * The state shared by a bta::promise<T> and its bta::future<T>.
 *
 * Holds a value or an exception, at most one continuation, and the callback used to propagate cancellation to
 * whatever produces the value.
 */
template <typename T>
class future_shared_state {
public:
  explicit future_shared_state(std::function<void()> cancel_callback)
      : cancel_callback_(std::move(cancel_callback)) {
  }

  bool set_value(T&& value) {
    std::unique_lock<std::mutex> lock(mu_);
    if (ready_) {
      return false;
    }
    value_.reset(new T(std::move(value)));
    mark_ready(std::move(lock));
    return true;
  }

  bool set_exception(std::exception_ptr ex) {
    std::unique_lock<std::mutex> lock(mu_);
    if (ready_) {
      return false;
    }
    exception_ = std::move(ex);
    mark_ready(std::move(lock));
    return true;
  }

  bool cancel() {
    std::unique_lock<std::mutex> lock(mu_);
    if (ready_) {
      return false;
    }
    exception_ = make_rpc_error(error_kind::cancelled, grpc::StatusCode::CANCELLED, "future cancelled");
    auto callback = std::move(cancel_callback_);
    mark_ready(std::move(lock));
    if (callback) {
      callback();
    }
    return true;
  }

  void set_continuation(std::function<void()> continuation) {
    std::unique_lock<std::mutex> lock(mu_);
    if (continuation_) {
      throw std::future_error(std::future_errc::future_already_retrieved);
    }
    if (not ready_) {
      continuation_ = std::move(continuation);
      return;
    }
    lock.unlock();
    continuation();
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this]() { return ready_; });
  }

  template <typename Rep, typename Period>
  std::future_status wait_for(std::chrono::duration<Rep, Period> const& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (cv_.wait_for(lock, timeout, [this]() { return ready_; })) {
      return std::future_status::ready;
    }
    return std::future_status::timeout;
  }

  bool is_ready() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ready_;
  }

  /// Block until ready, then return the value or raise the exception.
  T get() {
    wait();
    std::lock_guard<std::mutex> lock(mu_);
    if (exception_) {
      std::rethrow_exception(exception_);
    }
    return std::move(*value_);
  }

  /// Return the exception stored in the state, null if there is a value, only valid once ready.
  std::exception_ptr exception() const {
    std::lock_guard<std::mutex> lock(mu_);
    return exception_;
  }

  bool retrieved = false;

private:
  void mark_ready(std::unique_lock<std::mutex> lock) {
    ready_ = true;
    cancel_callback_ = nullptr;
    auto continuation = std::move(continuation_);
    continuation_ = nullptr;
    lock.unlock();
    cv_.notify_all();
    if (continuation) {
      continuation();
    }
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool ready_ = false;
  std::unique_ptr<T> value_;
  std::exception_ptr exception_;
  std::function<void()> continuation_;
  std::function<void()> cancel_callback_;
};
} // namespace detail

/**
 * A one-shot asynchronous result, returned by the public asynchronous APIs.
 *
 * Similar to std::future<T>, with two additions: a continuation can be attached using then(), and the operation can
 * be cancelled.  Like std::future<T> it is move-only, and get() or then() consume it.
 *
 * @tparam T the type of the value.
 */
template <typename T>
class future {
public:
  future() = default;
  future(future&&) = default;
  future& operator=(future&&) = default;
  future(future const&) = delete;
  future& operator=(future const&) = delete;

  bool valid() const {
    return (bool)state_;
  }

  /// Block until the result is available, return the value or raise the exception.
  T get() {
    check_valid();
    auto s = std::move(state_);
    return s->get();
  }

  void wait() const {
    check_valid();
    state_->wait();
  }

  template <typename Rep, typename Period>
  std::future_status wait_for(std::chrono::duration<Rep, Period> const& timeout) const {
    check_valid();
    return state_->wait_for(timeout);
  }

  bool is_ready() const {
    check_valid();
    return state_->is_ready();
  }

  /**
   * Cancel the operation producing the value.
   *
   * If the future is not ready it becomes ready with a bta::rpc_error of kind error_kind::cancelled, and the
   * cancellation is propagated to the producer.
   *
   * @returns true if the cancellation took effect, false if the future was already satisfied.
   */
  bool cancel() {
    check_valid();
    return state_->cancel();
  }

  /**
   * Attach a continuation, called with a ready future<T> when this future is satisfied.
   *
   * The continuation runs in the thread that satisfies the future, or immediately if it is already satisfied.
   * Exceptions raised by the continuation are captured in the returned future.  Cancelling the returned future
   * cancels this one.
   *
   * @returns a future<R> where R is the type returned by @a f.
   */
  template <typename F>
  future<typename std::result_of<F(future<T>)>::type> then(F&& f) {
    using R = typename std::result_of<F(future<T>)>::type;
    static_assert(not std::is_void<R>::value, "bta::future<T>::then() continuations must return a value");
    check_valid();
    auto source = std::move(state_);
    auto derived = std::make_shared<detail::future_shared_state<R>>([source]() { source->cancel(); });
    std::weak_ptr<detail::future_shared_state<T>> weak = source;
    source->set_continuation([weak, derived, functor = std::forward<F>(f)]() mutable {
      auto s = weak.lock();
      if (not s) {
        return;
      }
      try {
        derived->set_value(functor(future<T>(std::move(s))));
      } catch (...) {
        derived->set_exception(std::current_exception());
      }
    });
    return future<R>(std::move(derived));
  }

private:
  template <typename U>
  friend class future;
  friend class promise<T>;

  explicit future(std::shared_ptr<detail::future_shared_state<T>> state)
      : state_(std::move(state)) {
  }

  void check_valid() const {
    if (not state_) {
      throw std::future_error(std::future_errc::no_state);
    }
  }

private:
  std::shared_ptr<detail::future_shared_state<T>> state_;
};

/**
 * The producer side of a bta::future<T>.
 *
 * Setting the value (or exception) more than once has no effect, the functions return false instead.
 */
template <typename T>
class promise {
public:
  promise()
      : promise(std::function<void()>()) {
  }

  /// Create a promise, @a cancel_callback is called if the future is cancelled before the promise is satisfied.
  explicit promise(std::function<void()> cancel_callback)
      : state_(std::make_shared<detail::future_shared_state<T>>(std::move(cancel_callback))) {
  }

  /// Return the future associated with this promise, can only be called once.
  future<T> get_future() {
    if (state_->retrieved) {
      throw std::future_error(std::future_errc::future_already_retrieved);
    }
    state_->retrieved = true;
    return future<T>(state_);
  }

  bool set_value(T value) {
    return state_->set_value(std::move(value));
  }

  bool set_exception(std::exception_ptr ex) {
    return state_->set_exception(std::move(ex));
  }

  bool is_ready() const {
    return state_->is_ready();
  }

private:
  std::shared_ptr<detail::future_shared_state<T>> state_;
};

/// Create a future that is already satisfied with @a value.
template <typename T>
future<typename std::decay<T>::type> make_ready_future(T&& value) {
  promise<typename std::decay<T>::type> p;
  p.set_value(std::forward<T>(value));
  return p.get_future();
}

} // namespace bta

#endif // bta_future_hpp
