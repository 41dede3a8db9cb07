#ifndef bta_detail_completion_handle_hpp
#define bta_detail_completion_handle_hpp
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

#include <bta/log.hpp>
#include <bta/rpc_error.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace bta {
namespace detail {

/**
 * A write-once container for the result of an asynchronous operation.
 *
 * This is the asynchronous result type used inside the library.  The producer (typically a retrying_unary_call)
 * resolves it exactly once, with a value or an error.  Any further attempt to resolve it returns false and leaves
 * the result untouched.  Copies of a handle refer to the same result, and any number of listeners can be attached
 * to them, before or after the resolution, each listener is called exactly once.
 *
 * Listeners run inline, in the thread that resolves the handle (or in the thread that attaches them if the handle
 * is already resolved).  Listeners that need to do heavy work should hop to their own thread.
 *
 * Any reader can cancel the handle.  That resolves it with a bta::rpc_error of kind error_kind::cancelled, and if
 * (and only if) that resolution wins, it calls the cancellation hook installed by the producer.  The hook runs before
 * any listener, so the producer has stopped by the time the listeners observe the cancellation.
 *
 * Listeners should not throw, exceptions escaping a listener are logged and discarded.
 *
 * @tparam T the type of the value.
 */
template <typename T>
class completion_handle {
public:
  //@{
  /// @name type traits
  using value_type = T;
  using result_type = operation_result<T>;
  using listener_type = std::function<void(result_type const&)>;
  //@}

  completion_handle()
      : state_(std::make_shared<state>()) {
  }

  /// Resolve with a value, returns false if the handle was already resolved.
  bool set_value(T value) {
    return resolve(result_type::success(std::move(value)));
  }

  /// Resolve with an error, returns false if the handle was already resolved.
  bool set_error(std::exception_ptr error) {
    return resolve(result_type::failure(std::move(error)));
  }

  /**
   * Cancel the operation.
   *
   * Calling this more than once (or after the handle is resolved) has no effect.
   *
   * @returns true if this call resolved the handle.
   */
  bool cancel() {
    auto error = make_rpc_error(error_kind::cancelled, grpc::StatusCode::CANCELLED, "operation cancelled");
    return resolve(result_type::failure(std::move(error)), true);
  }

  /**
   * Install the function called when the handle is cancelled.
   *
   * Only the producer should call this.  If the handle is already cancelled the hook is called immediately, if it is
   * resolved in any other way the hook is discarded.
   */
  void on_cancel(std::function<void()> hook) {
    std::unique_lock<std::mutex> lock(state_->mu);
    if (not state_->result) {
      state_->cancel_hook = std::move(hook);
      return;
    }
    bool cancelled = state_->cancelled;
    lock.unlock();
    if (cancelled) {
      run_hook(hook);
    }
  }

  /// Call @a listener when the handle is resolved, or immediately if it is already resolved.
  void add_listener(listener_type listener) {
    std::unique_lock<std::mutex> lock(state_->mu);
    if (not state_->result) {
      state_->listeners.push_back(std::move(listener));
      return;
    }
    // ... the result never changes once set, it is safe to read it without the lock ...
    lock.unlock();
    invoke(listener, *state_->result);
  }

  bool is_resolved() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return (bool)state_->result;
  }

  bool is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->cancelled;
  }

  /// Block until the handle is resolved, and return the result.
  result_type const& wait() const {
    std::unique_lock<std::mutex> lock(state_->mu);
    state_->cv.wait(lock, [this]() { return (bool)state_->result; });
    return *state_->result;
  }

  /// Block until the handle is resolved or @a timeout expires, returns true if the handle is resolved.
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> const& timeout) const {
    std::unique_lock<std::mutex> lock(state_->mu);
    return state_->cv.wait_for(lock, timeout, [this]() { return (bool)state_->result; });
  }

  /// Return true if both handles refer to the same result.
  bool same_state(completion_handle const& rhs) const {
    return state_ == rhs.state_;
  }

private:
  struct state {
    std::mutex mu;
    std::condition_variable cv;
    std::unique_ptr<result_type> result;
    bool cancelled = false;
    std::vector<listener_type> listeners;
    std::function<void()> cancel_hook;
  };

  /// The only place where the result is set, the first caller wins.
  bool resolve(result_type&& r, bool cancelled = false) {
    // ... keep the state alive while the listeners run, they may drop the last copy of this handle ...
    auto s = state_;
    std::vector<listener_type> listeners;
    std::function<void()> hook;
    {
      std::lock_guard<std::mutex> lock(s->mu);
      if (s->result) {
        return false;
      }
      s->result.reset(new result_type(std::move(r)));
      s->cancelled = cancelled;
      listeners.swap(s->listeners);
      if (cancelled) {
        hook = std::move(s->cancel_hook);
      }
      // ... the hook may hold references back to this state, drop it to break the cycle ...
      s->cancel_hook = nullptr;
    }
    if (hook) {
      run_hook(hook);
    }
    s->cv.notify_all();
    for (auto& l : listeners) {
      invoke(l, *s->result);
    }
    return true;
  }

  static void invoke(listener_type& listener, result_type const& r) {
    try {
      listener(r);
    } catch (std::exception const& ex) {
      // ... the resolving thread belongs to the producer (often the completion queue loop), a failing listener
      // should not break it or stop the other listeners ...
      BTA_LOG(error) << "completion_handle listener raised an exception: " << ex.what();
    } catch (...) {
      BTA_LOG(error) << "completion_handle listener raised an unknown exception";
    }
  }

  static void run_hook(std::function<void()>& hook) {
    try {
      hook();
    } catch (std::exception const& ex) {
      BTA_LOG(error) << "completion_handle cancellation hook raised an exception: " << ex.what();
    } catch (...) {
      BTA_LOG(error) << "completion_handle cancellation hook raised an unknown exception";
    }
  }

private:
  std::shared_ptr<state> state_;
};

} // namespace detail
} // namespace bta

#endif // bta_detail_completion_handle_hpp
