#ifndef bta_detail_future_bridge_hpp
#define bta_detail_future_bridge_hpp
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

#include <bta/detail/completion_handle.hpp>
#include <bta/future.hpp>

#include <memory>
#include <type_traits>

namespace bta {
namespace detail {

/**
 * Expose a completion_handle<T> to the application as a bta::future<T>.
 *
 * The future is satisfied with the same value, or the same exception, as the handle.  Cancelling the future cancels
 * the handle, which propagates to whatever produces the result.  Many futures can be created from the same handle.
 */
template <typename T>
future<T> to_caller_future(completion_handle<T> handle) {
  promise<T> p([handle]() mutable { handle.cancel(); });
  auto f = p.get_future();
  handle.add_listener([p](operation_result<T> const& r) mutable {
    if (r.ok()) {
      p.set_value(r.value());
      return;
    }
    p.set_exception(r.error());
  });
  return f;
}

/**
 * Consume a bta::future<T> and return a completion_handle<T> resolved with the same outcome.
 *
 * Cancelling the handle cancels the future.
 */
template <typename T>
completion_handle<T> to_completion_handle(future<T> f) {
  completion_handle<T> handle;
  auto forwarded = std::make_shared<future<bool>>(f.then([handle](future<T> g) mutable {
    try {
      return handle.set_value(g.get());
    } catch (...) {
      // ... forwarded as-is, the handle owns the error from now on ...
      return handle.set_error(std::current_exception());
    }
  }));
  handle.on_cancel([forwarded]() { forwarded->cancel(); });
  return handle;
}

/**
 * Apply @a f to the value of a future, returning a future with the result.
 *
 * Errors (including exceptions raised by @a f) are propagated to the returned future.  Cancelling the returned future
 * cancels @a source.
 */
template <typename A, typename F>
future<typename std::decay<typename std::result_of<F(A const&)>::type>::type> transform(future<A> source, F&& f) {
  using B = typename std::decay<typename std::result_of<F(A const&)>::type>::type;
  auto upstream = to_completion_handle(std::move(source));
  completion_handle<B> downstream;
  upstream.add_listener([downstream, functor = std::forward<F>(f)](operation_result<A> const& r) mutable {
    if (not r.ok()) {
      downstream.set_error(r.error());
      return;
    }
    try {
      downstream.set_value(functor(r.value()));
    } catch (...) {
      downstream.set_error(std::current_exception());
    }
  });
  downstream.on_cancel([upstream]() mutable { upstream.cancel(); });
  return to_caller_future(std::move(downstream));
}

} // namespace detail
} // namespace bta

#endif // bta_detail_future_bridge_hpp
