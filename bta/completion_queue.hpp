#ifndef bta_completion_queue_hpp
#define bta_completion_queue_hpp
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

#include <bta/detail/async_unary_op.hpp>
#include <bta/detail/attempt_context.hpp>
#include <bta/detail/base_async_op.hpp>
#include <bta/detail/base_completion_queue.hpp>
#include <bta/detail/deadline_timer.hpp>
#include <bta/detail/default_grpc_interceptor.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace bta {

/**
 * Wrap a gRPC completion queue.
 *
 * The grpc::CompletionQueue is not much of an abstraction, nor is it idiomatic C++.  This wrapper makes it easier to
 * write asynchronous operations that call functors (lambdas, std::function<>, etc) when the operation completes.  It
 * supports the two operations a retrying call needs: timers, to wait between attempts, and unary RPCs.
 *
 * @tparam grpc_interceptor_t mediate all calls to the gRPC library.  The default inlines all the calls, so it is
 * basically zero overhead.  The main reason to change it is to mock the gRPC++ APIs in tests.
 */
template <typename grpc_interceptor_t = detail::default_grpc_interceptor>
class completion_queue : public detail::base_completion_queue {
public:
  //@{
  /// @name type traits
  using grpc_interceptor_type = grpc_interceptor_t;
  using clock = std::chrono::system_clock;
  //@}

  explicit completion_queue(
      grpc_interceptor_type interceptor = grpc_interceptor_type(),
      std::chrono::milliseconds loop_timeout = detail::base_completion_queue::default_loop_timeout)
      : detail::base_completion_queue(loop_timeout)
      , interceptor_(std::move(interceptor)) {
  }

  /**
   * Call the functor when the deadline timer expires.
   *
   * The functor is called as f(detail::deadline_timer const&, bool ok), where @a ok is false if the timer was
   * cancelled.
   *
   * Notice that system_clock is not guaranteed to be monotonic.  The timers in this library are backoff periods, in
   * the millisecond to second range, so that is good enough.
   */
  template <typename Functor>
  std::shared_ptr<detail::deadline_timer> make_deadline_timer(
      clock::time_point deadline, std::string name, Functor&& f) {
    auto op = create_op<detail::deadline_timer>(std::move(name), std::forward<Functor>(f));
    op->deadline = deadline;
    void* tag = register_op("make_deadline_timer()", op);
    interceptor_.make_deadline_timer(op, cq(), tag);
    return op;
  }

  /// Call the functor after @a duration.
  template <typename duration_type, typename Functor>
  std::shared_ptr<detail::deadline_timer> make_relative_timer(
      duration_type duration, std::string name, Functor&& functor) {
    auto deadline = clock::now() + duration;
    return make_deadline_timer(deadline, std::move(name), std::forward<Functor>(functor));
  }

  /**
   * Start an asynchronous unary RPC and call a functor with the results.
   *
   * The request and response are serialized messages, the method is identified by its full name:
   *
   * @code
   * bta::completion_queue<> queue;
   * grpc::GenericStub stub(channel);
   * auto op = queue.async_rpc(
   *     &stub, "/google.bigtable.admin.v2.BigtableTableAdmin/GetTable", std::move(buffer), attempt,
   *     "GetTable/attempt=1", [](bta::detail::async_unary_op const& op, bool ok) { });
   * @endcode
   *
   * The @a ok flag is false if the completion queue cancelled the operation, in that case the status may not be set.
   * The deadline and metadata in @a attempt are applied to the grpc::ClientContext.
   *
   * @returns the operation, which can be used to cancel the RPC with try_cancel().
   */
  template <typename Functor>
  std::shared_ptr<detail::async_unary_op> async_rpc(
      grpc::GenericStub* stub, std::string method, grpc::ByteBuffer request, detail::attempt_context attempt,
      std::string name, Functor&& f) {
    auto op = create_op<detail::async_unary_op>(std::move(name), std::forward<Functor>(f));
    op->method = std::move(method);
    op->request.Swap(&request);
    if (attempt.has_deadline()) {
      op->context.set_deadline(attempt.deadline);
    }
    for (auto const& kv : attempt.metadata) {
      op->context.AddMetadata(kv.first, kv.second);
    }
    op->attempt = std::move(attempt);
    void* tag = register_op("async_rpc()", op);
    interceptor_.async_rpc(stub, op, cq(), tag);
    return op;
  }

  /**
   * Try to cancel a pending RPC.
   *
   * Cancellation is best effort, the functor provided to async_rpc() is still called, typically with a CANCELLED
   * status.
   */
  void try_cancel(std::shared_ptr<detail::async_unary_op> op) {
    if (not op) {
      return;
    }
    interceptor_.try_cancel(std::move(op));
  }

  grpc_interceptor_type& interceptor() {
    return interceptor_;
  }

private:
  /// The interceptor to catch all interactions with the underlying grpc::CompletionQueue.
  grpc_interceptor_type interceptor_;
};

} // namespace bta

#endif // bta_completion_queue_hpp
