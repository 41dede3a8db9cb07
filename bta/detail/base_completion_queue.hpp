#ifndef bta_detail_base_completion_queue_hpp
#define bta_detail_base_completion_queue_hpp
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

#include <bta/detail/base_async_op.hpp>

#include <grpc++/grpc++.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace bta {
namespace detail {
/// A helper class for testing.
struct base_completion_queue_test_only;

/**
 * The base class for the grpc::CompletionQueue wrappers.
 *
 * Refactor code common to all bta::completion_queue<> template instantiations: the event loop, and the table of
 * pending operations, indexed by their gRPC tag.
 */
class base_completion_queue {
public:
  /// How often the loop wakes up to check if it should shutdown, unless the application picks a different value.
  static std::chrono::milliseconds constexpr default_loop_timeout{50};

  explicit base_completion_queue(std::chrono::milliseconds loop_timeout = default_loop_timeout);
  virtual ~base_completion_queue();

  /// Run the completion queue loop, returns after shutdown() is called.
  void run();

  /// Shutdown the completion queue loop.
  void shutdown();

  /// The number of operations posted and not yet completed.
  std::size_t pending_operations() const;

  std::chrono::milliseconds loop_timeout() const {
    return loop_timeout_;
  }

protected:
  friend struct ::bta::detail::base_completion_queue_test_only;
  /// The underlying completion queue pointer for the gRPC APIs.
  grpc::CompletionQueue* cq() {
    return &queue_;
  }

  /**
   * Create an operation and perform the common initialization.
   *
   * The member functions in bta::completion_queue create different types of operations, all of them need to move the
   * name and the functor into the new object, and wrap the functor in a callback that downcasts the operation.
   *
   * @tparam op_type the type derived from bta::detail::base_async_op to create.
   * @tparam Functor the type of the user-provided functor, called as f(op_type const&, bool).
   */
  template <typename op_type, typename Functor>
  std::shared_ptr<op_type> create_op(std::string name, Functor&& f) const {
    auto op = std::make_shared<op_type>();
    op->callback = [functor = std::forward<Functor>(f)](base_async_op & bop, bool ok) mutable {
      auto const& op = dynamic_cast<op_type const&>(bop);
      functor(op, ok);
    };
    op->name = std::move(name);
    return op;
  }

  /// Save a newly created operation and return its gRPC tag.
  void* register_op(char const* where, std::shared_ptr<base_async_op> op);

  /// Get an operation given its gRPC tag, and remove it from the pending operations.
  std::shared_ptr<base_async_op> unregister_op(void* tag);

private:
  mutable std::mutex mu_;
  using pending_ops_type = std::unordered_map<std::intptr_t, std::shared_ptr<base_async_op>>;
  pending_ops_type pending_ops_;

  grpc::CompletionQueue queue_;
  std::atomic<bool> shutdown_;
  std::chrono::milliseconds loop_timeout_;
};
} // namespace detail
} // namespace bta

#endif // bta_detail_base_completion_queue_hpp
