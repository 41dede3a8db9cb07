#ifndef bta_detail_base_async_op_hpp
#define bta_detail_base_async_op_hpp
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

#include <functional>
#include <memory>
#include <string>

namespace bta {
namespace detail {

/**
 * Base class for the state of all the operations posted to a bta::completion_queue.
 *
 * The application (or more commonly a bta::detail::retrying_unary_call) asks the completion queue to start an
 * operation, and provides a functor to call when it completes.  The queue creates an object derived from this class,
 * keeps it alive while the operation is pending, and uses its address as the gRPC tag.  When gRPC reports the tag the
 * queue calls the functor, with the operation (so results can be read) and a flag indicating if the operation
 * completed normally (true) or was cancelled (false).  The queue releases the operation once the functor returns,
 * functors must copy anything they want to keep.
 */
struct base_async_op {
  base_async_op() {
  }

  virtual ~base_async_op() {
  }

  /// Called by the completion queue loop.
  std::function<void(base_async_op&, bool)> callback;

  /// A name for logging and debugging.
  std::string name;
};

} // namespace detail
} // namespace bta

#endif // bta_detail_base_async_op_hpp
