#ifndef bta_detail_deadline_timer_hpp
#define bta_detail_deadline_timer_hpp
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

#include <grpc++/alarm.h>

#include <chrono>
#include <memory>

namespace bta {
namespace detail {

/**
 * The state of a timer posted to a bta::completion_queue.
 *
 * A retrying call uses one of these for each backoff period.
 */
struct deadline_timer : public base_async_op {
  /**
   * Cancel the timer.
   *
   * The callback is still called, from the completion queue loop, with ok == false.  It is safe to call this from
   * any thread, and more than once.
   */
  void cancel() {
    if ((bool)alarm_) {
      alarm_->Cancel();
    }
  }

  std::chrono::system_clock::time_point deadline;

private:
  friend struct default_grpc_interceptor;
  std::unique_ptr<grpc::Alarm> alarm_;
};

} // namespace detail
} // namespace bta

#endif // bta_detail_deadline_timer_hpp
