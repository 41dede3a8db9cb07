#ifndef bta_active_completion_queue_hpp
#define bta_active_completion_queue_hpp
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

#include <bta/completion_queue.hpp>

#include <memory>
#include <thread>

namespace bta {

/**
 * A completion queue with a thread running its loop.
 *
 * The retrying calls, and all their continuations, run in that thread.  On destruction (or when stop() is called) the
 * queue is shutdown first, and then the thread is joined.  The queue can be shared with the objects that post
 * operations to it, using queue(), but they should not outlive this object if they still have pending operations.
 */
class active_completion_queue {
public:
  /// Create a new completion queue and a thread to run it.
  active_completion_queue();

  /// Take ownership of an existing queue and the thread running it, the thread must call q->run().
  active_completion_queue(std::shared_ptr<completion_queue<>> q, std::thread&& t);

  active_completion_queue(active_completion_queue&& rhs) = default;
  active_completion_queue& operator=(active_completion_queue&& rhs);
  active_completion_queue(active_completion_queue const&) = delete;
  active_completion_queue& operator=(active_completion_queue const&) = delete;

  ~active_completion_queue();

  explicit operator bool() const {
    return (bool)queue_;
  }

  completion_queue<>& cq() {
    return *queue_;
  }

  std::shared_ptr<completion_queue<>> queue() const {
    return queue_;
  }

  /// Shutdown the queue and join the thread, calling it more than once has no effect.
  void stop();

private:
  std::shared_ptr<completion_queue<>> queue_;
  std::thread thread_;
};

} // namespace bta

#endif // bta_active_completion_queue_hpp
