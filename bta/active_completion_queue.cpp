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
#include "bta/active_completion_queue.hpp"
#include <bta/log.hpp>

namespace bta {

active_completion_queue::active_completion_queue()
    : queue_(std::make_shared<completion_queue<>>())
    , thread_() {
  auto q = queue_;
  thread_ = std::thread([q]() { q->run(); });
}

active_completion_queue::active_completion_queue(std::shared_ptr<completion_queue<>> q, std::thread&& t)
    : queue_(std::move(q))
    , thread_(std::move(t)) {
}

active_completion_queue& active_completion_queue::operator=(active_completion_queue&& rhs) {
  // ... release our queue and thread before taking over the ones in rhs ...
  stop();
  queue_ = std::move(rhs.queue_);
  thread_ = std::move(rhs.thread_);
  return *this;
}

active_completion_queue::~active_completion_queue() {
  stop();
}

void active_completion_queue::stop() {
  if (queue_) {
    BTA_LOG(trace) << "shutdown active completion queue";
    queue_->shutdown();
    queue_.reset();
  }
  if (thread_.joinable()) {
    BTA_LOG(trace) << "join active completion queue";
    thread_.join();
  }
}

} // namespace bta
