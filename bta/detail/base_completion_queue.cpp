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
#include "bta/detail/base_completion_queue.hpp"
#include <bta/assert_throw.hpp>
#include <bta/log.hpp>

#include <sstream>
#include <stdexcept>

namespace bta {
namespace detail {

std::chrono::milliseconds constexpr base_completion_queue::default_loop_timeout;

base_completion_queue::base_completion_queue(std::chrono::milliseconds loop_timeout)
    : mu_()
    , pending_ops_()
    , queue_()
    , shutdown_(false)
    , loop_timeout_(loop_timeout) {
  if (loop_timeout_.count() <= 0) {
    std::ostringstream os;
    os << "base_completion_queue() - loop_timeout (" << loop_timeout_.count() << "ms) must be positive";
    throw std::invalid_argument(os.str());
  }
}

base_completion_queue::~base_completion_queue() {
  std::lock_guard<std::mutex> lock(mu_);
  if (pending_ops_.empty()) {
    return;
  }
  // ... the callbacks may point to objects already deleted, calling them is not safe, the best we can do is to report
  // what was left behind ...
  std::ostringstream os;
  for (auto const& op : pending_ops_) {
    os << op.second->name << "\n";
  }
  BTA_LOG(error) << "completion queue deleted while holding " << pending_ops_.size()
                 << " pending operations: " << os.str();
}

void base_completion_queue::run() {
  void* tag = nullptr;
  bool ok = false;
  while (not shutdown_.load()) {
    auto deadline = std::chrono::system_clock::now() + loop_timeout_;

    auto status = queue_.AsyncNext(&tag, &ok, deadline);
    if (status == grpc::CompletionQueue::SHUTDOWN) {
      BTA_LOG(trace) << "shutdown, exit loop";
      break;
    }
    if (status == grpc::CompletionQueue::TIMEOUT) {
      continue;
    }
    if (tag == nullptr) {
      BTA_LOG(warning) << "null tag reported in asynchronous operation, ignored";
      continue;
    }

    // ... try to find the operation in our list of known operations ...
    std::shared_ptr<base_async_op> op = unregister_op(tag);
    if (not op) {
      BTA_LOG(error) << "unknown tag reported in asynchronous operation: " << std::hex << std::intptr_t(tag);
      continue;
    }
    // ... it was there, now it is removed, and the lock is released, call it ...
    op->callback(*op, ok);
  }
}

void base_completion_queue::shutdown() {
  BTA_LOG(trace) << "shutting down queue";
  shutdown_.store(true);
  queue_.Shutdown();
}

std::size_t base_completion_queue::pending_operations() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_ops_.size();
}

void* base_completion_queue::register_op(char const* where, std::shared_ptr<base_async_op> op) {
  void* tag = static_cast<void*>(op.get());
  auto key = reinterpret_cast<std::intptr_t>(tag);
  std::lock_guard<std::mutex> lock(mu_);
  auto r = pending_ops_.emplace(key, op);
  BTA_ASSERT_THROW(r.second != false);
  BTA_LOG(trace) << where << " registered " << op->name;
  return tag;
}

std::shared_ptr<base_async_op> base_completion_queue::unregister_op(void* tag) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = pending_ops_.find(reinterpret_cast<std::intptr_t>(tag));
  if (i == pending_ops_.end()) {
    return std::shared_ptr<base_async_op>();
  }
  auto op = std::move(i->second);
  pending_ops_.erase(i);
  return op;
}

} // namespace detail
} // namespace bta
