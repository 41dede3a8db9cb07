#ifndef bta_detail_default_grpc_interceptor_hpp
#define bta_detail_default_grpc_interceptor_hpp
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

#include <grpc++/alarm.h>
#include <grpc++/generic/generic_stub.h>
#include <grpc++/grpc++.h>

#include <memory>

namespace bta {
namespace detail {

/**
 * Provides a dependency injection point to mock the gRPC++ library.
 *
 * The retry tests need to simulate the behavior of the gRPC++ library, and of the servers reached through it: failed
 * attempts, late responses, cancelled timers.  This class defines the narrow interface where bta::completion_queue
 * calls into gRPC++, and bta::detail::mocked_grpc_interceptor replaces it in the tests.
 */
struct default_grpc_interceptor {
  /// Post a timer to the completion queue.
  template <typename op_type>
  void make_deadline_timer(std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->alarm_.reset(new grpc::Alarm);
    op->alarm_->Set(cq, op->deadline, tag);
  }

  /// Start an asynchronous unary RPC.
  template <typename op_type>
  void async_rpc(grpc::GenericStub* stub, std::shared_ptr<op_type> op, grpc::CompletionQueue* cq, void* tag) {
    op->rpc = stub->PrepareUnaryCall(&op->context, op->method, op->request, cq);
    op->rpc->StartCall();
    op->rpc->Finish(&op->response, &op->status, tag);
  }

  /// Cancel an asynchronous unary RPC, the completion queue still reports it, with a CANCELLED status.
  template <typename op_type>
  void try_cancel(std::shared_ptr<op_type> op) {
    op->context.TryCancel();
  }
};

} // namespace detail
} // namespace bta

#endif // bta_detail_default_grpc_interceptor_hpp
