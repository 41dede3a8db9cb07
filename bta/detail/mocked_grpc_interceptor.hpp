#ifndef bta_detail_mocked_grpc_interceptor_hpp
#define bta_detail_mocked_grpc_interceptor_hpp
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
#include <bta/detail/base_async_op.hpp>
#include <bta/detail/deadline_timer.hpp>

#include <gmock/gmock.h>
#include <grpc++/grpc++.h>

#include <memory>

namespace bta {
namespace detail {

/**
 * Replace bta::detail::default_grpc_interceptor in tests.
 *
 * Nothing reaches gRPC.  The tests set expectations on the shared mock and, typically, capture the operations and
 * call their callbacks when the scenario requires it.  The mock is shared so copies of the interceptor (and the
 * completion queue holding it) observe the same expectations.
 */
struct mocked_grpc_interceptor {
  mocked_grpc_interceptor()
      : shared_mock(new mocked) {
  }

  /// Intercept timers.
  template <typename op_type>
  void make_deadline_timer(std::shared_ptr<op_type> op, grpc::CompletionQueue*, void*) {
    shared_mock->make_deadline_timer(op);
  }

  /// Intercept unary RPCs.
  template <typename op_type>
  void async_rpc(grpc::GenericStub*, std::shared_ptr<op_type> op, grpc::CompletionQueue*, void*) {
    shared_mock->async_rpc(op);
  }

  /// Intercept attempts to cancel unary RPCs.
  template <typename op_type>
  void try_cancel(std::shared_ptr<op_type> op) {
    shared_mock->try_cancel(op);
  }

  struct mocked {
    MOCK_CONST_METHOD1(make_deadline_timer, void(std::shared_ptr<base_async_op> op));
    MOCK_CONST_METHOD1(async_rpc, void(std::shared_ptr<async_unary_op> op));
    MOCK_CONST_METHOD1(try_cancel, void(std::shared_ptr<async_unary_op> op));
  };

  std::shared_ptr<mocked> shared_mock;
};

} // namespace detail
} // namespace bta

#endif // bta_detail_mocked_grpc_interceptor_hpp
