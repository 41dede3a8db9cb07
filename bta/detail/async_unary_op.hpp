#ifndef bta_detail_async_unary_op_hpp
#define bta_detail_async_unary_op_hpp
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

#include <bta/detail/attempt_context.hpp>
#include <bta/detail/base_async_op.hpp>

#include <grpc++/generic/generic_stub.h>
#include <grpc++/grpc++.h>

#include <memory>
#include <string>

namespace bta {
namespace detail {

/**
 * The state of one attempt of a unary RPC posted to a bta::completion_queue.
 *
 * Request and response are serialized messages, the call is made through a grpc::GenericStub, so the completion queue
 * does not need generated service stubs.  The typed layer (bta::detail::retrying_unary_call) serializes the request
 * and parses the response.
 */
struct async_unary_op : public base_async_op {
  grpc::ClientContext context;
  grpc::Status status;
  /// The fully qualified method name, e.g. "/package.Service/Method".
  std::string method;
  grpc::ByteBuffer request;
  grpc::ByteBuffer response;
  attempt_context attempt;
  std::unique_ptr<grpc::GenericClientAsyncResponseReader> rpc;

  /// Copy the trailing metadata sent by the server, only valid once the operation has completed.
  call_metadata trailing_metadata() const {
    call_metadata result;
    for (auto const& kv : context.GetServerTrailingMetadata()) {
      result.emplace(std::string(kv.first.data(), kv.first.size()), std::string(kv.second.data(), kv.second.size()));
    }
    return result;
  }
};

} // namespace detail
} // namespace bta

#endif // bta_detail_async_unary_op_hpp
