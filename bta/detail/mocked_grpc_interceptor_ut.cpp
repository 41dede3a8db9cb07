#include "bta/detail/mocked_grpc_interceptor.hpp"
#include <bta/completion_queue.hpp>

#include <google/protobuf/wrappers.pb.h>
#include <grpc++/impl/codegen/proto_utils.h>

/**
 * @test Verify that we can mock timers using bta::detail::mocked_grpc_interceptor.
 */
TEST(mocked_grpc_interceptor, deadline_timer) {
  using namespace std::chrono_literals;
  using namespace bta::detail;

  using completion_queue_type = bta::completion_queue<bta::detail::mocked_grpc_interceptor>;
  completion_queue_type queue;

  std::vector<std::shared_ptr<deadline_timer>> pending_timer;
  using namespace ::testing;
  auto action = [&pending_timer](auto bop) {
    auto* op = dynamic_cast<deadline_timer*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    // ... the standard trick to downcast shared_ptr<> ...
    pending_timer.push_back(std::shared_ptr<deadline_timer>(bop, op));
  };
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "testing/deadline_timer";
  }))).WillOnce(Invoke(action));
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "testing/relative_timer";
  }))).WillOnce(Invoke(action));

  int cnt_ok = 0;
  int cnt_canceled = 0;
  auto handle_timer = [&cnt_ok, &cnt_canceled](auto& op, bool ok) {
    if (ok) {
      ++cnt_ok;
    } else {
      ++cnt_canceled;
    }
  };
  queue.make_relative_timer(100ms, "testing/relative_timer", handle_timer);
  ASSERT_EQ(pending_timer.size(), 1UL);
  ASSERT_EQ(cnt_ok, 0);
  ASSERT_EQ(cnt_canceled, 0);
  pending_timer[0]->callback(*pending_timer[0], true);
  ASSERT_EQ(cnt_ok, 1);
  ASSERT_EQ(cnt_canceled, 0);
  ASSERT_NO_THROW(pending_timer.pop_back());

  queue.make_deadline_timer(std::chrono::system_clock::now() + 100ms, "testing/deadline_timer", handle_timer);
  ASSERT_EQ(pending_timer.size(), 1UL);
  // ... cancelling a mocked timer is a no-op, the test decides what the callback sees ...
  pending_timer[0]->cancel();
  pending_timer[0]->callback(*pending_timer[0], false);
  ASSERT_EQ(cnt_ok, 1);
  ASSERT_EQ(cnt_canceled, 1);
  ASSERT_NO_THROW(pending_timer.pop_back());
}

/**
 * @test Make sure we can mock async_rpc() calls in a completion_queue.
 */
TEST(mocked_grpc_interceptor, async_rpc) {
  using namespace std::chrono_literals;
  using namespace bta::detail;
  bta::completion_queue<mocked_grpc_interceptor> queue;

  // ... the stub is never used by the mock, we do not need (or want) a real connection ...
  grpc::GenericStub* stub = nullptr;

  using ::testing::_;
  using ::testing::Invoke;
  std::shared_ptr<async_unary_op> last_op;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([&last_op](auto op) {
    last_op = op;
  }));

  google::protobuf::StringValue request;
  request.set_value("ping");
  grpc::ByteBuffer buffer;
  bool own_buffer = false;
  ASSERT_TRUE(grpc::SerializationTraits<google::protobuf::StringValue>::Serialize(request, &buffer, &own_buffer).ok());

  attempt_context attempt;
  attempt.attempt_number = 2;
  attempt.submitted_at = std::chrono::system_clock::now();
  attempt.deadline = attempt.submitted_at + 1s;
  attempt.metadata.emplace("x-test-header", "value");

  int cnt_ok = 0;
  std::string received;
  queue.async_rpc(
      stub, "/test.Echo/Echo", std::move(buffer), attempt, "test/Echo",
      [&cnt_ok, &received](async_unary_op const& op, bool ok) {
        if (not ok or not op.status.ok()) {
          return;
        }
        ++cnt_ok;
        grpc::ByteBuffer copy(op.response);
        google::protobuf::StringValue response;
        if (grpc::SerializationTraits<google::protobuf::StringValue>::Deserialize(&copy, &response).ok()) {
          received = response.value();
        }
      });

  ASSERT_TRUE((bool)last_op);
  EXPECT_EQ(last_op->method, "/test.Echo/Echo");
  EXPECT_EQ(last_op->name, "test/Echo");
  EXPECT_EQ(last_op->attempt.attempt_number, 2);
  EXPECT_EQ(last_op->attempt.metadata.size(), 1UL);
  EXPECT_EQ(queue.pending_operations(), 1UL);

  // ... the request was moved into the operation ...
  {
    grpc::ByteBuffer copy(last_op->request);
    google::protobuf::StringValue sent;
    ASSERT_TRUE(grpc::SerializationTraits<google::protobuf::StringValue>::Deserialize(&copy, &sent).ok());
    EXPECT_EQ(sent.value(), "ping");
  }

  // ... fill the response, as the server would ...
  google::protobuf::StringValue response;
  response.set_value("pong");
  bool own = false;
  ASSERT_TRUE(
      grpc::SerializationTraits<google::protobuf::StringValue>::Serialize(response, &last_op->response, &own).ok());
  last_op->status = grpc::Status::OK;
  last_op->callback(*last_op, true);
  EXPECT_EQ(cnt_ok, 1);
  EXPECT_EQ(received, "pong");
}

/**
 * @test Verify that try_cancel() reaches the interceptor.
 */
TEST(mocked_grpc_interceptor, try_cancel) {
  using namespace bta::detail;
  bta::completion_queue<mocked_grpc_interceptor> queue;

  using ::testing::_;
  using ::testing::Invoke;
  std::shared_ptr<async_unary_op> last_op;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([&last_op](auto op) {
    last_op = op;
  }));
  int cancelled = 0;
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel(_)).WillOnce(Invoke([&cancelled](auto op) {
    ++cancelled;
    op->status = grpc::Status(grpc::StatusCode::CANCELLED, "cancelled by test");
    op->callback(*op, true);
  }));

  grpc::StatusCode code = grpc::StatusCode::OK;
  queue.async_rpc(
      nullptr, "/test.Echo/Echo", grpc::ByteBuffer(), attempt_context(), "test/Echo/cancel",
      [&code](async_unary_op const& op, bool ok) { code = op.status.error_code(); });
  ASSERT_TRUE((bool)last_op);

  queue.try_cancel(last_op);
  EXPECT_EQ(cancelled, 1);
  EXPECT_EQ(code, grpc::StatusCode::CANCELLED);

  // ... null operations are ignored ...
  queue.try_cancel(std::shared_ptr<async_unary_op>());
  EXPECT_EQ(cancelled, 1);
}
