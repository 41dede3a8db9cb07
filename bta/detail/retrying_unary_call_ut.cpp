#include "bta/detail/retrying_unary_call.hpp"
#include <bta/completion_queue.hpp>
#include <bta/detail/mocked_grpc_interceptor.hpp>

#include <google/protobuf/wrappers.pb.h>
#include <gmock/gmock.h>

#include <atomic>
#include <mutex>
#include <sstream>
#include <thread>

namespace bta {
namespace detail {
struct base_completion_queue_test_only {
  /**
   * Discard the operations that never went through the event loop.
   *
   * Their callbacks hold the calls, which hold the queue and (while an attempt or timer is pending) the operation.
   */
  static void discard_pending(base_completion_queue& q) {
    base_completion_queue::pending_ops_type pending;
    {
      std::lock_guard<std::mutex> lock(q.mu_);
      pending.swap(q.pending_ops_);
    }
    for (auto& kv : pending) {
      kv.second->callback = nullptr;
    }
  }
};
} // namespace detail
} // namespace bta

namespace {
using namespace std::chrono_literals;
using namespace bta::detail;
using completion_queue_type = bta::completion_queue<mocked_grpc_interceptor>;
using call_type =
    retrying_unary_call<google::protobuf::StringValue, google::protobuf::StringValue, completion_queue_type>;

/**
 * Capture the attempts, timers and cancellations posted to a mocked completion queue.
 *
 * The tests complete the attempts and fire the timers explicitly, in whatever order the scenario requires.
 */
class retrying_unary_call_test : public ::testing::Test {
protected:
  void SetUp() override {
    queue = std::make_shared<completion_queue_type>();
    now = std::chrono::system_clock::now();
    using ::testing::_;
    using ::testing::Invoke;
    auto& mock = *queue->interceptor().shared_mock;
    EXPECT_CALL(mock, async_rpc(_)).WillRepeatedly(Invoke([this](std::shared_ptr<async_unary_op> op) {
      std::lock_guard<std::mutex> lock(mu);
      attempts.push_back(op);
    }));
    EXPECT_CALL(mock, make_deadline_timer(_)).WillRepeatedly(Invoke([this](std::shared_ptr<base_async_op> op) {
      auto timer = std::dynamic_pointer_cast<deadline_timer>(op);
      ASSERT_TRUE((bool)timer);
      std::lock_guard<std::mutex> lock(mu);
      timers.push_back(timer);
    }));
    EXPECT_CALL(mock, try_cancel(_)).WillRepeatedly(Invoke([this](std::shared_ptr<async_unary_op> op) {
      std::lock_guard<std::mutex> lock(mu);
      cancelled.push_back(op);
    }));
  }

  void TearDown() override {
    base_completion_queue_test_only::discard_pending(*queue);
  }

  std::size_t attempt_count() {
    std::lock_guard<std::mutex> lock(mu);
    return attempts.size();
  }

  std::shared_ptr<call_type> make_call(bta::retry_options options, bta::call_metadata metadata = {}) {
    google::protobuf::StringValue request;
    request.set_value("request");
    return call_type::create(
        queue, std::shared_ptr<grpc::GenericStub>(), "/test.Service/Method", request, std::move(options),
        std::move(metadata), jitter_source::none(), [this]() { return now; });
  }

  /// Complete @a op with @a code, and a response containing @a value if it is not null.
  static void finish(std::shared_ptr<async_unary_op> const& op, grpc::StatusCode code, char const* value = nullptr) {
    if (value != nullptr) {
      google::protobuf::StringValue response;
      response.set_value(value);
      bool own = false;
      ASSERT_TRUE(
          grpc::SerializationTraits<google::protobuf::StringValue>::Serialize(response, &op->response, &own).ok());
    }
    op->status = grpc::Status(code, code == grpc::StatusCode::OK ? "" : "injected failure");
    op->callback(*op, true);
  }

  static void fire(std::shared_ptr<deadline_timer> const& timer, bool ok = true) {
    timer->callback(*timer, ok);
  }

  std::mutex mu;
  std::shared_ptr<completion_queue_type> queue;
  std::chrono::system_clock::time_point now;
  std::vector<std::shared_ptr<async_unary_op>> attempts;
  std::vector<std::shared_ptr<deadline_timer>> timers;
  std::vector<std::shared_ptr<async_unary_op>> cancelled;
};

/// Verify that a timer was armed for approximately @a delay after @a before.
::testing::AssertionResult armed_for(
    std::shared_ptr<deadline_timer> const& timer, std::chrono::system_clock::time_point before,
    std::chrono::milliseconds delay) {
  auto actual = std::chrono::duration_cast<std::chrono::milliseconds>(timer->deadline - before);
  if (actual >= delay and actual < delay + 500ms) {
    return ::testing::AssertionSuccess();
  }
  return ::testing::AssertionFailure() << "expected delay=" << delay.count() << "ms, actual=" << actual.count()
                                       << "ms";
}
} // anonymous namespace

/**
 * @test Verify that retryable failures are retried with exponential backoff until the call succeeds.
 */
TEST_F(retrying_unary_call_test, retry_until_success) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  EXPECT_EQ(call->state(), call_state::idle);
  auto handle = call->start();
  ASSERT_EQ(attempts.size(), 1UL);
  EXPECT_EQ(attempts[0]->method, "/test.Service/Method");
  EXPECT_EQ(call->state(), call_state::attempt_in_flight);

  std::chrono::milliseconds const expected_delays[] = {100ms, 200ms, 400ms, 800ms};
  for (int i = 0; i != 4; ++i) {
    auto before = std::chrono::system_clock::now();
    finish(attempts[i], grpc::StatusCode::UNAVAILABLE);
    ASSERT_EQ(timers.size(), std::size_t(i + 1));
    EXPECT_TRUE(armed_for(timers[i], before, expected_delays[i])) << "i=" << i;
    EXPECT_EQ(call->state(), call_state::backoff_scheduled);
    EXPECT_FALSE(handle.is_resolved());
    // ... no new attempt until the timer fires ...
    EXPECT_EQ(attempts.size(), std::size_t(i + 1));
    fire(timers[i]);
    ASSERT_EQ(attempts.size(), std::size_t(i + 2));
    EXPECT_EQ(attempts[i + 1]->attempt.attempt_number, i + 2);
  }

  finish(attempts[4], grpc::StatusCode::OK, "ok");
  ASSERT_TRUE(handle.is_resolved());
  auto const& result = handle.wait();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value().value(), "ok");
  EXPECT_EQ(call->attempts_made(), 5);
  EXPECT_EQ(call->state(), call_state::succeeded);
  EXPECT_EQ(attempts.size(), 5UL);
  EXPECT_TRUE(cancelled.empty());
}

/**
 * @test Verify that the call gives up after the maximum number of attempts, reporting the last status.
 */
TEST_F(retrying_unary_call_test, retries_exhausted) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  for (int i = 0; i != 4; ++i) {
    ASSERT_EQ(attempts.size(), std::size_t(i + 1));
    finish(attempts[i], grpc::StatusCode::UNAVAILABLE);
    ASSERT_EQ(timers.size(), std::size_t(i + 1));
    fire(timers[i]);
  }
  ASSERT_EQ(attempts.size(), 5UL);
  finish(attempts[4], grpc::StatusCode::UNAVAILABLE);

  ASSERT_TRUE(handle.is_resolved());
  auto const& result = handle.wait();
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.kind(), bta::error_kind::retries_exhausted);
  EXPECT_EQ(result.status_code(), grpc::StatusCode::UNAVAILABLE);
  EXPECT_EQ(call->attempts_made(), 5);
  EXPECT_EQ(call->last_status().error_code(), grpc::StatusCode::UNAVAILABLE);
  // ... no sixth attempt, and no timer for it ...
  EXPECT_EQ(attempts.size(), 5UL);
  EXPECT_EQ(timers.size(), 4UL);
  EXPECT_EQ(call->state(), call_state::failed);
}

/**
 * @test Verify that permanent failures are not retried.
 */
TEST_F(retrying_unary_call_test, permanent_failure) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  ASSERT_EQ(attempts.size(), 1UL);
  finish(attempts[0], grpc::StatusCode::PERMISSION_DENIED);

  ASSERT_TRUE(handle.is_resolved());
  auto const& result = handle.wait();
  EXPECT_EQ(result.kind(), bta::error_kind::permanent_failure);
  EXPECT_EQ(result.status_code(), grpc::StatusCode::PERMISSION_DENIED);
  EXPECT_EQ(call->attempts_made(), 1);
  EXPECT_TRUE(timers.empty());
  EXPECT_EQ(attempts.size(), 1UL);
}

/**
 * @test Verify that callbacks from superseded attempts are discarded.
 */
TEST_F(retrying_unary_call_test, stale_callbacks) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  finish(attempts[0], grpc::StatusCode::UNAVAILABLE);
  fire(timers[0]);
  ASSERT_EQ(attempts.size(), 2UL);

  // ... a late value and a late OK for attempt 1 must not resolve the call ...
  google::protobuf::StringValue late;
  late.set_value("late");
  call->on_message(1, late);
  call->on_terminal(1, grpc::Status::OK, bta::call_metadata());
  EXPECT_FALSE(handle.is_resolved());
  EXPECT_EQ(call->state(), call_state::attempt_in_flight);

  // ... a late timer for attempt 1 does not start another attempt ...
  fire(timers[0]);
  EXPECT_EQ(attempts.size(), 2UL);

  finish(attempts[1], grpc::StatusCode::OK, "ok");
  ASSERT_TRUE(handle.is_resolved());
  EXPECT_EQ(handle.wait().value().value(), "ok");

  // ... anything after the resolution is discarded too ...
  call->on_terminal(2, grpc::Status(grpc::StatusCode::UNAVAILABLE, "late"), bta::call_metadata());
  call->on_message(2, late);
  EXPECT_EQ(handle.wait().value().value(), "ok");
  EXPECT_EQ(call->state(), call_state::succeeded);
  EXPECT_EQ(timers.size(), 1UL);
}

/**
 * @test Verify that cancelling a call with an attempt in flight cancels the attempt.
 */
TEST_F(retrying_unary_call_test, cancel_in_flight) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  ASSERT_EQ(attempts.size(), 1UL);

  EXPECT_TRUE(handle.cancel());
  ASSERT_TRUE(handle.is_resolved());
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::cancelled);
  EXPECT_EQ(call->state(), call_state::failed);
  ASSERT_EQ(cancelled.size(), 1UL);
  EXPECT_EQ(cancelled[0], attempts[0]);

  // ... the attempt completes, typically with CANCELLED, and it is ignored ...
  finish(attempts[0], grpc::StatusCode::CANCELLED);
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::cancelled);
  EXPECT_TRUE(timers.empty());
  EXPECT_EQ(attempts.size(), 1UL);
}

/**
 * @test Verify that cancelling a call during the backoff period prevents further attempts.
 */
TEST_F(retrying_unary_call_test, cancel_in_backoff) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  finish(attempts[0], grpc::StatusCode::UNAVAILABLE);
  ASSERT_EQ(timers.size(), 1UL);
  EXPECT_EQ(call->state(), call_state::backoff_scheduled);

  EXPECT_TRUE(call->cancel());
  ASSERT_TRUE(handle.is_resolved());
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::cancelled);
  EXPECT_EQ(handle.wait().status_code(), grpc::StatusCode::CANCELLED);
  EXPECT_TRUE(cancelled.empty());

  // ... the cancelled timer is reported with ok == false, and even if it fired it would be ignored ...
  fire(timers[0], false);
  fire(timers[0], true);
  EXPECT_EQ(attempts.size(), 1UL);
  EXPECT_EQ(call->attempts_made(), 1);
}

/**
 * @test Verify that cancelling twice has no additional effect.
 */
TEST_F(retrying_unary_call_test, double_cancel) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  EXPECT_TRUE(call->cancel());
  EXPECT_FALSE(call->cancel());
  EXPECT_FALSE(handle.cancel());
  EXPECT_EQ(cancelled.size(), 1UL);
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::cancelled);

  // ... and cancelling a completed call does nothing ...
  auto other = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto h2 = other->start();
  finish(attempts.back(), grpc::StatusCode::OK, "ok");
  EXPECT_FALSE(other->cancel());
  EXPECT_TRUE(h2.wait().ok());
  EXPECT_EQ(cancelled.size(), 1UL);
}

/**
 * @test Verify that an OK status without a value is reported as an internal consistency error.
 */
TEST_F(retrying_unary_call_test, ok_without_value) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  finish(attempts[0], grpc::StatusCode::OK);

  ASSERT_TRUE(handle.is_resolved());
  auto const& result = handle.wait();
  EXPECT_EQ(result.kind(), bta::error_kind::internal_consistency);
  EXPECT_EQ(result.status_code(), grpc::StatusCode::INTERNAL);
  EXPECT_TRUE((bool)result.error());
  EXPECT_TRUE(timers.empty());
  EXPECT_EQ(attempts.size(), 1UL);
}

/**
 * @test Verify that a second value for the same attempt resolves the call and cancels the attempt.
 */
TEST_F(retrying_unary_call_test, double_value) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  google::protobuf::StringValue v;
  v.set_value("first");
  call->on_message(1, v);
  EXPECT_FALSE(handle.is_resolved());
  v.set_value("second");
  call->on_message(1, v);

  ASSERT_TRUE(handle.is_resolved());
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::internal_consistency);
  ASSERT_EQ(cancelled.size(), 1UL);
  EXPECT_EQ(cancelled[0], attempts[0]);

  // ... the terminal status for the attempt is now stale ...
  call->on_terminal(1, grpc::Status::OK, bta::call_metadata());
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::internal_consistency);
  EXPECT_EQ(call->state(), call_state::failed);
}

/**
 * @test Verify that start() can only be called once.
 */
TEST_F(retrying_unary_call_test, start_twice) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  EXPECT_THROW(call->start(), std::logic_error);
  EXPECT_EQ(attempts.size(), 1UL);
  EXPECT_FALSE(handle.is_resolved());
}

/**
 * @test Verify that attempts cancelled by the completion queue are treated as CANCELLED.
 */
TEST_F(retrying_unary_call_test, queue_cancelled_attempt) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  attempts[0]->callback(*attempts[0], false);
  ASSERT_TRUE(handle.is_resolved());
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::permanent_failure);
  EXPECT_EQ(handle.wait().status_code(), grpc::StatusCode::CANCELLED);

  // ... unless the application says CANCELLED is retryable ...
  auto options = bta::retry_options(100ms, 1000ms, 2.0, 5).with_retryable_codes({grpc::StatusCode::CANCELLED});
  auto retried = make_call(options);
  auto h2 = retried->start();
  attempts.back()->callback(*attempts.back(), false);
  EXPECT_FALSE(h2.is_resolved());
  EXPECT_EQ(timers.size(), 1UL);
}

/**
 * @test Verify that a backoff timer cancelled by the completion queue resolves the call.
 */
TEST_F(retrying_unary_call_test, queue_cancelled_timer) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  finish(attempts[0], grpc::StatusCode::UNAVAILABLE);
  ASSERT_EQ(timers.size(), 1UL);
  fire(timers[0], false);
  ASSERT_TRUE(handle.is_resolved());
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::cancelled);
  EXPECT_EQ(attempts.size(), 1UL);
}

/**
 * @test Verify that the call gives up when the next attempt would start after the deadline.
 */
TEST_F(retrying_unary_call_test, deadline_exhausted) {
  auto options = bta::retry_options(100ms, 1000ms, 2.0, 10).with_deadline(now + 250ms);
  auto call = make_call(options);
  auto handle = call->start();
  finish(attempts[0], grpc::StatusCode::DEADLINE_EXCEEDED);
  ASSERT_EQ(timers.size(), 1UL);
  now += 100ms;
  fire(timers[0]);
  ASSERT_EQ(attempts.size(), 2UL);
  // ... the next delay would be 200ms, past the deadline ...
  finish(attempts[1], grpc::StatusCode::UNAVAILABLE);
  ASSERT_TRUE(handle.is_resolved());
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::retries_exhausted);
  EXPECT_EQ(handle.wait().status_code(), grpc::StatusCode::UNAVAILABLE);
  EXPECT_EQ(timers.size(), 1UL);
}

/**
 * @test Verify that with retries disabled a retryable failure ends the call.
 */
TEST_F(retrying_unary_call_test, retries_disabled) {
  auto call = make_call(bta::retry_options().with_retries_enabled(false));
  auto handle = call->start();
  finish(attempts[0], grpc::StatusCode::UNAVAILABLE);
  ASSERT_TRUE(handle.is_resolved());
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::retries_exhausted);
  EXPECT_TRUE(timers.empty());
}

/**
 * @test Verify that each attempt carries the deadline and the metadata.
 */
TEST_F(retrying_unary_call_test, attempt_deadline_and_metadata) {
  auto options = bta::retry_options(100ms, 1000ms, 2.0, 5).with_attempt_timeout(2s).with_deadline(now + 10s);
  auto call = make_call(options, bta::call_metadata{{"x-goog-request-params", "name=foo"}});
  auto handle = call->start();
  ASSERT_EQ(attempts.size(), 1UL);
  auto const& attempt = attempts[0]->attempt;
  EXPECT_EQ(attempt.attempt_number, 1);
  EXPECT_EQ(attempt.submitted_at, now);
  EXPECT_EQ(attempt.deadline, now + 2s);
  ASSERT_EQ(attempt.metadata.size(), 1UL);
  EXPECT_EQ(attempt.metadata.begin()->second, "name=foo");

  // ... the request is sent unchanged ...
  grpc::ByteBuffer copy(attempts[0]->request);
  google::protobuf::StringValue sent;
  ASSERT_TRUE(grpc::SerializationTraits<google::protobuf::StringValue>::Deserialize(&copy, &sent).ok());
  EXPECT_EQ(sent.value(), "request");

  now += 9s;
  finish(attempts[0], grpc::StatusCode::UNAVAILABLE);
  fire(timers[0]);
  ASSERT_EQ(attempts.size(), 2UL);
  // ... the second attempt is limited by the overall deadline ...
  EXPECT_EQ(attempts[1]->attempt.deadline, options.deadline());
}

/**
 * @test Verify that responses that cannot be parsed are reported as permanent failures.
 */
TEST_F(retrying_unary_call_test, unparseable_response) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  grpc::Slice garbage(std::string("\xff\xff\xff\xff"));
  attempts[0]->response = grpc::ByteBuffer(&garbage, 1);
  attempts[0]->status = grpc::Status::OK;
  attempts[0]->callback(*attempts[0], true);
  ASSERT_TRUE(handle.is_resolved());
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::permanent_failure);
  EXPECT_EQ(handle.wait().status_code(), grpc::StatusCode::INTERNAL);
}

/**
 * @test Verify that cancelling the call before it starts prevents any attempt.
 */
TEST_F(retrying_unary_call_test, cancel_before_start) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  EXPECT_TRUE(call->cancel());
  auto handle = call->start();
  EXPECT_TRUE(handle.is_cancelled());
  EXPECT_TRUE(attempts.empty());
  EXPECT_EQ(call->state(), call_state::failed);
}

/**
 * @test Verify that the backoff timer cannot start a new attempt once the handle is cancelled.
 *
 * The listeners of the handle run as part of the cancellation, firing the timer from one of them is the earliest
 * point where a straggler timer can be delivered.
 */
TEST_F(retrying_unary_call_test, timer_during_cancel) {
  auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
  auto handle = call->start();
  finish(attempts[0], grpc::StatusCode::UNAVAILABLE);
  ASSERT_EQ(timers.size(), 1UL);

  int listener_calls = 0;
  handle.add_listener([this, &listener_calls](auto const&) {
    ++listener_calls;
    fire(timers[0]);
  });
  EXPECT_TRUE(call->cancel());
  EXPECT_EQ(listener_calls, 1);
  EXPECT_EQ(attempts.size(), 1UL);
  EXPECT_EQ(call->attempts_made(), 1);
  EXPECT_EQ(call->state(), call_state::failed);
  EXPECT_EQ(handle.wait().kind(), bta::error_kind::cancelled);
}

/**
 * @test Verify that an expiring backoff timer racing with cancel() never submits an attempt after the resolution.
 */
TEST_F(retrying_unary_call_test, cancel_races_timer) {
  for (int i = 0; i != 200; ++i) {
    auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
    auto handle = call->start();
    std::shared_ptr<async_unary_op> first;
    {
      std::lock_guard<std::mutex> lock(mu);
      first = attempts.back();
    }
    finish(first, grpc::StatusCode::UNAVAILABLE);
    std::shared_ptr<deadline_timer> timer;
    {
      std::lock_guard<std::mutex> lock(mu);
      timer = timers.back();
    }
    auto const before = attempt_count();

    std::atomic<int> resolutions(0);
    std::atomic<std::size_t> attempts_at_resolution(0);
    handle.add_listener([this, &resolutions, &attempts_at_resolution](auto const&) {
      ++resolutions;
      attempts_at_resolution = attempt_count();
    });

    std::thread t([timer]() { fire(timer); });
    call->cancel();
    t.join();

    EXPECT_EQ(resolutions.load(), 1) << "i=" << i;
    EXPECT_EQ(handle.wait().kind(), bta::error_kind::cancelled) << "i=" << i;
    EXPECT_EQ(attempt_count(), attempts_at_resolution.load()) << "i=" << i;
    EXPECT_EQ(call->state(), call_state::failed) << "i=" << i;
    if (attempt_count() != before) {
      // ... the timer won the race, the new attempt must have been cancelled ...
      std::lock_guard<std::mutex> lock(mu);
      ASSERT_FALSE(cancelled.empty()) << "i=" << i;
      EXPECT_EQ(cancelled.back(), attempts.back()) << "i=" << i;
    }
  }
}

/**
 * @test Verify that a completing attempt racing with cancel() resolves the handle exactly once.
 */
TEST_F(retrying_unary_call_test, cancel_races_completion) {
  for (int i = 0; i != 200; ++i) {
    auto call = make_call(bta::retry_options(100ms, 1000ms, 2.0, 5));
    auto handle = call->start();
    std::shared_ptr<async_unary_op> op;
    {
      std::lock_guard<std::mutex> lock(mu);
      op = attempts.back();
    }
    auto const before = attempt_count();

    std::atomic<int> resolutions(0);
    handle.add_listener([&resolutions](auto const&) { ++resolutions; });

    std::thread t([op]() { finish(op, grpc::StatusCode::OK, "ok"); });
    bool cancelled_first = call->cancel();
    t.join();

    EXPECT_EQ(resolutions.load(), 1) << "i=" << i;
    EXPECT_EQ(attempt_count(), before) << "i=" << i;
    EXPECT_EQ(call->attempts_made(), 1) << "i=" << i;
    auto const& result = handle.wait();
    if (cancelled_first) {
      EXPECT_EQ(result.kind(), bta::error_kind::cancelled) << "i=" << i;
      EXPECT_EQ(call->state(), call_state::failed) << "i=" << i;
    } else {
      ASSERT_TRUE(result.ok()) << "i=" << i;
      EXPECT_EQ(result.value().value(), "ok") << "i=" << i;
      EXPECT_EQ(call->state(), call_state::succeeded) << "i=" << i;
    }
  }
}

/**
 * @test Verify that call_state values can be streamed.
 */
TEST(retrying_unary_call, call_state_stream) {
  std::ostringstream os;
  os << call_state::idle << " " << call_state::attempt_in_flight << " " << call_state::backoff_scheduled << " "
     << call_state::succeeded << " " << call_state::failed;
  EXPECT_EQ(os.str(), "idle attempt_in_flight backoff_scheduled succeeded failed");
}
