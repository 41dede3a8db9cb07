#include "bta/rpc_error.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify that bta::rpc_error carries the kind, status code, and message.
 */
TEST(rpc_error, basic) {
  bta::rpc_error err(bta::error_kind::retries_exhausted, grpc::StatusCode::UNAVAILABLE, "gave up after 5 attempts");
  EXPECT_EQ(err.kind(), bta::error_kind::retries_exhausted);
  EXPECT_EQ(err.status_code(), grpc::StatusCode::UNAVAILABLE);
  EXPECT_EQ(err.message(), "gave up after 5 attempts");
  EXPECT_EQ(std::string(err.what()), "retries_exhausted [UNAVAILABLE]: gave up after 5 attempts");
}

/**
 * @test Verify that bta::make_rpc_error() formats the annotations.
 */
TEST(rpc_error, make_rpc_error) {
  auto ex = bta::make_rpc_error(bta::error_kind::cancelled, grpc::StatusCode::CANCELLED, "attempt=", 3, " name=", "x");
  try {
    std::rethrow_exception(ex);
  } catch (bta::rpc_error const& err) {
    EXPECT_EQ(err.kind(), bta::error_kind::cancelled);
    EXPECT_EQ(err.message(), "attempt=3 name=x");
  }
}

/**
 * @test Verify that bta::operation_result holds values.
 */
TEST(operation_result, success) {
  auto r = bta::operation_result<std::string>::success("ok");
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value(), "ok");
  EXPECT_EQ(r.status_code(), grpc::StatusCode::OK);
  EXPECT_FALSE((bool)r.error());
}

/**
 * @test Verify that bta::operation_result holds errors and classifies them.
 */
TEST(operation_result, failure) {
  auto r = bta::operation_result<std::string>::failure(
      bta::make_rpc_error(bta::error_kind::permanent_failure, grpc::StatusCode::PERMISSION_DENIED, "denied"));
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.kind(), bta::error_kind::permanent_failure);
  EXPECT_EQ(r.status_code(), grpc::StatusCode::PERMISSION_DENIED);
  EXPECT_THROW(r.value(), bta::rpc_error);

  auto other = bta::operation_result<int>::failure(std::make_exception_ptr(std::out_of_range("oops")));
  EXPECT_EQ(other.kind(), bta::error_kind::permanent_failure);
  EXPECT_EQ(other.status_code(), grpc::StatusCode::UNKNOWN);
  // ... the original exception is preserved, not replaced ...
  EXPECT_THROW(other.value(), std::out_of_range);

  EXPECT_THROW(bta::operation_result<int>::failure(std::exception_ptr()), std::invalid_argument);
}
