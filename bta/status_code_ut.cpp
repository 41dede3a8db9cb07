#include "bta/status_code.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify that status code names round trip through bta::parse_status_code().
 */
TEST(status_code, names) {
  EXPECT_EQ(bta::status_code_name(grpc::StatusCode::OK), "OK");
  EXPECT_EQ(bta::status_code_name(grpc::StatusCode::UNAVAILABLE), "UNAVAILABLE");
  EXPECT_EQ(bta::status_code_name(grpc::StatusCode::PERMISSION_DENIED), "PERMISSION_DENIED");
  EXPECT_EQ(bta::status_code_name(grpc::StatusCode(42)), "UNKNOWN_STATUS_CODE(42)");

  for (int i = 0; i <= int(grpc::StatusCode::UNAUTHENTICATED); ++i) {
    auto code = grpc::StatusCode(i);
    EXPECT_EQ(bta::parse_status_code(bta::status_code_name(code)), code);
  }
}

/**
 * @test Verify that bta::parse_status_code() is case insensitive and rejects unknown names.
 */
TEST(status_code, parse) {
  EXPECT_EQ(bta::parse_status_code("aborted"), grpc::StatusCode::ABORTED);
  EXPECT_EQ(bta::parse_status_code("Deadline_Exceeded"), grpc::StatusCode::DEADLINE_EXCEEDED);
  EXPECT_THROW(bta::parse_status_code("NOT_A_CODE"), std::invalid_argument);
  EXPECT_THROW(bta::parse_status_code(""), std::invalid_argument);
}

/**
 * @test Verify that lists of status codes are parsed as expected.
 */
TEST(status_code, parse_list) {
  auto codes = bta::parse_status_code_list(" UNAVAILABLE, aborted ,RESOURCE_EXHAUSTED");
  std::set<grpc::StatusCode> expected{grpc::StatusCode::UNAVAILABLE, grpc::StatusCode::ABORTED,
                                      grpc::StatusCode::RESOURCE_EXHAUSTED};
  EXPECT_EQ(codes, expected);

  EXPECT_TRUE(bta::parse_status_code_list("").empty());
  EXPECT_TRUE(bta::parse_status_code_list("   ").empty());
  EXPECT_THROW(bta::parse_status_code_list("UNAVAILABLE,,ABORTED"), std::invalid_argument);
  EXPECT_THROW(bta::parse_status_code_list("UNAVAILABLE,BOGUS"), std::invalid_argument);
}
