#include "bta/detail/grpc_errors.hpp"

#include <google/protobuf/wrappers.pb.h>
#include <gmock/gmock.h>

/**
 * @test Verify that format_grpc_status produces the expected strings.
 */
TEST(grpc_errors, format_grpc_status) {
  using namespace bta::detail;
  grpc::Status status(grpc::StatusCode::PERMISSION_DENIED, "go away");
  EXPECT_EQ(format_grpc_status(status), "PERMISSION_DENIED: go away");
  EXPECT_EQ(format_grpc_status(status, " after ", 3, " attempts"), "PERMISSION_DENIED: go away after 3 attempts");
}

/**
 * @test Verify that print_to_stream formats messages in a single line.
 */
TEST(grpc_errors, print_to_stream_basic) {
  using namespace bta::detail;

  google::protobuf::StringValue req;
  req.set_value("my-table");

  std::ostringstream os;
  os << print_to_stream(req);
  auto actual = os.str();
  using namespace ::testing;
  EXPECT_THAT(actual, HasSubstr(R"""(value: "my-table")"""));
  EXPECT_THAT(actual, Not(HasSubstr("\n")));
}
