#include "bta/detail/outcome_classifier.hpp"
#include <bta/retry_options.hpp>
#include <bta/status_code.hpp>

#include <gtest/gtest.h>

/**
 * @test Verify the classification with the default retryable codes.
 */
TEST(outcome_classifier, defaults) {
  using namespace bta::detail;
  outcome_classifier classifier(bta::retry_options::default_retryable_codes());

  EXPECT_EQ(classifier.classify(grpc::StatusCode::OK), call_outcome::success);
  EXPECT_EQ(classifier.classify(grpc::StatusCode::UNAVAILABLE), call_outcome::retryable_failure);
  EXPECT_EQ(classifier.classify(grpc::StatusCode::DEADLINE_EXCEEDED), call_outcome::retryable_failure);
  EXPECT_EQ(classifier.classify(grpc::StatusCode::RESOURCE_EXHAUSTED), call_outcome::retryable_failure);
  EXPECT_EQ(classifier.classify(grpc::StatusCode::ABORTED), call_outcome::retryable_failure);

  for (auto code : {grpc::StatusCode::CANCELLED, grpc::StatusCode::UNKNOWN, grpc::StatusCode::INVALID_ARGUMENT,
                    grpc::StatusCode::NOT_FOUND, grpc::StatusCode::ALREADY_EXISTS, grpc::StatusCode::PERMISSION_DENIED,
                    grpc::StatusCode::FAILED_PRECONDITION, grpc::StatusCode::OUT_OF_RANGE,
                    grpc::StatusCode::UNIMPLEMENTED, grpc::StatusCode::INTERNAL, grpc::StatusCode::DATA_LOSS,
                    grpc::StatusCode::UNAUTHENTICATED}) {
    EXPECT_EQ(classifier.classify(code), call_outcome::permanent_failure) << bta::status_code_name(code);
  }
}

/**
 * @test Verify that the retryable codes come from data.
 */
TEST(outcome_classifier, custom_codes) {
  using namespace bta::detail;
  outcome_classifier classifier(bta::parse_status_code_list("UNAVAILABLE,UNAUTHENTICATED"));

  EXPECT_EQ(classifier.classify(grpc::StatusCode::UNAVAILABLE), call_outcome::retryable_failure);
  EXPECT_EQ(classifier.classify(grpc::StatusCode::UNAUTHENTICATED), call_outcome::retryable_failure);
  EXPECT_EQ(classifier.classify(grpc::StatusCode::ABORTED), call_outcome::permanent_failure);
  EXPECT_EQ(classifier.classify(grpc::StatusCode::DEADLINE_EXCEEDED), call_outcome::permanent_failure);

  outcome_classifier never_retry(std::set<grpc::StatusCode>{});
  EXPECT_EQ(never_retry.classify(grpc::StatusCode::UNAVAILABLE), call_outcome::permanent_failure);
}

/**
 * @test Verify that an OK status is only a success if exactly one value was received.
 */
TEST(outcome_classifier, unary_values) {
  using namespace bta::detail;
  outcome_classifier classifier(bta::retry_options::default_retryable_codes());

  EXPECT_EQ(classifier.classify(grpc::StatusCode::OK, 1), call_outcome::success);
  EXPECT_EQ(classifier.classify(grpc::StatusCode::OK, 0), call_outcome::internal_consistency_failure);
  EXPECT_EQ(classifier.classify(grpc::StatusCode::OK, 2), call_outcome::internal_consistency_failure);
  // ... the value count is irrelevant for failures ...
  EXPECT_EQ(classifier.classify(grpc::StatusCode::UNAVAILABLE, 0), call_outcome::retryable_failure);
  EXPECT_EQ(classifier.classify(grpc::StatusCode::NOT_FOUND, 0), call_outcome::permanent_failure);
}
