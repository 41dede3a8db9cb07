#include "bta/assert_throw.hpp"

#include <gmock/gmock.h>
#include <stdexcept>

/**
 * @test Verify that BTA_ASSERT_THROW() works as expected.
 */
TEST(assert_throw, basic) {
  ASSERT_THROW(bta::assert_throw_impl("foo", "bar()", "bar.cc", 20), std::logic_error);

  ASSERT_THROW(BTA_ASSERT_THROW(false), std::logic_error);
  ASSERT_NO_THROW(BTA_ASSERT_THROW(true));
}

/**
 * @test Verify that the exception message describes the failed predicate and its location.
 */
TEST(assert_throw, message) {
  try {
    int attempts = 0;
    BTA_ASSERT_THROW(attempts > 0);
    FAIL() << "BTA_ASSERT_THROW() should have raised";
  } catch (std::logic_error const& ex) {
    using namespace ::testing;
    EXPECT_THAT(ex.what(), HasSubstr("attempts > 0"));
    EXPECT_THAT(ex.what(), HasSubstr("assert_throw_ut.cpp"));
  }
}
