#include "bta/log_severity.hpp"

#include <gtest/gtest.h>
#include <sstream>

/**
 * @test Verify that the severity streaming operator produces the expected names.
 */
TEST(log_severity, streaming) {
  std::ostringstream os;
  os << bta::severity::trace << " " << bta::severity::warning << " " << bta::severity::fatal;
  ASSERT_EQ(os.str(), "trace warning fatal");
}

/**
 * @test Verify that bta::parse_severity() is the inverse of the streaming operator.
 */
TEST(log_severity, parse) {
  for (int i = int(bta::severity::LOWEST); i <= int(bta::severity::HIGHEST); ++i) {
    std::ostringstream os;
    os << bta::severity(i);
    EXPECT_EQ(bta::parse_severity(os.str()), bta::severity(i));
  }
  EXPECT_THROW(bta::parse_severity("verbose"), std::invalid_argument);
  EXPECT_THROW(bta::parse_severity(""), std::invalid_argument);
}
