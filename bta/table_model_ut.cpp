#include "bta/table_model.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify that the table models can be printed.
 */
TEST(table_model, stream) {
  std::ostringstream os;
  os << bta::table_spec{"t0", {{"a", 1}, {"b", 0}}};
  EXPECT_EQ(os.str(), "table_id=t0, column_families={a:1, b:0}");

  os.str("");
  os << bta::table_info{"t1", {"x", "y"}};
  EXPECT_EQ(os.str(), "table_id=t1, column_families={x, y}");

  os.str("");
  os << bta::column_family_modification::update("fam", 3);
  EXPECT_EQ(os.str(), "update fam max_versions=3");

  os.str("");
  os << bta::column_family_modification::drop("fam");
  EXPECT_EQ(os.str(), "drop fam");
}

/**
 * @test Verify table_info comparisons.
 */
TEST(table_model, compare) {
  bta::table_info a{"t0", {"x"}};
  bta::table_info b{"t0", {"x"}};
  EXPECT_EQ(a, b);
  b.column_families.push_back("y");
  EXPECT_NE(a, b);
}

/**
 * @test Verify that snapshots and operations can be printed and compared.
 */
TEST(table_model, snapshots) {
  bta::snapshot_info a{"c0", "s0", "t0", 1024, "daily", true};
  bta::snapshot_info b = a;
  EXPECT_EQ(a, b);
  b.ready = false;
  EXPECT_NE(a, b);

  std::ostringstream os;
  os << a;
  EXPECT_EQ(
      os.str(),
      "cluster_id=c0, snapshot_id=s0, source_table_id=t0, data_size_bytes=1024, description=daily, ready=true");

  os.str("");
  os << bta::operation_info{"operations/op0", false, 0, ""};
  EXPECT_EQ(os.str(), "name=operations/op0, done=false");

  os.str("");
  os << bta::operation_info{"operations/op1", true, 5, "not found"};
  EXPECT_EQ(os.str(), "name=operations/op1, done=true, error=5 not found");
}
